#pragma once
#include <chrono>

namespace HonestMark {

struct Permit {
    bool granted = false;
    std::chrono::milliseconds wait{0}; // Time until the current window ends; zero when granted.
};

class IQuotaTracker {
public:
    virtual ~IQuotaTracker() = default;
    virtual Permit TryAcquire() = 0;
};

}


#include "QuotaTracker.hpp"
#include <stdexcept>
#include <string>
#include <utility>

namespace HonestMark {

QuotaTracker::QuotaTracker(std::chrono::milliseconds window_length, int capacity, Clock clock)
    : window_length(window_length), capacity(capacity), clock(std::move(clock)) {
    if (capacity <= 0) {
        throw std::invalid_argument("Request limit must be positive, got " + std::to_string(capacity));
    }
    if (window_length.count() <= 0) {
        throw std::invalid_argument("Window length must be positive");
    }
    if (!this->clock) {
        throw std::invalid_argument("QuotaTracker requires a clock");
    }
    remaining = capacity;
    window_start = this->clock();
}

Permit QuotaTracker::TryAcquire() {
    std::lock_guard<std::mutex> lock(mutex);
    auto now = clock();

    if (now - window_start >= window_length) {
        remaining = capacity;
        window_start = now;
    }

    const int before = remaining--;
    if (before > 0) {
        return {true, std::chrono::milliseconds(0)};
    }

    auto left = std::chrono::ceil<std::chrono::milliseconds>(window_length - (now - window_start));
    if (left.count() < 0) {
        left = std::chrono::milliseconds(0);
    }
    return {false, left};
}

int QuotaTracker::Remaining() {
    std::lock_guard<std::mutex> lock(mutex);
    return remaining;
}

}

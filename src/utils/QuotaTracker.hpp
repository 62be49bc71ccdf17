#pragma once
#include <chrono>
#include <functional>
#include <mutex>
#include "../interfaces/IQuotaTracker.hpp"

namespace HonestMark {
    // Fixed-window quota: at most `capacity` grants per `window_length`.
    //
    // Check-and-decrement happens under one lock. The decrement is optimistic and
    // never refunded, so over-quota callers push `remaining` below zero until the
    // next refill; each of them waits for the same window boundary and then
    // competes again for the fresh pool.
    class QuotaTracker : public IQuotaTracker {
    public:
        using Clock = std::function<std::chrono::steady_clock::time_point()>;

        QuotaTracker(std::chrono::milliseconds window_length, int capacity, Clock clock = &std::chrono::steady_clock::now);
        Permit TryAcquire() override;

        int Capacity() const { return capacity; }
        std::chrono::milliseconds WindowLength() const { return window_length; }
        int Remaining();

    private:
        const std::chrono::milliseconds window_length;
        const int capacity;
        Clock clock;
        int remaining;
        std::chrono::steady_clock::time_point window_start;
        std::mutex mutex;
    };
}

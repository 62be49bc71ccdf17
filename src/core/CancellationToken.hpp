#pragma once
#include <atomic>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <utility>

namespace HonestMark {
    // Shared cancel flag. Copies observe the same state.
    class CancellationToken {
    public:
        using Callback = std::function<void()>;
        using SubscriptionId = std::uint64_t;

        CancellationToken() : state_(std::make_shared<State>()) {}

        // Sets the flag, then runs every subscribed callback once, on the
        // calling thread and outside the token's lock.
        void Cancel() {
            std::map<SubscriptionId, Callback> callbacks;
            {
                std::lock_guard<std::mutex> lock(state_->mutex);
                if (state_->cancelled.exchange(true)) return;
                std::swap(callbacks, state_->callbacks);
            }
            for (auto& entry : callbacks) {
                entry.second();
            }
        }

        bool IsCancelled() const { return state_->cancelled.load(); }

        // Returns 0 without registering when the token is already cancelled.
        SubscriptionId Subscribe(Callback callback) const {
            std::lock_guard<std::mutex> lock(state_->mutex);
            if (state_->cancelled.load()) return 0;
            SubscriptionId id = ++state_->next_id;
            state_->callbacks.emplace(id, std::move(callback));
            return id;
        }

        void Unsubscribe(SubscriptionId id) const {
            if (id == 0) return;
            std::lock_guard<std::mutex> lock(state_->mutex);
            state_->callbacks.erase(id);
        }

    private:
        struct State {
            std::atomic<bool> cancelled{false};
            std::mutex mutex;
            std::map<SubscriptionId, Callback> callbacks;
            SubscriptionId next_id = 0;
        };

        std::shared_ptr<State> state_;
    };
}

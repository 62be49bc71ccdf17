#pragma once
#include <exception>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <type_traits>
#include <utility>
#include "CancellationToken.hpp"
#include "JobScheduler.hpp"
#include "../errors/ClientError.hpp"
#include "../interfaces/IQuotaTracker.hpp"
#include "../utils/Logger.hpp"
#include "../utils/ThreadPool.hpp"

namespace HonestMark {
    // Runs tasks under a quota. A granted task goes straight to the pool; a
    // refused one is re-checked against the tracker once the reported wait has
    // elapsed. Waking up never entitles a caller to a permit by itself.
    //
    // There is no queue limit and no FIFO order among waiters. Cancelling the
    // token withdraws a pending re-check and resolves the future with
    // OperationCancelled at once; the permit already decremented is not given
    // back.
    class AdmissionGate {
    public:
        AdmissionGate(IQuotaTracker& tracker, ThreadPool& pool, JobScheduler& scheduler)
            : tracker_(tracker), pool_(pool), scheduler_(scheduler) {}

        template <typename T>
        std::future<T> Execute(std::function<T()> task, CancellationToken token = {}) {
            auto admission = std::make_shared<Admission<T>>();
            admission->task = std::move(task);
            admission->token = std::move(token);
            auto future = admission->promise.get_future();

            std::weak_ptr<Admission<T>> weak = admission;
            admission->subscription = admission->token.Subscribe([this, weak]() {
                if (auto waiting = weak.lock()) {
                    Withdraw(waiting);
                }
            });
            Attempt(admission);
            return future;
        }

    private:
        template <typename T>
        struct Admission {
            std::function<T()> task;
            CancellationToken token;
            CancellationToken::SubscriptionId subscription = 0;
            std::promise<T> promise;
            int attempts = 0;

            std::mutex mutex;
            JobScheduler::JobId pending = 0; // guarded by mutex
        };

        template <typename T>
        void Attempt(std::shared_ptr<Admission<T>> admission) {
            if (admission->token.IsCancelled()) {
                Fail(*admission, OperationCancelled("Cancelled while waiting for quota"));
                return;
            }

            ++admission->attempts;
            Permit permit = tracker_.TryAcquire();
            if (permit.granted) {
                if (!pool_.enqueue([admission]() { Run(*admission); })) {
                    Fail(*admission, ClientClosedError("Client shut down before the task started"));
                }
                return;
            }

            Logger::Log(LogLevel::Debug, "Quota exhausted, attempt " + std::to_string(admission->attempts) +
                " deferred by " + std::to_string(permit.wait.count()) + " ms");

            // Held across Schedule() so the re-check cannot start before its id is recorded
            std::unique_lock<std::mutex> lock(admission->mutex);
            JobScheduler::JobId id = scheduler_.Schedule(permit.wait,
                [this, admission]() { Attempt(admission); },
                [admission]() { Fail(*admission, ClientClosedError("Client shut down while waiting for quota")); });
            if (id == 0) {
                lock.unlock();
                Fail(*admission, ClientClosedError("Client shut down while waiting for quota"));
                return;
            }
            admission->pending = id;
            lock.unlock();

            // Cancel() may have run before the id was visible to its callback
            if (admission->token.IsCancelled()) {
                Withdraw(admission);
            }
        }

        // Takes the pending re-check off the scheduler. Only the caller that
        // actually removes the job resolves the future.
        template <typename T>
        void Withdraw(const std::shared_ptr<Admission<T>>& admission) {
            JobScheduler::JobId id = 0;
            {
                std::lock_guard<std::mutex> lock(admission->mutex);
                std::swap(id, admission->pending);
            }
            if (id != 0 && scheduler_.Cancel(id)) {
                Fail(*admission, OperationCancelled("Cancelled while waiting for quota"));
            }
        }

        template <typename T>
        static void Run(Admission<T>& admission) {
            admission.token.Unsubscribe(admission.subscription);
            if (admission.token.IsCancelled()) {
                Fail(admission, OperationCancelled("Cancelled before the task started"));
                return;
            }
            try {
                if constexpr (std::is_void_v<T>) {
                    admission.task();
                    admission.promise.set_value();
                } else {
                    admission.promise.set_value(admission.task());
                }
            } catch (...) {
                admission.promise.set_exception(std::current_exception());
            }
        }

        template <typename T, typename E>
        static void Fail(Admission<T>& admission, const E& error) {
            admission.token.Unsubscribe(admission.subscription);
            admission.promise.set_exception(std::make_exception_ptr(error));
        }

        IQuotaTracker& tracker_;
        ThreadPool& pool_;
        JobScheduler& scheduler_;
    };
}

#pragma once
#include <condition_variable>
#include <functional>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

namespace HonestMark {
    class ThreadPool {
    public:
        explicit ThreadPool(size_t num_threads);
        ~ThreadPool();

        // Non-copyable
        ThreadPool(const ThreadPool&) = delete;
        ThreadPool& operator=(const ThreadPool&) = delete;

        // Returns false, dropping the task, once Shutdown() has begun.
        bool enqueue(std::function<void()> task);

        // Runs every queued task, then joins the workers. Idempotent.
        void Shutdown();

        size_t size() const { return workers.size(); }

    private:
        void WorkerLoop();

        std::vector<std::thread> workers;
        std::queue<std::function<void()>> tasks;
        std::mutex queue_mutex;
        std::condition_variable cv;
        bool stop_ = false;
    };
}

#include "ThreadPool.hpp"
#include "Logger.hpp"
#include <exception>
#include <stdexcept>
#include <string>
#include <utility>

namespace HonestMark {

ThreadPool::ThreadPool(size_t num_threads) {
    if (num_threads == 0) {
        throw std::invalid_argument("ThreadPool requires at least one worker");
    }
    workers.reserve(num_threads);
    for (size_t i = 0; i < num_threads; ++i) {
        workers.emplace_back(&ThreadPool::WorkerLoop, this);
    }
}

ThreadPool::~ThreadPool() {
    Shutdown();
}

bool ThreadPool::enqueue(std::function<void()> task) {
    {
        std::unique_lock<std::mutex> lock(queue_mutex);
        if (stop_) {
            Logger::Log(LogLevel::Warn, "ThreadPool is shut down; dropping task.");
            return false;
        }
        tasks.push(std::move(task));
    }
    cv.notify_one();
    return true;
}

void ThreadPool::Shutdown() {
    {
        std::unique_lock<std::mutex> lock(queue_mutex);
        if (stop_) return;
        stop_ = true;
    }
    cv.notify_all();
    for (auto& worker : workers) {
        if (worker.joinable()) {
            worker.join();
        }
    }
}

void ThreadPool::WorkerLoop() {
    while (true) {
        std::function<void()> task;
        {
            std::unique_lock<std::mutex> lock(queue_mutex);
            cv.wait(lock, [this] { return stop_ || !tasks.empty(); });
            if (stop_ && tasks.empty()) return;
            task = std::move(tasks.front());
            tasks.pop();
        }

        try {
            task();
        } catch (const std::exception& e) {
            Logger::Log(LogLevel::Error, "Exception in pool task: " + std::string(e.what()));
        } catch (...) {
            Logger::Log(LogLevel::Error, "Unknown exception in pool task");
        }
    }
}

}

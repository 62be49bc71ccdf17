#include "JobScheduler.hpp"
#include "../utils/Logger.hpp"
#include <algorithm>
#include <exception>
#include <string>

namespace HonestMark {

JobScheduler::JobScheduler(ThreadPool& pool) : thread_pool(pool) {
    scheduler_thread = std::thread(&JobScheduler::Run, this);
}

JobScheduler::~JobScheduler() {
    Stop();
}

void JobScheduler::Stop() {
    std::vector<ScheduledJob> abandoned;
    std::thread worker;
    {
        // Only the first caller takes the thread, so it is joined exactly once
        std::unique_lock<std::mutex> lock(jobs_mutex);
        stop_ = true;
        std::swap(abandoned, jobs);
        worker = std::move(scheduler_thread);
    }
    cv.notify_all();
    if (worker.joinable()) {
        worker.join();
    }

    if (!abandoned.empty()) {
        Logger::Log(LogLevel::Warn, "Scheduler stopped with " + std::to_string(abandoned.size()) + " pending job(s).");
    }
    for (auto& scheduled : abandoned) {
        Abandon(scheduled);
    }
}

void JobScheduler::Abandon(ScheduledJob& scheduled) {
    if (!scheduled.on_abandon) return;
    try {
        scheduled.on_abandon();
    } catch (const std::exception& e) {
        Logger::Log(LogLevel::Error, "Exception in abandon handler: " + std::string(e.what()));
    }
}

void JobScheduler::Run() {
    std::unique_lock<std::mutex> lock(jobs_mutex);
    while (!stop_) {
        if (jobs.empty()) {
            cv.wait(lock, [this] { return stop_ || !jobs.empty(); });
            continue;
        }

        auto now = std::chrono::steady_clock::now();
        auto next_time = jobs.front().execution_time;
        if (next_time > now) {
            // Woken early by Schedule() or Stop(); the heap is re-inspected either way.
            cv.wait_until(lock, next_time);
            continue;
        }

        std::pop_heap(jobs.begin(), jobs.end(), &JobScheduler::RunsLater);
        ScheduledJob due = std::move(jobs.back());
        jobs.pop_back();

        // Unlock before handing off so callers can keep scheduling
        lock.unlock();
        if (!thread_pool.enqueue(std::move(due.job))) {
            Abandon(due);
        }
        lock.lock();
    }
}

JobScheduler::JobId JobScheduler::Schedule(std::chrono::milliseconds delay, Job job, Job on_abandon) {
    JobId id = 0;
    {
        std::unique_lock<std::mutex> lock(jobs_mutex);
        if (stop_) return 0;
        id = ++next_id_;
        jobs.push_back({id, std::chrono::steady_clock::now() + delay, std::move(job), std::move(on_abandon)});
        std::push_heap(jobs.begin(), jobs.end(), &JobScheduler::RunsLater);
    }
    cv.notify_one();
    return id;
}

bool JobScheduler::Cancel(JobId id) {
    {
        std::unique_lock<std::mutex> lock(jobs_mutex);
        auto it = std::find_if(jobs.begin(), jobs.end(), [id](const ScheduledJob& j) { return j.id == id; });
        if (it == jobs.end()) return false;
        jobs.erase(it);
        std::make_heap(jobs.begin(), jobs.end(), &JobScheduler::RunsLater);
    }
    Logger::Log(LogLevel::Debug, "Cancelled scheduled job " + std::to_string(id));
    cv.notify_all();
    return true;
}

// Heap order: front() is the earliest job.
bool JobScheduler::RunsLater(const ScheduledJob& a, const ScheduledJob& b) {
    return a.execution_time > b.execution_time;
}

size_t JobScheduler::Pending() {
    std::unique_lock<std::mutex> lock(jobs_mutex);
    return jobs.size();
}

}

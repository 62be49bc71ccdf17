#pragma once
#include <functional>
#include <vector>
#include <mutex>
#include <thread>
#include <condition_variable>
#include <chrono>
#include <cstdint>
#include "../utils/ThreadPool.hpp"

namespace HonestMark {
    // Single timer thread holding delayed jobs. Due jobs are handed to the
    // thread pool; the timer thread never runs job bodies itself.
    class JobScheduler {
    public:
        using Job = std::function<void()>;
        using JobId = std::uint64_t; // 0 is never a valid id

        explicit JobScheduler(ThreadPool& pool);
        ~JobScheduler();

        JobScheduler(const JobScheduler&) = delete;
        JobScheduler& operator=(const JobScheduler&) = delete;

        // Runs `job` on the pool once `delay` has elapsed. `on_abandon` is invoked
        // instead if the scheduler stops first or the pool refuses the job.
        // Returns 0, invoking nothing, when the scheduler is already stopped.
        JobId Schedule(std::chrono::milliseconds delay, Job job, Job on_abandon = {});

        // Removes a job that has not been handed to the pool yet. Neither `job`
        // nor `on_abandon` runs. Returns false if the job already left the queue.
        bool Cancel(JobId id);

        // Joins the timer thread and abandons every pending job. Idempotent.
        void Stop();

        size_t Pending();

    private:
        void Run();

        struct ScheduledJob {
            JobId id;
            std::chrono::steady_clock::time_point execution_time;
            Job job;
            Job on_abandon;
        };
        static bool RunsLater(const ScheduledJob& a, const ScheduledJob& b);
        static void Abandon(ScheduledJob& scheduled);

        ThreadPool& thread_pool;
        std::vector<ScheduledJob> jobs;
        std::mutex jobs_mutex;
        std::condition_variable cv;
        std::thread scheduler_thread;
        bool stop_ = false;
        JobId next_id_ = 0;
    };
}

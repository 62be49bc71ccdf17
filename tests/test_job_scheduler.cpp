#include <catch2/catch_all.hpp>
#include <atomic>
#include <future>
#include <stdexcept>
#include <thread>
#include "core/JobScheduler.hpp"
#include "utils/ThreadPool.hpp"

using namespace HonestMark;
using namespace std::chrono_literals;

TEST_CASE("JobScheduler runs a job once its delay has elapsed") {
    ThreadPool pool(2);
    JobScheduler scheduler(pool);
    std::promise<void> done;
    auto start = std::chrono::steady_clock::now();

    REQUIRE(scheduler.Schedule(100ms, [&] { done.set_value(); }) != 0);
    auto future = done.get_future();
    REQUIRE(future.wait_for(2s) == std::future_status::ready);
    CHECK(std::chrono::steady_clock::now() - start >= 100ms);
}

TEST_CASE("JobScheduler drops a cancelled job without abandoning it") {
    ThreadPool pool(2);
    JobScheduler scheduler(pool);
    std::atomic<bool> ran{false};
    std::atomic<bool> abandoned{false};

    auto id = scheduler.Schedule(200ms, [&] { ran = true; }, [&] { abandoned = true; });
    REQUIRE(id != 0);
    CHECK(scheduler.Cancel(id));
    CHECK(scheduler.Pending() == 0);
    CHECK_FALSE(scheduler.Cancel(id));

    std::this_thread::sleep_for(400ms);
    scheduler.Stop();
    CHECK_FALSE(ran.load());
    CHECK_FALSE(abandoned.load());
}

TEST_CASE("JobScheduler keeps other jobs when one is cancelled") {
    ThreadPool pool(2);
    JobScheduler scheduler(pool);
    std::promise<int> done;

    auto early = scheduler.Schedule(50ms, [&] { done.set_value(1); });
    scheduler.Schedule(150ms, [&] { done.set_value(2); });
    REQUIRE(scheduler.Cancel(early));

    auto future = done.get_future();
    REQUIRE(future.wait_for(2s) == std::future_status::ready);
    CHECK(future.get() == 2);
}

TEST_CASE("JobScheduler Stop is safe to call from several threads") {
    ThreadPool pool(2);
    JobScheduler scheduler(pool);
    std::atomic<int> abandoned{0};
    scheduler.Schedule(std::chrono::hours(1), [] {}, [&] { ++abandoned; });

    std::thread a([&] { scheduler.Stop(); });
    std::thread b([&] { scheduler.Stop(); });
    a.join();
    b.join();
    CHECK_NOTHROW(scheduler.Stop());
    CHECK(abandoned.load() == 1);
    CHECK(scheduler.Schedule(1ms, [] {}) == 0);
}

TEST_CASE("JobScheduler abandons a due job the pool refuses") {
    ThreadPool pool(1);
    JobScheduler scheduler(pool);
    pool.Shutdown();

    std::promise<void> abandoned;
    std::atomic<bool> ran{false};
    scheduler.Schedule(10ms, [&] { ran = true; }, [&] { abandoned.set_value(); });

    auto future = abandoned.get_future();
    REQUIRE(future.wait_for(2s) == std::future_status::ready);
    CHECK_FALSE(ran.load());
}

TEST_CASE("ThreadPool keeps working after a task throws a non-standard exception") {
    ThreadPool pool(1);
    std::promise<void> done;

    REQUIRE(pool.enqueue([] { throw 42; }));
    REQUIRE(pool.enqueue([&] { done.set_value(); }));

    auto future = done.get_future();
    CHECK(future.wait_for(2s) == std::future_status::ready);
}

TEST_CASE("ThreadPool refuses tasks after Shutdown") {
    ThreadPool pool(1);
    pool.Shutdown();
    CHECK_FALSE(pool.enqueue([] {}));
}

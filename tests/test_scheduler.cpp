#include "../include/scheduler/periodic_scheduler.hpp"
#include "../include/util/time_utils.hpp"

#include <atomic>
#include <cassert>
#include <chrono>
#include <iostream>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace econ;
using namespace econ::scheduler;

#define TEST(name) void name()
#define RUN_TEST(name)                                                                                                 \
    do {                                                                                                               \
        std::cout << "Running " << #name << "... ";                                                                    \
        name();                                                                                                        \
        std::cout << "PASSED\n";                                                                                       \
    } while (0)

#define ASSERT_EQ(a, b) assert((a) == (b))
#define ASSERT_TRUE(x) assert(x)
#define ASSERT_FALSE(x) assert(!(x))

constexpr uint64_t SEC = config::time::NS_PER_SECOND;

TEST(test_task_runs_on_interval) {
    util::SimulatedClock clock(0);
    PeriodicScheduler scheduler(clock);
    int runs = 0;
    auto id = scheduler.add_task("counter", 60 * SEC, [&](Timestamp) { ++runs; });

    ASSERT_EQ(scheduler.tick(), 0u);
    clock.advance_seconds(59);
    ASSERT_EQ(scheduler.tick(), 0u);
    clock.advance_seconds(1);
    ASSERT_EQ(scheduler.tick(), 1u);
    ASSERT_EQ(runs, 1);

    clock.advance_seconds(60);
    scheduler.tick();
    ASSERT_EQ(runs, 2);
    ASSERT_EQ(scheduler.stats(id).runs, 2u);
    ASSERT_EQ(scheduler.stats(id).next_due, clock.now() + 60 * SEC);
}

// Ten missed intervals produce a single run, not a burst
TEST(test_no_catch_up_burst) {
    util::SimulatedClock clock(0);
    PeriodicScheduler scheduler(clock);
    int runs = 0;
    scheduler.add_task("slow", 60 * SEC, [&](Timestamp) { ++runs; });

    clock.advance_seconds(600);
    ASSERT_EQ(scheduler.tick(), 1u);
    ASSERT_EQ(scheduler.tick(), 0u);
    ASSERT_EQ(runs, 1);
}

TEST(test_registration_order_and_now) {
    util::SimulatedClock clock(0);
    PeriodicScheduler scheduler(clock);
    std::vector<std::string> order;
    Timestamp seen = 0;
    scheduler.add_task("dispatch", SEC, [&](Timestamp) { order.push_back("dispatch"); });
    scheduler.add_task("sweep", SEC, [&](Timestamp now) {
        order.push_back("sweep");
        seen = now;
    });

    clock.advance_seconds(5);
    scheduler.tick();
    std::vector<std::string> expected = {"dispatch", "sweep"};
    ASSERT_EQ(order, expected);
    ASSERT_EQ(seen, 5 * SEC);
    ASSERT_EQ(scheduler.task_count(), 2u);
    ASSERT_EQ(scheduler.ticks(), 1u);
}

TEST(test_failing_task_counted_and_isolated) {
    util::SimulatedClock clock(0);
    PeriodicScheduler scheduler(clock);
    int healthy = 0;
    auto bad = scheduler.add_task("bad", SEC, [](Timestamp) { throw std::runtime_error("broken"); });
    scheduler.add_task("good", SEC, [&](Timestamp) { ++healthy; });

    for (int i = 0; i < 3; ++i) {
        clock.advance_seconds(1);
        scheduler.tick();
    }
    ASSERT_EQ(healthy, 3);
    ASSERT_EQ(scheduler.stats(bad).failures, 3u);
    ASSERT_EQ(scheduler.stats(bad).runs, 3u);
}

TEST(test_run_now) {
    util::SimulatedClock clock(0);
    PeriodicScheduler scheduler(clock);
    int runs = 0;
    auto id = scheduler.add_task("manual", 3600 * SEC, [&](Timestamp) { ++runs; });

    ASSERT_TRUE(scheduler.run_now(id));
    ASSERT_FALSE(scheduler.run_now(99));
    ASSERT_EQ(runs, 1);
    ASSERT_EQ(scheduler.stats(99).runs, 0u);
}

TEST(test_driver_thread) {
    util::SimulatedClock clock(0);
    PeriodicScheduler scheduler(clock, nullptr, 1);
    std::atomic<int> runs{0};
    scheduler.add_task("bg", SEC, [&](Timestamp) { runs.fetch_add(1); });

    scheduler.start();
    ASSERT_TRUE(scheduler.running());
    clock.advance_seconds(1);
    for (int i = 0; i < 2000 && runs.load() == 0; ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    ASSERT_EQ(runs.load(), 1);

    scheduler.pause();
    ASSERT_TRUE(scheduler.paused());
    // Give the driver time to observe the pause before moving the clock
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    clock.advance_seconds(5);
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    ASSERT_EQ(runs.load(), 1);

    scheduler.resume();
    for (int i = 0; i < 2000 && runs.load() == 1; ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    scheduler.stop();
    ASSERT_FALSE(scheduler.running());
    ASSERT_EQ(runs.load(), 2);
}

int main() {
    std::cout << "=== Periodic Scheduler Tests ===\n";

    RUN_TEST(test_task_runs_on_interval);
    RUN_TEST(test_no_catch_up_burst);
    RUN_TEST(test_registration_order_and_now);
    RUN_TEST(test_failing_task_counted_and_isolated);
    RUN_TEST(test_run_now);
    RUN_TEST(test_driver_thread);

    std::cout << "\nAll tests PASSED!\n";
    return 0;
}

#include <atomic>
#include <thread>

#include <gtest/gtest.h>

#include <topology/core/error.hh>
#include <topology/discovery/scheduler.hh>
#include <topology/test/manual_clock.hh>
#include <topology/test/test.hh>

using topo::test::eventually;

TEST(timer_set, periods) {
    using namespace std::chrono;
    topo::test::manual_clock clock;
    topo::clock::mutex_type mutex;
    topo::clock::semaphore_type semaphore;
    std::atomic<int> fast{0}, slow{0};
    bool running = true;
    topod::timer_set timers;
    timers.add("fast", seconds(2), [&fast] () { ++fast; });
    timers.add("slow", seconds(5), [&slow] () { ++slow; });
    std::thread thread([&] () {
        topo::clock::lock_type lock(mutex);
        timers.run(clock, lock, semaphore, [&running] () { return running; });
    });
    // let the thread initialise the timers before the time moves
    std::this_thread::sleep_for(milliseconds(50));
    EXPECT_EQ(0, fast.load());
    for (int i=1; i<=10; ++i) {
        clock.advance(seconds(1));
        const int expected_fast = i/2, expected_slow = i/5;
        EXPECT_TRUE(eventually([&] () {
            return fast.load() == expected_fast && slow.load() == expected_slow;
        })) << "second " << i << ": fast=" << fast.load() << " slow=" << slow.load();
    }
    {
        topo::clock::lock_type lock(mutex);
        running = false;
        semaphore.notify_all();
    }
    thread.join();
}

TEST(timer_set, overdue_timers_fire_once) {
    using namespace std::chrono;
    topo::test::manual_clock clock;
    topo::clock::mutex_type mutex;
    topo::clock::semaphore_type semaphore;
    std::atomic<int> count{0};
    bool running = true;
    topod::timer_set timers;
    timers.add("prune", seconds(2), [&count] () { ++count; });
    std::thread thread([&] () {
        topo::clock::lock_type lock(mutex);
        timers.run(clock, lock, semaphore, [&running] () { return running; });
    });
    std::this_thread::sleep_for(milliseconds(50));
    clock.advance(seconds(35));
    EXPECT_TRUE(eventually([&count] () { return count.load() == 1; }));
    std::this_thread::sleep_for(milliseconds(50));
    EXPECT_EQ(1, count.load());
    clock.advance(seconds(2));
    EXPECT_TRUE(eventually([&count] () { return count.load() == 2; }));
    {
        topo::clock::lock_type lock(mutex);
        running = false;
        semaphore.notify_all();
    }
    thread.join();
}

TEST(timer_set, stop) {
    using namespace std::chrono;
    topo::system_clock clock;
    topo::clock::mutex_type mutex;
    topo::clock::semaphore_type semaphore;
    bool running = true;
    topod::timer_set timers;
    timers.add("hourly", hours(1), [] () {});
    std::thread thread([&] () {
        topo::clock::lock_type lock(mutex);
        timers.run(clock, lock, semaphore, [&running] () { return running; });
    });
    std::this_thread::sleep_for(milliseconds(10));
    const auto t0 = steady_clock::now();
    {
        topo::clock::lock_type lock(mutex);
        running = false;
        semaphore.notify_all();
    }
    thread.join();
    EXPECT_LT(steady_clock::now() - t0, seconds(5));
}

TEST(timer_set, invalid_period) {
    topod::timer_set timers;
    EXPECT_THROW(timers.add("zero", std::chrono::seconds(0), [] () {}), topo::error);
    EXPECT_TRUE(timers.empty());
}

TEST(timer_set, explicit_start) {
    using namespace std::chrono;
    topo::test::manual_clock clock;
    topo::clock::mutex_type mutex;
    topo::clock::semaphore_type semaphore;
    std::atomic<int> count{0};
    bool running = true;
    topod::timer_set timers;
    timers.add("emit", seconds(10), [&count] () { ++count; });
    const auto start = clock.now() - seconds(9);
    std::thread thread([&] () {
        topo::clock::lock_type lock(mutex);
        timers.run(clock, start, lock, semaphore, [&running] () { return running; });
    });
    clock.advance(seconds(1));
    EXPECT_TRUE(eventually([&count] () { return count.load() == 1; }));
    {
        topo::clock::lock_type lock(mutex);
        EXPECT_TRUE(clock.now() + seconds(10) == timers.timers().front().next);
        running = false;
        semaphore.notify_all();
    }
    thread.join();
}

#ifndef TOPOLOGY_CORE_CLOCK_HH
#define TOPOLOGY_CORE_CLOCK_HH

#include <chrono>
#include <condition_variable>
#include <mutex>

namespace topo {

    /**
    \brief Source of wall-clock time and of timed waits.

    Every component that stamps entries or sleeps between periodic actions
    takes the time from a clock, so that tests can replace real time with
    simulated time.
    */
    class clock {

    public:
        using clock_type = std::chrono::system_clock;
        using time_point = clock_type::time_point;
        using duration = clock_type::duration;
        using mutex_type = std::mutex;
        using lock_type = std::unique_lock<mutex_type>;
        using semaphore_type = std::condition_variable;

    public:
        clock() = default;
        virtual ~clock() = default;
        clock(const clock&) = delete;
        clock& operator=(const clock&) = delete;
        clock(clock&&) = delete;
        clock& operator=(clock&&) = delete;

        virtual time_point now() const = 0;

        /**
        Blocks on the semaphore until it is notified or the time point is reached.
        Spurious wake-ups are allowed, the caller rechecks its condition.
        */
        virtual void wait_until(semaphore_type& semaphore, lock_type& lock, time_point t) = 0;

    };

    class system_clock: public clock {

    public:
        inline time_point now() const override { return clock_type::now(); }

        inline void
        wait_until(semaphore_type& semaphore, lock_type& lock, time_point t) override {
            semaphore.wait_until(lock, t);
        }

    };

    /// Clock shared by default by all components.
    clock& default_clock();

}

#endif // vim:filetype=cpp

#ifndef TOPOLOGY_DISCOVERY_SCHEDULER_HH
#define TOPOLOGY_DISCOVERY_SCHEDULER_HH

#include <functional>
#include <string>
#include <vector>

#include <topology/core/clock.hh>

namespace topod {

    /**
    \brief Periodic timers multiplexed on the calling thread.

    \link run \endlink waits for the earliest timer, calls its function with
    the lock released and reschedules it one period after the time it fired.
    Timers that are overdue by more than one period fire once.
    */
    class timer_set {

    public:
        using clock_type = topo::clock;
        using time_point = clock_type::time_point;
        using duration = clock_type::duration;
        using lock_type = clock_type::lock_type;
        using semaphore_type = clock_type::semaphore_type;
        using function_type = std::function<void()>;
        using predicate_type = std::function<bool()>;

        struct timer {
            std::string name;
            duration period{};
            time_point next{};
            function_type function;
        };

        using timer_array = std::vector<timer>;

    private:
        timer_array _timers;

    public:

        void add(std::string name, duration period, function_type function);

        /**
        Runs the timers while the predicate returns true. The predicate is
        checked with the lock held every time the thread wakes up.
        */
        void run(clock_type& clock, lock_type& lock, semaphore_type& semaphore,
                 predicate_type running);

        /// Same as above, but the first period of every timer is counted from \p start.
        void run(clock_type& clock, time_point start, lock_type& lock,
                 semaphore_type& semaphore, predicate_type running);

        inline const timer_array& timers() const noexcept { return this->_timers; }
        inline std::size_t size() const noexcept { return this->_timers.size(); }
        inline bool empty() const noexcept { return this->_timers.empty(); }
        inline void clear() { this->_timers.clear(); }

    };

}

#endif // vim:filetype=cpp

#ifndef TOPOLOGY_TEST_MANUAL_CLOCK_HH
#define TOPOLOGY_TEST_MANUAL_CLOCK_HH

#include <chrono>
#include <mutex>

#include <topology/core/clock.hh>

namespace topo {

    namespace test {

        /**
        \brief Clock that moves only when the test advances it.

        Waiting threads wake up every millisecond of real time to observe
        the simulated time. Time never moves by itself: a thread waiting for
        a later time point (a retry delay or the next timer) keeps waiting
        until the test calls \link advance \endlink or the semaphore is
        notified with the waiter's condition satisfied.
        */
        class manual_clock: public clock {

        private:
            time_point _now;
            mutable std::mutex _mutex;

        public:

            inline explicit manual_clock(time_point start=clock_type::now()): _now(start) {}

            inline time_point now() const override {
                std::lock_guard<std::mutex> lock(this->_mutex);
                return this->_now;
            }

            inline void advance(duration d) {
                std::lock_guard<std::mutex> lock(this->_mutex);
                this->_now += d;
            }

            inline void
            wait_until(semaphore_type& semaphore, lock_type& lock, time_point t) override {
                if (now() < t) { semaphore.wait_for(lock, std::chrono::milliseconds(1)); }
            }

        };

    }

}

#endif // vim:filetype=cpp

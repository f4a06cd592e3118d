#ifndef TOPOLOGY_TEST_TEST_HH
#define TOPOLOGY_TEST_TEST_HH

#include <chrono>
#include <thread>

namespace topo {

    namespace test {

        /// Polls the predicate until it returns true or the real-time limit is reached.
        template <class Predicate> bool
        eventually(Predicate pred, std::chrono::milliseconds limit=std::chrono::seconds(10)) {
            using clock_type = std::chrono::steady_clock;
            const auto deadline = clock_type::now() + limit;
            while (!pred()) {
                if (clock_type::now() > deadline) { return false; }
                std::this_thread::sleep_for(std::chrono::milliseconds(1));
            }
            return true;
        }

    }

}

#endif // vim:filetype=cpp

#include <algorithm>
#include <utility>

#include <unistdx/base/unlock_guard>

#include <topology/bits/contracts.hh>
#include <topology/core/error.hh>
#include <topology/discovery/scheduler.hh>

void topod::timer_set::add(std::string name, duration period, function_type function) {
    if (period <= duration::zero()) {
        topo::throw_error("non-positive period for timer ", name);
    }
    timer t;
    t.name = std::move(name);
    t.period = period;
    t.function = std::move(function);
    this->_timers.emplace_back(std::move(t));
}

void topod::timer_set::run(clock_type& clock, lock_type& lock, semaphore_type& semaphore,
                           predicate_type running) {
    run(clock, clock.now(), lock, semaphore, std::move(running));
}

void topod::timer_set::run(clock_type& clock, time_point start, lock_type& lock,
                           semaphore_type& semaphore, predicate_type running) {
    Expects(lock.owns_lock());
    for (auto& t : this->_timers) { t.next = start + t.period; }
    auto earlier = [] (const timer& a, const timer& b) { return a.next < b.next; };
    while (running()) {
        const auto now = clock.now();
        auto first = std::min_element(this->_timers.begin(), this->_timers.end(), earlier);
        if (first == this->_timers.end()) {
            clock.wait_until(semaphore, lock, now + std::chrono::hours(1));
        } else if (first->next <= now) {
            first->next = now + first->period;
            sys::unlock_guard<lock_type> g(lock);
            first->function();
        } else {
            clock.wait_until(semaphore, lock, first->next);
        }
    }
}

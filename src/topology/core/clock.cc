#include <topology/core/clock.hh>

topo::clock& topo::default_clock() {
    static system_clock instance;
    return instance;
}

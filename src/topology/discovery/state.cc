#include <ostream>
#include <type_traits>

#include <topology/discovery/state.hh>

const char* topod::to_string(states rhs) noexcept {
    using s = states;
    switch (rhs) {
        case s::disconnected: return "disconnected";
        case s::connected: return "connected";
        case s::pipeline_available: return "pipeline-available";
        case s::elected: return "elected";
        case s::ports_discovered: return "ports-discovered";
        case s::configured: return "configured";
        case s::reconfigured: return "reconfigured";
        case s::stopped: return "stopped";
        default: return nullptr;
    }
}

std::ostream& topod::operator<<(std::ostream& out, states rhs) {
    if (auto* s = to_string(rhs)) {
        out << s;
    } else {
        out << "unknown(";
        out << static_cast<std::underlying_type<states>::type>(rhs);
        out << ')';
    }
    return out;
}

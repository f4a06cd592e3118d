#include <algorithm>
#include <ostream>

#include <topology/discovery/port_monitor.hh>

auto topod::port_monitor::update(const port_array& ports) -> port_change_array {
    port_change_array changes;
    std::unordered_map<std::uint32_t,port> current;
    for (const auto& p : ports) {
        current[p.number] = p;
        auto result = this->_ports.find(p.number);
        if (result == this->_ports.end()) {
            changes.emplace_back(port_change{port{}, p});
        } else if (result->second.status != p.status ||
                   result->second.last_change != p.last_change) {
            changes.emplace_back(port_change{result->second, p});
        }
    }
    for (const auto& pair : this->_ports) {
        if (current.find(pair.first) == current.end()) {
            changes.emplace_back(port_change{pair.second, port{}});
        }
    }
    this->_ports.swap(current);
    std::sort(changes.begin(), changes.end(),
              [] (const port_change& a, const port_change& b) { return a.number() < b.number(); });
    return changes;
}

bool topod::port_monitor::up(std::uint32_t number) const {
    auto result = this->_ports.find(number);
    return result != this->_ports.end() && result->second.up();
}

std::ostream& topod::operator<<(std::ostream& out, const port_change& rhs) {
    out << "port " << rhs.number() << ": ";
    if (rhs.added()) { return out << "added " << rhs.current.status; }
    if (rhs.removed()) { return out << "removed"; }
    return out << rhs.previous.status << " -> " << rhs.current.status;
}

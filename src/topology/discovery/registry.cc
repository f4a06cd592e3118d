#include <ostream>
#include <type_traits>

#include <topology/discovery/registry.hh>

namespace {

    inline bool by_number(const topod::port& a, const topod::port& b) noexcept {
        return a.number < b.number;
    }

}

std::ostream& topod::operator<<(std::ostream& out, update_result rhs) {
    switch (rhs) {
        case update_result::added: return out << "added";
        case update_result::replaced: return out << "replaced";
        case update_result::refreshed: return out << "refreshed";
        default: return out << "unknown("
            << static_cast<std::underlying_type<update_result>::type>(rhs) << ')';
    }
}

void topod::port_registry::assign(const port_array& ports) {
    this->_ports.clear();
    for (const auto& p : ports) { this->_ports[p.id] = p; }
}

auto topod::port_registry::find(const std::string& id) const -> const port* {
    auto result = this->_ports.find(id);
    return result == this->_ports.end() ? nullptr : &result->second;
}

auto topod::port_registry::find(std::uint32_t number) const -> const port* {
    for (const auto& pair : this->_ports) {
        if (pair.second.number == number) { return &pair.second; }
    }
    return nullptr;
}

auto topod::port_registry::up_ports() const -> port_array {
    port_array result;
    for (const auto& pair : this->_ports) {
        if (pair.second.up()) { result.emplace_back(pair.second); }
    }
    std::sort(result.begin(), result.end(), by_number);
    return result;
}

auto topod::port_registry::snapshot() const -> port_array {
    port_array result;
    result.reserve(this->_ports.size());
    for (const auto& pair : this->_ports) { result.emplace_back(pair.second); }
    std::sort(result.begin(), result.end(), by_number);
    return result;
}

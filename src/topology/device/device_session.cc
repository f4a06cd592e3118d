#include <ostream>

#include <topology/device/device_session.hh>

std::ostream& topod::operator<<(std::ostream& out, const port& rhs) {
    return out << rhs.number << '(' << rhs.id << ' ' << rhs.status << ')';
}

std::ostream& topod::operator<<(std::ostream& out, const pipeline_config& rhs) {
    return out << rhs.name << " cookie " << rhs.cookie;
}

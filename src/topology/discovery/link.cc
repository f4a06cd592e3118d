#include <ostream>

#include <topology/discovery/link.hh>

std::ostream& topod::operator<<(std::ostream& out, const link& rhs) {
    return out << rhs.ingress_port << " <- " << rhs.egress_device << '/' << rhs.egress_port;
}

std::ostream& topod::operator<<(std::ostream& out, const host& rhs) {
    return out << rhs.mac << " <- " << rhs.ip << '/' << rhs.port;
}

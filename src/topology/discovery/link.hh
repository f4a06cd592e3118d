#ifndef TOPOLOGY_DISCOVERY_LINK_HH
#define TOPOLOGY_DISCOVERY_LINK_HH

#include <cstdint>
#include <iosfwd>
#include <string>
#include <vector>

#include <topology/core/clock.hh>

namespace topod {

    using time_point = topo::clock::time_point;

    /**
    \brief Directed edge: the local ingress port hears probes sent out of
    the egress port of the remote device.
    */
    struct link {
        std::uint32_t ingress_port = 0;
        std::uint32_t egress_port = 0;
        std::string egress_device;
        time_point last_update{};

        inline bool same_identity(const link& rhs) const noexcept {
            return this->egress_port == rhs.egress_port &&
                this->egress_device == rhs.egress_device;
        }
    };

    using link_array = std::vector<link>;

    std::ostream& operator<<(std::ostream& out, const link& rhs);

    /// Network interface of a host attached to one of the local ports.
    struct host {
        std::string mac;
        std::string ip;
        std::uint32_t port = 0;
        time_point last_update{};

        inline bool same_identity(const host& rhs) const noexcept {
            return this->mac == rhs.mac && this->ip == rhs.ip && this->port == rhs.port;
        }
    };

    using host_array = std::vector<host>;

    std::ostream& operator<<(std::ostream& out, const host& rhs);

}

#endif // vim:filetype=cpp

#ifndef TOPOLOGY_NET_HOST_HH
#define TOPOLOGY_NET_HOST_HH

#include <iosfwd>
#include <string>

#include <topology/net/ethernet.hh>

namespace topo {

    namespace net {

        /// Address pair of a host learned from its own signalling traffic.
        struct host_sighting {
            mac_address mac;
            std::string ip;
        };

        std::ostream& operator<<(std::ostream& out, const host_sighting& rhs);

        /// ARP request or reply with a non-zero sender protocol address.
        bool parse_arp(const byte_array& frame, host_sighting& result);

        /**
        DHCP client message (UDP to port 67). The address is taken from the
        "requested IP address" option or from ciaddr.
        */
        bool parse_dhcp(const byte_array& frame, host_sighting& result);

        /// Tries all host-originated frame types.
        bool parse_host(const byte_array& frame, host_sighting& result);

    }

}

#endif // vim:filetype=cpp

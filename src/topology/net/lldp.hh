#ifndef TOPOLOGY_NET_LLDP_HH
#define TOPOLOGY_NET_LLDP_HH

#include <cstdint>
#include <iosfwd>
#include <string>

#include <topology/net/ethernet.hh>

namespace topo {

    namespace net {

        /// Identity carried by a discovery probe: who sent it and out of which port.
        struct lldp_probe {
            std::string chassis_id;
            std::uint32_t port_number = 0;
            std::uint16_t ttl = 120;
        };

        std::ostream& operator<<(std::ostream& out, const lldp_probe& rhs);

        /// Nearest-bridge group address, never forwarded by 802.1D bridges.
        const mac_address& lldp_multicast_address() noexcept;

        byte_array make_lldp_frame(const lldp_probe& probe, const mac_address& source);

        /**
        \return false unless the frame is an LLDP frame with chassis id, port id
        and time-to-live TLVs and a numeric port id
        */
        bool parse_lldp(const byte_array& frame, lldp_probe& result);

    }

}

#endif // vim:filetype=cpp

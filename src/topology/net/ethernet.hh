#ifndef TOPOLOGY_NET_ETHERNET_HH
#define TOPOLOGY_NET_ETHERNET_HH

#include <array>
#include <cstdint>
#include <iosfwd>
#include <string>
#include <vector>

namespace topo {

    namespace net {

        using byte_array = std::vector<std::uint8_t>;

        class mac_address {

        public:
            using array_type = std::array<std::uint8_t,6>;

        private:
            array_type _bytes{};

        public:

            mac_address() = default;
            inline explicit mac_address(const array_type& rhs) noexcept: _bytes(rhs) {}
            explicit mac_address(const std::uint8_t* first) noexcept;

            inline const array_type& bytes() const noexcept { return this->_bytes; }
            inline const std::uint8_t* data() const noexcept { return this->_bytes.data(); }
            bool zero() const noexcept;
            inline bool multicast() const noexcept { return (this->_bytes[0] & 1) != 0; }
            std::string to_string() const;

            inline bool operator==(const mac_address& rhs) const noexcept {
                return this->_bytes == rhs._bytes;
            }

            inline bool operator!=(const mac_address& rhs) const noexcept {
                return !operator==(rhs);
            }

        };

        std::ostream& operator<<(std::ostream& out, const mac_address& rhs);

        enum class ether_types: std::uint16_t {
            ipv4 = 0x0800,
            arp = 0x0806,
            vlan = 0x8100,
            lldp = 0x88cc,
        };

        constexpr const std::size_t ethernet_header_size = 14;

        struct ethernet_header {
            mac_address destination;
            mac_address source;
            std::uint16_t type = 0;
            /// Offset of the first byte after the header (and VLAN tag).
            std::size_t payload = 0;

            inline bool is(ether_types rhs) const noexcept {
                return this->type == static_cast<std::uint16_t>(rhs);
            }
        };

        /// Parses the header skipping at most one 802.1Q tag.
        bool parse_ethernet(const byte_array& frame, ethernet_header& result) noexcept;

        void write_ethernet(byte_array& out, const mac_address& destination,
                            const mac_address& source, ether_types type);

        inline std::uint16_t read_u16(const std::uint8_t* p) noexcept {
            return static_cast<std::uint16_t>((p[0] << 8) | p[1]);
        }

        inline void write_u16(byte_array& out, std::uint16_t rhs) {
            out.push_back(static_cast<std::uint8_t>(rhs >> 8));
            out.push_back(static_cast<std::uint8_t>(rhs & 0xff));
        }

    }

}

#endif // vim:filetype=cpp

#include <ostream>
#include <sstream>

#include <unistdx/net/ipv4_address>

#include <topology/net/host.hh>

namespace {

    constexpr const std::size_t arp_size = 28;
    constexpr const std::uint8_t udp_protocol = 17;
    constexpr const std::uint16_t dhcp_server_port = 67;
    constexpr const std::size_t udp_header_size = 8;
    constexpr const std::size_t bootp_options = 240;
    constexpr const std::uint8_t bootp_request = 1;
    constexpr const std::uint8_t option_pad = 0;
    constexpr const std::uint8_t option_requested_address = 50;
    constexpr const std::uint8_t option_end = 255;
    constexpr const std::uint8_t magic_cookie[4] = {99, 130, 83, 99};

    inline sys::ipv4_address make_ipv4(const std::uint8_t* p) noexcept {
        return sys::ipv4_address{p[0], p[1], p[2], p[3]};
    }

    inline bool zero_ipv4(const std::uint8_t* p) noexcept {
        return p[0] == 0 && p[1] == 0 && p[2] == 0 && p[3] == 0;
    }

    std::string format_ipv4(const sys::ipv4_address& rhs) {
        std::stringstream tmp;
        tmp << rhs;
        return tmp.str();
    }

}

bool topo::net::parse_arp(const byte_array& frame, host_sighting& result) {
    ethernet_header header;
    if (!parse_ethernet(frame, header) || !header.is(ether_types::arp)) { return false; }
    if (frame.size() < header.payload + arp_size) { return false; }
    const auto* p = frame.data() + header.payload;
    const bool ethernet_ipv4 =
        read_u16(p) == 1 && read_u16(p+2) == static_cast<std::uint16_t>(ether_types::ipv4) &&
        p[4] == 6 && p[5] == 4;
    if (!ethernet_ipv4) { return false; }
    const auto* sender_ip = p+14;
    if (zero_ipv4(sender_ip)) { return false; }
    result.mac = mac_address(p+8);
    result.ip = format_ipv4(make_ipv4(sender_ip));
    return !result.mac.zero();
}

bool topo::net::parse_dhcp(const byte_array& frame, host_sighting& result) {
    ethernet_header header;
    if (!parse_ethernet(frame, header) || !header.is(ether_types::ipv4)) { return false; }
    const auto n = frame.size();
    std::size_t i = header.payload;
    if (n < i + 20) { return false; }
    const auto* ip = frame.data() + i;
    if ((ip[0] >> 4) != 4 || ip[9] != udp_protocol) { return false; }
    i += (ip[0] & 0xf) * 4;
    if (n < i + udp_header_size) { return false; }
    if (read_u16(frame.data()+i+2) != dhcp_server_port) { return false; }
    i += udp_header_size;
    if (n < i + bootp_options) { return false; }
    const auto* bootp = frame.data() + i;
    if (bootp[0] != bootp_request || bootp[2] != 6) { return false; }
    for (std::size_t j=0; j<4; ++j) {
        if (bootp[236+j] != magic_cookie[j]) { return false; }
    }
    const std::uint8_t* address = bootp+12;
    for (std::size_t j=i+bootp_options; j<n;) {
        const auto code = frame[j];
        if (code == option_end) { break; }
        if (code == option_pad) { ++j; continue; }
        if (j + 2 > n) { return false; }
        const std::size_t length = frame[j+1];
        if (j + 2 + length > n) { return false; }
        if (code == option_requested_address && length == 4) {
            address = frame.data()+j+2;
        }
        j += 2 + length;
    }
    if (zero_ipv4(address)) { return false; }
    result.mac = mac_address(bootp+28);
    result.ip = format_ipv4(make_ipv4(address));
    return !result.mac.zero();
}

bool topo::net::parse_host(const byte_array& frame, host_sighting& result) {
    return parse_arp(frame, result) || parse_dhcp(frame, result);
}

std::ostream& topo::net::operator<<(std::ostream& out, const host_sighting& rhs) {
    return out << rhs.mac << '/' << rhs.ip;
}

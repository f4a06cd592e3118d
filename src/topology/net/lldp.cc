#include <limits>
#include <ostream>
#include <string>

#include <topology/net/lldp.hh>

namespace {

    enum tlv_types: std::uint8_t {
        end_of_lldpdu = 0,
        chassis_id = 1,
        port_id = 2,
        time_to_live = 3,
    };

    enum id_subtypes: std::uint8_t {
        mac_address_subtype = 4,
        interface_name_subtype = 5,
        local_subtype = 7,
    };

    inline void write_tlv_header(topo::net::byte_array& out, std::uint8_t type, std::size_t length) {
        topo::net::write_u16(out, static_cast<std::uint16_t>((type << 9) | (length & 0x1ff)));
    }

    inline void write_id_tlv(topo::net::byte_array& out, std::uint8_t type,
                             std::uint8_t subtype, const std::string& id) {
        write_tlv_header(out, type, id.size() + 1);
        out.push_back(subtype);
        out.insert(out.end(), id.begin(), id.end());
    }

    inline bool parse_port_number(const std::uint8_t* first, std::size_t n,
                                  std::uint32_t& result) noexcept {
        if (n == 0 || n > 10) { return false; }
        std::uint64_t value = 0;
        for (std::size_t i=0; i<n; ++i) {
            const auto ch = first[i];
            if (ch < '0' || ch > '9') { return false; }
            value = value*10 + (ch - '0');
        }
        if (value > std::numeric_limits<std::uint32_t>::max()) { return false; }
        result = static_cast<std::uint32_t>(value);
        return true;
    }

}

const topo::net::mac_address& topo::net::lldp_multicast_address() noexcept {
    static const mac_address address{mac_address::array_type{{0x01,0x80,0xc2,0x00,0x00,0x0e}}};
    return address;
}

auto topo::net::make_lldp_frame(const lldp_probe& probe, const mac_address& source) -> byte_array {
    byte_array out;
    out.reserve(ethernet_header_size + probe.chassis_id.size() + 32);
    write_ethernet(out, lldp_multicast_address(), source, ether_types::lldp);
    write_id_tlv(out, chassis_id, local_subtype, probe.chassis_id);
    write_id_tlv(out, port_id, local_subtype, std::to_string(probe.port_number));
    write_tlv_header(out, time_to_live, 2);
    write_u16(out, probe.ttl);
    write_tlv_header(out, end_of_lldpdu, 0);
    return out;
}

bool topo::net::parse_lldp(const byte_array& frame, lldp_probe& result) {
    ethernet_header header;
    if (!parse_ethernet(frame, header) || !header.is(ether_types::lldp)) { return false; }
    bool has_chassis = false, has_port = false, has_ttl = false;
    std::size_t i = header.payload;
    const auto n = frame.size();
    const auto* p = frame.data();
    while (i + 2 <= n) {
        const auto h = read_u16(p+i);
        const std::uint8_t type = static_cast<std::uint8_t>(h >> 9);
        const std::size_t length = h & 0x1ff;
        i += 2;
        if (type == end_of_lldpdu) { break; }
        if (i + length > n) { return false; }
        const auto* value = p+i;
        switch (type) {
            case chassis_id:
                if (length < 2) { return false; }
                if (value[0] == mac_address_subtype && length == 7) {
                    result.chassis_id = mac_address(value+1).to_string();
                } else {
                    result.chassis_id.assign(value+1, value+length);
                }
                has_chassis = true;
                break;
            case port_id:
                if (length < 2) { return false; }
                if (value[0] != local_subtype && value[0] != interface_name_subtype) {
                    return false;
                }
                if (!parse_port_number(value+1, length-1, result.port_number)) { return false; }
                has_port = true;
                break;
            case time_to_live:
                if (length < 2) { return false; }
                result.ttl = read_u16(value);
                has_ttl = true;
                break;
            default:
                break;
        }
        i += length;
    }
    return has_chassis && has_port && has_ttl;
}

std::ostream& topo::net::operator<<(std::ostream& out, const lldp_probe& rhs) {
    return out << rhs.chassis_id << '/' << rhs.port_number;
}

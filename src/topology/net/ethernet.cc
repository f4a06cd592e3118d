#include <algorithm>
#include <iomanip>
#include <ostream>
#include <sstream>

#include <topology/net/ethernet.hh>

topo::net::mac_address::mac_address(const std::uint8_t* first) noexcept {
    std::copy_n(first, this->_bytes.size(), this->_bytes.begin());
}

bool topo::net::mac_address::zero() const noexcept {
    return std::all_of(this->_bytes.begin(), this->_bytes.end(),
                       [] (std::uint8_t b) { return b == 0; });
}

std::string topo::net::mac_address::to_string() const {
    std::stringstream tmp;
    tmp << *this;
    return tmp.str();
}

std::ostream& topo::net::operator<<(std::ostream& out, const mac_address& rhs) {
    std::ostringstream tmp;
    tmp << std::hex << std::setfill('0');
    const auto& b = rhs.bytes();
    for (std::size_t i=0; i<b.size(); ++i) {
        if (i != 0) { tmp << ':'; }
        tmp << std::setw(2) << static_cast<unsigned int>(b[i]);
    }
    return out << tmp.str();
}

bool topo::net::parse_ethernet(const byte_array& frame, ethernet_header& result) noexcept {
    if (frame.size() < ethernet_header_size) { return false; }
    const auto* p = frame.data();
    result.destination = mac_address(p);
    result.source = mac_address(p+6);
    result.type = read_u16(p+12);
    result.payload = ethernet_header_size;
    if (result.is(ether_types::vlan)) {
        if (frame.size() < ethernet_header_size + 4) { return false; }
        result.type = read_u16(p+16);
        result.payload += 4;
    }
    return true;
}

void topo::net::write_ethernet(byte_array& out, const mac_address& destination,
                               const mac_address& source, ether_types type) {
    out.insert(out.end(), destination.bytes().begin(), destination.bytes().end());
    out.insert(out.end(), source.bytes().begin(), source.bytes().end());
    write_u16(out, static_cast<std::uint16_t>(type));
}

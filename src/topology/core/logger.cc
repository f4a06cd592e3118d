#include <ostream>
#include <stdexcept>
#include <type_traits>

#include <topology/bits/string.hh>
#include <topology/core/logger.hh>

auto topo::string_to_level(std::string s) -> logger::levels {
    using l = logger::levels;
    bits::trim_both(s);
    bits::to_lower(s);
    if (s == "debug") { return l::debug; }
    if (s == "info") { return l::info; }
    if (s == "warning") { return l::warning; }
    if (s == "none") { return l::none; }
    throw std::invalid_argument("bad log level");
}

const char* topo::to_string(logger::levels rhs) noexcept {
    using l = logger::levels;
    switch (rhs) {
        case l::debug: return "debug";
        case l::info: return "info";
        case l::warning: return "warning";
        case l::none: return "none";
        default: return nullptr;
    }
}

std::ostream& topo::operator<<(std::ostream& out, logger::levels rhs) {
    if (auto* s = to_string(rhs)) {
        out << s;
    } else {
        out << "unknown(";
        out << static_cast<std::underlying_type<logger::levels>::type>(rhs);
        out << ')';
    }
    return out;
}

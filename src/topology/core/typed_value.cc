#include <ostream>
#include <limits>
#include <type_traits>

#include <topology/core/error.hh>
#include <topology/core/typed_value.hh>

namespace {

    inline void check_type(topo::typed_value::types expected, topo::typed_value::types actual) {
        if (expected != actual) {
            topo::throw_error("bad value type: expected ", expected, ", got ", actual);
        }
    }

}

std::int64_t topo::typed_value::int_value() const {
    // unsigned values that fit are accepted as well
    if (this->_type == types::uint_value &&
        this->_uint <= static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
        return static_cast<std::int64_t>(this->_uint);
    }
    check_type(types::int_value, this->_type);
    return this->_int;
}

std::uint64_t topo::typed_value::uint_value() const {
    if (this->_type == types::int_value && this->_int >= 0) {
        return static_cast<std::uint64_t>(this->_int);
    }
    check_type(types::uint_value, this->_type);
    return this->_uint;
}

bool topo::typed_value::bool_value() const {
    check_type(types::bool_value, this->_type);
    return this->_bool;
}

const std::string& topo::typed_value::string_value() const {
    check_type(types::string_value, this->_type);
    return this->_string;
}

bool topo::typed_value::operator==(const typed_value& rhs) const noexcept {
    if (this->_type != rhs._type) { return false; }
    switch (this->_type) {
        case types::none: return true;
        case types::int_value: return this->_int == rhs._int;
        case types::uint_value: return this->_uint == rhs._uint;
        case types::bool_value: return this->_bool == rhs._bool;
        case types::string_value: return this->_string == rhs._string;
        default: return false;
    }
}

const char* topo::to_string(typed_value::types rhs) noexcept {
    using t = typed_value::types;
    switch (rhs) {
        case t::none: return "none";
        case t::int_value: return "int";
        case t::uint_value: return "uint";
        case t::string_value: return "string";
        case t::bool_value: return "bool";
        default: return nullptr;
    }
}

std::ostream& topo::operator<<(std::ostream& out, typed_value::types rhs) {
    if (auto* s = to_string(rhs)) {
        out << s;
    } else {
        out << "unknown(";
        out << static_cast<std::underlying_type<typed_value::types>::type>(rhs);
        out << ')';
    }
    return out;
}

std::ostream& topo::operator<<(std::ostream& out, const typed_value& rhs) {
    using t = typed_value::types;
    switch (rhs.type()) {
        case t::int_value: out << rhs.int_value(); break;
        case t::uint_value: out << rhs.uint_value(); break;
        case t::bool_value: out << (rhs.bool_value() ? "true" : "false"); break;
        case t::string_value: out << '"' << rhs.string_value() << '"'; break;
        default: out << "<none>"; break;
    }
    return out;
}

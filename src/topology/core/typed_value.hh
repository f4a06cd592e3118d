#ifndef TOPOLOGY_CORE_TYPED_VALUE_HH
#define TOPOLOGY_CORE_TYPED_VALUE_HH

#include <cstdint>
#include <iosfwd>
#include <string>
#include <utility>

namespace topo {

    /// Scalar leaf value of the configuration tree.
    class typed_value {

    public:
        enum class types { none, int_value, uint_value, string_value, bool_value };

    private:
        types _type = types::none;
        union {
            std::int64_t _int;
            std::uint64_t _uint;
            bool _bool;
        };
        std::string _string;

    public:

        inline typed_value() noexcept: _int(0) {}
        inline static typed_value
        of_int(std::int64_t rhs) noexcept { typed_value v; v._type = types::int_value; v._int = rhs; return v; }
        inline static typed_value
        of_uint(std::uint64_t rhs) noexcept { typed_value v; v._type = types::uint_value; v._uint = rhs; return v; }
        inline static typed_value
        of_bool(bool rhs) noexcept { typed_value v; v._type = types::bool_value; v._bool = rhs; return v; }
        inline static typed_value
        of_string(std::string rhs) {
            typed_value v; v._type = types::string_value; v._string = std::move(rhs); return v;
        }

        ~typed_value() = default;
        typed_value(const typed_value&) = default;
        typed_value& operator=(const typed_value&) = default;
        typed_value(typed_value&&) = default;
        typed_value& operator=(typed_value&&) = default;

        inline types type() const noexcept { return this->_type; }
        inline bool empty() const noexcept { return this->_type == types::none; }

        /// \throws topo::error when the value is not an integer
        std::int64_t int_value() const;
        std::uint64_t uint_value() const;
        bool bool_value() const;
        const std::string& string_value() const;

        bool operator==(const typed_value& rhs) const noexcept;
        inline bool operator!=(const typed_value& rhs) const noexcept { return !operator==(rhs); }

    };

    const char* to_string(typed_value::types rhs) noexcept;
    std::ostream& operator<<(std::ostream& out, typed_value::types rhs);
    std::ostream& operator<<(std::ostream& out, const typed_value& rhs);

}

#endif // vim:filetype=cpp

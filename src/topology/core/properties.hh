#ifndef TOPOLOGY_CORE_PROPERTIES_HH
#define TOPOLOGY_CORE_PROPERTIES_HH

#include <chrono>
#include <cstdint>
#include <iosfwd>
#include <string>

namespace topo {

    /**
    \brief Reader of key=value property lists.

    Properties come from files (one pair per line, `#` starts a comment)
    or from command-line arguments (one pair per argument). Each parsed pair
    is passed to \link property \endlink which throws on unknown keys or
    malformed values.
    */
    class properties {

    public:

        properties() = default;
        virtual ~properties() = default;
        properties(const properties&) = default;
        properties& operator=(const properties&) = default;
        properties(properties&&) = default;
        properties& operator=(properties&&) = default;

        void open(const char* filename);
        inline void open(const std::string& filename) { open(filename.data()); }
        void read(std::istream& in, const char* filename);
        void read(int argc, const char** argv);
        inline void read(int argc, char** argv) { read(argc, const_cast<const char**>(argv)); }

        virtual void property(const std::string& key, const std::string& value) = 0;

    };

    bool string_to_bool(std::string s);

    class Duration: public std::chrono::system_clock::duration {
    public:
        using base_duration = std::chrono::system_clock::duration;
        using base_duration::duration;
        inline Duration(base_duration rhs) noexcept: base_duration(rhs) {}
    };

    auto string_to_duration(std::string s) -> Duration;
    std::istream& operator>>(std::istream& in, Duration& rhs);

    /// Whole seconds of a duration written as a property value, e.g. "-5s" is rejected.
    auto string_to_seconds(const std::string& s) -> std::int64_t;

    /// Writes one "key=value" line.
    void write_property(std::ostream& out, const char* key, const std::string& value);

}

#endif // vim:filetype=cpp

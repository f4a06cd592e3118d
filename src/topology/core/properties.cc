#include <cctype>
#include <chrono>
#include <fstream>
#include <ostream>
#include <sstream>
#include <stdexcept>
#include <string>

#include <topology/bits/string.hh>
#include <topology/core/properties.hh>

using topo::bits::to_lower;
using topo::bits::trim_both;
using topo::bits::trim_right;

namespace  {

    constexpr const char line_delimiter = '\n';
    constexpr const char word_delimiter = '=';
    constexpr const char comment_character = '#';

    /// Character-at-a-time parser of a single key=value pair.
    class pair_parser {

    public:
        enum class states { key, value, comment, finished };

    private:
        char _end_of_pair;
        char _comment;
        std::string _key, _value;
        states _state = states::key;
        bool _success = true;

    public:

        inline explicit pair_parser(char end_of_pair, char comment):
        _end_of_pair(end_of_pair), _comment(comment) {
            this->_key.reserve(128), this->_value.reserve(128);
        }

        inline void reset() {
            this->_key.clear(), this->_value.clear();
            this->_state = states::key;
            this->_success = true;
        }

        /// \return true when the pair is complete and no more characters are needed
        bool feed(char ch);

        inline bool complete() const noexcept {
            return this->_success && this->_state == states::finished;
        }

        inline bool empty() const noexcept { return this->_key.empty() && this->_value.empty(); }
        inline void fail() noexcept { this->_success = false; }
        inline std::string& key() noexcept { return this->_key; }
        inline std::string& value() noexcept { return this->_value; }

    };

    bool pair_parser::feed(char ch) {
        const bool end = ch == 0 || ch == this->_end_of_pair;
        switch (this->_state) {
            case states::key:
                if (end) { this->_success = false; return true; }
                if (this->_comment && ch == this->_comment) {
                    this->_state = states::comment;
                    this->_success = false;
                } else if (ch == word_delimiter) {
                    this->_state = states::value;
                } else if (!(this->_key.empty() && std::isspace(static_cast<unsigned char>(ch)))) {
                    this->_key += ch;
                }
                return false;
            case states::value:
                if (end) { this->_state = states::finished; return true; }
                if (this->_comment && ch == this->_comment) {
                    this->_state = states::comment;
                } else if (!(this->_value.empty() && std::isspace(static_cast<unsigned char>(ch)))) {
                    this->_value += ch;
                }
                return false;
            case states::comment:
                if (end) {
                    if (this->_success) { this->_state = states::finished; }
                    return true;
                }
                return false;
            default:
                return true;
        }
    }

}

void topo::properties::open(const char* filename) {
    std::ifstream in;
    in.open(filename);
    if (!in.is_open()) {
        std::stringstream msg;
        msg << "failed to open \"" << filename << '\"';
        throw std::runtime_error(msg.str());
    }
    read(in, filename);
}

void topo::properties::read(std::istream& in, const char* filename) {
    pair_parser parser(line_delimiter, comment_character);
    char ch = 0;
    for (int line_number=1; in.good(); ++line_number) {
        parser.reset();
        while (true) {
            if (!in.get(ch)) {
                if (in.bad()) { parser.fail(); }
                ch = 0;
            }
            if (parser.feed(ch)) { break; }
        }
        auto& key = parser.key();
        auto& value = parser.value();
        trim_right(key), trim_right(value);
        if (parser.complete()) {
            try {
                property(key, value);
            } catch (const std::exception& err) {
                std::stringstream msg;
                msg << filename << ':' << line_number << ": invalid \"" << key
                    << "\": " << err.what();
                throw std::runtime_error(msg.str());
            }
        } else if (!parser.empty()) {
            std::stringstream msg;
            msg << filename << ':' << line_number << ": invalid line, key=\"" << key
                << "\", value=\"" << value << '\"';
            throw std::runtime_error(msg.str());
        }
    }
}

void topo::properties::read(int argc, const char** argv) {
    pair_parser parser(' ', 0);
    for (int i=0; i<argc; ++i) {
        const char* s = argv[i];
        if (!s) { continue; }
        char ch = 0;
        do {
            parser.reset();
            while (!parser.feed(ch=*s++)) {}
            auto& key = parser.key();
            auto& value = parser.value();
            trim_right(key), trim_right(value);
            if (parser.complete()) {
                property(key, value);
            } else if (!parser.empty()) {
                std::stringstream msg;
                msg << "invalid property: key=\"" << key << "\", value=\"" << value << '\"';
                throw std::invalid_argument(msg.str());
            }
        } while (ch != 0);
    }
}

bool topo::string_to_bool(std::string s) {
    trim_both(s);
    to_lower(s);
    if (s == "yes" || s == "on" || s == "true" || s == "1") { return true; }
    if (s == "no" || s == "off" || s == "false" || s == "0") { return false; }
    throw std::invalid_argument("bad boolean");
}

namespace {

    template <class Unit>
    topo::Duration checked_duration(topo::Duration::rep value) {
        using namespace std::chrono;
        using d = topo::Duration::base_duration;
        constexpr const auto limit = duration_cast<Unit>(d::max()).count();
        if (value > limit) { throw std::out_of_range("duration is too large"); }
        return duration_cast<d>(Unit(value));
    }

}

auto topo::string_to_duration(std::string s) -> Duration {
    using namespace std::chrono;
    using days = std::chrono::duration<Duration::rep,std::ratio<60*60*24>>;
    trim_both(s);
    if (s.empty() || !std::isdigit(static_cast<unsigned char>(s.front()))) {
        throw std::invalid_argument("bad duration");
    }
    std::size_t i = 0, n = s.size();
    const Duration::rep value = std::stoll(s, &i);
    std::string suffix;
    if (i != n) { suffix = s.substr(i); }
    if (suffix == "ns") { return checked_duration<nanoseconds>(value); }
    if (suffix == "us") { return checked_duration<microseconds>(value); }
    if (suffix == "ms") { return checked_duration<milliseconds>(value); }
    if (suffix == "s" || suffix.empty()) { return checked_duration<seconds>(value); }
    if (suffix == "m") { return checked_duration<minutes>(value); }
    if (suffix == "h") { return checked_duration<hours>(value); }
    if (suffix == "d") { return checked_duration<days>(value); }
    std::stringstream tmp;
    tmp << "unknown duration suffix \"" << suffix << "\"";
    throw std::invalid_argument(tmp.str());
}

std::istream& topo::operator>>(std::istream& in, Duration& rhs) {
    std::string s; in >> s; rhs = string_to_duration(s); return in;
}

auto topo::string_to_seconds(const std::string& s) -> std::int64_t {
    using namespace std::chrono;
    return duration_cast<seconds>(string_to_duration(s)).count();
}

void topo::write_property(std::ostream& out, const char* key, const std::string& value) {
    out << key << word_delimiter << value << line_delimiter;
}

#ifndef TOPOLOGY_BITS_STRING_HH
#define TOPOLOGY_BITS_STRING_HH

#include <cctype>
#include <string>

namespace topo {

    namespace bits {

        inline void trim_right(std::string& s) {
            while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) {
                s.pop_back();
            }
        }

        inline void trim_left(std::string& s) {
            std::string::size_type i = 0;
            const auto n = s.size();
            for (; i<n && std::isspace(static_cast<unsigned char>(s[i])); ++i) {}
            s.erase(0, i);
        }

        inline void trim_both(std::string& s) {
            trim_right(s);
            trim_left(s);
        }

        inline void to_lower(std::string& s) {
            for (auto& ch : s) { ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch))); }
        }

        inline bool starts_with(const std::string& s, const char* prefix) noexcept {
            return s.compare(0, std::char_traits<char>::length(prefix), prefix) == 0;
        }

    }

}

#endif // vim:filetype=cpp

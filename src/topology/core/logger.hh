#ifndef TOPOLOGY_CORE_LOGGER_HH
#define TOPOLOGY_CORE_LOGGER_HH

#include <iosfwd>
#include <string>
#include <utility>

#include <unistdx/base/log_message>

namespace topo {

    /**
    \brief Named logging capability handed to the components that log.

    Messages use the `_` placeholder syntax of \c sys::log_message and are
    dropped when their level is below the logger's threshold.
    */
    class logger {

    public:
        enum class levels { debug, info, warning, none };

    private:
        std::string _name{"topo"};
        levels _level = levels::info;

    public:

        inline explicit logger(std::string name, levels level=levels::info):
        _name(std::move(name)), _level(level) {}

        logger() = default;
        ~logger() = default;
        logger(const logger&) = default;
        logger& operator=(const logger&) = default;
        logger(logger&&) = default;
        logger& operator=(logger&&) = default;

        inline const std::string& name() const noexcept { return this->_name; }
        inline levels level() const noexcept { return this->_level; }
        inline void level(levels rhs) noexcept { this->_level = rhs; }
        inline bool enabled(levels rhs) const noexcept {
            return rhs != levels::none && rhs >= this->_level;
        }

        template <class ... Args> inline void
        debug(const char* fmt, const Args& ... args) const {
            if (enabled(levels::debug)) { sys::log_message(this->_name.data(), fmt, args...); }
        }

        template <class ... Args> inline void
        info(const char* fmt, const Args& ... args) const {
            if (enabled(levels::info)) { sys::log_message(this->_name.data(), fmt, args...); }
        }

        template <class ... Args> inline void
        warning(const char* fmt, const Args& ... args) const {
            if (enabled(levels::warning)) {
                const std::string f = std::string("warning: ") + fmt;
                sys::log_message(this->_name.data(), f.data(), args...);
            }
        }

    };

    auto string_to_level(std::string s) -> logger::levels;
    const char* to_string(logger::levels rhs) noexcept;
    std::ostream& operator<<(std::ostream& out, logger::levels rhs);

}

#endif // vim:filetype=cpp

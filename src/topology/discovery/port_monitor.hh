#ifndef TOPOLOGY_DISCOVERY_PORT_MONITOR_HH
#define TOPOLOGY_DISCOVERY_PORT_MONITOR_HH

#include <iosfwd>
#include <unordered_map>
#include <vector>

#include <topology/device/device_session.hh>

namespace topod {

    /// Difference between two observations of the same port number.
    struct port_change {
        /// Empty status means that the port was not present.
        port previous;
        port current;

        inline bool added() const noexcept { return this->previous.status.empty(); }
        inline bool removed() const noexcept { return this->current.status.empty(); }
        inline bool went_down() const noexcept { return this->previous.up() && !this->current.up(); }
        inline bool went_up() const noexcept { return !this->previous.up() && this->current.up(); }
        inline std::uint32_t number() const noexcept {
            return removed() ? this->previous.number : this->current.number;
        }
    };

    using port_change_array = std::vector<port_change>;

    std::ostream& operator<<(std::ostream& out, const port_change& rhs);

    /**
    \brief Last known operational status of every port.

    Comparing a new enumeration with the previous one tells which ports went
    down, so that links behind them are dropped without waiting for them to
    age out.
    */
    class port_monitor {

    private:
        std::unordered_map<std::uint32_t,port> _ports;

    public:

        /// Records the enumeration and returns changes ordered by port number.
        port_change_array update(const port_array& ports);
        bool up(std::uint32_t number) const;
        inline std::size_t size() const noexcept { return this->_ports.size(); }
        inline void clear() { this->_ports.clear(); }

    };

}

#endif // vim:filetype=cpp

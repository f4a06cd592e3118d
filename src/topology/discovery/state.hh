#ifndef TOPOLOGY_DISCOVERY_STATE_HH
#define TOPOLOGY_DISCOVERY_STATE_HH

#include <iosfwd>

namespace topod {

    /// Lifecycle position of the discovery controller.
    enum class states {
        /// Initial state, no device session.
        disconnected = 0,
        /// Device session has been established.
        connected,
        /// Pipeline description has been obtained from the device.
        pipeline_available,
        /// This controller won the mastership arbitration.
        elected,
        /// Device ports have been enumerated.
        ports_discovered,
        /// Intercept rules are installed, steady-state discovery runs.
        configured,
        /// New configuration has been applied.
        reconfigured,
        /// Terminal state.
        stopped,
    };

    constexpr const int num_states = 8;

    const char* to_string(states rhs) noexcept;
    std::ostream& operator<<(std::ostream& out, states rhs);

}

#endif // vim:filetype=cpp

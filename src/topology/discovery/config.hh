#ifndef TOPOLOGY_DISCOVERY_CONFIG_HH
#define TOPOLOGY_DISCOVERY_CONFIG_HH

#include <cstdint>
#include <iosfwd>
#include <string>

#include <topology/core/logger.hh>
#include <topology/core/properties.hh>

namespace topod {

    /// Upper bound of every period in seconds (one year).
    constexpr const std::int64_t max_period = 365L*24L*60L*60L;

    /// Tunables of the discovery controller. All periods are in seconds.
    struct config {
        std::int64_t emit_frequency = 5;
        std::int64_t max_link_age = 30;
        std::int64_t pipeline_validation_frequency = 60;
        std::int64_t port_rediscovery_frequency = 60;
        std::int64_t link_prune_frequency = 2;
        std::int64_t max_host_age = 30*60;
        /// Emit probes as soon as the controller enters configured state.
        bool emit_on_configured = true;

        bool set(const char* key, const std::string& value);
        void write(std::ostream& out) const;
        /// \return true if every period is positive and at most \link max_period \endlink
        bool valid() const noexcept;

        bool operator==(const config& rhs) const noexcept;
        inline bool operator!=(const config& rhs) const noexcept { return !operator==(rhs); }
    };

    std::ostream& operator<<(std::ostream& out, const config& rhs);

    /// Properties file with the controller tunables.
    class config_file: public topo::properties {

    private:
        config& _config;

    public:
        inline explicit config_file(config& c): _config(c) {}
        void property(const std::string& key, const std::string& value) override;

    };

    /**
    Reads the tunables from the file. Missing or malformed file is not an
    error: the warning is logged and the defaults are returned.
    */
    config load_config(const std::string& filename, const topo::logger& log);

    /// \return false if the file could not be written
    bool save_config(const std::string& filename, const config& c, const topo::logger& log);

}

#endif // vim:filetype=cpp

#ifndef TOPOLOGY_DISCOVERY_CONTROLLER_HH
#define TOPOLOGY_DISCOVERY_CONTROLLER_HH

#include <cstdint>
#include <shared_mutex>
#include <string>
#include <thread>

#include <topology/core/clock.hh>
#include <topology/core/config_tree.hh>
#include <topology/core/configurable.hh>
#include <topology/core/logger.hh>
#include <topology/core/properties.hh>
#include <topology/device/device_session.hh>
#include <topology/discovery/config.hh>
#include <topology/discovery/link.hh>
#include <topology/discovery/port_monitor.hh>
#include <topology/discovery/registry.hh>
#include <topology/discovery/state.hh>
#include <topology/discovery/tree_exporter.hh>

#if !defined(TOPOD_CONFIG_FILE)
#define TOPOD_CONFIG_FILE "/etc/topod/topod.properties"
#endif

namespace topod {

    /**
    \brief Discovers links and hosts attached to one programmable switch.

    The worker thread drives the device session from \c disconnected to
    \c configured and then runs the periodic timers. The listener thread
    classifies punted frames. Registries, tunables and the state are guarded
    by one read/write lock.

    Tree notifications are published with the lock held. Subscribers must
    not call back into the controller from the notification thread.
    */
    class controller: public topo::configurable, public topo::exportable {

    public:
        struct properties {
            std::string agent_id{"topod"};
            /// Tunables file. Empty name disables loading and saving.
            std::string config_file{TOPOD_CONFIG_FILE};
            election_id election = 1;
            topo::Duration min_retry_delay = std::chrono::milliseconds(100);
            topo::Duration max_retry_delay = std::chrono::seconds(5);
            bool set(const char* key, const std::string& value);
        };

        using clock_type = topo::clock;
        using time_point = clock_type::time_point;
        using duration = clock_type::duration;
        using link_registry = registry<std::uint32_t,link>;
        using host_registry = registry<std::string,host>;

    private:
        using shared_mutex_type = std::shared_timed_mutex;
        using shared_lock_type = std::shared_lock<shared_mutex_type>;
        using unique_lock_type = std::unique_lock<shared_mutex_type>;
        using mutex_type = clock_type::mutex_type;
        using lock_type = clock_type::lock_type;
        using semaphore_type = clock_type::semaphore_type;
        using handler_type = void (controller::*)();

    private:
        device_session& _device;
        properties _properties;
        topo::logger _log;
        clock_type& _clock;
        topo::config_tree _tree;
        tree_exporter _exporter;
        states _state = states::disconnected;
        config _config;
        link_registry _links;
        host_registry _hosts;
        port_registry _ports;
        port_monitor _monitor;
        pipeline_config _pipeline;
        mutable shared_mutex_type _lock;
        /// Serialises reading, validating and saving of the "config/" subtree.
        mutex_type _config_mutex;
        /// Wakes up the timers and the retry delays.
        mutex_type _mutex;
        semaphore_type _semaphore;
        bool _stopped = false;
        duration _retry_delay{};
        bool _listening = false;
        std::thread _worker;
        std::thread _listener;

        static const handler_type _handlers[num_states];

    public:

        explicit controller(device_session& device);
        controller(device_session& device, const properties& props,
                   topo::logger log=topo::logger("discovery"),
                   clock_type& clock=topo::default_clock());
        ~controller();

        controller(const controller&) = delete;
        controller& operator=(const controller&) = delete;
        controller(controller&&) = delete;
        controller& operator=(controller&&) = delete;

        /// Starts the worker thread and returns.
        void start();
        /// Switches to \c stopped, cancels all waits and closes the session.
        void stop();
        /// Waits for the worker and the listener to finish.
        void wait();
        /// Runs the handler of the current state once.
        void step();

        states state() const;
        /// Forces the state. Nothing leaves \c stopped.
        void state(states rhs);
        /// Switches to the new state only if the current state equals the condition.
        bool state_if(states condition, states rhs);

        /// Links ordered by ingress port.
        link_array links() const;
        /// Hosts ordered by MAC address.
        host_array hosts() const;
        port_array ports() const;
        config current_config() const;
        pipeline_config pipeline() const;

        update_result update_link(std::uint32_t ingress_port, std::uint32_t egress_port,
                                  const std::string& egress_device);
        update_result update_host(const std::string& mac, const std::string& ip,
                                  std::uint32_t port);
        /// Removes links older than the maximal link age.
        std::size_t prune_links();
        /// Removes hosts older than the maximal host age.
        std::size_t prune_hosts();
        /// Classifies the frame and updates the link or the host.
        void handle_packet(const packet_in& packet);

        /// Sends one probe out of every operational port.
        void emit_probes();
        /// Enumerates device ports and evicts links behind ports that went down.
        void discover_ports();
        /// Moves back to \c connected if the pipeline has changed.
        void validate_pipeline();

        void update_config() override;
        void refresh_config() override;

        inline topo::config_tree& tree() noexcept override { return this->_tree; }
        inline const topo::config_tree& tree() const noexcept override { return this->_tree; }
        inline clock_type& tree_clock() const noexcept override { return this->_clock; }

        inline const properties& agent_properties() const noexcept { return this->_properties; }
        inline const topo::logger& log() const noexcept { return this->_log; }

    private:

        void run();
        void listen();
        void pause(duration d);
        void notify();
        void start_listener();

        void on_disconnected();
        void on_connected();
        void on_pipeline_available();
        void on_elected();
        void on_ports_discovered();
        void on_configured();
        void on_reconfigured();
        void on_stopped();

    };

}

#endif // vim:filetype=cpp

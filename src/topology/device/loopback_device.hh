#ifndef TOPOLOGY_DEVICE_LOOPBACK_DEVICE_HH
#define TOPOLOGY_DEVICE_LOOPBACK_DEVICE_HH

#include <condition_variable>
#include <deque>
#include <mutex>
#include <string>
#include <unordered_map>

#include <topology/device/device_session.hh>

namespace topod {

    /**
    \brief In-process switch that implements the device session.

    Ports of two loopback devices can be wired together: a frame emitted out
    of one end arrives as a packet-in at the other end, provided that both
    ports are up. Failures of each operation can be injected to exercise the
    retry paths of the controller.
    */
    class loopback_device: public device_session {

    private:
        using mutex_type = std::mutex;
        using lock_type = std::unique_lock<mutex_type>;
        using semaphore_type = std::condition_variable;

        struct wire_end {
            loopback_device* peer = nullptr;
            std::uint32_t peer_port = 0;
        };

        using wire_table = std::unordered_map<std::uint32_t,wire_end>;

    private:
        std::string _name;
        port_array _ports;
        pipeline_config _pipeline;
        wire_table _wires;
        std::deque<packet_in> _inbox;
        packet_out_array _emitted;
        std::size_t _max_emitted = 1024;
        election_id _election_id = 0;
        int _connect_failures = 0;
        int _pipeline_failures = 0;
        int _port_failures = 0;
        int _arbitration_losses = 0;
        int _rule_failures = 0;
        int _num_connects = 0;
        int _num_rule_installs = 0;
        bool _connected = false;
        bool _master = false;
        bool _closed = false;
        mutable mutex_type _mutex;
        semaphore_type _semaphore;

    public:

        explicit loopback_device(std::string name);
        ~loopback_device() = default;

        inline const std::string& name() const noexcept { return this->_name; }

        /// Replaces all ports.
        void ports(port_array rhs);
        /// \return false if there is no such port
        bool port_status(std::uint32_t number, const std::string& status);
        void pipeline(pipeline_config rhs);

        void fail_connect(int n);
        void fail_pipeline(int n);
        void fail_ports(int n);
        void lose_arbitration(int n);
        void fail_rules(int n);

        /// Connects the port of this device and the port of the peer in both directions.
        void wire(std::uint32_t port, loopback_device& peer, std::uint32_t peer_port);
        /// Queues the frame as if it was punted by the device.
        void inject(packet_in packet);

        packet_out_array emitted() const;
        void clear_emitted();
        int num_connects() const;
        int num_rule_installs() const;
        bool master() const;
        election_id master_id() const;
        bool closed() const;

        void connect() override;
        pipeline_config pipeline() override;
        bool arbitrate(election_id id) override;
        port_array ports() override;
        void install_intercept_rules() override;
        void emit(const packet_out& packet) override;
        bool receive(packet_in& packet) override;
        void close() override;

    private:

        void check_connected(const char* operation) const;
        bool port_up(std::uint32_t number) const;
        void deliver(std::uint32_t port, const topo::net::byte_array& payload);

    };

}

#endif // vim:filetype=cpp

#ifndef TOPOLOGY_DEVICE_DEVICE_SESSION_HH
#define TOPOLOGY_DEVICE_DEVICE_SESSION_HH

#include <cstdint>
#include <iosfwd>
#include <string>
#include <vector>

#include <topology/core/error.hh>
#include <topology/net/ethernet.hh>

namespace topod {

    /**
    \brief Transient failure of a device-control operation. The caller retries.

    The message has the form "<device>: <operation>: <reason>".
    */
    class device_error: public topo::error {

    private:
        std::string _device;
        std::string _operation;

    public:
        inline
        device_error(const std::string& device, const char* operation, const std::string& reason):
        topo::error(device.data(), ": ", operation, ": ", reason),
        _device(device), _operation(operation) {}

        inline const std::string& device() const noexcept { return this->_device; }
        inline const std::string& operation() const noexcept { return this->_operation; }

    };

    /// Switch port as reported by the device.
    struct port {
        std::string id;
        std::uint32_t number = 0;
        /// Operational status, e.g. "UP" or "DOWN".
        std::string status;
        /// Device-reported change counter, not wall-clock time.
        std::uint64_t last_change = 0;

        inline bool up() const noexcept { return this->status == "UP"; }

        inline bool operator==(const port& rhs) const noexcept {
            return this->id == rhs.id && this->number == rhs.number &&
                this->status == rhs.status && this->last_change == rhs.last_change;
        }

        inline bool operator!=(const port& rhs) const noexcept { return !operator==(rhs); }
    };

    using port_array = std::vector<port>;

    std::ostream& operator<<(std::ostream& out, const port& rhs);

    /// Description of the forwarding program loaded into the device.
    struct pipeline_config {
        std::string name;
        std::uint64_t cookie = 0;
        std::string info;

        inline bool operator==(const pipeline_config& rhs) const noexcept {
            return this->name == rhs.name && this->cookie == rhs.cookie && this->info == rhs.info;
        }

        inline bool operator!=(const pipeline_config& rhs) const noexcept {
            return !operator==(rhs);
        }
    };

    std::ostream& operator<<(std::ostream& out, const pipeline_config& rhs);

    using election_id = std::uint64_t;

    /// Frame punted by the device to the controller.
    struct packet_in {
        std::uint32_t ingress_port = 0;
        topo::net::byte_array payload;
    };

    /// Frame sent by the controller out of a device port.
    struct packet_out {
        std::uint32_t egress_port = 0;
        topo::net::byte_array payload;
    };

    using packet_out_array = std::vector<packet_out>;

    /**
    \brief Control session to one programmable forwarding device.

    All operations may block until the device answers and throw
    \link device_error \endlink on failure. \link close \endlink may be called
    from any thread and makes every blocked operation return promptly.
    */
    class device_session {

    public:
        device_session() = default;
        virtual ~device_session() = default;
        device_session(const device_session&) = delete;
        device_session& operator=(const device_session&) = delete;
        device_session(device_session&&) = delete;
        device_session& operator=(device_session&&) = delete;

        virtual void connect() = 0;
        virtual pipeline_config pipeline() = 0;
        /// \return true if this controller became the master of the device
        virtual bool arbitrate(election_id id) = 0;
        virtual port_array ports() = 0;
        /// Installs the rules that punt probe and host traffic to the controller.
        virtual void install_intercept_rules() = 0;
        virtual void emit(const packet_out& packet) = 0;
        /// \return false when the session has been closed
        virtual bool receive(packet_in& packet) = 0;
        virtual void close() = 0;

    };

}

#endif // vim:filetype=cpp

#include <algorithm>

#include <topology/device/loopback_device.hh>

topod::loopback_device::loopback_device(std::string name):
_name(std::move(name)) {
    this->_pipeline.name = "loopback";
    this->_pipeline.cookie = 1;
}

void topod::loopback_device::ports(port_array rhs) {
    lock_type lock(this->_mutex);
    this->_ports = std::move(rhs);
}

bool topod::loopback_device::port_status(std::uint32_t number, const std::string& status) {
    lock_type lock(this->_mutex);
    for (auto& p : this->_ports) {
        if (p.number == number) {
            if (p.status != status) {
                p.status = status;
                ++p.last_change;
            }
            return true;
        }
    }
    return false;
}

void topod::loopback_device::pipeline(pipeline_config rhs) {
    lock_type lock(this->_mutex);
    this->_pipeline = std::move(rhs);
}

void topod::loopback_device::fail_connect(int n) {
    lock_type lock(this->_mutex);
    this->_connect_failures = n;
}

void topod::loopback_device::fail_pipeline(int n) {
    lock_type lock(this->_mutex);
    this->_pipeline_failures = n;
}

void topod::loopback_device::fail_ports(int n) {
    lock_type lock(this->_mutex);
    this->_port_failures = n;
}

void topod::loopback_device::lose_arbitration(int n) {
    lock_type lock(this->_mutex);
    this->_arbitration_losses = n;
}

void topod::loopback_device::fail_rules(int n) {
    lock_type lock(this->_mutex);
    this->_rule_failures = n;
}

void topod::loopback_device::wire(std::uint32_t port, loopback_device& peer,
                                  std::uint32_t peer_port) {
    {
        lock_type lock(this->_mutex);
        this->_wires[port] = wire_end{&peer, peer_port};
    }
    lock_type lock(peer._mutex);
    peer._wires[peer_port] = wire_end{this, port};
}

void topod::loopback_device::inject(packet_in packet) {
    lock_type lock(this->_mutex);
    if (this->_closed) { return; }
    this->_inbox.emplace_back(std::move(packet));
    this->_semaphore.notify_all();
}

auto topod::loopback_device::emitted() const -> packet_out_array {
    lock_type lock(this->_mutex);
    return this->_emitted;
}

void topod::loopback_device::clear_emitted() {
    lock_type lock(this->_mutex);
    this->_emitted.clear();
}

int topod::loopback_device::num_connects() const {
    lock_type lock(this->_mutex);
    return this->_num_connects;
}

int topod::loopback_device::num_rule_installs() const {
    lock_type lock(this->_mutex);
    return this->_num_rule_installs;
}

bool topod::loopback_device::master() const {
    lock_type lock(this->_mutex);
    return this->_master;
}

auto topod::loopback_device::master_id() const -> election_id {
    lock_type lock(this->_mutex);
    return this->_election_id;
}

bool topod::loopback_device::closed() const {
    lock_type lock(this->_mutex);
    return this->_closed;
}

void topod::loopback_device::connect() {
    lock_type lock(this->_mutex);
    if (this->_closed) { throw device_error(this->_name, "connect", "session is closed"); }
    if (this->_connect_failures > 0) {
        --this->_connect_failures;
        throw device_error(this->_name, "connect", "connection refused");
    }
    this->_connected = true;
    ++this->_num_connects;
}

auto topod::loopback_device::pipeline() -> pipeline_config {
    lock_type lock(this->_mutex);
    check_connected("pipeline");
    if (this->_pipeline_failures > 0) {
        --this->_pipeline_failures;
        throw device_error(this->_name, "pipeline", "pipeline config is not available");
    }
    return this->_pipeline;
}

bool topod::loopback_device::arbitrate(election_id id) {
    lock_type lock(this->_mutex);
    check_connected("arbitrate");
    if (this->_arbitration_losses > 0) {
        --this->_arbitration_losses;
        this->_master = false;
        return false;
    }
    this->_master = true;
    this->_election_id = id;
    return true;
}

auto topod::loopback_device::ports() -> port_array {
    lock_type lock(this->_mutex);
    check_connected("ports");
    if (this->_port_failures > 0) {
        --this->_port_failures;
        throw device_error(this->_name, "ports", "port enumeration failed");
    }
    return this->_ports;
}

void topod::loopback_device::install_intercept_rules() {
    lock_type lock(this->_mutex);
    check_connected("install-rules");
    if (!this->_master) { throw device_error(this->_name, "install-rules", "not the master"); }
    if (this->_rule_failures > 0) {
        --this->_rule_failures;
        throw device_error(this->_name, "install-rules", "rule installation failed");
    }
    ++this->_num_rule_installs;
}

void topod::loopback_device::emit(const packet_out& packet) {
    wire_end end;
    {
        lock_type lock(this->_mutex);
        check_connected("emit");
        if (!this->_master) { throw device_error(this->_name, "emit", "not the master"); }
        if (this->_emitted.size() == this->_max_emitted) {
            this->_emitted.erase(this->_emitted.begin());
        }
        this->_emitted.emplace_back(packet);
        if (!port_up(packet.egress_port)) { return; }
        auto result = this->_wires.find(packet.egress_port);
        if (result == this->_wires.end()) { return; }
        end = result->second;
    }
    end.peer->deliver(end.peer_port, packet.payload);
}

bool topod::loopback_device::receive(packet_in& packet) {
    lock_type lock(this->_mutex);
    this->_semaphore.wait(lock, [this] () { return this->_closed || !this->_inbox.empty(); });
    if (this->_closed) { return false; }
    packet = std::move(this->_inbox.front());
    this->_inbox.pop_front();
    return true;
}

void topod::loopback_device::close() {
    lock_type lock(this->_mutex);
    this->_closed = true;
    this->_connected = false;
    this->_master = false;
    this->_inbox.clear();
    this->_semaphore.notify_all();
}

void topod::loopback_device::check_connected(const char* operation) const {
    if (this->_closed) { throw device_error(this->_name, operation, "session is closed"); }
    if (!this->_connected) { throw device_error(this->_name, operation, "not connected"); }
}

bool topod::loopback_device::port_up(std::uint32_t number) const {
    return std::any_of(this->_ports.begin(), this->_ports.end(),
                       [number] (const port& p) { return p.number == number && p.up(); });
}

void topod::loopback_device::deliver(std::uint32_t port, const topo::net::byte_array& payload) {
    lock_type lock(this->_mutex);
    if (this->_closed || !port_up(port)) { return; }
    packet_in packet;
    packet.ingress_port = port;
    packet.payload = payload;
    this->_inbox.emplace_back(std::move(packet));
    this->_semaphore.notify_all();
}

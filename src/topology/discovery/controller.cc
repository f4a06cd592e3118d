#include <algorithm>
#include <cstring>
#include <exception>
#include <string>

#include <topology/bits/contracts.hh>
#include <topology/discovery/controller.hh>
#include <topology/discovery/scheduler.hh>
#include <topology/net/host.hh>
#include <topology/net/lldp.hh>

namespace {

    inline bool by_ingress_port(const topod::link& a, const topod::link& b) noexcept {
        return a.ingress_port < b.ingress_port;
    }

    inline bool by_mac(const topod::host& a, const topod::host& b) noexcept {
        return a.mac < b.mac;
    }

    /// Locally administered address derived from the port number.
    topo::net::mac_address probe_source(std::uint32_t port) {
        topo::net::mac_address::array_type bytes{{
            0x02, 0x00,
            static_cast<std::uint8_t>((port >> 24) & 0xff),
            static_cast<std::uint8_t>((port >> 16) & 0xff),
            static_cast<std::uint8_t>((port >> 8) & 0xff),
            static_cast<std::uint8_t>(port & 0xff)
        }};
        return topo::net::mac_address(bytes);
    }

}

bool topod::controller::properties::set(const char* key, const std::string& value) {
    bool found = true;
    if (std::strcmp(key, "agent.id") == 0) {
        agent_id = value;
    } else if (std::strcmp(key, "agent.config-file") == 0) {
        config_file = value;
    } else if (std::strcmp(key, "agent.election-id") == 0) {
        election = std::stoull(value);
    } else if (std::strcmp(key, "retry.min-delay") == 0) {
        min_retry_delay = topo::string_to_duration(value);
    } else if (std::strcmp(key, "retry.max-delay") == 0) {
        max_retry_delay = topo::string_to_duration(value);
    } else {
        found = false;
    }
    return found;
}

const topod::controller::handler_type topod::controller::_handlers[num_states] = {
    &controller::on_disconnected,
    &controller::on_connected,
    &controller::on_pipeline_available,
    &controller::on_elected,
    &controller::on_ports_discovered,
    &controller::on_configured,
    &controller::on_reconfigured,
    &controller::on_stopped,
};

topod::controller::controller(device_session& device):
controller(device, properties{}) {}

topod::controller::controller(device_session& device, const properties& props,
                              topo::logger log, clock_type& clock):
_device(device), _properties(props), _log(std::move(log)), _clock(clock),
_exporter(_tree, _clock), _retry_delay(props.min_retry_delay) {
    if (!this->_properties.config_file.empty()) {
        this->_config = load_config(this->_properties.config_file, this->_log);
    }
    this->_exporter.populate(this->_properties.agent_id, this->_config);
}

topod::controller::~controller() {
    stop();
    wait();
}

void topod::controller::start() {
    this->_worker = std::thread([this] () { this->run(); });
}

void topod::controller::stop() {
    {
        lock_type lock(this->_mutex);
        this->_stopped = true;
    }
    state(states::stopped);
    this->_device.close();
}

void topod::controller::wait() {
    if (this->_worker.joinable()) { this->_worker.join(); }
    if (this->_listener.joinable()) { this->_listener.join(); }
}

void topod::controller::step() {
    const auto s = state();
    Assert(static_cast<int>(s) < num_states);
    (this->*_handlers[static_cast<int>(s)])();
}

auto topod::controller::state() const -> states {
    shared_lock_type lock(this->_lock);
    return this->_state;
}

void topod::controller::state(states rhs) {
    states old;
    {
        unique_lock_type lock(this->_lock);
        old = this->_state;
        if (old == states::stopped || old == rhs) { return; }
        this->_state = rhs;
    }
    log().info("state _ -> _", old, rhs);
    notify();
}

bool topod::controller::state_if(states condition, states rhs) {
    {
        unique_lock_type lock(this->_lock);
        if (this->_state != condition || condition == states::stopped) { return false; }
        this->_state = rhs;
    }
    log().info("state _ -> _", condition, rhs);
    notify();
    return true;
}

auto topod::controller::links() const -> link_array {
    shared_lock_type lock(this->_lock);
    return this->_links.snapshot(by_ingress_port);
}

auto topod::controller::hosts() const -> host_array {
    shared_lock_type lock(this->_lock);
    return this->_hosts.snapshot(by_mac);
}

auto topod::controller::ports() const -> port_array {
    shared_lock_type lock(this->_lock);
    return this->_ports.snapshot();
}

auto topod::controller::current_config() const -> config {
    shared_lock_type lock(this->_lock);
    return this->_config;
}

auto topod::controller::pipeline() const -> pipeline_config {
    shared_lock_type lock(this->_lock);
    return this->_pipeline;
}

auto topod::controller::update_link(std::uint32_t ingress_port, std::uint32_t egress_port,
                                    const std::string& egress_device) -> update_result {
    link l;
    l.ingress_port = ingress_port;
    l.egress_port = egress_port;
    l.egress_device = egress_device;
    unique_lock_type lock(this->_lock);
    const auto result = this->_links.update(ingress_port, std::move(l), this->_clock.now());
    if (result != update_result::refreshed) {
        const auto& current = *this->_links.find(ingress_port);
        log().info("_ link _", result, current);
        this->_exporter.add_link(current);
    }
    return result;
}

auto topod::controller::update_host(const std::string& mac, const std::string& ip,
                                    std::uint32_t port) -> update_result {
    host h;
    h.mac = mac;
    h.ip = ip;
    h.port = port;
    unique_lock_type lock(this->_lock);
    const auto result = this->_hosts.update(mac, std::move(h), this->_clock.now());
    if (result != update_result::refreshed) {
        const auto& current = *this->_hosts.find(mac);
        log().info("_ host _", result, current);
        this->_exporter.add_host(current);
    }
    return result;
}

std::size_t topod::controller::prune_links() {
    unique_lock_type lock(this->_lock);
    const auto limit = this->_clock.now() - std::chrono::seconds(this->_config.max_link_age);
    return this->_links.prune(limit, [this] (const link& l) {
        log().info("pruned link _", l);
        this->_exporter.remove_link(l.ingress_port);
    });
}

std::size_t topod::controller::prune_hosts() {
    unique_lock_type lock(this->_lock);
    const auto limit = this->_clock.now() - std::chrono::seconds(this->_config.max_host_age);
    return this->_hosts.prune(limit, [this] (const host& h) {
        log().info("pruned host _", h);
        this->_exporter.remove_host(h.mac);
    });
}

void topod::controller::handle_packet(const packet_in& packet) {
    topo::net::lldp_probe probe;
    if (topo::net::parse_lldp(packet.payload, probe)) {
        update_link(packet.ingress_port, probe.port_number, probe.chassis_id);
        return;
    }
    topo::net::host_sighting sighting;
    if (topo::net::parse_host(packet.payload, sighting)) {
        update_host(sighting.mac.to_string(), sighting.ip, packet.ingress_port);
    }
}

void topod::controller::emit_probes() {
    port_array ports;
    {
        shared_lock_type lock(this->_lock);
        ports = this->_ports.up_ports();
    }
    topo::net::lldp_probe probe;
    probe.chassis_id = this->_properties.agent_id;
    for (const auto& p : ports) {
        probe.port_number = p.number;
        packet_out packet;
        packet.egress_port = p.number;
        packet.payload = topo::net::make_lldp_frame(probe, probe_source(p.number));
        this->_device.emit(packet);
    }
    log().debug("emitted _ probes", ports.size());
}

void topod::controller::discover_ports() {
    const auto ports = this->_device.ports();
    unique_lock_type lock(this->_lock);
    this->_ports.assign(ports);
    for (const auto& change : this->_monitor.update(ports)) {
        log().debug("_", change);
        if (!change.went_down() && !change.removed()) { continue; }
        const auto number = change.number();
        if (this->_links.remove(number)) {
            log().info("removed link at port _: port is down", number);
            this->_exporter.remove_link(number);
        }
    }
}

void topod::controller::validate_pipeline() {
    const auto current = this->_device.pipeline();
    const auto previous = pipeline();
    if (current != previous) {
        log().warning("pipeline has changed from _ to _", previous, current);
        state_if(states::configured, states::connected);
    }
}

void topod::controller::update_config() {
    lock_type config_lock(this->_config_mutex);
    config c;
    try {
        this->_exporter.read(c);
    } catch (const std::exception& err) {
        log().warning("rejected configuration update: _", err.what());
        this->_exporter.write(current_config());
        return;
    }
    if (!c.valid()) {
        log().warning("rejected configuration update: _", c);
        this->_exporter.write(current_config());
        return;
    }
    {
        unique_lock_type lock(this->_lock);
        this->_config = c;
    }
    log().info("new configuration: _", c);
    if (!this->_properties.config_file.empty()) {
        save_config(this->_properties.config_file, c, this->_log);
    }
    state_if(states::configured, states::reconfigured);
}

void topod::controller::refresh_config() {}

void topod::controller::run() {
    while (state() != states::stopped) {
        try {
            step();
            this->_retry_delay = this->_properties.min_retry_delay;
        } catch (const std::exception& err) {
            const auto s = state();
            if (s == states::stopped) { break; }
            log().warning("_ state failed: _", s, err.what());
            pause(this->_retry_delay);
            this->_retry_delay = std::min<duration>(this->_retry_delay*2,
                                                    this->_properties.max_retry_delay);
        }
    }
    log().info("worker has finished");
}

void topod::controller::listen() {
    packet_in packet;
    while (state() != states::stopped) {
        try {
            if (!this->_device.receive(packet)) { break; }
            handle_packet(packet);
        } catch (const std::exception& err) {
            log().warning("failed to receive packet: _", err.what());
            pause(this->_properties.min_retry_delay);
        }
    }
}

void topod::controller::pause(duration d) {
    lock_type lock(this->_mutex);
    const auto t = this->_clock.now() + d;
    while (!this->_stopped && this->_clock.now() < t) {
        this->_clock.wait_until(this->_semaphore, lock, t);
    }
}

void topod::controller::notify() {
    lock_type lock(this->_mutex);
    this->_semaphore.notify_all();
}

void topod::controller::start_listener() {
    if (this->_listening) { return; }
    this->_listener = std::thread([this] () { this->listen(); });
    this->_listening = true;
}

void topod::controller::on_disconnected() {
    this->_device.connect();
    state_if(states::disconnected, states::connected);
}

void topod::controller::on_connected() {
    auto p = this->_device.pipeline();
    log().info("pipeline _", p);
    {
        unique_lock_type lock(this->_lock);
        this->_pipeline = std::move(p);
    }
    state_if(states::connected, states::pipeline_available);
}

void topod::controller::on_pipeline_available() {
    const auto id = this->_properties.election;
    if (!this->_device.arbitrate(id)) {
        throw device_error(this->_properties.agent_id, "arbitrate",
                           "lost arbitration with election id " + std::to_string(id));
    }
    state_if(states::pipeline_available, states::elected);
}

void topod::controller::on_elected() {
    discover_ports();
    log().info("discovered _ ports", ports().size());
    state_if(states::elected, states::ports_discovered);
}

void topod::controller::on_ports_discovered() {
    this->_device.install_intercept_rules();
    start_listener();
    state_if(states::ports_discovered, states::configured);
}

void topod::controller::on_configured() {
    using std::chrono::seconds;
    const auto c = current_config();
    timer_set timers;
    timers.add("emit", seconds(c.emit_frequency), [this] () {
        try {
            emit_probes();
        } catch (const device_error& err) {
            log().warning("failed to emit probes: _", err.what());
        }
    });
    timers.add("port-rediscovery", seconds(c.port_rediscovery_frequency), [this] () {
        try {
            discover_ports();
        } catch (const device_error& err) {
            log().warning("failed to discover ports: _", err.what());
        }
    });
    timers.add("pipeline-validation", seconds(c.pipeline_validation_frequency), [this] () {
        try {
            validate_pipeline();
        } catch (const device_error& err) {
            log().warning("failed to validate pipeline: _", err.what());
        }
    });
    timers.add("prune", seconds(c.link_prune_frequency), [this] () {
        prune_links();
        prune_hosts();
    });
    const auto start = this->_clock.now();
    if (c.emit_on_configured) {
        try {
            emit_probes();
        } catch (const device_error& err) {
            log().warning("failed to emit probes: _", err.what());
        }
    }
    lock_type lock(this->_mutex);
    timers.run(this->_clock, start, lock, this->_semaphore, [this] () {
        return !this->_stopped && state() == states::configured;
    });
}

void topod::controller::on_reconfigured() {
    const auto c = current_config();
    if (c.max_link_age <= c.emit_frequency) {
        log().warning("maximal link age _s does not exceed emit frequency _s, "
                      "links will be pruned between probes", c.max_link_age, c.emit_frequency);
    }
    state_if(states::reconfigured, states::configured);
}

void topod::controller::on_stopped() {}

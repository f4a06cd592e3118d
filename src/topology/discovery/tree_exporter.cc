#include <chrono>

#include <topology/core/error.hh>
#include <topology/discovery/tree_exporter.hh>

namespace {

    constexpr const char* agent_id_path = "state/agent-id";
    constexpr const char* links_path = "state/links";
    constexpr const char* emit_frequency_path = "config/emitFrequency";
    constexpr const char* max_link_age_path = "config/maxLinkAge";
    constexpr const char* pipeline_validation_path = "config/pipelineValidationFrequency";
    constexpr const char* port_rediscovery_path = "config/portRediscoveryFrequency";
    constexpr const char* link_prune_path = "config/linkPruneFrequency";
    constexpr const char* max_host_age_path = "config/maxHostAge";
    constexpr const char* emit_on_configured_path = "config/emitOnConfigured";

    std::int64_t
    read_int(const topo::config_tree& tree, const char* path) {
        return tree.get(path).int_value();
    }

    template <class Duration>
    std::uint64_t
    to_nanoseconds(Duration d) {
        using namespace std::chrono;
        return static_cast<std::uint64_t>(duration_cast<nanoseconds>(d).count());
    }

}

std::string topod::link_path(std::uint32_t ingress_port) {
    return "state/link[port=" + std::to_string(ingress_port) + ']';
}

std::string topod::host_path(const std::string& mac) {
    return "state/host[mac=" + mac + ']';
}

void topod::tree_exporter::populate(const std::string& agent_id, const config& c) {
    using topo::typed_value;
    auto updates = config_values(c);
    updates.emplace_back(agent_id_path, typed_value::of_string(agent_id));
    updates.emplace_back(links_path, typed_value{});
    publish(std::move(updates), {});
}

void topod::tree_exporter::write(const config& c) {
    publish(config_values(c), {});
}

void topod::tree_exporter::read(config& c) const {
    config tmp;
    tmp.emit_frequency = read_int(this->_tree, emit_frequency_path);
    tmp.max_link_age = read_int(this->_tree, max_link_age_path);
    tmp.pipeline_validation_frequency = read_int(this->_tree, pipeline_validation_path);
    tmp.port_rediscovery_frequency = read_int(this->_tree, port_rediscovery_path);
    tmp.link_prune_frequency = read_int(this->_tree, link_prune_path);
    tmp.max_host_age = read_int(this->_tree, max_host_age_path);
    tmp.emit_on_configured = this->_tree.get(emit_on_configured_path).bool_value();
    c = tmp;
}

void topod::tree_exporter::add_link(const link& l) {
    using topo::typed_value;
    const auto prefix = link_path(l.ingress_port);
    topo::path_value_array updates;
    updates.emplace_back(prefix + "/egress-port", typed_value::of_uint(l.egress_port));
    updates.emplace_back(prefix + "/egress-device", typed_value::of_string(l.egress_device));
    updates.emplace_back(prefix + "/create-time",
                         typed_value::of_uint(to_nanoseconds(l.last_update.time_since_epoch())));
    publish(std::move(updates), {});
}

void topod::tree_exporter::remove_link(std::uint32_t ingress_port) {
    publish({}, {link_path(ingress_port)});
}

void topod::tree_exporter::add_host(const host& h) {
    using topo::typed_value;
    const auto prefix = host_path(h.mac);
    topo::path_value_array updates;
    updates.emplace_back(prefix + "/port", typed_value::of_uint(h.port));
    updates.emplace_back(prefix + "/ip-address", typed_value::of_string(h.ip));
    updates.emplace_back(prefix + "/create-time",
                         typed_value::of_uint(to_nanoseconds(h.last_update.time_since_epoch())));
    publish(std::move(updates), {});
}

void topod::tree_exporter::remove_host(const std::string& mac) {
    publish({}, {host_path(mac)});
}

auto topod::tree_exporter::config_values(const config& c) const -> topo::path_value_array {
    using topo::typed_value;
    topo::path_value_array result;
    result.emplace_back(emit_frequency_path, typed_value::of_int(c.emit_frequency));
    result.emplace_back(max_link_age_path, typed_value::of_int(c.max_link_age));
    result.emplace_back(pipeline_validation_path,
                        typed_value::of_int(c.pipeline_validation_frequency));
    result.emplace_back(port_rediscovery_path, typed_value::of_int(c.port_rediscovery_frequency));
    result.emplace_back(link_prune_path, typed_value::of_int(c.link_prune_frequency));
    result.emplace_back(max_host_age_path, typed_value::of_int(c.max_host_age));
    result.emplace_back(emit_on_configured_path, typed_value::of_bool(c.emit_on_configured));
    return result;
}

void topod::tree_exporter::publish(topo::path_value_array updates, topo::path_array deletes) {
    for (const auto& u : updates) { this->_tree.add(u.path, u.value); }
    for (const auto& d : deletes) { this->_tree.remove(d); }
    topo::notification n;
    n.timestamp = timestamp();
    n.updates = std::move(updates);
    n.deletes = std::move(deletes);
    this->_tree.publish(n);
}

std::int64_t topod::tree_exporter::timestamp() const {
    using namespace std::chrono;
    return duration_cast<nanoseconds>(this->_clock.now().time_since_epoch()).count();
}

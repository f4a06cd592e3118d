#include <cstring>
#include <fstream>
#include <ostream>
#include <stdexcept>

#include <topology/discovery/config.hh>

bool topod::config::set(const char* key, const std::string& value) {
    using topo::string_to_seconds;
    bool found = true;
    if (std::strcmp(key, "emit-frequency") == 0) {
        emit_frequency = string_to_seconds(value);
    } else if (std::strcmp(key, "max-link-age") == 0) {
        max_link_age = string_to_seconds(value);
    } else if (std::strcmp(key, "pipeline-validation-frequency") == 0) {
        pipeline_validation_frequency = string_to_seconds(value);
    } else if (std::strcmp(key, "port-rediscovery-frequency") == 0) {
        port_rediscovery_frequency = string_to_seconds(value);
    } else if (std::strcmp(key, "link-prune-frequency") == 0) {
        link_prune_frequency = string_to_seconds(value);
    } else if (std::strcmp(key, "max-host-age") == 0) {
        max_host_age = string_to_seconds(value);
    } else if (std::strcmp(key, "emit-on-configured") == 0) {
        emit_on_configured = topo::string_to_bool(value);
    } else {
        found = false;
    }
    return found;
}

void topod::config::write(std::ostream& out) const {
    using topo::write_property;
    using std::to_string;
    write_property(out, "emit-frequency", to_string(emit_frequency) + 's');
    write_property(out, "max-link-age", to_string(max_link_age) + 's');
    write_property(out, "pipeline-validation-frequency",
                   to_string(pipeline_validation_frequency) + 's');
    write_property(out, "port-rediscovery-frequency", to_string(port_rediscovery_frequency) + 's');
    write_property(out, "link-prune-frequency", to_string(link_prune_frequency) + 's');
    write_property(out, "max-host-age", to_string(max_host_age) + 's');
    write_property(out, "emit-on-configured", emit_on_configured ? "yes" : "no");
}

namespace {

    inline bool valid_period(std::int64_t rhs) noexcept {
        return rhs > 0 && rhs <= topod::max_period;
    }

}

bool topod::config::valid() const noexcept {
    return valid_period(emit_frequency) && valid_period(max_link_age) &&
        valid_period(pipeline_validation_frequency) && valid_period(port_rediscovery_frequency) &&
        valid_period(link_prune_frequency) && valid_period(max_host_age);
}

bool topod::config::operator==(const config& rhs) const noexcept {
    return emit_frequency == rhs.emit_frequency &&
        max_link_age == rhs.max_link_age &&
        pipeline_validation_frequency == rhs.pipeline_validation_frequency &&
        port_rediscovery_frequency == rhs.port_rediscovery_frequency &&
        link_prune_frequency == rhs.link_prune_frequency &&
        max_host_age == rhs.max_host_age &&
        emit_on_configured == rhs.emit_on_configured;
}

std::ostream& topod::operator<<(std::ostream& out, const config& rhs) {
    return out << "emit=" << rhs.emit_frequency << "s max-link-age=" << rhs.max_link_age
        << "s pipeline-validation=" << rhs.pipeline_validation_frequency
        << "s port-rediscovery=" << rhs.port_rediscovery_frequency
        << "s prune=" << rhs.link_prune_frequency
        << "s max-host-age=" << rhs.max_host_age << 's';
}

void topod::config_file::property(const std::string& key, const std::string& value) {
    if (!this->_config.set(key.data(), value)) {
        throw std::invalid_argument("unknown property");
    }
}

auto topod::load_config(const std::string& filename, const topo::logger& log) -> config {
    config result;
    try {
        config_file file(result);
        file.open(filename);
    } catch (const std::exception& err) {
        log.warning("failed to load _, using defaults: _", filename, err.what());
        return config{};
    }
    if (!result.valid()) {
        log.warning("period out of range in _, using defaults", filename);
        return config{};
    }
    return result;
}

bool topod::save_config(const std::string& filename, const config& c, const topo::logger& log) {
    std::ofstream out(filename);
    if (out.is_open()) { c.write(out); }
    out.close();
    if (!out) {
        log.warning("failed to save _", filename);
        return false;
    }
    return true;
}

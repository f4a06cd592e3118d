#include <chrono>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include <unistdx/base/log_message>

#include <topology/core/configurable.hh>
#include <topology/core/error_handler.hh>
#include <topology/core/logger.hh>
#include <topology/core/properties.hh>
#include <topology/device/loopback_device.hh>
#include <topology/discovery/controller.hh>

namespace {

    /// Ring of loopback switches, port 1 of each node is wired to port 2 of the next one.
    class ring_properties: public topo::properties {

    public:
        int nodes = 3;
        topo::Duration duration = std::chrono::seconds(10);
        std::int64_t emit_frequency = 1;
        topo::logger::levels level = topo::logger::levels::info;

        void property(const std::string& key, const std::string& value) override {
            if (key == "nodes") {
                nodes = std::stoi(value);
                if (nodes <= 0) { throw std::invalid_argument("non-positive number of nodes"); }
            } else if (key == "duration") {
                duration = topo::string_to_duration(value);
            } else if (key == "emit-frequency") {
                emit_frequency = topo::string_to_seconds(value);
                if (emit_frequency <= 0) { throw std::invalid_argument("non-positive frequency"); }
            } else if (key == "log-level") {
                level = topo::string_to_level(value);
            } else {
                throw std::invalid_argument("unknown property");
            }
        }

    };

    using device_ptr = std::unique_ptr<topod::loopback_device>;
    using controller_ptr = std::unique_ptr<topod::controller>;

    template <class ... Args>
    inline void
    log(const Args& ... args) {
        sys::log_message("topo-sim", args...);
    }

    void parse_standard_arguments(int argc, char** argv) {
        if (argc != 2) { return; }
        std::string h("-h"), help("--help"), version("--version");
        if (argv[1] == h || argv[1] == help) {
            std::cout << argv[0] << " [-h] [--help] [--version] [key=value]...\n"
                "nodes=3             number of switches in the ring\n"
                "duration=10s        how long to run discovery\n"
                "emit-frequency=1s   probe period\n"
                "log-level=info      debug, info, warning or none\n";
            std::exit(0);
        } else if (argv[1] == version) {
            std::cout << 1 << std::endl;
            std::exit(0);
        }
    }

    std::string node_name(int i) { return "node-" + std::to_string(i); }

    bool has_link(const topod::link_array& links, std::uint32_t ingress_port,
                  std::uint32_t egress_port, const std::string& egress_device) {
        for (const auto& l : links) {
            if (l.ingress_port == ingress_port && l.egress_port == egress_port &&
                l.egress_device == egress_device) {
                return true;
            }
        }
        return false;
    }

    /// \return true if the node has heard both of its neighbours.
    bool discovered_neighbours(const std::vector<controller_ptr>& controllers, int i) {
        const int n = static_cast<int>(controllers.size());
        const auto links = controllers[i]->links();
        return has_link(links, 1, 2, node_name((i+1)%n)) &&
            has_link(links, 2, 1, node_name((i+n-1)%n));
    }

    bool all_discovered(const std::vector<controller_ptr>& controllers) {
        for (int i=0; i<int(controllers.size()); ++i) {
            if (!discovered_neighbours(controllers, i)) { return false; }
        }
        return true;
    }

}

int main(int argc, char* argv[]) {
    parse_standard_arguments(argc, argv);
    topo::install_error_handler();
    ring_properties props;
    try {
        props.read(argc-1, argv+1);
    } catch (const std::exception& err) {
        std::cerr << err.what() << std::endl;
        return 1;
    }
    const int n = props.nodes;
    std::vector<device_ptr> devices;
    for (int i=0; i<n; ++i) {
        devices.emplace_back(new topod::loopback_device(node_name(i)));
        devices.back()->ports({{"eth1", 1, "UP", 0}, {"eth2", 2, "UP", 0}});
    }
    for (int i=0; i<n; ++i) {
        devices[i]->wire(1, *devices[(i+1)%n], 2);
    }
    std::vector<controller_ptr> controllers;
    for (int i=0; i<n; ++i) {
        topod::controller::properties p;
        p.agent_id = node_name(i);
        p.config_file.clear();
        p.election = i+1;
        controllers.emplace_back(new topod::controller(
            *devices[i], p, topo::logger(node_name(i), props.level)));
        topo::path_value_array updates;
        updates.emplace_back("config/emitFrequency", topo::typed_value::of_int(props.emit_frequency));
        topo::apply(*controllers.back(), *controllers.back(), updates);
    }
    log("starting _ nodes for _s", n,
        std::chrono::duration_cast<std::chrono::seconds>(props.duration).count());
    for (auto& c : controllers) { c->start(); }
    const auto deadline = std::chrono::steady_clock::now() + props.duration;
    while (std::chrono::steady_clock::now() < deadline && !all_discovered(controllers)) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }
    for (auto& c : controllers) { c->stop(); }
    for (auto& c : controllers) { c->wait(); }
    bool success = true;
    for (int i=0; i<n; ++i) {
        const bool ok = discovered_neighbours(controllers, i);
        std::cout << node_name(i) << (ok ? "" : " (incomplete)") << '\n';
        for (const auto& l : controllers[i]->links()) { std::cout << "  " << l << '\n'; }
        success = success && ok;
    }
    std::cout << std::flush;
    return success ? 0 : 1;
}

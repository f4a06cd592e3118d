#ifndef TOPOLOGY_DISCOVERY_TREE_EXPORTER_HH
#define TOPOLOGY_DISCOVERY_TREE_EXPORTER_HH

#include <cstdint>
#include <string>

#include <topology/core/clock.hh>
#include <topology/core/config_tree.hh>
#include <topology/discovery/config.hh>
#include <topology/discovery/link.hh>

namespace topod {

    /**
    \brief Mirrors registry changes and the tunables into the configuration tree.

    Every mutation is written to the tree and then published as one
    notification, so that subscribers see a consistent change set.
    */
    class tree_exporter {

    private:
        topo::config_tree& _tree;
        topo::clock& _clock;

    public:

        tree_exporter(topo::config_tree& tree, topo::clock& clock):
        _tree(tree), _clock(clock) {}

        /// Adds the agent identifier, the tunables and the empty link list.
        void populate(const std::string& agent_id, const config& c);
        /// Writes the tunables and publishes the change.
        void write(const config& c);
        /// \throws topo::error when any tunable is missing or has wrong type
        void read(config& c) const;

        void add_link(const link& l);
        void remove_link(std::uint32_t ingress_port);
        void add_host(const host& h);
        void remove_host(const std::string& mac);

        inline topo::config_tree& tree() noexcept { return this->_tree; }
        inline const topo::config_tree& tree() const noexcept { return this->_tree; }

    private:

        topo::path_value_array config_values(const config& c) const;
        void publish(topo::path_value_array updates, topo::path_array deletes);
        std::int64_t timestamp() const;

    };

    std::string link_path(std::uint32_t ingress_port);
    std::string host_path(const std::string& mac);

}

#endif // vim:filetype=cpp

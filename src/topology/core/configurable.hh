#ifndef TOPOLOGY_CORE_CONFIGURABLE_HH
#define TOPOLOGY_CORE_CONFIGURABLE_HH

#include <string>

#include <topology/core/clock.hh>
#include <topology/core/config_tree.hh>

namespace topo {

    /// Component whose settings are mirrored under the "config/" subtree.
    class configurable {

    public:
        configurable() = default;
        virtual ~configurable() = default;
        configurable(const configurable&) = default;
        configurable& operator=(const configurable&) = default;
        configurable(configurable&&) = default;
        configurable& operator=(configurable&&) = default;

        /// Called after the "config/" subtree has been written to.
        virtual void update_config() = 0;
        /// Called before the tree is read by an external client.
        virtual void refresh_config() = 0;

    };

    /// Component that exports its state as a configuration tree.
    class exportable {

    public:
        exportable() = default;
        virtual ~exportable() = default;
        exportable(const exportable&) = default;
        exportable& operator=(const exportable&) = default;
        exportable(exportable&&) = default;
        exportable& operator=(exportable&&) = default;

        virtual config_tree& tree() noexcept = 0;
        virtual const config_tree& tree() const noexcept = 0;
        /// Clock that stamps notifications of the tree.
        virtual clock& tree_clock() const noexcept { return default_clock(); }

    };

    /**
    \brief Writes external updates into the tree and applies them.

    Only leaves below "config/" may be written.
    \throws topo::error when any path is outside of the writable subtree
    */
    void apply(configurable& target, exportable& source, const path_value_array& updates);

    /// Refreshes the configuration and returns all leaves below the prefix.
    path_value_array snapshot(configurable& target, const exportable& source,
                              const std::string& prefix);

}

#endif // vim:filetype=cpp

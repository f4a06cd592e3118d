#ifndef TOPOLOGY_CORE_CONFIG_TREE_HH
#define TOPOLOGY_CORE_CONFIG_TREE_HH

#include <cstdint>
#include <functional>
#include <iosfwd>
#include <map>
#include <mutex>
#include <string>
#include <vector>

#include <topology/core/typed_value.hh>

namespace topo {

    struct path_value {
        std::string path;
        typed_value value;

        path_value() = default;
        inline path_value(std::string p, typed_value v): path(std::move(p)), value(std::move(v)) {}
    };

    using path_value_array = std::vector<path_value>;
    using path_array = std::vector<std::string>;

    /// Change set pushed to subscribers of the tree.
    struct notification {
        /// Nanoseconds since the epoch.
        std::int64_t timestamp = 0;
        path_value_array updates;
        path_array deletes;
    };

    std::ostream& operator<<(std::ostream& out, const notification& rhs);

    /**
    \brief Hierarchical key/value mirror with subscription fan-out.

    Paths are slash-separated, elements may carry keys in square brackets,
    e.g. "state/link[port=1]/egress-port". Only leaves hold values;
    removing a path removes every leaf below it.
    */
    class config_tree {

    public:
        using listener_type = std::function<void(const notification&)>;
        using subscription_type = std::uint64_t;

    private:
        using container_type = std::map<std::string,typed_value>;
        using listener_map = std::map<subscription_type,listener_type>;
        using mutex_type = std::mutex;
        using lock_type = std::unique_lock<mutex_type>;

    private:
        container_type _leaves;
        listener_map _listeners;
        subscription_type _next_subscription = 1;
        mutable mutex_type _mutex;

    public:

        config_tree() = default;
        ~config_tree() = default;
        config_tree(const config_tree&) = delete;
        config_tree& operator=(const config_tree&) = delete;
        config_tree(config_tree&&) = delete;
        config_tree& operator=(config_tree&&) = delete;

        /// Adds or replaces the leaf. Empty value creates a placeholder.
        void add(const std::string& path, typed_value value);
        bool find(const std::string& path, typed_value& result) const;
        /// \throws topo::error when there is no such leaf
        typed_value get(const std::string& path) const;
        bool contains(const std::string& path) const;
        /// Removes the leaf and all leaves below the path.
        bool remove(const std::string& path);
        /// All leaves equal to or below the prefix, ordered by path.
        path_value_array list(const std::string& prefix) const;
        std::size_t size() const;

        subscription_type subscribe(listener_type listener);
        void unsubscribe(subscription_type id);
        std::size_t num_subscribers() const;
        /// Sends the notification to every subscriber.
        void publish(const notification& n) const;

    };

    /// \return true if path equals the prefix or continues it with a '/'.
    bool path_starts_with(const std::string& path, const std::string& prefix) noexcept;

}

#endif // vim:filetype=cpp

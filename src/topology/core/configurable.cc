#include <chrono>

#include <topology/core/configurable.hh>
#include <topology/core/error.hh>

namespace {
    const std::string writable_prefix{"config"};
}

void topo::apply(configurable& target, exportable& source, const path_value_array& updates) {
    for (const auto& u : updates) {
        if (!path_starts_with(u.path, writable_prefix) || u.path == writable_prefix) {
            throw_error("path is not writable: ", u.path);
        }
    }
    auto& tree = source.tree();
    notification n;
    n.timestamp = std::chrono::duration_cast<std::chrono::nanoseconds>(
        source.tree_clock().now().time_since_epoch()).count();
    for (const auto& u : updates) {
        tree.add(u.path, u.value);
        n.updates.emplace_back(u);
    }
    tree.publish(n);
    target.update_config();
}

auto topo::snapshot(configurable& target, const exportable& source,
                    const std::string& prefix) -> path_value_array {
    target.refresh_config();
    return source.tree().list(prefix);
}

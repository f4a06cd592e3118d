#include <algorithm>
#include <ostream>

#include <unistdx/it/intersperse_iterator>

#include <topology/core/config_tree.hh>
#include <topology/core/error.hh>

bool topo::path_starts_with(const std::string& path, const std::string& prefix) noexcept {
    if (prefix.empty()) { return true; }
    if (path.compare(0, prefix.size(), prefix) != 0) { return false; }
    return path.size() == prefix.size() || path[prefix.size()] == '/';
}

void topo::config_tree::add(const std::string& path, typed_value value) {
    lock_type lock(this->_mutex);
    this->_leaves[path] = std::move(value);
}

bool topo::config_tree::find(const std::string& path, typed_value& result) const {
    lock_type lock(this->_mutex);
    auto it = this->_leaves.find(path);
    if (it == this->_leaves.end()) { return false; }
    result = it->second;
    return true;
}

auto topo::config_tree::get(const std::string& path) const -> typed_value {
    typed_value result;
    if (!find(path, result)) { throw_error("no such path: ", path); }
    return result;
}

bool topo::config_tree::contains(const std::string& path) const {
    lock_type lock(this->_mutex);
    return this->_leaves.find(path) != this->_leaves.end();
}

bool topo::config_tree::remove(const std::string& path) {
    lock_type lock(this->_mutex);
    bool removed = false;
    auto first = this->_leaves.lower_bound(path);
    while (first != this->_leaves.end() && first->first.compare(0, path.size(), path) == 0) {
        if (path_starts_with(first->first, path)) {
            first = this->_leaves.erase(first);
            removed = true;
        } else {
            ++first;
        }
    }
    return removed;
}

auto topo::config_tree::list(const std::string& prefix) const -> path_value_array {
    lock_type lock(this->_mutex);
    path_value_array result;
    auto first = this->_leaves.lower_bound(prefix);
    for (; first != this->_leaves.end() &&
           first->first.compare(0, prefix.size(), prefix) == 0; ++first) {
        if (path_starts_with(first->first, prefix)) {
            result.emplace_back(first->first, first->second);
        }
    }
    return result;
}

std::size_t topo::config_tree::size() const {
    lock_type lock(this->_mutex);
    return this->_leaves.size();
}

auto topo::config_tree::subscribe(listener_type listener) -> subscription_type {
    lock_type lock(this->_mutex);
    const auto id = this->_next_subscription++;
    this->_listeners.emplace(id, std::move(listener));
    return id;
}

void topo::config_tree::unsubscribe(subscription_type id) {
    lock_type lock(this->_mutex);
    this->_listeners.erase(id);
}

std::size_t topo::config_tree::num_subscribers() const {
    lock_type lock(this->_mutex);
    return this->_listeners.size();
}

void topo::config_tree::publish(const notification& n) const {
    listener_map listeners;
    {
        lock_type lock(this->_mutex);
        listeners = this->_listeners;
    }
    for (const auto& pair : listeners) { pair.second(n); }
}

std::ostream& topo::operator<<(std::ostream& out, const notification& rhs) {
    out << "timestamp=" << rhs.timestamp << " updates=[";
    bool first = true;
    for (const auto& u : rhs.updates) {
        if (!first) { out << ','; }
        out << u.path << '=' << u.value;
        first = false;
    }
    out << "] deletes=[";
    std::copy(rhs.deletes.begin(), rhs.deletes.end(),
              sys::intersperse_iterator<std::string,char>(out, ','));
    out << ']';
    return out;
}

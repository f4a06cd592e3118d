#ifndef TOPOLOGY_DISCOVERY_REGISTRY_HH
#define TOPOLOGY_DISCOVERY_REGISTRY_HH

#include <algorithm>
#include <iosfwd>
#include <string>
#include <unordered_map>
#include <vector>

#include <topology/core/clock.hh>
#include <topology/device/device_session.hh>

namespace topod {

    enum class update_result {
        /// There was no entry for the key.
        added,
        /// The entry had different identity and was replaced.
        replaced,
        /// Only the time stamp was updated.
        refreshed,
    };

    std::ostream& operator<<(std::ostream& out, update_result rhs);

    /**
    \brief Entries that age out when they are not observed again.

    At most one entry exists per key. Entries are compared with
    \c same_identity, the time of the last observation is kept in
    \c last_update. The registry does no locking: the owner serializes access.
    */
    template <class Key, class Entry>
    class registry {

    public:
        using key_type = Key;
        using entry_type = Entry;
        using container_type = std::unordered_map<key_type,entry_type>;
        using const_iterator = typename container_type::const_iterator;
        using size_type = typename container_type::size_type;
        using time_point = topo::clock::time_point;
        using entry_array = std::vector<entry_type>;

    private:
        container_type _entries;

    public:

        /// Replaces the entry if its identity differs, refreshes the time stamp in any case.
        update_result update(const key_type& key, entry_type entry, time_point now) {
            entry.last_update = now;
            auto result = this->_entries.find(key);
            if (result == this->_entries.end()) {
                this->_entries.emplace(key, std::move(entry));
                return update_result::added;
            }
            auto& existing = result->second;
            if (!existing.same_identity(entry)) {
                existing = std::move(entry);
                return update_result::replaced;
            }
            existing.last_update = now;
            return update_result::refreshed;
        }

        /// Removes every entry last updated before the limit and calls the function for it.
        template <class Function>
        size_type prune(time_point limit, Function on_evict) {
            size_type n = 0;
            auto first = this->_entries.begin();
            while (first != this->_entries.end()) {
                if (first->second.last_update < limit) {
                    on_evict(first->second);
                    first = this->_entries.erase(first);
                    ++n;
                } else {
                    ++first;
                }
            }
            return n;
        }

        inline bool remove(const key_type& key) { return this->_entries.erase(key) != 0; }

        inline const entry_type* find(const key_type& key) const {
            auto result = this->_entries.find(key);
            return result == this->_entries.end() ? nullptr : &result->second;
        }

        /// Copy of all entries ordered by the comparator.
        template <class Compare>
        entry_array snapshot(Compare compare) const {
            entry_array result;
            result.reserve(this->_entries.size());
            for (const auto& pair : this->_entries) { result.emplace_back(pair.second); }
            std::stable_sort(result.begin(), result.end(), compare);
            return result;
        }

        inline const_iterator begin() const noexcept { return this->_entries.begin(); }
        inline const_iterator end() const noexcept { return this->_entries.end(); }
        inline size_type size() const noexcept { return this->_entries.size(); }
        inline bool empty() const noexcept { return this->_entries.empty(); }
        inline void clear() { this->_entries.clear(); }

    };

    /// Ports from the last enumeration, keyed by port id.
    class port_registry {

    public:
        using container_type = std::unordered_map<std::string,port>;

    private:
        container_type _ports;

    public:

        /// Replaces all ports with the result of a new enumeration.
        void assign(const port_array& ports);
        const port* find(const std::string& id) const;
        const port* find(std::uint32_t number) const;
        /// Operational ports ordered by number.
        port_array up_ports() const;
        /// All ports ordered by number.
        port_array snapshot() const;

        inline std::size_t size() const noexcept { return this->_ports.size(); }
        inline bool empty() const noexcept { return this->_ports.empty(); }

    };

}

#endif // vim:filetype=cpp

#ifndef CLAMM_JOURNAL_HPP
#define CLAMM_JOURNAL_HPP

#include <cstddef>
#include <optional>
#include <utility>
#include <vector>

namespace clamm {

// =============================================================================
// JournaledMap - map whose writes can be undone
// =============================================================================
//
// While a journal is open, every write first records the entry's prior value
// (or its absence). rollback_journal() replays the records newest first and
// commit_journal() drops them, so both cost the number of writes made, not
// the size of the map. With no journal open it is a plain map.

template <typename Map>
class JournaledMap {
public:
    using key_type = typename Map::key_type;
    using mapped_type = typename Map::mapped_type;

    const mapped_type* find(const key_type& key) const {
        auto it = map_.find(key);
        return it != map_.end() ? &it->second : nullptr;
    }

    bool contains(const key_type& key) const { return map_.count(key) != 0; }
    std::size_t size() const { return map_.size(); }
    const Map& entries() const { return map_; }

    // Writable entry, value-initialized when absent
    mapped_type& write(const key_type& key) {
        record(key);
        return map_[key];
    }

    void erase(const key_type& key) {
        if (map_.count(key) == 0) return;
        record(key);
        map_.erase(key);
    }

    bool journaling() const { return journaling_; }
    std::size_t journal_size() const { return undo_.size(); }

    void begin_journal() {
        undo_.clear();
        journaling_ = true;
    }

    void commit_journal() {
        undo_.clear();
        journaling_ = false;
    }

    void rollback_journal() {
        for (auto it = undo_.rbegin(); it != undo_.rend(); ++it) {
            if (it->second) {
                map_.insert_or_assign(it->first, std::move(*it->second));
            } else {
                map_.erase(it->first);
            }
        }
        commit_journal();
    }

private:
    void record(const key_type& key) {
        if (!journaling_) return;
        auto it = map_.find(key);
        undo_.emplace_back(key, it != map_.end() ? std::optional<mapped_type>(it->second)
                                                 : std::nullopt);
    }

    Map map_;
    std::vector<std::pair<key_type, std::optional<mapped_type>>> undo_;
    bool journaling_ = false;
};

} // namespace clamm

#endif // CLAMM_JOURNAL_HPP

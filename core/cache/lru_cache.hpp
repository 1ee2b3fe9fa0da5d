#pragma once

#include "util/errors.hpp"

#include <cstddef>
#include <functional>
#include <list>
#include <unordered_map>
#include <utility>

namespace advtext {

// ─── LRU Cache ─────────────────────────────────────────────────
// Fixed-capacity map with least-recently-used eviction.
// Recency list front = most recent. Lookups through contains() do
// not promote, nor does peek(); get(), touch() and put() do.

template <typename Key, typename Value, typename Hash = std::hash<Key>>
class LruCache {
public:
    explicit LruCache(size_t capacity) : capacity_(capacity) {
        if (capacity_ == 0) {
            throw ConfigurationError("LruCache capacity must be positive");
        }
    }

    bool contains(const Key& key) const {
        return index_.count(key) > 0;
    }

    /// Lookup without promotion. Returns nullptr on miss.
    const Value* peek(const Key& key) const {
        auto it = index_.find(key);
        return it != index_.end() ? &it->second->second : nullptr;
    }

    /// Lookup with promotion. Returns nullptr on miss.
    const Value* get(const Key& key) {
        auto it = index_.find(key);
        if (it == index_.end()) {
            misses_++;
            return nullptr;
        }
        hits_++;
        entries_.splice(entries_.begin(), entries_, it->second);
        return &it->second->second;
    }

    /// Promote an entry without reading it. Returns false on miss.
    bool touch(const Key& key) {
        auto it = index_.find(key);
        if (it == index_.end()) return false;
        hits_++;
        entries_.splice(entries_.begin(), entries_, it->second);
        return true;
    }

    /// Insert or overwrite, promoting the entry. Evicts the least recently
    /// used entry once the cache grows past capacity.
    void put(const Key& key, Value value) {
        auto it = index_.find(key);
        if (it != index_.end()) {
            it->second->second = std::move(value);
            entries_.splice(entries_.begin(), entries_, it->second);
            return;
        }
        entries_.emplace_front(key, std::move(value));
        index_[key] = entries_.begin();
        if (entries_.size() > capacity_) {
            index_.erase(entries_.back().first);
            entries_.pop_back();
            evictions_++;
        }
    }

    void clear() {
        entries_.clear();
        index_.clear();
    }

    size_t size() const { return entries_.size(); }
    size_t capacity() const { return capacity_; }
    size_t hits() const { return hits_; }
    size_t misses() const { return misses_; }
    size_t evictions() const { return evictions_; }

private:
    using Entry = std::pair<Key, Value>;

    size_t capacity_;
    std::list<Entry> entries_;
    std::unordered_map<Key, typename std::list<Entry>::iterator, Hash> index_;
    size_t hits_ = 0;
    size_t misses_ = 0;
    size_t evictions_ = 0;
};

} // namespace advtext

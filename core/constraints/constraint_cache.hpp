#pragma once

#include "cache/lru_cache.hpp"
#include "text/attacked_text.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <utility>

namespace advtext {

// ─── Constraint Cache ──────────────────────────────────────────
// (current text, candidate text) → "passes every post-transformation
// constraint". Keyed by rendered text, so content-equal texts share an
// entry. Entries are only written by the uncached filtering pass; a
// present entry is authoritative until evicted.

class ConstraintCache {
public:
    using Key = std::pair<std::string, std::string>;

    struct KeyHash {
        size_t operator()(const Key& key) const {
            size_t h1 = std::hash<std::string>{}(key.first);
            size_t h2 = std::hash<std::string>{}(key.second);
            return h1 ^ (h2 + 0x9e3779b97f4a7c15ULL + (h1 << 6) + (h1 >> 2));
        }
    };

    explicit ConstraintCache(size_t capacity) : cache_(capacity) {}

    static Key makeKey(const AttackedText& current_text, const AttackedText& candidate) {
        return {current_text.text(), candidate.text()};
    }

    bool contains(const AttackedText& current_text, const AttackedText& candidate) const {
        return cache_.contains(makeKey(current_text, candidate));
    }

    /// Lookup without promotion or hit counting.
    std::optional<bool> peek(const AttackedText& current_text, const AttackedText& candidate) const {
        const bool* value = cache_.peek(makeKey(current_text, candidate));
        if (!value) return std::nullopt;
        return *value;
    }

    /// Lookup with promotion. nullptr when the pair was never filtered or
    /// has been evicted.
    const bool* lookup(const AttackedText& current_text, const AttackedText& candidate) {
        return cache_.get(makeKey(current_text, candidate));
    }

    void record(const AttackedText& current_text, const AttackedText& candidate, bool passed) {
        cache_.put(makeKey(current_text, candidate), passed);
    }

    void clear() { cache_.clear(); }

    size_t size() const { return cache_.size(); }
    size_t capacity() const { return cache_.capacity(); }
    size_t hits() const { return cache_.hits(); }
    size_t misses() const { return cache_.misses(); }
    size_t evictions() const { return cache_.evictions(); }

private:
    LruCache<Key, bool, KeyHash> cache_;
};

} // namespace advtext

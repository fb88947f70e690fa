// include/holdings_ngin/classification/lfu_cache.hpp
#pragma once

#include <cstddef>
#include <iterator>
#include <list>
#include <optional>
#include <unordered_map>
#include <utility>

namespace holdings_ngin {

/**
 * @brief Bounded least-frequently-used cache with O(1) get and put
 *
 * Entries live in per-frequency lists ordered by recency, so among entries with the
 * lowest use count the least recently used one is evicted first.
 * Not synchronized; callers hold their own lock.
 */
template <typename Key, typename Value, typename Hash = std::hash<Key>>
class LfuCache {
public:
    explicit LfuCache(size_t capacity) : capacity_(capacity) {}

    /**
     * @brief Look up a key and count the access
     */
    std::optional<Value> get(const Key& key) {
        auto it = entries_.find(key);
        if (it == entries_.end()) {
            return std::nullopt;
        }
        touch(it->second);
        return it->second.node->second;
    }

    /**
     * @brief Look up a key without counting the access
     */
    std::optional<Value> peek(const Key& key) const {
        auto it = entries_.find(key);
        if (it == entries_.end()) {
            return std::nullopt;
        }
        return it->second.node->second;
    }

    /**
     * @brief Insert or replace a value; replacing counts as an access
     */
    void put(const Key& key, Value value) {
        if (capacity_ == 0) {
            return;
        }

        auto it = entries_.find(key);
        if (it != entries_.end()) {
            it->second.node->second = std::move(value);
            touch(it->second);
            return;
        }

        if (entries_.size() >= capacity_) {
            evict();
        }

        auto& bucket = buckets_[1];
        bucket.emplace_front(key, std::move(value));
        entries_.emplace(key, Slot{1, bucket.begin()});
        min_frequency_ = 1;
    }

    bool erase(const Key& key) {
        auto it = entries_.find(key);
        if (it == entries_.end()) {
            return false;
        }
        remove_from_bucket(it->second);
        entries_.erase(it);
        return true;
    }

    void clear() {
        entries_.clear();
        buckets_.clear();
        min_frequency_ = 0;
    }

    size_t size() const {
        return entries_.size();
    }

    size_t capacity() const {
        return capacity_;
    }

    bool contains(const Key& key) const {
        return entries_.find(key) != entries_.end();
    }

    /**
     * @brief Use count of a key, 0 if absent
     */
    size_t frequency(const Key& key) const {
        auto it = entries_.find(key);
        return it == entries_.end() ? 0 : it->second.frequency;
    }

private:
    using Node = std::pair<Key, Value>;
    using Bucket = std::list<Node>;

    struct Slot {
        size_t frequency;
        typename Bucket::iterator node;
    };

    void remove_from_bucket(const Slot& slot) {
        auto bucket = buckets_.find(slot.frequency);
        bucket->second.erase(slot.node);
        if (bucket->second.empty()) {
            buckets_.erase(bucket);
            if (min_frequency_ == slot.frequency) {
                ++min_frequency_;
            }
        }
    }

    void touch(Slot& slot) {
        auto& from = buckets_[slot.frequency];
        auto& to = buckets_[slot.frequency + 1];
        // splice keeps the iterator valid
        to.splice(to.begin(), from, slot.node);
        if (from.empty()) {
            buckets_.erase(slot.frequency);
            if (min_frequency_ == slot.frequency) {
                ++min_frequency_;
            }
        }
        ++slot.frequency;
    }

    void evict() {
        if (entries_.empty()) {
            return;
        }
        auto bucket = buckets_.find(min_frequency_);
        if (bucket == buckets_.end()) {
            // after erase() min_frequency_ can point past an emptied bucket
            bucket = buckets_.begin();
            for (auto it = buckets_.begin(); it != buckets_.end(); ++it) {
                if (it->first < bucket->first)
                    bucket = it;
            }
        }
        const Key victim = bucket->second.back().first;
        bucket->second.pop_back();
        if (bucket->second.empty()) {
            buckets_.erase(bucket);
        }
        entries_.erase(victim);
    }

    size_t capacity_;
    size_t min_frequency_{0};
    std::unordered_map<Key, Slot, Hash> entries_;
    std::unordered_map<size_t, Bucket> buckets_;
};

}  // namespace holdings_ngin

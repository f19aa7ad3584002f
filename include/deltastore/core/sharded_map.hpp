#pragma once

#include "deltastore/core/constants.hpp"

#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <unordered_map>
#include <utility>
#include <vector>

namespace deltastore {

// Concurrent hash map split into independently locked shards.
// Readers of one shard never block readers or writers of another; each entry is
// replaced atomically under its shard's lock so a lookup sees the old or the new
// value, never a partial one.
template <typename Key, typename Value, typename Hash = std::hash<Key>>
class ShardedMap {
public:
    explicit ShardedMap(size_t num_shards = constants::DEFAULT_REGISTRY_SHARDS) {
        if (num_shards == 0) num_shards = 1;
        shards_.reserve(num_shards);
        for (size_t i = 0; i < num_shards; ++i) {
            shards_.push_back(std::make_unique<Shard>());
        }
    }

    ShardedMap(const ShardedMap&) = delete;
    ShardedMap& operator=(const ShardedMap&) = delete;

    // Insert or replace; returns the displaced value, if any
    std::optional<Value> insert_or_assign(const Key& key, Value value) {
        auto& shard = get_shard(key);
        std::unique_lock lock(shard.mutex);
        auto it = shard.map.find(key);
        if (it == shard.map.end()) {
            shard.map.emplace(key, std::move(value));
            return std::nullopt;
        }
        std::optional<Value> previous(std::move(it->second));
        it->second = std::move(value);
        return previous;
    }

    std::optional<Value> find(const Key& key) const {
        auto& shard = get_shard(key);
        std::shared_lock lock(shard.mutex);
        auto it = shard.map.find(key);
        if (it == shard.map.end()) return std::nullopt;
        return it->second;
    }

    bool contains(const Key& key) const {
        auto& shard = get_shard(key);
        std::shared_lock lock(shard.mutex);
        return shard.map.count(key) != 0;
    }

    size_t size() const {
        size_t total = 0;
        for (const auto& shard : shards_) {
            std::shared_lock lock(shard->mutex);
            total += shard->map.size();
        }
        return total;
    }

    bool empty() const { return size() == 0; }

    // Visit every entry, one shard at a time under that shard's read lock.
    // The callback must not call back into this map.
    void for_each(const std::function<void(const Key&, const Value&)>& fn) const {
        for (const auto& shard : shards_) {
            std::shared_lock lock(shard->mutex);
            for (const auto& [key, value] : shard->map) {
                fn(key, value);
            }
        }
    }

    std::vector<Key> keys() const {
        std::vector<Key> result;
        for_each([&result](const Key& key, const Value&) { result.push_back(key); });
        return result;
    }

    std::vector<std::pair<Key, Value>> snapshot() const {
        std::vector<std::pair<Key, Value>> result;
        for_each([&result](const Key& key, const Value& value) {
            result.emplace_back(key, value);
        });
        return result;
    }

    size_t shard_count() const { return shards_.size(); }

private:
    struct Shard {
        mutable std::shared_mutex mutex;
        std::unordered_map<Key, Value, Hash> map;
    };

    std::vector<std::unique_ptr<Shard>> shards_;

    Shard& get_shard(const Key& key) const {
        size_t hash = Hash{}(key);
        return *shards_[hash % shards_.size()];
    }
};

} // namespace deltastore

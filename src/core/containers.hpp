/*
 * Copyright 2025 Eden Contributors
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *     http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

// Eden Containers - Header
// Hash container aliases and a sharded concurrent map

#pragma once

#include <ankerl/unordered_dense.h>

#include <array>
#include <cstddef>
#include <functional>
#include <mutex>
#include <shared_mutex>
#include <vector>

namespace eden::core {

// ankerl::unordered_dense keeps key-value pairs in a contiguous vector, which
// makes iteration (snapshots, listings) cheap. Iterators are invalidated on
// insertion, like std::vector.
template <typename Key, typename Value>
using fast_map = ankerl::unordered_dense::map<Key, Value>;

template <typename Key>
using fast_set = ankerl::unordered_dense::set<Key>;

/// Concurrent map split into independently locked shards.
///
/// A key always lands in the same shard, so operations on different keys
/// rarely contend and there is no lock spanning the whole map. Readers take
/// a shared lock on one shard, writers an exclusive lock on one shard.
/// Callbacks run while the shard lock is held and must not re-enter the map.
template <typename Key, typename Value, size_t ShardCount = 16>
class ShardedMap {
public:
    static_assert(ShardCount > 0, "ShardedMap needs at least one shard");

    ShardedMap() = default;

    // Non-copyable, non-movable (mutexes)
    ShardedMap(const ShardedMap&) = delete;
    ShardedMap& operator=(const ShardedMap&) = delete;

    /// Run fn(const Value&) under a shared lock if key exists
    /// @return true if the key was found
    template <typename Fn>
    bool read(const Key& key, Fn&& fn) const {
        const auto& shard = shard_for(key);
        std::shared_lock lock(shard.mutex);
        auto it = shard.map.find(key);
        if (it == shard.map.end()) {
            return false;
        }
        fn(it->second);
        return true;
    }

    /// Run fn(Value&) under an exclusive lock if key exists
    /// @return true if the key was found
    template <typename Fn>
    bool update(const Key& key, Fn&& fn) {
        auto& shard = shard_for(key);
        std::unique_lock lock(shard.mutex);
        auto it = shard.map.find(key);
        if (it == shard.map.end()) {
            return false;
        }
        fn(it->second);
        return true;
    }

    /// Run fn(Value&) under an exclusive lock, default-constructing the value
    /// via make() when the key is absent
    template <typename Make, typename Fn>
    decltype(auto) upsert(const Key& key, Make&& make, Fn&& fn) {
        auto& shard = shard_for(key);
        std::unique_lock lock(shard.mutex);
        auto it = shard.map.find(key);
        if (it == shard.map.end()) {
            it = shard.map.emplace(key, make()).first;
        }
        return fn(it->second);
    }

    /// Insert if absent
    /// @return false if the key already existed (map unchanged)
    bool insert(const Key& key, Value value) {
        auto& shard = shard_for(key);
        std::unique_lock lock(shard.mutex);
        return shard.map.emplace(key, std::move(value)).second;
    }

    /// Erase key; fn(Value&) runs on the value before removal
    template <typename Fn>
    bool erase(const Key& key, Fn&& fn) {
        auto& shard = shard_for(key);
        std::unique_lock lock(shard.mutex);
        auto it = shard.map.find(key);
        if (it == shard.map.end()) {
            return false;
        }
        fn(it->second);
        shard.map.erase(it);
        return true;
    }

    bool erase(const Key& key) {
        return erase(key, [](Value&) {});
    }

    /// Erase the entry when pred(Value&) returns true, under one exclusive lock
    template <typename Pred>
    bool erase_if(const Key& key, Pred&& pred) {
        auto& shard = shard_for(key);
        std::unique_lock lock(shard.mutex);
        auto it = shard.map.find(key);
        if (it == shard.map.end() || !pred(it->second)) {
            return false;
        }
        shard.map.erase(it);
        return true;
    }

    /// Erase every entry for which pred(const Key&, Value&) is true, one shard at a time
    /// @return number of entries removed
    template <typename Pred>
    size_t remove_if(Pred&& pred) {
        size_t removed = 0;
        std::vector<Key> doomed;
        for (auto& shard : shards_) {
            std::unique_lock lock(shard.mutex);
            doomed.clear();
            for (auto& [key, value] : shard.map) {
                if (pred(key, value)) {
                    doomed.push_back(key);
                }
            }
            for (const auto& key : doomed) {
                shard.map.erase(key);
            }
            removed += doomed.size();
        }
        return removed;
    }

    [[nodiscard]] bool contains(const Key& key) const {
        const auto& shard = shard_for(key);
        std::shared_lock lock(shard.mutex);
        return shard.map.contains(key);
    }

    /// Visit every entry, one shard at a time (not a global snapshot)
    template <typename Fn>
    void for_each(Fn&& fn) const {
        for (const auto& shard : shards_) {
            std::shared_lock lock(shard.mutex);
            for (const auto& [key, value] : shard.map) {
                fn(key, value);
            }
        }
    }

    [[nodiscard]] size_t size() const {
        size_t total = 0;
        for (const auto& shard : shards_) {
            std::shared_lock lock(shard.mutex);
            total += shard.map.size();
        }
        return total;
    }

    void clear() {
        for (auto& shard : shards_) {
            std::unique_lock lock(shard.mutex);
            shard.map.clear();
        }
    }

private:
    struct Shard {
        mutable std::shared_mutex mutex;
        fast_map<Key, Value> map;
    };

    [[nodiscard]] Shard& shard_for(const Key& key) {
        return shards_[ankerl::unordered_dense::hash<Key>{}(key) % ShardCount];
    }

    [[nodiscard]] const Shard& shard_for(const Key& key) const {
        return shards_[ankerl::unordered_dense::hash<Key>{}(key) % ShardCount];
    }

    std::array<Shard, ShardCount> shards_;
};

}  // namespace eden::core

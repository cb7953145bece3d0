// Licensed to the Apache Software Foundation (ASF) under one
// or more contributor license agreements.  See the NOTICE file
// distributed with this work for additional information
// regarding copyright ownership.  The ASF licenses this file
// to you under the Apache License, Version 2.0 (the
// "License"); you may not use this file except in compliance
// with the License.  You may obtain a copy of the License at
//
//   http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing,
// software distributed under the License is distributed on an
// "AS IS" BASIS, WITHOUT WARRANTIES OR CONDITIONS OF ANY
// KIND, either express or implied.  See the License for the
// specific language governing permissions and limitations
// under the License.

#pragma once

#include <parallel_hashmap/phmap.h>

#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <utility>
#include <vector>

namespace vigil {
#include "common/compile_check_begin.h"

// A hash map split into shards, each protected by its own shared_mutex, so that
// registering a query never blocks readers of the other shards and a reader never blocks
// the whole map.
//
// The lock only protects the structure of the map. It does not protect the values, which
// are expected to be shared_ptr to thread safe objects.
template <typename Key, typename Value>
class ConcurrentContextMap {
public:
    using MapType = phmap::flat_hash_map<Key, Value>;

    explicit ConcurrentContextMap(size_t num_shards = 128) : _num_shards(num_shards) {
        _internal_map_lock.reserve(_num_shards);
        _internal_map.resize(_num_shards);
        for (size_t i = 0; i < _num_shards; i++) {
            _internal_map_lock.emplace_back(std::make_unique<std::shared_mutex>());
        }
    }

    // Returns a default constructed Value (nullptr for pointers) if key is absent.
    Value find(const Key& key) const {
        auto id = _shard(key);
        std::shared_lock lock(*_internal_map_lock[id]);
        const auto& map = _internal_map[id];
        auto it = map.find(key);
        if (it == map.end()) {
            return Value {};
        }
        return it->second;
    }

    bool contains(const Key& key) const {
        auto id = _shard(key);
        std::shared_lock lock(*_internal_map_lock[id]);
        return _internal_map[id].contains(key);
    }

    // Insert only if the key is not registered yet. Never replaces an existing value.
    bool insert_if_absent(const Key& key, Value value) {
        auto id = _shard(key);
        std::unique_lock lock(*_internal_map_lock[id]);
        return _internal_map[id].try_emplace(key, std::move(value)).second;
    }

    bool erase(const Key& key) {
        auto id = _shard(key);
        std::unique_lock lock(*_internal_map_lock[id]);
        return _internal_map[id].erase(key) > 0;
    }

    void clear() {
        for (size_t id = 0; id < _num_shards; id++) {
            std::unique_lock lock(*_internal_map_lock[id]);
            _internal_map[id].clear();
        }
    }

    size_t num_items() const {
        size_t n = 0;
        for (size_t id = 0; id < _num_shards; id++) {
            std::shared_lock lock(*_internal_map_lock[id]);
            n += _internal_map[id].size();
        }
        return n;
    }

    // Copies all values. Shards are locked one at a time, the result is consistent per
    // entry, not across entries.
    std::vector<Value> values() const {
        std::vector<Value> res;
        for (size_t id = 0; id < _num_shards; id++) {
            std::shared_lock lock(*_internal_map_lock[id]);
            res.reserve(res.size() + _internal_map[id].size());
            for (const auto& entry : _internal_map[id]) {
                res.push_back(entry.second);
            }
        }
        return res;
    }

    // Calls function(const MapType&) for every shard while holding its read lock.
    // function must not call back into this map.
    template <typename Function>
    void apply(Function&& function) const {
        for (size_t id = 0; id < _num_shards; id++) {
            std::shared_lock lock(*_internal_map_lock[id]);
            function(_internal_map[id]);
        }
    }

private:
    size_t _shard(const Key& key) const { return std::hash<Key> {}(key) % _num_shards; }

    const size_t _num_shards;
    std::vector<std::unique_ptr<std::shared_mutex>> _internal_map_lock;
    std::vector<MapType> _internal_map;
};

#include "common/compile_check_end.h"
} // namespace vigil

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

#include <cstdint>
#include <memory>
#include <mutex>
#include <vector>

#include "runtime/query_management/memory_leak_detector.h"
#include "runtime/query_management/query_execution.h"

namespace vigil {

// Cluster memory accounting. The QueryManager hands it the running queries on every
// enforcement pass and asks it to audit for leaks from time to time.
class ClusterMemoryManager {
public:
    virtual ~ClusterMemoryManager() = default;

    virtual void process(const std::vector<std::shared_ptr<QueryExecution>>& running_queries) = 0;

    virtual void check_for_leaks(const QueryInfoSupplier& query_info_supplier) = 0;
};

// Keeps the user memory reservation of every query and fails queries above the
// per query memory limit (config::query_max_memory_bytes, lowered by the resource group).
class DefaultClusterMemoryManager final : public ClusterMemoryManager {
public:
    void process(const std::vector<std::shared_ptr<QueryExecution>>& running_queries) override;

    void check_for_leaks(const QueryInfoSupplier& query_info_supplier) override;

    // Reservation reported by the workers. A query that is not running anymore keeps its last
    // reservation until the workers report 0.
    void update_reservation(const QueryId& query_id, int64_t bytes);

    int64_t reservation(const QueryId& query_id) const;
    int64_t total_reservation() const;

    const ClusterMemoryLeakDetector& leak_detector() const { return _leak_detector; }

private:
    mutable std::mutex _lock;
    phmap::flat_hash_map<QueryId, int64_t> _reservations;
    ClusterMemoryLeakDetector _leak_detector;
};

} // namespace vigil

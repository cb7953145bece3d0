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
#include <cstdint>
#include <functional>
#include <mutex>
#include <vector>

#include "runtime/query_management/query_info.h"
#include "util/uid_util.h"

namespace vigil {

using QueryInfoSupplier = std::function<std::vector<BasicQueryInfo>()>;

// Finds queries that still hold memory although the coordinator forgot them, or they
// finished long enough ago for the workers to have released everything.
class ClusterMemoryLeakDetector {
public:
    // A finished query is only considered leaked this long after its end time.
    static constexpr int64_t LEAK_CLAIM_DELTA_MS = 60 * 1000;

    // Replaces the set of leaked queries with the result of this check.
    void check_for_memory_leaks(const QueryInfoSupplier& query_info_supplier,
                                const phmap::flat_hash_map<QueryId, int64_t>& reservations);

    bool was_query_possibly_leaked(const QueryId& query_id) const;

    size_t num_leaked_queries() const;

private:
    static bool _is_leaked(const phmap::flat_hash_map<QueryId, BasicQueryInfo>& infos,
                           const QueryId& query_id, int64_t now_ms);

    mutable std::mutex _lock;
    phmap::flat_hash_set<QueryId> _leaked_queries;
};

} // namespace vigil

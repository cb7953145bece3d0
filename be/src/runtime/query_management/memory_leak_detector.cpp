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

#include "runtime/query_management/memory_leak_detector.h"

#include <fmt/format.h>

#include <iterator>

#include "common/logging.h"
#include "util/time.h"

namespace vigil {
#include "common/compile_check_begin.h"

void ClusterMemoryLeakDetector::check_for_memory_leaks(
        const QueryInfoSupplier& query_info_supplier,
        const phmap::flat_hash_map<QueryId, int64_t>& reservations) {
    phmap::flat_hash_map<QueryId, BasicQueryInfo> infos;
    for (auto& info : query_info_supplier()) {
        infos.emplace(info.query_id, std::move(info));
    }

    int64_t now_ms = UnixMillis();
    phmap::flat_hash_set<QueryId> leaked;
    fmt::memory_buffer leaked_desc;
    for (const auto& [query_id, bytes] : reservations) {
        if (bytes <= 0 || !_is_leaked(infos, query_id, now_ms)) {
            continue;
        }
        leaked.insert(query_id);
        fmt::format_to(std::back_inserter(leaked_desc), "{}{}={}", leaked.size() > 1 ? ", " : "",
                       print_id(query_id), bytes);
    }
    if (!leaked.empty()) {
        LOG(WARNING) << "Memory leak detected. The following queries are already finished, but "
                        "they have memory reservations on some worker node(s): "
                     << fmt::to_string(leaked_desc);
    }

    std::lock_guard<std::mutex> l(_lock);
    _leaked_queries.swap(leaked);
}

bool ClusterMemoryLeakDetector::was_query_possibly_leaked(const QueryId& query_id) const {
    std::lock_guard<std::mutex> l(_lock);
    return _leaked_queries.contains(query_id);
}

size_t ClusterMemoryLeakDetector::num_leaked_queries() const {
    std::lock_guard<std::mutex> l(_lock);
    return _leaked_queries.size();
}

bool ClusterMemoryLeakDetector::_is_leaked(
        const phmap::flat_hash_map<QueryId, BasicQueryInfo>& infos, const QueryId& query_id,
        int64_t now_ms) {
    auto it = infos.find(query_id);
    if (it == infos.end()) {
        return true;
    }
    const BasicQueryInfo& info = it->second;
    if (info.state == QueryState::RUNNING || info.end_time_ms == 0) {
        return false;
    }
    return now_ms - info.end_time_ms >= LEAK_CLAIM_DELTA_MS;
}

#include "common/compile_check_end.h"
} // namespace vigil

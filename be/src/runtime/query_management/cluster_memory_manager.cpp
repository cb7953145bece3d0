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

#include "runtime/query_management/cluster_memory_manager.h"

#include <exception>

#include "common/config.h"
#include "common/logging.h"
#include "runtime/query_management/query_limit.h"
#include "util/pretty_printer.h"

namespace vigil {
#include "common/compile_check_begin.h"

void DefaultClusterMemoryManager::process(
        const std::vector<std::shared_ptr<QueryExecution>>& running_queries) {
    for (const auto& query : running_queries) {
        if (query->is_done()) {
            continue;
        }
        try {
            int64_t bytes = query->user_memory_bytes();
            update_reservation(query->query_id(), bytes);

            std::optional<DataSizeLimit> resource_group_limit;
            auto limits = query->resource_group_query_limits();
            if (limits.has_value() && limits->total_memory_bytes.has_value()) {
                resource_group_limit = create_data_size_limit(*limits->total_memory_bytes,
                                                              LimitSource::RESOURCE_GROUP);
            }
            DataSizeLimit limit = get_minimum<int64_t>(
                    {create_data_size_limit(config::query_max_memory_bytes, LimitSource::SYSTEM),
                     resource_group_limit});
            if (bytes > limit.limit()) {
                query->fail(Status::Error<ErrorCode::EXCEEDED_MEMORY_LIMIT>(
                        "Query exceeded distributed user memory limit of {} defined at the {} "
                        "level",
                        PrettyPrinter::print_bytes(limit.limit()), limit.source_name()));
            }
        } catch (const std::exception& e) {
            LOG(WARNING) << "Error enforcing memory limit for query " << print_id(query->query_id())
                         << ": " << e.what();
        }
    }
}

void DefaultClusterMemoryManager::check_for_leaks(const QueryInfoSupplier& query_info_supplier) {
    phmap::flat_hash_map<QueryId, int64_t> reservations;
    {
        std::lock_guard<std::mutex> l(_lock);
        reservations = _reservations;
    }
    _leak_detector.check_for_memory_leaks(query_info_supplier, reservations);
}

void DefaultClusterMemoryManager::update_reservation(const QueryId& query_id, int64_t bytes) {
    std::lock_guard<std::mutex> l(_lock);
    if (bytes <= 0) {
        _reservations.erase(query_id);
    } else {
        _reservations[query_id] = bytes;
    }
}

int64_t DefaultClusterMemoryManager::reservation(const QueryId& query_id) const {
    std::lock_guard<std::mutex> l(_lock);
    auto it = _reservations.find(query_id);
    return it == _reservations.end() ? 0 : it->second;
}

int64_t DefaultClusterMemoryManager::total_reservation() const {
    std::lock_guard<std::mutex> l(_lock);
    int64_t total = 0;
    for (const auto& [query_id, bytes] : _reservations) {
        total += bytes;
    }
    return total;
}

#include "common/compile_check_end.h"
} // namespace vigil

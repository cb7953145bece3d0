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

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "common/status.h"
#include "runtime/query_management/query_state.h"
#include "util/uid_util.h"

namespace vigil {

// Summary of a query, cheap to copy. Survives pruning.
struct BasicQueryInfo {
    QueryId query_id;
    QueryState state = QueryState::QUEUED;
    std::string user;
    std::string source;
    std::string query;

    int64_t create_time_ms = 0;
    int64_t execution_start_time_ms = 0;
    int64_t end_time_ms = 0;
    int64_t queued_time_ms = 0;

    int64_t total_cpu_time_ms = 0;
    int64_t raw_input_bytes = 0;
    int64_t output_positions = 0;
    int64_t user_memory_bytes = 0;
    int32_t running_task_count = 0;

    // Set for FAILED and CANCELED queries.
    std::optional<Status> failure_cause;

    bool is_done() const { return is_done_state(state); }
};

// Per stage progress reported by the runner, dropped once the query info is pruned.
struct StageInfo {
    int32_t stage_id = 0;
    std::string plan;
    int32_t total_tasks = 0;
    int32_t running_tasks = 0;
    int64_t cpu_time_ms = 0;
    int64_t raw_input_bytes = 0;
};

struct QueryInfo {
    BasicQueryInfo basic;

    int64_t written_intermediate_bytes = 0;
    int64_t output_bytes = 0;
    int64_t last_heartbeat_ms = 0;

    std::vector<StageInfo> stages;

    // True once the query reached a terminal state and no counter will change anymore.
    bool final_query_info = false;
    // True once verbose details (query text, stages) were discarded.
    bool pruned = false;
};

} // namespace vigil

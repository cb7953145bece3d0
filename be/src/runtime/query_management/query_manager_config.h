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
#include <limits>

namespace vigil {

// Settings of the QueryTracker and the QueryManager, fixed for their lifetime.
// Defaults match the ones in common/config.cpp.
struct QueryManagerConfig {
    int32_t max_query_history = 100;
    int64_t min_query_expire_age_ms = 15 * 60 * 1000;

    // Task limits are only enforced when both are lowered from the maximum.
    int32_t max_total_running_task_count_to_kill_query = std::numeric_limits<int32_t>::max();
    int32_t max_query_running_task_count = std::numeric_limits<int32_t>::max();

    int64_t query_max_run_time_ms = 100LL * 24 * 3600 * 1000;
    int64_t query_max_queued_time_ms = 100LL * 24 * 3600 * 1000;
    int64_t query_max_execution_time_ms = 100LL * 24 * 3600 * 1000;
    int64_t query_max_cpu_time_ms = 1000000000LL * 1000;
    int64_t query_max_scan_raw_input_bytes = 1LL << 50;
    int64_t query_max_written_intermediate_bytes = 2LL << 40;
    int64_t query_max_output_positions = std::numeric_limits<int64_t>::max();
    int64_t query_max_output_size_bytes = 1LL << 50;

    int32_t executor_pool_size = 5;
    int32_t executor_queue_size = 102400;

    int64_t tracker_interval_ms = 1000;
    int64_t manager_interval_ms = 1000;
    int64_t memory_leak_check_interval_ms = 60 * 1000;
    int64_t shutdown_grace_period_ms = 5000;

    bool task_limits_enabled() const {
        return max_total_running_task_count_to_kill_query != std::numeric_limits<int32_t>::max() &&
               max_query_running_task_count != std::numeric_limits<int32_t>::max();
    }

    // Snapshot of the current values in config::.
    static QueryManagerConfig create_from_config();
};

} // namespace vigil

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

#include "runtime/query_management/query_manager_config.h"

#include "common/config.h"

namespace vigil {

QueryManagerConfig QueryManagerConfig::create_from_config() {
    QueryManagerConfig conf;
    conf.max_query_history = config::max_query_history;
    conf.min_query_expire_age_ms = config::min_query_expire_age_ms;
    conf.max_total_running_task_count_to_kill_query =
            config::max_total_running_task_count_to_kill_query;
    conf.max_query_running_task_count = config::max_query_running_task_count;
    conf.query_max_run_time_ms = config::query_max_run_time_ms;
    conf.query_max_queued_time_ms = config::query_max_queued_time_ms;
    conf.query_max_execution_time_ms = config::query_max_execution_time_ms;
    conf.query_max_cpu_time_ms = config::query_max_cpu_time_ms;
    conf.query_max_scan_raw_input_bytes = config::query_max_scan_raw_input_bytes;
    conf.query_max_written_intermediate_bytes = config::query_max_written_intermediate_bytes;
    conf.query_max_output_positions = config::query_max_output_positions;
    conf.query_max_output_size_bytes = config::query_max_output_size_bytes;
    conf.executor_pool_size = config::query_manager_executor_pool_size;
    conf.executor_queue_size = config::query_manager_executor_queue_size;
    conf.tracker_interval_ms = config::query_tracker_interval_ms;
    conf.manager_interval_ms = config::query_manager_interval_ms;
    conf.memory_leak_check_interval_ms = config::query_memory_leak_check_interval_ms;
    conf.shutdown_grace_period_ms = config::query_shutdown_grace_period_ms;
    return conf;
}

} // namespace vigil

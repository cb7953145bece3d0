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
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

#include "common/status.h"
#include "runtime/query_management/query_execution.h"
#include "runtime/query_management/query_info.h"
#include "runtime/query_management/query_manager_config.h"
#include "runtime/query_management/query_manager_stats.h"
#include "runtime/query_management/query_tracker.h"
#include "runtime/query_management/session.h"
#include "util/countdown_latch.h"
#include "util/uid_util.h"

namespace vigil {

class ClusterMemoryManager;
class ClusterQueryTrackerService;
class QueryMonitor;
class ThreadPool;

// Entry point for queries of a coordinator. Registers them with the QueryTracker, starts
// them on the "query-management" pool and, in the background, fails queries that exceed a
// resource limit (memory, cpu, scan, output, written intermediate bytes).
//
// Lookups of unknown queries throw Exception(NOT_FOUND); commands on unknown queries
// (fail, cancel, heartbeat) are ignored.
class QueryManager {
public:
    // memory_manager and monitor must outlive the manager. cluster_service may be null.
    QueryManager(const QueryManagerConfig& config, ClusterMemoryManager* memory_manager,
                 QueryMonitor* monitor, ClusterQueryTrackerService* cluster_service = nullptr);

    ~QueryManager();

    QueryManager(const QueryManager&) = delete;
    QueryManager& operator=(const QueryManager&) = delete;

    Status start();

    // Fails every live query, then stops the background threads and the pool.
    void stop();

    // Registers and asynchronously starts the query. Registering the same id twice is an
    // internal error.
    Status create_query(std::shared_ptr<QueryExecution> execution);

    void fail_query(const QueryId& query_id, const Status& cause);
    void cancel_query(const QueryId& query_id);
    void record_heartbeat(const QueryId& query_id);

    QueryInfo get_query_info(const QueryId& query_id) const;
    BasicQueryInfo get_query_basic_info(const QueryId& query_id) const;
    QueryState get_query_state(const QueryId& query_id) const;
    Session get_query_session(const QueryId& query_id) const;
    int64_t get_duration_until_expiration_ms(const QueryId& query_id) const;
    bool is_query_registered(const QueryId& query_id) const;

    void add_state_change_listener(const QueryId& query_id,
                                   QueryExecution::StateChangeListener listener);
    void add_final_query_info_listener(const QueryId& query_id,
                                       QueryExecution::FinalQueryInfoListener listener);

    // Summaries of all known queries. Queries that fail to report are skipped.
    std::vector<BasicQueryInfo> get_queries() const;

    const QueryManagerStats& stats() const { return *_stats; }
    int64_t running_task_count() const { return _tracker->running_task_count(); }
    int64_t queries_killed_due_to_too_many_task() const {
        return _tracker->queries_killed_due_to_too_many_task();
    }

    QueryTracker<QueryExecution>& query_tracker() { return *_tracker; }

    // One pass of the enforcement thread, each step isolated from the others.
    void run_enforcement_pass();

    void enforce_memory_limits();
    void enforce_cpu_limits();
    void enforce_scan_limits();
    void enforce_output_positions_limits();
    // Only for queries that may materialize intermediate results.
    void enforce_written_intermediate_bytes_limit();
    void enforce_output_size_limits();

    void check_for_memory_leaks();

private:
    template <typename Check>
    void _for_each_live_query(const char* limit_name, Check check);
    void _enforcement_loop();
    void _memory_leak_check_loop();
    void _stop_threads();

    const QueryManagerConfig _config;
    ClusterMemoryManager* _memory_manager;
    QueryMonitor* _monitor;

    // Final info listeners only hold a weak reference.
    std::shared_ptr<QueryTracker<QueryExecution>> _tracker;
    std::shared_ptr<QueryManagerStats> _stats;
    std::unique_ptr<ThreadPool> _thread_pool;

    // Protects the threads and the flags below.
    std::mutex _lock;
    std::unique_ptr<std::thread> _enforcement_thread;
    std::unique_ptr<std::thread> _memory_leak_check_thread;
    CountDownLatch _stop_latch {1};
    bool _started = false;
    bool _stopped = false;
};

} // namespace vigil

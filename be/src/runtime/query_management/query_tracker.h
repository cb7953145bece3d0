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

#include <bvar/bvar.h>

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <thread>
#include <type_traits>
#include <vector>

#include "common/status.h"
#include "runtime/query_management/query_manager_config.h"
#include "runtime/query_management/tracked_query.h"
#include "util/concurrent_context_map.h"
#include "util/countdown_latch.h"
#include "util/uid_util.h"

namespace vigil {

class ClusterQueryTrackerService;

extern bvar::Adder<int64_t> g_query_tracker_killed_by_task_limit;
extern bvar::Adder<int64_t> g_query_tracker_removed_queries;

// Registry of every query known to this coordinator, live or done.
//
// Done queries are handed over with expire_query() and kept in completion order, so that the
// most recent max_query_history of them stay queryable. Older ones are pruned to a summary
// and then forgotten once they are min_query_expire_age_ms old.
//
// A background thread periodically fails queries that were abandoned by their client, that
// exceeded a time limit, or that run too many tasks while the cluster is overloaded.
//
// Include query_tracker.inline.h to use it.
template <typename T>
class QueryTracker {
    static_assert(std::is_base_of_v<TrackedQuery, T>, "T must derive from TrackedQuery");

public:
    explicit QueryTracker(const QueryManagerConfig& config,
                          ClusterQueryTrackerService* cluster_service = nullptr);

    ~QueryTracker();

    QueryTracker(const QueryTracker&) = delete;
    QueryTracker& operator=(const QueryTracker&) = delete;

    Status start();

    // Stops the maintenance thread and fails every live query with SERVER_SHUTTING_DOWN.
    // If any query was failed, waits shutdown_grace_period_ms for them to wind down.
    void stop();

    // Returns false and leaves the registered query untouched if the id is already known.
    bool add_query(std::shared_ptr<T> query);

    // Throws Exception(NOT_FOUND) for unknown ids.
    std::shared_ptr<T> get_query(const QueryId& query_id) const;

    // nullptr for unknown ids.
    std::shared_ptr<T> try_get_query(const QueryId& query_id) const;

    std::vector<std::shared_ptr<T>> get_all_queries() const;

    // Queues a done query for expiration. A query is queued at most once, unknown ids are
    // ignored.
    void expire_query(const QueryId& query_id);

    int64_t running_task_count() const { return _running_task_count.load(); }
    int64_t queries_killed_due_to_too_many_task() const { return _queries_killed_by_task_limit; }
    size_t expiration_queue_size() const;
    size_t num_queries() const { return _queries.num_items(); }

    // One pass of the maintenance thread. Each step is isolated from the failures of the
    // others.
    void run_maintenance_pass();

    void fail_abandoned_queries();
    void enforce_time_limits();
    // Kills the queries with the most tasks while the cluster runs more than
    // max_total_running_task_count_to_kill_query tasks. Only queries above
    // max_query_running_task_count are candidates.
    void enforce_task_limits();
    void remove_expired_queries();
    void prune_expired_queries();

private:
    struct TrackedEntry {
        explicit TrackedEntry(std::shared_ptr<T> query_) : query(std::move(query_)) {}

        std::shared_ptr<T> query;
        std::atomic<bool> expiration_enqueued {false};
    };

    struct ExpiredEntry {
        std::shared_ptr<TrackedEntry> entry;
        // Completion time of the query when it was queued.
        int64_t end_time_ms;
    };

    void _maintenance_loop();
    void _stop_thread();
    template <typename Step>
    void _run_step(const char* name, Step step);
    bool _is_abandoned(const T& query, int64_t now_ms) const;

    const QueryManagerConfig _config;
    ClusterQueryTrackerService* _cluster_service;

    ConcurrentContextMap<QueryId, std::shared_ptr<TrackedEntry>> _queries;

    mutable std::mutex _expiration_lock;
    std::deque<ExpiredEntry> _expiration_queue;

    std::atomic<int64_t> _running_task_count {0};
    std::atomic<int64_t> _queries_killed_by_task_limit {0};

    // Protects the maintenance thread and the flags below.
    std::mutex _thread_lock;
    std::unique_ptr<std::thread> _maintenance_thread;
    CountDownLatch _stop_latch {1};
    bool _started = false;
    bool _stopped = false;
};

} // namespace vigil

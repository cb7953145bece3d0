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

#include <fmt/format.h>

#include <chrono>
#include <exception>
#include <optional>
#include <queue>
#include <utility>

#include "common/exception.h"
#include "common/logging.h"
#include "runtime/query_management/cluster_query_tracker_service.h"
#include "runtime/query_management/query_limit.h"
#include "runtime/query_management/query_tracker.h"
#include "runtime/query_management/session.h"
#include "runtime/query_management/session_properties.h"
#include "util/pretty_printer.h"
#include "util/time.h"

namespace vigil {
#include "common/compile_check_begin.h"

template <typename T>
QueryTracker<T>::QueryTracker(const QueryManagerConfig& config,
                              ClusterQueryTrackerService* cluster_service)
        : _config(config), _cluster_service(cluster_service) {}

template <typename T>
QueryTracker<T>::~QueryTracker() {
    _stop_thread();
}

template <typename T>
Status QueryTracker<T>::start() {
    std::lock_guard<std::mutex> l(_thread_lock);
    if (_started || _stopped) {
        return Status::InternalError("QueryTracker already started");
    }
    _started = true;
    _maintenance_thread =
            std::make_unique<std::thread>(&QueryTracker<T>::_maintenance_loop, this);
    return Status::OK();
}

template <typename T>
void QueryTracker<T>::_stop_thread() {
    std::unique_ptr<std::thread> thread;
    {
        std::lock_guard<std::mutex> l(_thread_lock);
        _stopped = true;
        thread.swap(_maintenance_thread);
    }
    _stop_latch.count_down();
    if (thread != nullptr && thread->joinable()) {
        thread->join();
    }
}

template <typename T>
void QueryTracker<T>::stop() {
    _stop_thread();

    bool query_cancelled = false;
    for (const auto& entry : _queries.values()) {
        const auto& query = entry->query;
        if (query->is_done()) {
            continue;
        }
        query_cancelled = true;
        try {
            query->fail(Status::Error<ErrorCode::SERVER_SHUTTING_DOWN>(
                    "Server is shutting down. Query {} has been cancelled",
                    print_id(query->query_id())));
        } catch (const std::exception& e) {
            LOG(WARNING) << "Error failing query " << print_id(query->query_id())
                         << " on shutdown: " << e.what();
        }
    }
    if (query_cancelled) {
        LOG(INFO) << "Waiting " << _config.shutdown_grace_period_ms
                  << "ms for cancelled queries to finish";
        std::this_thread::sleep_for(std::chrono::milliseconds(_config.shutdown_grace_period_ms));
    }
}

template <typename T>
bool QueryTracker<T>::add_query(std::shared_ptr<T> query) {
    QueryId query_id = query->query_id();
    bool added =
            _queries.insert_if_absent(query_id, std::make_shared<TrackedEntry>(std::move(query)));
    if (added) {
        VLOG_DEBUG << "Added query " << print_id(query_id);
    }
    return added;
}

template <typename T>
std::shared_ptr<T> QueryTracker<T>::get_query(const QueryId& query_id) const {
    auto query = try_get_query(query_id);
    if (query == nullptr) {
        throw Exception(ErrorCode::NOT_FOUND, "Query {} not found", print_id(query_id));
    }
    return query;
}

template <typename T>
std::shared_ptr<T> QueryTracker<T>::try_get_query(const QueryId& query_id) const {
    auto entry = _queries.find(query_id);
    if (entry == nullptr) {
        return nullptr;
    }
    return entry->query;
}

template <typename T>
std::vector<std::shared_ptr<T>> QueryTracker<T>::get_all_queries() const {
    auto entries = _queries.values();
    std::vector<std::shared_ptr<T>> queries;
    queries.reserve(entries.size());
    for (const auto& entry : entries) {
        queries.push_back(entry->query);
    }
    return queries;
}

template <typename T>
void QueryTracker<T>::expire_query(const QueryId& query_id) {
    auto entry = _queries.find(query_id);
    if (entry == nullptr) {
        return;
    }
    if (!entry->query->is_done()) {
        LOG(WARNING) << "Ignore expiring query " << print_id(query_id) << " which is not done";
        return;
    }
    if (entry->expiration_enqueued.exchange(true)) {
        return;
    }
    entry->query->prune_finished_query_info();
    int64_t end_time_ms = entry->query->end_time_ms();
    if (end_time_ms <= 0) {
        end_time_ms = UnixMillis();
    }
    std::lock_guard<std::mutex> l(_expiration_lock);
    _expiration_queue.push_back({std::move(entry), end_time_ms});
}

template <typename T>
size_t QueryTracker<T>::expiration_queue_size() const {
    std::lock_guard<std::mutex> l(_expiration_lock);
    return _expiration_queue.size();
}

template <typename T>
void QueryTracker<T>::_maintenance_loop() {
    while (!_stop_latch.wait_for(std::chrono::milliseconds(_config.tracker_interval_ms))) {
        run_maintenance_pass();
        LOG_EVERY_T(INFO, 60) << "query tracker: " << num_queries() << " queries, "
                              << expiration_queue_size() << " in expiration queue, "
                              << running_task_count() << " running tasks";
    }
}

template <typename T>
template <typename Step>
void QueryTracker<T>::_run_step(const char* name, Step step) {
    try {
        step();
    } catch (const std::exception& e) {
        LOG(ERROR) << "Error " << name << ": " << e.what();
    }
}

template <typename T>
void QueryTracker<T>::run_maintenance_pass() {
    _run_step("failing abandoned queries", [this]() { fail_abandoned_queries(); });
    _run_step("enforcing time limits", [this]() { enforce_time_limits(); });
    if (_config.task_limits_enabled()) {
        _run_step("enforcing running task limits", [this]() { enforce_task_limits(); });
    }
    _run_step("removing expired queries", [this]() { remove_expired_queries(); });
    _run_step("pruning expired queries", [this]() { prune_expired_queries(); });
}

template <typename T>
bool QueryTracker<T>::_is_abandoned(const T& query, int64_t now_ms) const {
    int64_t last_heartbeat_ms = query.last_heartbeat_ms();
    int64_t timeout_ms = get_query_client_timeout_ms(query.session());
    return last_heartbeat_ms > 0 && last_heartbeat_ms < now_ms - timeout_ms;
}

template <typename T>
void QueryTracker<T>::fail_abandoned_queries() {
    for (const auto& entry : _queries.values()) {
        const auto& query = entry->query;
        try {
            if (query->is_done()) {
                continue;
            }
            int64_t now_ms = UnixMillis();
            if (!_is_abandoned(*query, now_ms)) {
                continue;
            }
            LOG(INFO) << "Failing abandoned query " << print_id(query->query_id());
            query->fail(Status::Error<ErrorCode::ABANDONED_QUERY>(
                    "Query {} has not been accessed since {}ms: currentTime {}ms",
                    print_id(query->query_id()), query->last_heartbeat_ms(), now_ms));
        } catch (const std::exception& e) {
            LOG(WARNING) << "Exception failing abandoned query " << print_id(query->query_id())
                         << ": " << e.what();
        }
    }
}

template <typename T>
void QueryTracker<T>::enforce_time_limits() {
    for (const auto& entry : _queries.values()) {
        const auto& query = entry->query;
        try {
            if (query->is_done()) {
                continue;
            }
            const Session& session = query->session();
            int64_t now_ms = UnixMillis();

            auto session_limit = [](std::optional<int64_t> ms) -> std::optional<DurationLimit> {
                if (!ms.has_value()) {
                    return std::nullopt;
                }
                return create_duration_limit(*ms, LimitSource::QUERY);
            };

            DurationLimit queued_limit = get_minimum<int64_t>(
                    {create_duration_limit(_config.query_max_queued_time_ms, LimitSource::SYSTEM),
                     session_limit(get_query_max_queued_time_ms(session))});
            if (query->queued_time_ms() > queued_limit.limit()) {
                query->fail(Status::ExceededTimeLimit(
                        "Query exceeded maximum queued time limit of {} defined at the {} level",
                        PrettyPrinter::print_duration_ms(queued_limit.limit()),
                        queued_limit.source_name()));
            }

            int64_t execution_start_ms = query->execution_start_time_ms();
            if (execution_start_ms > 0) {
                std::optional<DurationLimit> resource_group_limit;
                auto limits = query->resource_group_query_limits();
                if (limits.has_value() && limits->execution_time_ms.has_value()) {
                    resource_group_limit = create_duration_limit(*limits->execution_time_ms,
                                                                 LimitSource::RESOURCE_GROUP);
                }
                DurationLimit execution_limit = get_minimum<int64_t>(
                        {create_duration_limit(_config.query_max_execution_time_ms,
                                               LimitSource::SYSTEM),
                         resource_group_limit,
                         session_limit(get_query_max_execution_time_ms(session))});
                if (execution_start_ms + execution_limit.limit() < now_ms) {
                    query->fail(Status::ExceededTimeLimit(
                            "Query exceeded the maximum execution time limit of {} defined at "
                            "the {} level",
                            PrettyPrinter::print_duration_ms(execution_limit.limit()),
                            execution_limit.source_name()));
                }
            }

            DurationLimit run_limit = get_minimum<int64_t>(
                    {create_duration_limit(_config.query_max_run_time_ms, LimitSource::SYSTEM),
                     session_limit(get_query_max_run_time_ms(session))});
            if (query->create_time_ms() + run_limit.limit() < now_ms) {
                query->fail(Status::ExceededTimeLimit(
                        "Query exceeded maximum time limit of {} defined at the {} level",
                        PrettyPrinter::print_duration_ms(run_limit.limit()),
                        run_limit.source_name()));
            }
        } catch (const std::exception& e) {
            LOG(WARNING) << "Exception enforcing time limits of query "
                         << print_id(query->query_id()) << ": " << e.what();
        }
    }
}

template <typename T>
void QueryTracker<T>::enforce_task_limits() {
    struct Candidate {
        int64_t task_count;
        size_t order;
        std::shared_ptr<T> query;
    };
    // Most tasks on top, earliest seen first among equals.
    auto less = [](const Candidate& a, const Candidate& b) {
        if (a.task_count != b.task_count) {
            return a.task_count < b.task_count;
        }
        return a.order > b.order;
    };
    std::priority_queue<Candidate, std::vector<Candidate>, decltype(less)> candidates(less);

    int64_t total_running_task_count = 0;
    size_t order = 0;
    for (const auto& entry : _queries.values()) {
        const auto& query = entry->query;
        if (query->is_done()) {
            continue;
        }
        int64_t task_count = query->running_task_count();
        total_running_task_count += task_count;
        if (task_count > _config.max_query_running_task_count) {
            candidates.push({task_count, order++, query});
        }
    }
    if (_cluster_service != nullptr) {
        total_running_task_count = _cluster_service->running_task_count();
    }
    _running_task_count.store(total_running_task_count);

    while (total_running_task_count > _config.max_total_running_task_count_to_kill_query &&
           !candidates.empty()) {
        Candidate candidate = candidates.top();
        candidates.pop();
        try {
            LOG(WARNING) << "Killing query " << print_id(candidate.query->query_id())
                         << " running " << candidate.task_count << " of "
                         << total_running_task_count << " tasks";
            candidate.query->fail(Status::Error<ErrorCode::CLUSTER_HAS_TOO_MANY_RUNNING_TASKS>(
                    "Query killed because the cluster is overloaded with too many tasks ({}) and "
                    "this query was running with the highest number of tasks ({}). Please try "
                    "again later.",
                    total_running_task_count, candidate.task_count));
        } catch (const std::exception& e) {
            LOG(WARNING) << "Exception killing query " << print_id(candidate.query->query_id())
                         << ": " << e.what();
        }
        total_running_task_count -= candidate.task_count;
        _queries_killed_by_task_limit++;
        g_query_tracker_killed_by_task_limit << 1;
    }
}

template <typename T>
void QueryTracker<T>::remove_expired_queries() {
    int64_t time_horizon_ms = UnixMillis() - _config.min_query_expire_age_ms;
    auto max_history = static_cast<size_t>(_config.max_query_history);

    std::vector<std::shared_ptr<TrackedEntry>> removed;
    {
        std::lock_guard<std::mutex> l(_expiration_lock);
        while (_expiration_queue.size() > max_history) {
            const ExpiredEntry& front = _expiration_queue.front();
            if (front.end_time_ms > time_horizon_ms) {
                break;
            }
            removed.push_back(front.entry);
            _expiration_queue.pop_front();
        }
    }
    for (const auto& entry : removed) {
        QueryId query_id = entry->query->query_id();
        VLOG_DEBUG << "Remove query " << print_id(query_id);
        static_cast<void>(_queries.erase(query_id));
        g_query_tracker_removed_queries << 1;
    }
}

template <typename T>
void QueryTracker<T>::prune_expired_queries() {
    auto max_history = static_cast<size_t>(_config.max_query_history);
    std::vector<std::shared_ptr<TrackedEntry>> to_prune;
    {
        std::lock_guard<std::mutex> l(_expiration_lock);
        if (_expiration_queue.size() <= max_history) {
            return;
        }
        size_t count = _expiration_queue.size() - max_history;
        to_prune.reserve(count);
        for (size_t i = 0; i < count; ++i) {
            to_prune.push_back(_expiration_queue[i].entry);
        }
    }
    for (const auto& entry : to_prune) {
        entry->query->prune_expired_query_info();
    }
}

#include "common/compile_check_end.h"
} // namespace vigil

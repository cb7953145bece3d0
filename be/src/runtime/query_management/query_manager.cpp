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

#include "runtime/query_management/query_manager.h"

#include <chrono>
#include <exception>
#include <optional>
#include <utility>

#include "common/exception.h"
#include "common/logging.h"
#include "runtime/query_management/cluster_memory_manager.h"
#include "runtime/query_management/query_limit.h"
#include "runtime/query_management/query_monitor.h"
#include "runtime/query_management/query_tracker.inline.h"
#include "runtime/query_management/session_properties.h"
#include "util/pretty_printer.h"
#include "util/threadpool.h"

namespace vigil {
#include "common/compile_check_begin.h"

namespace {

std::optional<QueryLimit<int64_t>> query_level_limit(std::optional<int64_t> value) {
    if (!value.has_value()) {
        return std::nullopt;
    }
    return QueryLimit<int64_t>(*value, LimitSource::QUERY);
}

} // namespace

QueryManager::QueryManager(const QueryManagerConfig& config, ClusterMemoryManager* memory_manager,
                           QueryMonitor* monitor, ClusterQueryTrackerService* cluster_service)
        : _config(config),
          _memory_manager(memory_manager),
          _monitor(monitor),
          _tracker(std::make_shared<QueryTracker<QueryExecution>>(config, cluster_service)),
          _stats(std::make_shared<QueryManagerStats>()) {}

QueryManager::~QueryManager() {
    _stop_threads();
    if (_thread_pool != nullptr) {
        _thread_pool->shutdown();
    }
}

Status QueryManager::start() {
    std::lock_guard<std::mutex> l(_lock);
    if (_started || _stopped) {
        return Status::InternalError("QueryManager already started");
    }
    RETURN_IF_ERROR(ThreadPoolBuilder("query-management")
                            .set_min_threads(1)
                            .set_max_threads(_config.executor_pool_size)
                            .set_max_queue_size(_config.executor_queue_size)
                            .build(&_thread_pool));
    RETURN_IF_ERROR(_tracker->start());
    _enforcement_thread = std::make_unique<std::thread>(&QueryManager::_enforcement_loop, this);
    _memory_leak_check_thread =
            std::make_unique<std::thread>(&QueryManager::_memory_leak_check_loop, this);
    _started = true;
    LOG(INFO) << "QueryManager started";
    return Status::OK();
}

void QueryManager::_stop_threads() {
    std::unique_ptr<std::thread> enforcement_thread;
    std::unique_ptr<std::thread> memory_leak_check_thread;
    {
        std::lock_guard<std::mutex> l(_lock);
        _stopped = true;
        enforcement_thread.swap(_enforcement_thread);
        memory_leak_check_thread.swap(_memory_leak_check_thread);
    }
    _stop_latch.count_down();
    if (enforcement_thread != nullptr && enforcement_thread->joinable()) {
        enforcement_thread->join();
    }
    if (memory_leak_check_thread != nullptr && memory_leak_check_thread->joinable()) {
        memory_leak_check_thread->join();
    }
}

void QueryManager::stop() {
    {
        std::lock_guard<std::mutex> l(_lock);
        _stopped = true;
    }
    _tracker->stop();
    _stop_threads();
    if (_thread_pool != nullptr) {
        _thread_pool->shutdown();
    }
    LOG(INFO) << "QueryManager stopped. " << _stats->debug_string();
}

Status QueryManager::create_query(std::shared_ptr<QueryExecution> execution) {
    ThreadPool* thread_pool = nullptr;
    {
        std::lock_guard<std::mutex> l(_lock);
        if (!_started || _stopped) {
            return Status::Uninitialized("QueryManager is not running");
        }
        thread_pool = _thread_pool.get();
    }

    QueryId query_id = execution->query_id();
    if (!_tracker->add_query(execution)) {
        return Status::InternalError("Query {} already registered", print_id(query_id));
    }

    std::weak_ptr<QueryTracker<QueryExecution>> weak_tracker = _tracker;
    QueryMonitor* monitor = _monitor;
    execution->add_final_query_info_listener(
            [weak_tracker, monitor, query_id](const QueryInfo& info) {
                try {
                    monitor->query_completed_event(info);
                } catch (const std::exception& e) {
                    LOG(WARNING) << "Error reporting completion of query " << print_id(query_id)
                                 << ": " << e.what();
                }
                if (auto tracker = weak_tracker.lock(); tracker != nullptr) {
                    tracker->expire_query(query_id);
                }
            });

    _stats->track_query_stats(execution);

    Status st = thread_pool->submit_func([execution]() { execution->start(); });
    if (!st.ok()) {
        LOG(WARNING) << "Failed to submit query " << print_id(query_id) << ": " << st;
        execution->fail(st);
    }
    return Status::OK();
}

void QueryManager::fail_query(const QueryId& query_id, const Status& cause) {
    if (auto query = _tracker->try_get_query(query_id); query != nullptr) {
        query->fail(cause);
    }
}

void QueryManager::cancel_query(const QueryId& query_id) {
    VLOG_NOTICE << "Cancel query " << print_id(query_id);
    if (auto query = _tracker->try_get_query(query_id); query != nullptr) {
        query->cancel_query();
    }
}

void QueryManager::record_heartbeat(const QueryId& query_id) {
    if (auto query = _tracker->try_get_query(query_id); query != nullptr) {
        query->record_heartbeat();
    }
}

QueryInfo QueryManager::get_query_info(const QueryId& query_id) const {
    return _tracker->get_query(query_id)->query_info();
}

BasicQueryInfo QueryManager::get_query_basic_info(const QueryId& query_id) const {
    return _tracker->get_query(query_id)->basic_query_info();
}

QueryState QueryManager::get_query_state(const QueryId& query_id) const {
    return _tracker->get_query(query_id)->state();
}

Session QueryManager::get_query_session(const QueryId& query_id) const {
    return _tracker->get_query(query_id)->session();
}

int64_t QueryManager::get_duration_until_expiration_ms(const QueryId& query_id) const {
    return _tracker->get_query(query_id)->duration_until_expiration_ms();
}

bool QueryManager::is_query_registered(const QueryId& query_id) const {
    return _tracker->try_get_query(query_id) != nullptr;
}

void QueryManager::add_state_change_listener(const QueryId& query_id,
                                             QueryExecution::StateChangeListener listener) {
    _tracker->get_query(query_id)->add_state_change_listener(std::move(listener));
}

void QueryManager::add_final_query_info_listener(
        const QueryId& query_id, QueryExecution::FinalQueryInfoListener listener) {
    _tracker->get_query(query_id)->add_final_query_info_listener(std::move(listener));
}

std::vector<BasicQueryInfo> QueryManager::get_queries() const {
    std::vector<BasicQueryInfo> infos;
    for (const auto& query : _tracker->get_all_queries()) {
        try {
            infos.push_back(query->basic_query_info());
        } catch (const std::exception& e) {
            VLOG_DEBUG << "Skip query " << print_id(query->query_id()) << ": " << e.what();
        }
    }
    return infos;
}

void QueryManager::_enforcement_loop() {
    while (!_stop_latch.wait_for(std::chrono::milliseconds(_config.manager_interval_ms))) {
        run_enforcement_pass();
    }
}

void QueryManager::_memory_leak_check_loop() {
    while (!_stop_latch.wait_for(
            std::chrono::milliseconds(_config.memory_leak_check_interval_ms))) {
        try {
            check_for_memory_leaks();
        } catch (const std::exception& e) {
            LOG(ERROR) << "Error checking for memory leaks: " << e.what();
        }
    }
}

void QueryManager::run_enforcement_pass() {
    auto run_step = [](const char* name, auto&& step) {
        try {
            step();
        } catch (const std::exception& e) {
            LOG(ERROR) << "Error " << name << ": " << e.what();
        }
    };
    run_step("enforcing memory limits", [this]() { enforce_memory_limits(); });
    run_step("enforcing CPU limits", [this]() { enforce_cpu_limits(); });
    run_step("enforcing scan limits", [this]() { enforce_scan_limits(); });
    run_step("enforcing output positions limits", [this]() { enforce_output_positions_limits(); });
    run_step("enforcing written intermediate bytes limits",
             [this]() { enforce_written_intermediate_bytes_limit(); });
    run_step("enforcing output size limits", [this]() { enforce_output_size_limits(); });
}

template <typename Check>
void QueryManager::_for_each_live_query(const char* limit_name, Check check) {
    for (const auto& query : _tracker->get_all_queries()) {
        if (query->is_done()) {
            continue;
        }
        try {
            check(*query);
        } catch (const std::exception& e) {
            LOG(WARNING) << "Error enforcing " << limit_name << " limit of query "
                         << print_id(query->query_id()) << ": " << e.what();
        }
    }
}

void QueryManager::enforce_memory_limits() {
    std::vector<std::shared_ptr<QueryExecution>> running_queries;
    for (auto& query : _tracker->get_all_queries()) {
        if (query->state() == QueryState::RUNNING) {
            running_queries.push_back(std::move(query));
        }
    }
    _memory_manager->process(running_queries);
}

void QueryManager::enforce_cpu_limits() {
    _for_each_live_query("CPU", [this](QueryExecution& query) {
        std::optional<DurationLimit> resource_group_limit;
        auto limits = query.resource_group_query_limits();
        if (limits.has_value() && limits->cpu_time_ms.has_value()) {
            resource_group_limit =
                    create_duration_limit(*limits->cpu_time_ms, LimitSource::RESOURCE_GROUP);
        }
        DurationLimit limit = get_minimum<int64_t>(
                {create_duration_limit(_config.query_max_cpu_time_ms, LimitSource::SYSTEM),
                 resource_group_limit,
                 query_level_limit(get_query_max_cpu_time_ms(query.session()))});
        if (query.total_cpu_time_ms() > limit.limit()) {
            query.fail(Status::Error<ErrorCode::EXCEEDED_CPU_LIMIT>(
                    "Query exceeded {} CPU limit of {}", limit.source_name(),
                    PrettyPrinter::print_duration_ms(limit.limit())));
        }
    });
}

void QueryManager::enforce_scan_limits() {
    _for_each_live_query("scan", [this](QueryExecution& query) {
        std::optional<DataSizeLimit> resource_group_limit;
        auto limits = query.resource_group_query_limits();
        if (limits.has_value() && limits->scan_raw_input_bytes.has_value()) {
            resource_group_limit = create_data_size_limit(*limits->scan_raw_input_bytes,
                                                          LimitSource::RESOURCE_GROUP);
        }
        DataSizeLimit limit = get_minimum<int64_t>(
                {create_data_size_limit(_config.query_max_scan_raw_input_bytes,
                                        LimitSource::SYSTEM),
                 resource_group_limit,
                 query_level_limit(get_query_max_scan_raw_input_bytes(query.session()))});
        if (query.raw_input_bytes() >= limit.limit()) {
            query.fail(Status::Error<ErrorCode::EXCEEDED_SCAN_LIMIT>(
                    "Query has exceeded Scan Limit of {} defined at the {} level",
                    PrettyPrinter::print_bytes(limit.limit()), limit.source_name()));
        }
    });
}

void QueryManager::enforce_output_positions_limits() {
    _for_each_live_query("output positions", [this](QueryExecution& query) {
        QueryLimit<int64_t> limit = get_minimum<int64_t>(
                {QueryLimit<int64_t>(_config.query_max_output_positions, LimitSource::SYSTEM),
                 query_level_limit(get_query_max_output_positions(query.session()))});
        if (query.output_positions() > limit.limit()) {
            query.fail(Status::Error<ErrorCode::EXCEEDED_OUTPUT_POSITIONS_LIMIT>(
                    "Query has exceeded output rows Limit of {}", limit.limit()));
        }
    });
}

void QueryManager::enforce_written_intermediate_bytes_limit() {
    _for_each_live_query("written intermediate bytes", [this](QueryExecution& query) {
        if (!is_intermediate_materialization_enabled(query.session())) {
            return;
        }
        DataSizeLimit limit = get_minimum<int64_t>(
                {create_data_size_limit(_config.query_max_written_intermediate_bytes,
                                        LimitSource::SYSTEM),
                 query_level_limit(get_query_max_written_intermediate_bytes(query.session()))});
        if (query.written_intermediate_bytes() >= limit.limit()) {
            query.fail(Status::Error<ErrorCode::EXCEEDED_INTERMEDIATE_WRITTEN_BYTES>(
                    "Query has exceeded written intermediate bytes Limit of {}",
                    PrettyPrinter::print_bytes(limit.limit())));
        }
    });
}

void QueryManager::enforce_output_size_limits() {
    _for_each_live_query("output size", [this](QueryExecution& query) {
        DataSizeLimit limit = get_minimum<int64_t>(
                {create_data_size_limit(_config.query_max_output_size_bytes, LimitSource::SYSTEM),
                 query_level_limit(get_query_max_output_size_bytes(query.session()))});
        if (query.output_bytes() >= limit.limit()) {
            query.fail(Status::Error<ErrorCode::EXCEEDED_OUTPUT_SIZE_LIMIT>(
                    "Query has exceeded output size Limit of {}",
                    PrettyPrinter::print_bytes(limit.limit())));
        }
    });
}

void QueryManager::check_for_memory_leaks() {
    _memory_manager->check_for_leaks([this]() { return get_queries(); });
}

#include "common/compile_check_end.h"
} // namespace vigil

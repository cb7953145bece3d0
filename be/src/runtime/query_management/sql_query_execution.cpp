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

#include "runtime/query_management/sql_query_execution.h"

#include <exception>
#include <utility>

#include "common/exception.h"
#include "common/logging.h"

namespace vigil {
#include "common/compile_check_begin.h"

SqlQueryExecution::SqlQueryExecution(const QueryId& query_id, std::string query,
                                     std::shared_ptr<const Session> session,
                                     std::shared_ptr<QueryRunner> runner,
                                     std::optional<ResourceGroupQueryLimits> resource_group_limits)
        : _state_machine(query_id),
          _session(std::move(session)),
          _resource_group_limits(std::move(resource_group_limits)),
          _query(std::move(query)),
          _runner(std::move(runner)) {
    _state_machine.add_state_change_listener([this](QueryState new_state) {
        if (is_done_state(new_state)) {
            _fire_final_query_info();
        }
    });
}

void SqlQueryExecution::start() {
    if (!_state_machine.transition_to_running()) {
        return;
    }
    auto runner = _get_runner();
    if (runner == nullptr) {
        fail(Status::InternalError("Query {} has no runner", print_id(query_id())));
        return;
    }

    Status st;
    try {
        st = runner->run(this);
    } catch (const Exception& e) {
        st = e.to_status();
    } catch (const std::exception& e) {
        st = Status::InternalError("Query {} runner failed: {}", print_id(query_id()), e.what());
    }
    if (!st.ok()) {
        fail(st);
        return;
    }
    // Both are no-ops if the query was failed or canceled while running.
    static_cast<void>(_state_machine.transition_to_finishing());
    static_cast<void>(_state_machine.transition_to_finished());
}

void SqlQueryExecution::fail(const Status& cause) {
    // Terminal listeners may prune the runner, so it is taken before the transition.
    auto runner = _get_runner();
    if (!_state_machine.transition_to_failed(cause)) {
        return;
    }
    if (runner != nullptr) {
        runner->cancel(cause);
    }
}

void SqlQueryExecution::cancel_query() {
    auto runner = _get_runner();
    if (!_state_machine.transition_to_canceled()) {
        return;
    }
    if (runner != nullptr) {
        runner->cancel(Status::UserCanceled("Query was canceled"));
    }
}

void SqlQueryExecution::prune_expired_query_info() {
    std::lock_guard<std::mutex> l(_lock);
    _query.clear();
    _query.shrink_to_fit();
    _stages.clear();
    _stages.shrink_to_fit();
    _pruned = true;
}

void SqlQueryExecution::prune_finished_query_info() {
    std::shared_ptr<QueryRunner> runner;
    {
        std::lock_guard<std::mutex> l(_lock);
        runner.swap(_runner);
    }
    // runner is released outside of the lock.
}

void SqlQueryExecution::add_state_change_listener(StateChangeListener listener) {
    _state_machine.add_state_change_listener(std::move(listener));
}

void SqlQueryExecution::add_final_query_info_listener(FinalQueryInfoListener listener) {
    {
        std::lock_guard<std::mutex> l(_lock);
        if (!_final_info_fired) {
            _final_info_listeners.push_back(std::move(listener));
            return;
        }
    }
    QueryInfo info = query_info();
    try {
        listener(info);
    } catch (const std::exception& e) {
        LOG(WARNING) << "final query info listener of query " << print_id(query_id())
                     << " failed: " << e.what();
    }
}

void SqlQueryExecution::add_stage_info(StageInfo stage) {
    std::lock_guard<std::mutex> l(_lock);
    if (_pruned) {
        return;
    }
    _stages.push_back(std::move(stage));
}

BasicQueryInfo SqlQueryExecution::basic_query_info() const {
    BasicQueryInfo info;
    info.query_id = query_id();
    info.state = state();
    info.user = _session->user();
    info.source = _session->source();
    {
        std::lock_guard<std::mutex> l(_lock);
        info.query = _query;
    }
    info.create_time_ms = create_time_ms();
    info.execution_start_time_ms = execution_start_time_ms();
    info.end_time_ms = end_time_ms();
    info.queued_time_ms = queued_time_ms();
    info.total_cpu_time_ms = total_cpu_time_ms();
    info.raw_input_bytes = raw_input_bytes();
    info.output_positions = output_positions();
    info.user_memory_bytes = user_memory_bytes();
    info.running_task_count = running_task_count();
    info.failure_cause = _state_machine.failure_cause();
    return info;
}

QueryInfo SqlQueryExecution::query_info() const {
    QueryInfo info;
    info.basic = basic_query_info();
    info.written_intermediate_bytes = written_intermediate_bytes();
    info.output_bytes = output_bytes();
    info.last_heartbeat_ms = last_heartbeat_ms();
    info.final_query_info = info.basic.is_done();
    std::lock_guard<std::mutex> l(_lock);
    info.stages = _stages;
    info.pruned = _pruned;
    return info;
}

std::shared_ptr<QueryRunner> SqlQueryExecution::_get_runner() const {
    std::lock_guard<std::mutex> l(_lock);
    return _runner;
}

void SqlQueryExecution::_fire_final_query_info() {
    std::vector<FinalQueryInfoListener> listeners;
    {
        std::lock_guard<std::mutex> l(_lock);
        if (_final_info_fired) {
            return;
        }
        _final_info_fired = true;
        listeners.swap(_final_info_listeners);
    }
    if (listeners.empty()) {
        return;
    }
    QueryInfo info = query_info();
    for (auto& listener : listeners) {
        try {
            listener(info);
        } catch (const std::exception& e) {
            LOG(WARNING) << "final query info listener of query " << print_id(query_id())
                         << " failed: " << e.what();
        }
    }
}

#include "common/compile_check_end.h"
} // namespace vigil

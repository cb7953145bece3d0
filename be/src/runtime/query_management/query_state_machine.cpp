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

#include "runtime/query_management/query_state_machine.h"

#include <exception>

#include "common/logging.h"
#include "util/time.h"

namespace vigil {
#include "common/compile_check_begin.h"

QueryStateMachine::QueryStateMachine(const QueryId& query_id)
        : _query_id(query_id), _create_time_ms(UnixMillis()) {
    _last_heartbeat_ms.store(_create_time_ms, std::memory_order_relaxed);
}

bool QueryStateMachine::transition_to_running() {
    {
        std::lock_guard<std::mutex> l(_lock);
        if (_state.load(std::memory_order_relaxed) != QueryState::QUEUED) {
            return false;
        }
        _execution_start_time_ms.store(UnixMillis(), std::memory_order_release);
        _state.store(QueryState::RUNNING, std::memory_order_release);
    }
    _notify(QueryState::RUNNING);
    return true;
}

bool QueryStateMachine::transition_to_finishing() {
    {
        std::lock_guard<std::mutex> l(_lock);
        if (_state.load(std::memory_order_relaxed) != QueryState::RUNNING) {
            return false;
        }
        _state.store(QueryState::FINISHING, std::memory_order_release);
    }
    _notify(QueryState::FINISHING);
    return true;
}

bool QueryStateMachine::transition_to_finished() {
    return _transition_to_done(QueryState::FINISHED, nullptr);
}

bool QueryStateMachine::transition_to_failed(const Status& cause) {
    return _transition_to_done(QueryState::FAILED, &cause);
}

bool QueryStateMachine::transition_to_canceled() {
    Status cause = Status::UserCanceled("Query was canceled");
    return _transition_to_done(QueryState::CANCELED, &cause);
}

bool QueryStateMachine::_transition_to_done(QueryState target, const Status* cause) {
    {
        std::lock_guard<std::mutex> l(_lock);
        QueryState current = _state.load(std::memory_order_relaxed);
        if (is_done_state(current)) {
            return false;
        }
        // FINISHED is only reachable through FINISHING.
        if (target == QueryState::FINISHED && current != QueryState::FINISHING) {
            return false;
        }
        if (cause != nullptr) {
            _failure_cause = *cause;
        }
        _end_time_ms.store(UnixMillis(), std::memory_order_release);
        _state.store(target, std::memory_order_release);
    }
    if (target == QueryState::FAILED) {
        VLOG_NOTICE << "query " << print_id(_query_id) << " failed: " << cause->to_string();
    }
    _notify(target);
    return true;
}

void QueryStateMachine::record_heartbeat() {
    _last_heartbeat_ms.store(UnixMillis(), std::memory_order_relaxed);
}

int64_t QueryStateMachine::queued_time_ms() const {
    int64_t start = execution_start_time_ms();
    if (start > 0) {
        return start - _create_time_ms;
    }
    int64_t end = end_time_ms();
    if (end > 0) {
        return end - _create_time_ms;
    }
    return UnixMillis() - _create_time_ms;
}

std::optional<Status> QueryStateMachine::failure_cause() const {
    std::lock_guard<std::mutex> l(_lock);
    return _failure_cause;
}

void QueryStateMachine::add_state_change_listener(StateChangeListener listener) {
    QueryState current;
    {
        std::lock_guard<std::mutex> l(_lock);
        current = _state.load(std::memory_order_relaxed);
        if (!is_done_state(current)) {
            _listeners.push_back(std::move(listener));
            return;
        }
    }
    try {
        listener(current);
    } catch (const std::exception& e) {
        LOG(WARNING) << "state change listener of query " << print_id(_query_id)
                     << " failed: " << e.what();
    }
}

void QueryStateMachine::_notify(QueryState new_state) {
    std::lock_guard<std::recursive_mutex> notify_guard(_notify_lock);
    bool terminal = is_done_state(new_state);
    std::vector<StateChangeListener> listeners;
    {
        std::lock_guard<std::mutex> l(_lock);
        if (terminal) {
            // No transition follows a terminal one.
            listeners.swap(_listeners);
        } else if (is_done_state(_state.load(std::memory_order_relaxed))) {
            return;
        } else {
            listeners = _listeners;
        }
    }
    for (auto& listener : listeners) {
        // A terminal state already delivered supersedes this one.
        if (!terminal && is_done()) {
            break;
        }
        try {
            listener(new_state);
        } catch (const std::exception& e) {
            LOG(WARNING) << "state change listener of query " << print_id(_query_id)
                         << " failed: " << e.what();
        }
    }
}

#include "common/compile_check_end.h"
} // namespace vigil

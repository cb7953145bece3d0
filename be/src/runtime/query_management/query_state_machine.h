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

#include <atomic>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <vector>

#include "common/status.h"
#include "runtime/query_management/query_state.h"
#include "util/uid_util.h"

namespace vigil {

// Lifecycle of one query:
//
//   QUEUED -> RUNNING -> FINISHING -> FINISHED
//   any non terminal state -> FAILED | CANCELED
//
// All methods are thread safe. A terminal transition records the end time and the cause
// before the new state is published, so is_done() implies end_time_ms() > 0.
class QueryStateMachine {
public:
    using StateChangeListener = std::function<void(QueryState)>;

    explicit QueryStateMachine(const QueryId& query_id);

    const QueryId& query_id() const { return _query_id; }

    QueryState state() const { return _state.load(std::memory_order_acquire); }
    bool is_done() const { return is_done_state(state()); }

    // Each returns true if this call made the transition.
    bool transition_to_running();
    bool transition_to_finishing();
    bool transition_to_finished();
    bool transition_to_failed(const Status& cause);
    bool transition_to_canceled();

    void record_heartbeat();

    int64_t create_time_ms() const { return _create_time_ms; }
    int64_t execution_start_time_ms() const {
        return _execution_start_time_ms.load(std::memory_order_acquire);
    }
    int64_t last_heartbeat_ms() const { return _last_heartbeat_ms.load(std::memory_order_relaxed); }
    int64_t end_time_ms() const { return _end_time_ms.load(std::memory_order_acquire); }
    int64_t queued_time_ms() const;

    std::optional<Status> failure_cause() const;

    // Called outside of the state lock after every transition, one notification at a time.
    // A non terminal state is not delivered once the query is done. Added to a query that
    // is already done, the listener is called at once with the terminal state.
    // Exceptions thrown by a listener are logged and dropped.
    void add_state_change_listener(StateChangeListener listener);

private:
    bool _transition_to_done(QueryState target, const Status* cause);
    void _notify(QueryState new_state);

    const QueryId _query_id;
    const int64_t _create_time_ms;

    mutable std::mutex _lock;
    // Serializes listener calls. Recursive since a listener may move the query to a
    // terminal state.
    std::recursive_mutex _notify_lock;
    std::atomic<QueryState> _state {QueryState::QUEUED};
    std::atomic<int64_t> _execution_start_time_ms {0};
    std::atomic<int64_t> _last_heartbeat_ms {0};
    std::atomic<int64_t> _end_time_ms {0};
    // Protected by _lock.
    std::optional<Status> _failure_cause;
    std::vector<StateChangeListener> _listeners;
};

} // namespace vigil

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

#include "runtime/query_management/query_manager_stats.h"

#include <fmt/format.h>

#include <mutex>

#include "common/logging.h"
#include "runtime/query_management/query_execution.h"

namespace vigil {
#include "common/compile_check_begin.h"

namespace {

// Whether one query was counted as started and as stopped. The RUNNING listener and the
// final info listener may run concurrently.
struct QueryStatsState {
    std::mutex lock;
    bool started = false;
    bool stopped = false;
};

} // namespace

void QueryManagerStats::track_query_stats(const std::shared_ptr<QueryExecution>& query) {
    _submitted << 1;
    _queued << 1;

    auto state = std::make_shared<QueryStatsState>();
    std::weak_ptr<QueryManagerStats> weak_stats = weak_from_this();
    query->add_state_change_listener([weak_stats, state](QueryState new_state) {
        if (new_state != QueryState::RUNNING) {
            return;
        }
        auto stats = weak_stats.lock();
        if (stats == nullptr) {
            return;
        }
        std::lock_guard<std::mutex> l(state->lock);
        if (state->stopped || state->started) {
            return;
        }
        state->started = true;
        stats->_query_started();
    });
    query->add_final_query_info_listener([weak_stats, state](const QueryInfo& info) {
        auto stats = weak_stats.lock();
        if (stats == nullptr) {
            return;
        }
        std::lock_guard<std::mutex> l(state->lock);
        if (state->stopped) {
            return;
        }
        state->stopped = true;
        stats->_query_stopped(info, state->started);
    });
}

void QueryManagerStats::_query_started() {
    _started << 1;
    _queued << -1;
    _running << 1;
}

void QueryManagerStats::_query_stopped(const QueryInfo& info, bool started) {
    if (started) {
        _running << -1;
    } else {
        _queued << -1;
    }
    _completed << 1;

    const BasicQueryInfo& basic = info.basic;
    if (basic.state == QueryState::CANCELED) {
        _canceled << 1;
        return;
    }
    if (basic.state != QueryState::FAILED || !basic.failure_cause.has_value()) {
        return;
    }
    _failed << 1;
    const Status& cause = *basic.failure_cause;
    if (cause.is<ErrorCode::ABANDONED_QUERY>()) {
        _abandoned << 1;
    } else if (cause.is<ErrorCode::EXCEEDED_TIME_LIMIT>()) {
        _exceeded_time_limit << 1;
    }
    switch (cause.error_type()) {
    case ErrorCode::ErrorType::USER_ERROR:
        _user_error_failures << 1;
        break;
    case ErrorCode::ErrorType::INTERNAL_ERROR:
        _internal_failures << 1;
        break;
    case ErrorCode::ErrorType::INSUFFICIENT_RESOURCES:
        _insufficient_resources_failures << 1;
        break;
    case ErrorCode::ErrorType::EXTERNAL:
        _external_failures << 1;
        break;
    case ErrorCode::ErrorType::NONE:
        break;
    }
}

void QueryManagerStats::expose(const std::string& prefix) {
    auto expose_one = [&prefix](bvar::Variable& var, const char* name) {
        if (var.expose_as(prefix, name) != 0) {
            LOG(WARNING) << "failed to expose bvar " << prefix << "_" << name;
        }
    };
    expose_one(_submitted, "submitted_queries");
    expose_one(_started, "started_queries");
    expose_one(_queued, "queued_queries");
    expose_one(_running, "running_queries");
    expose_one(_completed, "completed_queries");
    expose_one(_failed, "failed_queries");
    expose_one(_abandoned, "abandoned_queries");
    expose_one(_canceled, "canceled_queries");
    expose_one(_user_error_failures, "user_error_failures");
    expose_one(_internal_failures, "internal_failures");
    expose_one(_external_failures, "external_failures");
    expose_one(_insufficient_resources_failures, "insufficient_resources_failures");
    expose_one(_exceeded_time_limit, "exceeded_time_limit_failures");
}

std::string QueryManagerStats::debug_string() const {
    return fmt::format(
            "submitted={}, queued={}, running={}, completed={}, failed={}, canceled={}, "
            "abandoned={}",
            submitted_queries(), queued_queries(), running_queries(), completed_queries(),
            failed_queries(), canceled_queries(), abandoned_queries());
}

#include "common/compile_check_end.h"
} // namespace vigil

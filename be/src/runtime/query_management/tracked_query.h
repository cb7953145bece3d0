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
#include <optional>

#include "common/status.h"
#include "runtime/query_management/resource_group_limits.h"
#include "util/uid_util.h"

namespace vigil {

class Session;

// What QueryTracker needs from a query. Implementations must be thread safe: the tracker
// calls into them from its maintenance thread while the query executes elsewhere.
class TrackedQuery {
public:
    virtual ~TrackedQuery() = default;

    virtual QueryId query_id() const = 0;

    // Monotonic: once true it never becomes false.
    virtual bool is_done() const = 0;

    virtual const Session& session() const = 0;

    // All timestamps are unix millis, 0 when the event did not happen yet.
    virtual int64_t create_time_ms() const = 0;
    virtual int64_t execution_start_time_ms() const = 0;
    virtual int64_t last_heartbeat_ms() const = 0;
    virtual int64_t end_time_ms() const = 0;

    // Time spent in QUEUED, up to now for a query that is still queued.
    virtual int64_t queued_time_ms() const = 0;

    virtual std::optional<ResourceGroupQueryLimits> resource_group_query_limits() const = 0;

    virtual int32_t running_task_count() const = 0;

    // Forces the query into FAILED. No-op for a query that is already done.
    virtual void fail(const Status& cause) = 0;

    // Drops verbose state of a query that is about to leave the history, keeping the summary.
    virtual void prune_expired_query_info() = 0;

    // Drops what is only needed while the query runs.
    virtual void prune_finished_query_info() = 0;

    // Time left before the query is abandoned if the client stays silent.
    virtual int64_t duration_until_expiration_ms() const;
};

} // namespace vigil

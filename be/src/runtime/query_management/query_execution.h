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
#include <functional>

#include "runtime/query_management/query_info.h"
#include "runtime/query_management/query_state.h"
#include "runtime/query_management/tracked_query.h"

namespace vigil {

// A query as seen by the QueryManager: a TrackedQuery that can be started, cancelled and
// observed, and that reports the counters the resource limits are enforced on.
class QueryExecution : public TrackedQuery {
public:
    using StateChangeListener = std::function<void(QueryState)>;
    using FinalQueryInfoListener = std::function<void(const QueryInfo&)>;

    ~QueryExecution() override = default;

    virtual QueryState state() const = 0;

    // Runs the query to completion on the calling thread.
    virtual void start() = 0;

    virtual void cancel_query() = 0;

    virtual void record_heartbeat() = 0;

    virtual void add_state_change_listener(StateChangeListener listener) = 0;

    // Called exactly once, with the final info, after the query reached a terminal state.
    virtual void add_final_query_info_listener(FinalQueryInfoListener listener) = 0;

    virtual int64_t total_cpu_time_ms() const = 0;
    virtual int64_t raw_input_bytes() const = 0;
    virtual int64_t written_intermediate_bytes() const = 0;
    virtual int64_t output_positions() const = 0;
    virtual int64_t output_bytes() const = 0;
    virtual int64_t user_memory_bytes() const = 0;

    virtual BasicQueryInfo basic_query_info() const = 0;
    virtual QueryInfo query_info() const = 0;
};

} // namespace vigil

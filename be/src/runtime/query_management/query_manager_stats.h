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

#include <cstdint>
#include <memory>
#include <string>

#include "runtime/query_management/query_info.h"

namespace vigil {

class QueryExecution;

// Query counters of one QueryManager. The counters are not exposed until expose() is called,
// so several managers can live in one process.
class QueryManagerStats : public std::enable_shared_from_this<QueryManagerStats> {
public:
    QueryManagerStats() = default;

    // Counts the query as submitted and follows its state changes. The query does not keep
    // the stats alive.
    void track_query_stats(const std::shared_ptr<QueryExecution>& query);

    // Exposes the counters as "<prefix>_<name>".
    void expose(const std::string& prefix);

    int64_t submitted_queries() const { return _submitted.get_value(); }
    int64_t started_queries() const { return _started.get_value(); }
    int64_t queued_queries() const { return _queued.get_value(); }
    int64_t running_queries() const { return _running.get_value(); }
    int64_t completed_queries() const { return _completed.get_value(); }
    int64_t failed_queries() const { return _failed.get_value(); }
    int64_t abandoned_queries() const { return _abandoned.get_value(); }
    int64_t canceled_queries() const { return _canceled.get_value(); }
    int64_t user_error_failures() const { return _user_error_failures.get_value(); }
    int64_t internal_failures() const { return _internal_failures.get_value(); }
    int64_t external_failures() const { return _external_failures.get_value(); }
    int64_t insufficient_resources_failures() const {
        return _insufficient_resources_failures.get_value();
    }
    int64_t exceeded_time_limit_failures() const { return _exceeded_time_limit.get_value(); }

    std::string debug_string() const;

private:
    void _query_started();
    void _query_stopped(const QueryInfo& info, bool started);

    bvar::Adder<int64_t> _submitted;
    bvar::Adder<int64_t> _started;
    bvar::Adder<int64_t> _queued;
    bvar::Adder<int64_t> _running;
    bvar::Adder<int64_t> _completed;
    bvar::Adder<int64_t> _failed;
    bvar::Adder<int64_t> _abandoned;
    bvar::Adder<int64_t> _canceled;
    bvar::Adder<int64_t> _user_error_failures;
    bvar::Adder<int64_t> _internal_failures;
    bvar::Adder<int64_t> _external_failures;
    bvar::Adder<int64_t> _insufficient_resources_failures;
    bvar::Adder<int64_t> _exceeded_time_limit;
};

} // namespace vigil

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
#include <chrono>
#include <functional>
#include <optional>
#include <utility>

#include "common/status.h"
#include "runtime/query_management/sql_query_execution.h"
#include "util/countdown_latch.h"

namespace vigil {

// Runs the given body, or blocks until release() or cancel() when there is none.
class MockQueryRunner : public QueryRunner {
public:
    using Body = std::function<Status(SqlQueryExecution*)>;

    MockQueryRunner() = default;
    explicit MockQueryRunner(Body body) : _body(std::move(body)) {}

    Status run(SqlQueryExecution* execution) override {
        _started.count_down();
        if (_body) {
            return _body(execution);
        }
        _release.wait();
        return _result;
    }

    void cancel(const Status& cause) override {
        _cancel_count++;
        _cancel_cause = cause;
        _result = cause;
        _release.count_down();
    }

    void release() { _release.count_down(); }

    // Waits until run() was entered.
    bool wait_started(int64_t timeout_ms) {
        return _started.wait_for(std::chrono::milliseconds(timeout_ms));
    }

    int cancel_count() const { return _cancel_count.load(); }
    std::optional<Status> cancel_cause() const { return _cancel_cause; }

private:
    Body _body;
    Status _result;
    CountDownLatch _started {1};
    CountDownLatch _release {1};
    std::atomic<int> _cancel_count {0};
    std::optional<Status> _cancel_cause;
};

} // namespace vigil

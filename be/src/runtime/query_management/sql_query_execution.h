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
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "common/factory_creator.h"
#include "common/status.h"
#include "runtime/query_management/query_execution.h"
#include "runtime/query_management/query_state_machine.h"
#include "runtime/query_management/session.h"

namespace vigil {

class SqlQueryExecution;

// Boundary to the distributed scheduler. run() executes the query and reports progress
// through the counters of the execution; cancel() may be called from any thread while
// run() is in progress.
class QueryRunner {
public:
    virtual ~QueryRunner() = default;

    virtual Status run(SqlQueryExecution* execution) = 0;

    virtual void cancel(const Status& cause) = 0;
};

class SqlQueryExecution final : public QueryExecution {
    ENABLE_FACTORY_CREATOR(SqlQueryExecution);

public:
    SqlQueryExecution(const QueryId& query_id, std::string query,
                      std::shared_ptr<const Session> session, std::shared_ptr<QueryRunner> runner,
                      std::optional<ResourceGroupQueryLimits> resource_group_limits = std::nullopt);

    ~SqlQueryExecution() override = default;

    QueryId query_id() const override { return _state_machine.query_id(); }
    bool is_done() const override { return _state_machine.is_done(); }
    const Session& session() const override { return *_session; }

    int64_t create_time_ms() const override { return _state_machine.create_time_ms(); }
    int64_t execution_start_time_ms() const override {
        return _state_machine.execution_start_time_ms();
    }
    int64_t last_heartbeat_ms() const override { return _state_machine.last_heartbeat_ms(); }
    int64_t end_time_ms() const override { return _state_machine.end_time_ms(); }
    int64_t queued_time_ms() const override { return _state_machine.queued_time_ms(); }

    std::optional<ResourceGroupQueryLimits> resource_group_query_limits() const override {
        return _resource_group_limits;
    }

    int32_t running_task_count() const override {
        return _running_task_count.load(std::memory_order_relaxed);
    }

    void fail(const Status& cause) override;
    void prune_expired_query_info() override;
    void prune_finished_query_info() override;

    QueryState state() const override { return _state_machine.state(); }
    void start() override;
    void cancel_query() override;
    void record_heartbeat() override { _state_machine.record_heartbeat(); }
    void add_state_change_listener(StateChangeListener listener) override;
    void add_final_query_info_listener(FinalQueryInfoListener listener) override;

    int64_t total_cpu_time_ms() const override { return _cpu_time_ms.load(); }
    int64_t raw_input_bytes() const override { return _raw_input_bytes.load(); }
    int64_t written_intermediate_bytes() const override {
        return _written_intermediate_bytes.load();
    }
    int64_t output_positions() const override { return _output_positions.load(); }
    int64_t output_bytes() const override { return _output_bytes.load(); }
    int64_t user_memory_bytes() const override { return _user_memory_bytes.load(); }

    BasicQueryInfo basic_query_info() const override;
    QueryInfo query_info() const override;

    // Progress reported by the runner.
    void add_cpu_time_ms(int64_t delta) { _cpu_time_ms.fetch_add(delta); }
    void add_raw_input_bytes(int64_t delta) { _raw_input_bytes.fetch_add(delta); }
    void add_written_intermediate_bytes(int64_t delta) {
        _written_intermediate_bytes.fetch_add(delta);
    }
    void add_output(int64_t positions, int64_t bytes) {
        _output_positions.fetch_add(positions);
        _output_bytes.fetch_add(bytes);
    }
    void set_running_task_count(int32_t count) { _running_task_count.store(count); }
    void set_user_memory_bytes(int64_t bytes) { _user_memory_bytes.store(bytes); }
    void add_stage_info(StageInfo stage);

    std::optional<Status> failure_cause() const { return _state_machine.failure_cause(); }

private:
    std::shared_ptr<QueryRunner> _get_runner() const;
    void _fire_final_query_info();

    QueryStateMachine _state_machine;
    const std::shared_ptr<const Session> _session;
    const std::optional<ResourceGroupQueryLimits> _resource_group_limits;

    std::atomic<int64_t> _cpu_time_ms {0};
    std::atomic<int64_t> _raw_input_bytes {0};
    std::atomic<int64_t> _written_intermediate_bytes {0};
    std::atomic<int64_t> _output_positions {0};
    std::atomic<int64_t> _output_bytes {0};
    std::atomic<int64_t> _user_memory_bytes {0};
    std::atomic<int32_t> _running_task_count {0};

    // Protects everything below.
    mutable std::mutex _lock;
    std::string _query;
    std::shared_ptr<QueryRunner> _runner;
    std::vector<StageInfo> _stages;
    bool _pruned = false;
    bool _final_info_fired = false;
    std::vector<FinalQueryInfoListener> _final_info_listeners;
};

} // namespace vigil

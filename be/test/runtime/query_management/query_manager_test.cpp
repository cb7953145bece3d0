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

#include <bvar/bvar.h>
#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "common/config.h"
#include "common/exception.h"
#include "runtime/query_management/cluster_memory_manager.h"
#include "runtime/query_management/query_monitor.h"
#include "runtime/query_management/query_tracker.inline.h"
#include "runtime/query_management/sql_query_execution.h"
#include "testutil/mock_query_runner.h"

namespace vigil {

namespace {

class RecordingQueryMonitor : public QueryMonitor {
public:
    void query_completed_event(const QueryInfo& info) override {
        std::lock_guard<std::mutex> l(_lock);
        _completed.push_back(info.basic.query_id);
        if (_throws) {
            throw std::runtime_error("monitor is broken");
        }
    }

    void set_throws(bool throws) { _throws = throws; }

    size_t num_completed() const {
        std::lock_guard<std::mutex> l(_lock);
        return _completed.size();
    }

private:
    mutable std::mutex _lock;
    std::vector<QueryId> _completed;
    std::atomic<bool> _throws {false};
};

class RecordingClusterMemoryManager : public ClusterMemoryManager {
public:
    void process(const std::vector<std::shared_ptr<QueryExecution>>& running_queries) override {
        std::lock_guard<std::mutex> l(_lock);
        _processed.clear();
        for (const auto& query : running_queries) {
            _processed.push_back(query->query_id());
        }
    }

    void check_for_leaks(const QueryInfoSupplier& query_info_supplier) override {
        auto infos = query_info_supplier();
        std::lock_guard<std::mutex> l(_lock);
        _last_supplied = infos.size();
        _leak_checks++;
    }

    std::vector<QueryId> processed() const {
        std::lock_guard<std::mutex> l(_lock);
        return _processed;
    }
    size_t last_supplied() const {
        std::lock_guard<std::mutex> l(_lock);
        return _last_supplied;
    }
    int leak_checks() const {
        std::lock_guard<std::mutex> l(_lock);
        return _leak_checks;
    }

private:
    mutable std::mutex _lock;
    std::vector<QueryId> _processed;
    size_t _last_supplied = 0;
    int _leak_checks = 0;
};

bool wait_until(const std::function<bool()>& condition, int64_t timeout_ms = 10000) {
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
    while (!condition()) {
        if (std::chrono::steady_clock::now() > deadline) {
            return false;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return true;
}

} // namespace

class QueryManagerTest : public testing::Test {
public:
    void SetUp() override {
        // Background passes are driven by the tests.
        _config.tracker_interval_ms = 3600 * 1000;
        _config.manager_interval_ms = 3600 * 1000;
        _config.memory_leak_check_interval_ms = 3600 * 1000;
        _config.shutdown_grace_period_ms = 10;
    }

    void TearDown() override {
        if (_manager != nullptr) {
            _manager->stop();
        }
    }

protected:
    void start_manager() {
        _manager = std::make_unique<QueryManager>(_config, &_memory_manager, &_monitor);
        ASSERT_TRUE(_manager->start().ok());
    }

    std::shared_ptr<SqlQueryExecution> create_execution(
            std::shared_ptr<QueryRunner> runner,
            std::shared_ptr<Session> session = std::make_shared<Session>("test"),
            std::optional<ResourceGroupQueryLimits> limits = std::nullopt) {
        return SqlQueryExecution::create_shared(UniqueId::gen_uid(), "SELECT 1",
                                                std::move(session), std::move(runner), limits);
    }

    // Registers a query whose runner blocks until the query is failed or canceled.
    std::shared_ptr<SqlQueryExecution> create_running_query(
            std::shared_ptr<Session> session = std::make_shared<Session>("test"),
            std::optional<ResourceGroupQueryLimits> limits = std::nullopt) {
        auto runner = std::make_shared<MockQueryRunner>();
        auto execution = create_execution(runner, std::move(session), limits);
        EXPECT_TRUE(_manager->create_query(execution).ok());
        EXPECT_TRUE(runner->wait_started(10000));
        _runners.emplace_back(execution->query_id(), runner);
        return execution;
    }

    std::shared_ptr<MockQueryRunner> runner_of(const SqlQueryExecution& query) const {
        for (const auto& [query_id, runner] : _runners) {
            if (query_id == query.query_id()) {
                return runner;
            }
        }
        return nullptr;
    }

    // The runner of a failed or canceled query is stopped exactly once with the cause.
    void expect_runner_canceled(const SqlQueryExecution& query, int code) const {
        auto runner = runner_of(query);
        ASSERT_NE(nullptr, runner);
        EXPECT_EQ(1, runner->cancel_count());
        auto cause = runner->cancel_cause();
        ASSERT_TRUE(cause.has_value());
        EXPECT_EQ(code, cause->code());
    }

    static bool is_failed_with(const SqlQueryExecution& query, int code) {
        auto cause = query.failure_cause();
        return query.state() == QueryState::FAILED && cause.has_value() && cause->code() == code;
    }

    QueryManagerConfig _config;
    RecordingQueryMonitor _monitor;
    RecordingClusterMemoryManager _memory_manager;
    std::unique_ptr<QueryManager> _manager;
    std::vector<std::pair<QueryId, std::shared_ptr<MockQueryRunner>>> _runners;
};

TEST_F(QueryManagerTest, CreateQueryRunsAndExpires) {
    start_manager();
    auto execution = create_execution(std::make_shared<MockQueryRunner>(
            [](SqlQueryExecution*) { return Status::OK(); }));
    ASSERT_TRUE(_manager->create_query(execution).ok());

    ASSERT_TRUE(wait_until(
            [&]() { return _manager->query_tracker().expiration_queue_size() == 1; }));
    EXPECT_EQ(QueryState::FINISHED, _manager->get_query_state(execution->query_id()));
    EXPECT_EQ(1, _monitor.num_completed());
    EXPECT_TRUE(_manager->is_query_registered(execution->query_id()));

    ASSERT_TRUE(wait_until([&]() { return _manager->stats().completed_queries() == 1; }));
    EXPECT_EQ(1, _manager->stats().submitted_queries());
    EXPECT_EQ(1, _manager->stats().started_queries());
    EXPECT_EQ(0, _manager->stats().running_queries());
    EXPECT_EQ(0, _manager->stats().queued_queries());
    EXPECT_EQ(0, _manager->stats().failed_queries());
}

TEST_F(QueryManagerTest, DuplicateRegistration) {
    start_manager();
    auto execution = create_running_query();
    Status st = _manager->create_query(execution);
    EXPECT_TRUE(st.is<ErrorCode::INTERNAL_ERROR>());
    EXPECT_NE(std::string::npos, std::string(st.msg()).find("already registered"));
    EXPECT_EQ(QueryState::RUNNING, execution->state());
}

TEST_F(QueryManagerTest, CreateBeforeStart) {
    _manager = std::make_unique<QueryManager>(_config, &_memory_manager, &_monitor);
    auto execution = create_execution(std::make_shared<MockQueryRunner>());
    EXPECT_TRUE(_manager->create_query(execution).is<ErrorCode::SERVICE_UNAVAILABLE>());
    EXPECT_FALSE(_manager->is_query_registered(execution->query_id()));
}

TEST_F(QueryManagerTest, MonitorFailureStillExpires) {
    start_manager();
    _monitor.set_throws(true);
    auto execution = create_execution(std::make_shared<MockQueryRunner>(
            [](SqlQueryExecution*) { return Status::OK(); }));
    ASSERT_TRUE(_manager->create_query(execution).ok());
    ASSERT_TRUE(wait_until(
            [&]() { return _manager->query_tracker().expiration_queue_size() == 1; }));
    EXPECT_EQ(1, _monitor.num_completed());
}

TEST_F(QueryManagerTest, UnknownQueries) {
    start_manager();
    UniqueId unknown = UniqueId::gen_uid();
    _manager->fail_query(unknown, Status::InternalError("x"));
    _manager->cancel_query(unknown);
    _manager->record_heartbeat(unknown);

    EXPECT_THROW(static_cast<void>(_manager->get_query_info(unknown)), Exception);
    EXPECT_THROW(static_cast<void>(_manager->get_query_state(unknown)), Exception);
    EXPECT_THROW(static_cast<void>(_manager->get_query_session(unknown)), Exception);
    EXPECT_THROW(static_cast<void>(_manager->get_duration_until_expiration_ms(unknown)),
                 Exception);
    try {
        _manager->add_state_change_listener(unknown, [](QueryState) {});
        FAIL() << "expected an exception";
    } catch (const Exception& e) {
        EXPECT_EQ(ErrorCode::NOT_FOUND, e.code());
    }
}

TEST_F(QueryManagerTest, FailAndCancel) {
    start_manager();
    auto failed = create_running_query();
    auto canceled = create_running_query();

    _manager->fail_query(failed->query_id(), Status::Error<ErrorCode::GENERIC_USER_ERROR>("bad"));
    _manager->cancel_query(canceled->query_id());
    EXPECT_TRUE(is_failed_with(*failed, ErrorCode::GENERIC_USER_ERROR));
    EXPECT_EQ(QueryState::CANCELED, canceled->state());
    expect_runner_canceled(*failed, ErrorCode::GENERIC_USER_ERROR);
    expect_runner_canceled(*canceled, ErrorCode::USER_CANCELED);

    ASSERT_TRUE(wait_until([&]() { return _manager->stats().completed_queries() == 2; }));
    EXPECT_EQ(1, _manager->stats().failed_queries());
    EXPECT_EQ(1, _manager->stats().user_error_failures());
    EXPECT_EQ(1, _manager->stats().canceled_queries());
}

TEST_F(QueryManagerTest, FailStopsRunnerOfExpiredQuery) {
    start_manager();
    auto execution = create_running_query();
    _manager->fail_query(execution->query_id(),
                         Status::ExceededTimeLimit("Query exceeded maximum time limit"));

    // Completion expires the query and drops its runner before fail_query returns.
    EXPECT_EQ(1, _manager->query_tracker().expiration_queue_size());
    EXPECT_TRUE(is_failed_with(*execution, ErrorCode::EXCEEDED_TIME_LIMIT));
    expect_runner_canceled(*execution, ErrorCode::EXCEEDED_TIME_LIMIT);

    _manager->fail_query(execution->query_id(), Status::InternalError("again"));
    _manager->cancel_query(execution->query_id());
    EXPECT_EQ(1, runner_of(*execution)->cancel_count());
}

TEST_F(QueryManagerTest, LookupsAndListeners) {
    start_manager();
    auto session = std::make_shared<Session>("carol");
    session->set_property("query_client_timeout", "10m");
    auto execution = create_running_query(session);
    QueryId id = execution->query_id();

    EXPECT_EQ(QueryState::RUNNING, _manager->get_query_state(id));
    EXPECT_EQ("carol", _manager->get_query_session(id).user());
    EXPECT_EQ("carol", _manager->get_query_info(id).basic.user);
    EXPECT_EQ(id, _manager->get_query_basic_info(id).query_id);
    EXPECT_GT(_manager->get_duration_until_expiration_ms(id), 9 * 60 * 1000);
    _manager->record_heartbeat(id);

    std::atomic<int> final_infos {0};
    std::atomic<bool> saw_failed {false};
    _manager->add_final_query_info_listener(id, [&](const QueryInfo&) { final_infos++; });
    _manager->add_state_change_listener(id, [&](QueryState state) {
        if (state == QueryState::FAILED) {
            saw_failed = true;
        }
    });

    auto queries = _manager->get_queries();
    ASSERT_EQ(1, queries.size());
    EXPECT_EQ(id, queries[0].query_id);

    _manager->fail_query(id, Status::InternalError("stop"));
    EXPECT_EQ(1, final_infos.load());
    EXPECT_TRUE(saw_failed.load());
}

TEST_F(QueryManagerTest, CpuLimit) {
    _config.query_max_cpu_time_ms = 1000;
    start_manager();
    auto at_limit = create_running_query();
    at_limit->add_cpu_time_ms(1000);
    auto over_limit = create_running_query();
    over_limit->add_cpu_time_ms(1001);

    ResourceGroupQueryLimits limits;
    limits.cpu_time_ms = 100;
    auto over_group_limit = create_running_query(std::make_shared<Session>("test"), limits);
    over_group_limit->add_cpu_time_ms(101);

    _manager->enforce_cpu_limits();
    EXPECT_EQ(QueryState::RUNNING, at_limit->state());
    EXPECT_EQ(0, runner_of(*at_limit)->cancel_count());
    EXPECT_TRUE(is_failed_with(*over_limit, ErrorCode::EXCEEDED_CPU_LIMIT));
    expect_runner_canceled(*over_limit, ErrorCode::EXCEEDED_CPU_LIMIT);
    EXPECT_NE(std::string::npos, std::string(over_limit->failure_cause()->msg()).find("SYSTEM"));
    EXPECT_TRUE(is_failed_with(*over_group_limit, ErrorCode::EXCEEDED_CPU_LIMIT));
    EXPECT_NE(std::string::npos,
              std::string(over_group_limit->failure_cause()->msg()).find("RESOURCE_GROUP"));
}

TEST_F(QueryManagerTest, CpuLimitFromSession) {
    start_manager();
    auto session = std::make_shared<Session>("test");
    session->set_property("query_max_cpu_time", "1s");
    auto query = create_running_query(session);
    query->add_cpu_time_ms(1500);
    _manager->enforce_cpu_limits();
    EXPECT_TRUE(is_failed_with(*query, ErrorCode::EXCEEDED_CPU_LIMIT));
    EXPECT_NE(std::string::npos, std::string(query->failure_cause()->msg()).find("QUERY"));
}

TEST_F(QueryManagerTest, ScanLimit) {
    _config.query_max_scan_raw_input_bytes = 100;
    start_manager();
    auto below = create_running_query();
    below->add_raw_input_bytes(99);
    auto at_limit = create_running_query();
    at_limit->add_raw_input_bytes(100);

    _manager->enforce_scan_limits();
    EXPECT_EQ(QueryState::RUNNING, below->state());
    EXPECT_TRUE(is_failed_with(*at_limit, ErrorCode::EXCEEDED_SCAN_LIMIT));
}

TEST_F(QueryManagerTest, OutputPositionsLimit) {
    _config.query_max_output_positions = 10;
    start_manager();
    auto at_limit = create_running_query();
    at_limit->add_output(10, 1);
    auto over_limit = create_running_query();
    over_limit->add_output(11, 1);

    _manager->enforce_output_positions_limits();
    EXPECT_EQ(QueryState::RUNNING, at_limit->state());
    EXPECT_TRUE(is_failed_with(*over_limit, ErrorCode::EXCEEDED_OUTPUT_POSITIONS_LIMIT));
}

TEST_F(QueryManagerTest, OutputSizeLimit) {
    _config.query_max_output_size_bytes = 100;
    start_manager();
    auto below = create_running_query();
    below->add_output(1, 99);
    auto at_limit = create_running_query();
    at_limit->add_output(1, 100);

    _manager->enforce_output_size_limits();
    EXPECT_EQ(QueryState::RUNNING, below->state());
    EXPECT_TRUE(is_failed_with(*at_limit, ErrorCode::EXCEEDED_OUTPUT_SIZE_LIMIT));
}

TEST_F(QueryManagerTest, WrittenIntermediateBytesLimit) {
    _config.query_max_written_intermediate_bytes = 100;
    start_manager();
    auto not_materialized = create_running_query();
    not_materialized->add_written_intermediate_bytes(1000);

    auto session = std::make_shared<Session>("test");
    session->set_property("enable_intermediate_materialization", "true");
    auto materialized = create_running_query(session);
    materialized->add_written_intermediate_bytes(100);

    _manager->enforce_written_intermediate_bytes_limit();
    EXPECT_EQ(QueryState::RUNNING, not_materialized->state());
    EXPECT_TRUE(is_failed_with(*materialized, ErrorCode::EXCEEDED_INTERMEDIATE_WRITTEN_BYTES));
}

TEST_F(QueryManagerTest, EnforcementPass) {
    _config.query_max_scan_raw_input_bytes = 100;
    _config.query_max_output_positions = 10;
    start_manager();
    auto scan = create_running_query();
    scan->add_raw_input_bytes(100);
    auto output = create_running_query();
    output->add_output(11, 1);
    auto fine = create_running_query();

    _manager->run_enforcement_pass();
    EXPECT_TRUE(is_failed_with(*scan, ErrorCode::EXCEEDED_SCAN_LIMIT));
    EXPECT_TRUE(is_failed_with(*output, ErrorCode::EXCEEDED_OUTPUT_POSITIONS_LIMIT));
    EXPECT_EQ(QueryState::RUNNING, fine->state());
}

TEST_F(QueryManagerTest, MemoryManagerGetsRunningQueries) {
    start_manager();
    auto running = create_running_query();
    auto failed = create_running_query();
    _manager->fail_query(failed->query_id(), Status::InternalError("x"));

    _manager->enforce_memory_limits();
    auto processed = _memory_manager.processed();
    ASSERT_EQ(1, processed.size());
    EXPECT_EQ(running->query_id(), processed[0]);
}

TEST_F(QueryManagerTest, CheckForMemoryLeaks) {
    start_manager();
    create_running_query();
    create_running_query();
    _manager->check_for_memory_leaks();
    EXPECT_EQ(1, _memory_manager.leak_checks());
    EXPECT_EQ(2, _memory_manager.last_supplied());
}

TEST_F(QueryManagerTest, BackgroundEnforcement) {
    _config.manager_interval_ms = 10;
    _config.memory_leak_check_interval_ms = 10;
    _config.query_max_scan_raw_input_bytes = 100;
    start_manager();
    auto query = create_running_query();
    query->add_raw_input_bytes(1000);
    EXPECT_TRUE(wait_until([&]() { return query->is_done(); }));
    EXPECT_TRUE(is_failed_with(*query, ErrorCode::EXCEEDED_SCAN_LIMIT));
    EXPECT_TRUE(wait_until([&]() { return _memory_manager.leak_checks() > 0; }));
}

TEST_F(QueryManagerTest, StopFailsLiveQueries) {
    start_manager();
    std::vector<std::shared_ptr<SqlQueryExecution>> queries;
    for (int i = 0; i < 3; ++i) {
        queries.push_back(create_running_query());
    }
    _manager->stop();
    for (const auto& query : queries) {
        EXPECT_TRUE(is_failed_with(*query, ErrorCode::SERVER_SHUTTING_DOWN));
        expect_runner_canceled(*query, ErrorCode::SERVER_SHUTTING_DOWN);
    }
    auto late = create_execution(std::make_shared<MockQueryRunner>());
    EXPECT_FALSE(_manager->create_query(late).ok());
}

TEST_F(QueryManagerTest, ConfigSnapshot) {
    ASSERT_TRUE(config::set_config("max_query_history", "7").ok());
    ASSERT_TRUE(config::set_config("query_max_cpu_time_ms", "60000").ok());
    QueryManagerConfig snapshot = QueryManagerConfig::create_from_config();
    config::reset_to_default();

    EXPECT_EQ(7, snapshot.max_query_history);
    EXPECT_EQ(60000, snapshot.query_max_cpu_time_ms);
    EXPECT_FALSE(snapshot.task_limits_enabled());
    EXPECT_EQ(100, QueryManagerConfig::create_from_config().max_query_history);
}

TEST(QueryManagerStatsTest, Expose) {
    auto stats = std::make_shared<QueryManagerStats>();
    stats->expose("vigil_stats_test");
    auto execution = SqlQueryExecution::create_shared(
            UniqueId::gen_uid(), "SELECT 1", std::make_shared<Session>("test"),
            std::make_shared<MockQueryRunner>([](SqlQueryExecution*) { return Status::OK(); }));
    stats->track_query_stats(execution);
    execution->start();

    EXPECT_EQ(1, stats->submitted_queries());
    EXPECT_EQ(1, stats->completed_queries());
    EXPECT_EQ("1", bvar::Variable::describe_exposed("vigil_stats_test_submitted_queries"));
    EXPECT_EQ("1", bvar::Variable::describe_exposed("vigil_stats_test_completed_queries"));
    EXPECT_NE(std::string::npos, stats->debug_string().find("completed=1"));
}

} // namespace vigil

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

#include "runtime/query_management/memory_leak_detector.h"

#include <gtest/gtest.h>

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "common/config.h"
#include "runtime/query_management/cluster_memory_manager.h"
#include "runtime/query_management/sql_query_execution.h"
#include "testutil/mock_query_runner.h"
#include "util/time.h"

namespace vigil {

namespace {

BasicQueryInfo make_info(const QueryId& id, QueryState state, int64_t end_time_ms) {
    BasicQueryInfo info;
    info.query_id = id;
    info.state = state;
    info.end_time_ms = end_time_ms;
    return info;
}

} // namespace

class MemoryLeakDetectorTest : public testing::Test {
protected:
    ClusterMemoryLeakDetector _detector;
};

TEST_F(MemoryLeakDetectorTest, DetectLeaks) {
    int64_t now = UnixMillis();
    UniqueId unknown(1, 1);
    UniqueId running(2, 2);
    UniqueId finished_long_ago(3, 3);
    UniqueId finished_recently(4, 4);
    UniqueId released(5, 5);

    std::vector<BasicQueryInfo> infos {
            make_info(running, QueryState::RUNNING, 0),
            make_info(finished_long_ago, QueryState::FINISHED, now - 61 * 1000),
            make_info(finished_recently, QueryState::FAILED, now - 1000),
            make_info(released, QueryState::FINISHED, now - 120 * 1000),
    };
    phmap::flat_hash_map<QueryId, int64_t> reservations {
            {unknown, 100}, {running, 100}, {finished_long_ago, 100}, {finished_recently, 100},
            {released, 0}};

    _detector.check_for_memory_leaks([&infos]() { return infos; }, reservations);
    EXPECT_EQ(2, _detector.num_leaked_queries());
    EXPECT_TRUE(_detector.was_query_possibly_leaked(unknown));
    EXPECT_TRUE(_detector.was_query_possibly_leaked(finished_long_ago));
    EXPECT_FALSE(_detector.was_query_possibly_leaked(running));
    EXPECT_FALSE(_detector.was_query_possibly_leaked(finished_recently));
    EXPECT_FALSE(_detector.was_query_possibly_leaked(released));

    // Each check replaces the previous result.
    _detector.check_for_memory_leaks([]() { return std::vector<BasicQueryInfo> {}; }, {});
    EXPECT_EQ(0, _detector.num_leaked_queries());
}

class ClusterMemoryManagerTest : public testing::Test {
public:
    void TearDown() override { config::query_max_memory_bytes = _default_limit; }

protected:
    std::shared_ptr<SqlQueryExecution> create_query(
            int64_t memory_bytes, std::optional<ResourceGroupQueryLimits> limits = std::nullopt) {
        auto execution = SqlQueryExecution::create_shared(
                UniqueId::gen_uid(), "SELECT 1", std::make_shared<Session>("test"),
                std::make_shared<MockQueryRunner>(), limits);
        execution->set_user_memory_bytes(memory_bytes);
        return execution;
    }

    int64_t _default_limit = config::query_max_memory_bytes;
    DefaultClusterMemoryManager _memory_manager;
};

TEST_F(ClusterMemoryManagerTest, Process) {
    config::query_max_memory_bytes = 1000;
    ResourceGroupQueryLimits limits;
    limits.total_memory_bytes = 100;

    auto small = create_query(50);
    auto over_system = create_query(1001);
    auto over_group = create_query(200, limits);

    _memory_manager.process({small, over_system, over_group});
    EXPECT_FALSE(small->is_done());
    ASSERT_EQ(QueryState::FAILED, over_system->state());
    EXPECT_TRUE(over_system->failure_cause()->is<ErrorCode::EXCEEDED_MEMORY_LIMIT>());
    EXPECT_NE(std::string::npos, over_system->failure_cause()->msg().find("SYSTEM"));
    ASSERT_EQ(QueryState::FAILED, over_group->state());
    EXPECT_NE(std::string::npos, over_group->failure_cause()->msg().find("RESOURCE_GROUP"));

    EXPECT_EQ(50, _memory_manager.reservation(small->query_id()));
    EXPECT_EQ(50 + 1001 + 200, _memory_manager.total_reservation());

    _memory_manager.update_reservation(over_system->query_id(), 0);
    EXPECT_EQ(0, _memory_manager.reservation(over_system->query_id()));
    EXPECT_EQ(250, _memory_manager.total_reservation());
}

TEST_F(ClusterMemoryManagerTest, CheckForLeaks) {
    auto query = create_query(10);
    _memory_manager.process({query});
    _memory_manager.update_reservation(UniqueId(9, 9), 20);

    std::vector<BasicQueryInfo> infos {query->basic_query_info()};
    _memory_manager.check_for_leaks([&infos]() { return infos; });
    EXPECT_EQ(1, _memory_manager.leak_detector().num_leaked_queries());
    EXPECT_TRUE(_memory_manager.leak_detector().was_query_possibly_leaked(UniqueId(9, 9)));
}

} // namespace vigil

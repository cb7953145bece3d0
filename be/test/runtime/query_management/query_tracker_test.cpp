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

#include "runtime/query_management/query_tracker.h"

#include <gtest/gtest.h>

#include <chrono>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "common/exception.h"
#include "runtime/query_management/cluster_query_tracker_service.h"
#include "runtime/query_management/query_tracker.inline.h"
#include "testutil/mock_tracked_query.h"
#include "util/time.h"

namespace vigil {

namespace {

class FixedClusterQueryTrackerService : public ClusterQueryTrackerService {
public:
    explicit FixedClusterQueryTrackerService(int64_t count) : _count(count) {}
    int64_t running_task_count() const override { return _count; }

private:
    int64_t _count;
};

constexpr int64_t HOUR_MS = 3600 * 1000;

} // namespace

class QueryTrackerTest : public testing::Test {
public:
    void SetUp() override {
        _config.tracker_interval_ms = 10;
        _config.shutdown_grace_period_ms = 10;
    }

protected:
    std::unique_ptr<QueryTracker<MockTrackedQuery>> create_tracker(
            ClusterQueryTrackerService* cluster_service = nullptr) {
        return std::make_unique<QueryTracker<MockTrackedQuery>>(_config, cluster_service);
    }

    std::shared_ptr<MockTrackedQuery> add(QueryTracker<MockTrackedQuery>* tracker,
                                          std::shared_ptr<Session> session = nullptr) {
        auto query = std::make_shared<MockTrackedQuery>(
                UniqueId::gen_uid(), session ? session : std::make_shared<Session>("test"));
        EXPECT_TRUE(tracker->add_query(query));
        return query;
    }

    static bool is_failed_with(const MockTrackedQuery& query, int code) {
        auto cause = query.failure_cause();
        return cause.has_value() && cause->code() == code;
    }

    QueryManagerConfig _config;
};

TEST_F(QueryTrackerTest, AddQuery) {
    auto tracker = create_tracker();
    UniqueId id = UniqueId::gen_uid();
    auto first = std::make_shared<MockTrackedQuery>(id);
    auto second = std::make_shared<MockTrackedQuery>(id);
    EXPECT_TRUE(tracker->add_query(first));
    EXPECT_FALSE(tracker->add_query(second));
    EXPECT_EQ(first, tracker->get_query(id));
    EXPECT_EQ(1, tracker->num_queries());
}

TEST_F(QueryTrackerTest, GetQuery) {
    auto tracker = create_tracker();
    auto query = add(tracker.get());
    EXPECT_EQ(query, tracker->try_get_query(query->query_id()));

    UniqueId unknown = UniqueId::gen_uid();
    EXPECT_EQ(nullptr, tracker->try_get_query(unknown));
    try {
        static_cast<void>(tracker->get_query(unknown));
        FAIL() << "expected an exception";
    } catch (const Exception& e) {
        EXPECT_EQ(ErrorCode::NOT_FOUND, e.code());
    }
}

TEST_F(QueryTrackerTest, GetAllQueries) {
    auto tracker = create_tracker();
    auto live = add(tracker.get());
    auto done = add(tracker.get());
    done->finish(UnixMillis());
    auto all = tracker->get_all_queries();
    EXPECT_EQ(2, all.size());
    // The result is a copy.
    all.clear();
    EXPECT_EQ(2, tracker->get_all_queries().size());
}

TEST_F(QueryTrackerTest, ExpireLiveQueryIgnored) {
    _config.max_query_history = 0;
    _config.min_query_expire_age_ms = 0;
    auto tracker = create_tracker();
    auto query = add(tracker.get());

    tracker->expire_query(query->query_id());
    EXPECT_EQ(0, tracker->expiration_queue_size());
    EXPECT_EQ(0, query->finished_prune_count());
    tracker->remove_expired_queries();
    EXPECT_EQ(query, tracker->try_get_query(query->query_id()));

    // Once done, the same query is expired and removed.
    query->finish(UnixMillis() - 1);
    tracker->expire_query(query->query_id());
    EXPECT_EQ(1, tracker->expiration_queue_size());
    tracker->remove_expired_queries();
    EXPECT_EQ(nullptr, tracker->try_get_query(query->query_id()));
}

TEST_F(QueryTrackerTest, ExpireQueryOnce) {
    auto tracker = create_tracker();
    auto query = add(tracker.get());
    query->finish(UnixMillis());

    tracker->expire_query(query->query_id());
    tracker->expire_query(query->query_id());
    EXPECT_EQ(1, tracker->expiration_queue_size());
    EXPECT_EQ(1, query->finished_prune_count());

    tracker->expire_query(UniqueId::gen_uid());
    EXPECT_EQ(1, tracker->expiration_queue_size());
}

TEST_F(QueryTrackerTest, ConcurrentExpireQuery) {
    auto tracker = create_tracker();
    auto query = add(tracker.get());
    query->finish(UnixMillis());
    std::vector<std::thread> threads;
    for (int i = 0; i < 8; ++i) {
        threads.emplace_back([&tracker, &query]() { tracker->expire_query(query->query_id()); });
    }
    for (auto& thread : threads) {
        thread.join();
    }
    EXPECT_EQ(1, tracker->expiration_queue_size());
    EXPECT_EQ(1, query->finished_prune_count());
}

TEST_F(QueryTrackerTest, RemoveExpiredQueries) {
    _config.max_query_history = 2;
    _config.min_query_expire_age_ms = HOUR_MS;
    auto tracker = create_tracker();

    std::vector<std::shared_ptr<MockTrackedQuery>> queries;
    for (int i = 0; i < 5; ++i) {
        auto query = add(tracker.get());
        query->finish(UnixMillis() - 2 * HOUR_MS + i);
        tracker->expire_query(query->query_id());
        queries.push_back(query);
    }
    auto live = add(tracker.get());

    tracker->remove_expired_queries();
    EXPECT_EQ(2, tracker->expiration_queue_size());
    for (int i = 0; i < 3; ++i) {
        EXPECT_EQ(nullptr, tracker->try_get_query(queries[i]->query_id()));
    }
    for (int i = 3; i < 5; ++i) {
        EXPECT_NE(nullptr, tracker->try_get_query(queries[i]->query_id()));
    }
    // Live queries are never removed.
    EXPECT_NE(nullptr, tracker->try_get_query(live->query_id()));
    EXPECT_EQ(3, tracker->num_queries());
}

TEST_F(QueryTrackerTest, RemoveStopsAtYoungQuery) {
    _config.max_query_history = 1;
    _config.min_query_expire_age_ms = HOUR_MS;
    auto tracker = create_tracker();

    auto old_query = add(tracker.get());
    old_query->finish(UnixMillis() - 2 * HOUR_MS);
    tracker->expire_query(old_query->query_id());
    auto young_query = add(tracker.get());
    young_query->finish(UnixMillis());
    tracker->expire_query(young_query->query_id());
    auto another_old_query = add(tracker.get());
    another_old_query->finish(UnixMillis() - 2 * HOUR_MS);
    tracker->expire_query(another_old_query->query_id());

    tracker->remove_expired_queries();
    // Queue order is completion order as seen by expire_query, the young query blocks the rest.
    EXPECT_EQ(nullptr, tracker->try_get_query(old_query->query_id()));
    EXPECT_NE(nullptr, tracker->try_get_query(young_query->query_id()));
    EXPECT_NE(nullptr, tracker->try_get_query(another_old_query->query_id()));
    EXPECT_EQ(2, tracker->expiration_queue_size());
}

TEST_F(QueryTrackerTest, PruneExpiredQueries) {
    _config.max_query_history = 2;
    _config.min_query_expire_age_ms = HOUR_MS;
    auto tracker = create_tracker();

    std::vector<std::shared_ptr<MockTrackedQuery>> queries;
    for (int i = 0; i < 5; ++i) {
        auto query = add(tracker.get());
        query->finish(UnixMillis());
        tracker->expire_query(query->query_id());
        queries.push_back(query);
    }

    tracker->remove_expired_queries();
    EXPECT_EQ(5, tracker->expiration_queue_size());

    tracker->prune_expired_queries();
    for (int i = 0; i < 3; ++i) {
        EXPECT_EQ(1, queries[i]->expired_prune_count());
    }
    for (int i = 3; i < 5; ++i) {
        EXPECT_EQ(0, queries[i]->expired_prune_count());
    }
    // Pruned queries stay retrievable.
    for (const auto& query : queries) {
        EXPECT_NE(nullptr, tracker->try_get_query(query->query_id()));
    }
    EXPECT_EQ(5, tracker->expiration_queue_size());
}

TEST_F(QueryTrackerTest, FailAbandonedQueries) {
    auto tracker = create_tracker();
    auto session = std::make_shared<Session>("test");
    session->set_property("query_client_timeout", "60s");

    auto abandoned = add(tracker.get(), session);
    abandoned->set_last_heartbeat_ms(UnixMillis() - 61 * 1000);
    auto alive = add(tracker.get(), session);
    alive->set_last_heartbeat_ms(UnixMillis() - 59 * 1000);
    auto no_heartbeat = add(tracker.get(), session);
    no_heartbeat->set_last_heartbeat_ms(0);

    tracker->fail_abandoned_queries();
    EXPECT_TRUE(abandoned->is_done());
    EXPECT_TRUE(is_failed_with(*abandoned, ErrorCode::ABANDONED_QUERY));
    EXPECT_NE(std::string::npos, abandoned->failure_cause()->msg().find("has not been accessed"));
    EXPECT_FALSE(alive->is_done());
    EXPECT_FALSE(no_heartbeat->is_done());
}

TEST_F(QueryTrackerTest, FailureOfOneQueryDoesNotStopOthers) {
    auto tracker = create_tracker();
    auto session = std::make_shared<Session>("test");
    session->set_property("query_client_timeout", "1s");

    auto broken = add(tracker.get(), session);
    broken->set_last_heartbeat_ms(UnixMillis() - 10000);
    broken->set_fail_throws(true);
    auto abandoned = add(tracker.get(), session);
    abandoned->set_last_heartbeat_ms(UnixMillis() - 10000);

    tracker->fail_abandoned_queries();
    EXPECT_FALSE(broken->is_done());
    EXPECT_TRUE(is_failed_with(*abandoned, ErrorCode::ABANDONED_QUERY));
}

TEST_F(QueryTrackerTest, QueuedTimeLimit) {
    _config.query_max_queued_time_ms = 10000;
    auto tracker = create_tracker();
    auto session = std::make_shared<Session>("test");
    session->set_property("query_max_queued_time", "5s");

    auto limited_by_session = add(tracker.get(), session);
    limited_by_session->set_queued_time_ms(6000);
    auto limited_by_system = add(tracker.get());
    limited_by_system->set_queued_time_ms(6000);

    tracker->enforce_time_limits();
    ASSERT_TRUE(is_failed_with(*limited_by_session, ErrorCode::EXCEEDED_TIME_LIMIT));
    std::string msg(limited_by_session->failure_cause()->msg());
    EXPECT_NE(std::string::npos, msg.find("queued time limit"));
    EXPECT_NE(std::string::npos, msg.find("QUERY"));
    EXPECT_FALSE(limited_by_system->is_done());

    limited_by_system->set_queued_time_ms(10001);
    tracker->enforce_time_limits();
    ASSERT_TRUE(is_failed_with(*limited_by_system, ErrorCode::EXCEEDED_TIME_LIMIT));
    EXPECT_NE(std::string::npos, limited_by_system->failure_cause()->msg().find("SYSTEM"));
}

TEST_F(QueryTrackerTest, ExecutionTimeLimit) {
    auto tracker = create_tracker();
    ResourceGroupQueryLimits limits;
    limits.execution_time_ms = 2000;

    auto running = add(tracker.get());
    running->set_resource_group_limits(limits);
    running->set_execution_start_time_ms(UnixMillis() - 3000);
    auto not_started = add(tracker.get());
    not_started->set_resource_group_limits(limits);

    tracker->enforce_time_limits();
    ASSERT_TRUE(is_failed_with(*running, ErrorCode::EXCEEDED_TIME_LIMIT));
    std::string msg(running->failure_cause()->msg());
    EXPECT_NE(std::string::npos, msg.find("maximum execution time limit"));
    EXPECT_NE(std::string::npos, msg.find("RESOURCE_GROUP"));
    EXPECT_FALSE(not_started->is_done());
}

TEST_F(QueryTrackerTest, RunTimeLimit) {
    _config.query_max_run_time_ms = 1000;
    auto tracker = create_tracker();
    auto too_old = add(tracker.get());
    too_old->set_create_time_ms(UnixMillis() - 2000);
    auto young = add(tracker.get());

    tracker->enforce_time_limits();
    ASSERT_TRUE(is_failed_with(*too_old, ErrorCode::EXCEEDED_TIME_LIMIT));
    EXPECT_NE(std::string::npos, too_old->failure_cause()->msg().find("maximum time limit"));
    EXPECT_FALSE(young->is_done());
}

TEST_F(QueryTrackerTest, TimeLimitsSkipDoneQueries) {
    _config.query_max_run_time_ms = 1000;
    auto tracker = create_tracker();
    auto done = add(tracker.get());
    done->set_create_time_ms(UnixMillis() - 2000);
    done->finish(UnixMillis());
    tracker->enforce_time_limits();
    EXPECT_FALSE(done->failure_cause().has_value());
}

TEST_F(QueryTrackerTest, TaskLimitKillsLargestQuery) {
    _config.max_query_running_task_count = 30;
    _config.max_total_running_task_count_to_kill_query = 50;
    FixedClusterQueryTrackerService cluster_service(85);
    auto tracker = create_tracker(&cluster_service);

    auto q1 = add(tracker.get());
    q1->set_running_task_count(40);
    auto q2 = add(tracker.get());
    q2->set_running_task_count(35);
    auto q3 = add(tracker.get());
    q3->set_running_task_count(10);

    tracker->enforce_task_limits();
    EXPECT_TRUE(is_failed_with(*q1, ErrorCode::CLUSTER_HAS_TOO_MANY_RUNNING_TASKS));
    EXPECT_NE(std::string::npos, q1->failure_cause()->msg().find("(85)"));
    EXPECT_FALSE(q2->is_done());
    EXPECT_FALSE(q3->is_done());
    EXPECT_EQ(1, tracker->queries_killed_due_to_too_many_task());
    EXPECT_EQ(85, tracker->running_task_count());
}

TEST_F(QueryTrackerTest, TaskLimitUsesLocalSum) {
    _config.max_query_running_task_count = 30;
    _config.max_total_running_task_count_to_kill_query = 20;
    auto tracker = create_tracker();

    auto q1 = add(tracker.get());
    q1->set_running_task_count(40);
    auto q2 = add(tracker.get());
    q2->set_running_task_count(35);
    auto q3 = add(tracker.get());
    q3->set_running_task_count(10);

    tracker->enforce_task_limits();
    // 85 -> 45 -> 10: both candidates are killed, q3 is below the per query ceiling.
    EXPECT_TRUE(q1->is_done());
    EXPECT_TRUE(q2->is_done());
    EXPECT_FALSE(q3->is_done());
    EXPECT_EQ(2, tracker->queries_killed_due_to_too_many_task());
    EXPECT_EQ(85, tracker->running_task_count());
}

TEST_F(QueryTrackerTest, TaskLimitDisabledByDefault) {
    auto tracker = create_tracker();
    auto query = add(tracker.get());
    query->set_running_task_count(1000000);
    tracker->run_maintenance_pass();
    EXPECT_FALSE(query->is_done());
    EXPECT_EQ(0, tracker->queries_killed_due_to_too_many_task());
}

TEST_F(QueryTrackerTest, Stop) {
    auto tracker = create_tracker();
    ASSERT_TRUE(tracker->start().ok());
    EXPECT_FALSE(tracker->start().ok());

    std::vector<std::shared_ptr<MockTrackedQuery>> live;
    for (int i = 0; i < 3; ++i) {
        live.push_back(add(tracker.get()));
    }
    auto done = add(tracker.get());
    done->finish(UnixMillis());

    tracker->stop();
    for (const auto& query : live) {
        EXPECT_TRUE(is_failed_with(*query, ErrorCode::SERVER_SHUTTING_DOWN));
        EXPECT_NE(std::string::npos, query->failure_cause()->msg().find("shutting down"));
    }
    EXPECT_FALSE(done->failure_cause().has_value());

    tracker->stop();
    EXPECT_FALSE(tracker->start().ok());
}

TEST_F(QueryTrackerTest, StopWithoutStart) {
    auto tracker = create_tracker();
    auto query = add(tracker.get());
    tracker->stop();
    EXPECT_TRUE(is_failed_with(*query, ErrorCode::SERVER_SHUTTING_DOWN));
}

TEST_F(QueryTrackerTest, BackgroundMaintenance) {
    _config.query_max_run_time_ms = 1000;
    auto tracker = create_tracker();
    auto query = add(tracker.get());
    query->set_create_time_ms(UnixMillis() - 2000);
    ASSERT_TRUE(tracker->start().ok());

    for (int i = 0; i < 500 && !query->is_done(); ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    EXPECT_TRUE(is_failed_with(*query, ErrorCode::EXCEEDED_TIME_LIMIT));
    tracker->stop();
}

} // namespace vigil

#include <chrono>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include <gtest/gtest.h>
#include <mariadb/mysql.h>

#include "db_test_support.hpp"
#include "leaderboard/errors.hpp"
#include "leaderboard/leaderboard_repository.hpp"

namespace {

using leaderboard::it::ApplySchema;
using leaderboard::it::OpenRawConnection;
using leaderboard::it::TestDbConfig;

class SubmissionItTest : public ::testing::Test {
 protected:
  void SetUp() override {
    ApplySchema();
    db_client_ = std::make_shared<leaderboard::MariaDbClient>(TestDbConfig());
    repository_ = std::make_shared<leaderboard::MariaDbLeaderboardRepository>(db_client_);
    repository_->ClearAll();
  }

  void Submit(int player_id, int score) {
    repository_->RecordSession(player_id, score, "solo", std::chrono::system_clock::now());
  }

  std::shared_ptr<leaderboard::MariaDbClient> db_client_;
  std::shared_ptr<leaderboard::MariaDbLeaderboardRepository> repository_;
};

TEST_F(SubmissionItTest, TotalEqualsSumOfSessions) {
  Submit(1, 100);
  Submit(1, 200);
  auto record = repository_->RecordSession(1, 150, "ranked", std::chrono::system_clock::now());
  EXPECT_EQ(record.total_score, 450);
  EXPECT_GT(record.session_id, 0);

  auto rank = repository_->FetchPlayerRank(1);
  ASSERT_TRUE(rank.has_value());
  EXPECT_EQ(rank->total_score, 450);
  EXPECT_EQ(rank->display_name, "user_1");
}

TEST_F(SubmissionItTest, ConcurrentSubmissionsSerializeOnPlayerRow) {
  std::vector<std::thread> threads;
  for (int i = 0; i < 20; ++i) {
    threads.emplace_back([this]() { Submit(9, 5); });
  }
  for (auto& thread : threads) {
    thread.join();
  }
  auto aggregate = repository_->FindAggregate(9);
  ASSERT_TRUE(aggregate.has_value());
  EXPECT_EQ(aggregate->total_score, 100);
  EXPECT_EQ(repository_->FetchStats().total_sessions, 20u);
}

TEST_F(SubmissionItTest, TopAndRankUseDenseOrdering) {
  Submit(3, 500);
  Submit(1, 500);
  Submit(2, 100);

  auto top = repository_->FetchTop(10);
  ASSERT_EQ(top.size(), 3u);
  EXPECT_EQ(top[0].player_id, 1);
  EXPECT_EQ(top[1].player_id, 3);
  EXPECT_EQ(top[1].rank, 1);
  EXPECT_EQ(top[2].rank, 2);

  auto rank = repository_->FetchPlayerRank(2);
  ASSERT_TRUE(rank.has_value());
  EXPECT_EQ(rank->rank, 2);
  EXPECT_EQ(rank->total_players, 3u);
  EXPECT_FALSE(repository_->FetchPlayerRank(77).has_value());
}

TEST_F(SubmissionItTest, RecomputeWritesStoredRanks) {
  Submit(1, 10);
  Submit(2, 30);
  Submit(3, 30);
  EXPECT_EQ(repository_->RecomputeAllRanks(), 3u);
  EXPECT_EQ(repository_->FindAggregate(2)->rank, 1);
  EXPECT_EQ(repository_->FindAggregate(3)->rank, 1);
  EXPECT_EQ(repository_->FindAggregate(1)->rank, 2);

  Submit(1, 40);
  EXPECT_EQ(repository_->RecomputePlayerRank(1), 1);
  EXPECT_FALSE(repository_->RecomputePlayerRank(404).has_value());
}

TEST_F(SubmissionItTest, StatsRoundAverageScore) {
  Submit(1, 10);
  Submit(1, 20);
  Submit(2, 31);
  auto stats = repository_->FetchStats();
  EXPECT_EQ(stats.total_players, 2u);
  EXPECT_EQ(stats.total_sessions, 3u);
  EXPECT_EQ(stats.average_score, 20);
}

TEST_F(SubmissionItTest, InjectedTransientFailureIsRetried) {
  db_client_->SetTransientInjector([](std::size_t attempt) { return attempt == 1; });
  Submit(1, 100);
  EXPECT_EQ(repository_->FindAggregate(1)->total_score, 100);
}

TEST_F(SubmissionItTest, PersistentFailureSurfacesAsTransientError) {
  db_client_->SetTransientInjector([](std::size_t) { return true; });
  EXPECT_THROW(Submit(1, 100), leaderboard::TransientStoreError);
  db_client_->SetTransientInjector(nullptr);
  EXPECT_FALSE(repository_->FindAggregate(1).has_value());
}

TEST_F(SubmissionItTest, LockTimeoutSurfacesAsTransientError) {
  Submit(1, 100);

  auto cfg = TestDbConfig();
  cfg.lock_wait_timeout_seconds = 1;
  cfg.transaction_timeout = std::chrono::seconds(2);
  auto client = std::make_shared<leaderboard::MariaDbClient>(cfg);
  leaderboard::MariaDbLeaderboardRepository repository(client);

  MYSQL* blocker = OpenRawConnection(TestDbConfig());
  ASSERT_NE(blocker, nullptr);
  mysql_autocommit(blocker, 0);
  ASSERT_EQ(mysql_query(blocker, "START TRANSACTION;"), 0);
  ASSERT_EQ(mysql_query(blocker, "SELECT * FROM players WHERE player_id = 1 FOR UPDATE;"), 0);
  MYSQL_RES* res = mysql_store_result(blocker);
  if (res) {
    mysql_free_result(res);
  }

  EXPECT_THROW(repository.RecordSession(1, 50, "solo", std::chrono::system_clock::now()),
               leaderboard::TransientStoreError);

  mysql_rollback(blocker);
  mysql_close(blocker);
  EXPECT_EQ(repository_->FindAggregate(1)->total_score, 100);
}

}  // namespace

#include <chrono>
#include <optional>
#include <string>
#include <string_view>

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include "leaderboard/errors.hpp"
#include "leaderboard/memory_store.hpp"

namespace {

using namespace std::chrono_literals;

void Record(leaderboard::MemoryLeaderboardStore& store, int player_id, int score) {
  store.RecordSession(player_id, score, "solo", std::chrono::system_clock::now());
}

TEST(MemoryStoreTest, RecordSessionUpsertsPlayerAndKeepsRunningSum) {
  leaderboard::MemoryLeaderboardStore store;
  auto first = store.RecordSession(1, 100, "solo", std::chrono::system_clock::now());
  auto second = store.RecordSession(1, 50, "ranked", std::chrono::system_clock::now());

  EXPECT_EQ(first.total_score, 100);
  EXPECT_EQ(second.total_score, 150);
  EXPECT_NE(first.session_id, second.session_id);
  EXPECT_EQ(store.SessionCount(1), 2u);

  auto rank = store.FetchPlayerRank(1);
  ASSERT_TRUE(rank.has_value());
  EXPECT_EQ(rank->display_name, "user_1");
  EXPECT_EQ(rank->total_score, 150);
  EXPECT_EQ(rank->total_players, 1u);
}

TEST(MemoryStoreTest, FetchTopUsesDenseRankAndPlayerIdTieBreak) {
  leaderboard::MemoryLeaderboardStore store;
  Record(store, 4, 100);
  Record(store, 3, 200);
  Record(store, 2, 200);
  Record(store, 1, 300);

  auto top = store.FetchTop(10);
  ASSERT_EQ(top.size(), 4u);
  EXPECT_EQ(top[0].player_id, 1);
  EXPECT_EQ(top[0].rank, 1);
  EXPECT_EQ(top[1].player_id, 2);
  EXPECT_EQ(top[1].rank, 2);
  EXPECT_EQ(top[2].player_id, 3);
  EXPECT_EQ(top[2].rank, 2);
  EXPECT_EQ(top[3].player_id, 4);
  EXPECT_EQ(top[3].rank, 3);

  EXPECT_EQ(store.FetchTop(2).size(), 2u);
  EXPECT_EQ(store.FetchPlayerRank(4)->rank, 3);
}

TEST(MemoryStoreTest, PlayerRankMatchesTopRank) {
  leaderboard::MemoryLeaderboardStore store;
  Record(store, 1, 500);
  Record(store, 2, 500);
  Record(store, 3, 10);
  for (const auto& entry : store.FetchTop(10)) {
    EXPECT_EQ(store.FetchPlayerRank(entry.player_id)->rank, entry.rank);
  }
}

TEST(MemoryStoreTest, IncrementalRecomputeTouchesOnlyOneRow) {
  leaderboard::MemoryLeaderboardStore store;
  Record(store, 1, 100);
  Record(store, 2, 200);
  EXPECT_EQ(store.RecomputeAllRanks(), 2u);
  EXPECT_EQ(store.FindAggregate(1)->rank, 2);
  EXPECT_EQ(store.FindAggregate(2)->rank, 1);

  Record(store, 1, 150);
  EXPECT_EQ(store.RecomputePlayerRank(1), 1);
  EXPECT_EQ(store.FindAggregate(1)->rank, 1);
  // 다음 전체 재계산 전까지 다른 행은 이전 값으로 남는다.
  EXPECT_EQ(store.FindAggregate(2)->rank, 1);

  store.RecomputeAllRanks();
  EXPECT_EQ(store.FindAggregate(2)->rank, 2);
}

TEST(MemoryStoreTest, UnknownPlayerHasNoAggregate) {
  leaderboard::MemoryLeaderboardStore store;
  EXPECT_FALSE(store.FetchPlayerRank(42).has_value());
  EXPECT_FALSE(store.RecomputePlayerRank(42).has_value());
  EXPECT_FALSE(store.FindAggregate(42).has_value());
}

TEST(MemoryStoreTest, StatsRoundAverageScore) {
  leaderboard::MemoryLeaderboardStore store;
  Record(store, 1, 10);
  Record(store, 1, 20);
  Record(store, 2, 31);
  auto stats = store.FetchStats();
  EXPECT_EQ(stats.total_players, 2u);
  EXPECT_EQ(stats.total_sessions, 3u);
  EXPECT_EQ(stats.average_score, 20);
}

TEST(MemoryStoreTest, InjectedFailureLeavesNothingBehind) {
  leaderboard::MemoryLeaderboardStore store;
  store.SetFailureInjector([](std::string_view op) { return op == "record_session"; });
  EXPECT_THROW(Record(store, 1, 10), leaderboard::TransientStoreError);
  store.SetFailureInjector(nullptr);
  EXPECT_EQ(store.SessionCount(1), 0u);
  EXPECT_FALSE(store.FindAggregate(1).has_value());
}

TEST(MemoryStoreTest, SessionsAreTrackedPerPlayer) {
  leaderboard::MemoryLeaderboardStore store;
  for (int i = 0; i < 1000; ++i) {
    Record(store, 2 + i % 10, 3);
  }
  auto record = store.RecordSession(1, 40, "solo", std::chrono::system_clock::now());
  EXPECT_EQ(record.total_score, 40);
  Record(store, 1, 2);

  EXPECT_EQ(store.FindAggregate(1)->total_score, 42);
  EXPECT_EQ(store.FindAggregate(2)->total_score, 300);
  EXPECT_EQ(store.SessionCount(1), 2u);
  EXPECT_EQ(store.SessionCount(5), 100u);
  EXPECT_EQ(store.SessionCount(99), 0u);

  auto stats = store.FetchStats();
  EXPECT_EQ(stats.total_players, 11u);
  EXPECT_EQ(stats.total_sessions, 1002u);
  EXPECT_EQ(stats.average_score, 3);
}

TEST(MemoryRankJobStoreTest, EnqueueCoalescesPendingDuplicates) {
  leaderboard::MemoryRankJobStore jobs;
  auto a = jobs.Enqueue(leaderboard::RankJobScope::kIncremental, 1);
  auto b = jobs.Enqueue(leaderboard::RankJobScope::kIncremental, 1);
  auto c = jobs.Enqueue(leaderboard::RankJobScope::kIncremental, 2);
  auto full1 = jobs.Enqueue(leaderboard::RankJobScope::kFull, std::nullopt);
  auto full2 = jobs.Enqueue(leaderboard::RankJobScope::kFull, std::nullopt);
  EXPECT_EQ(a, b);
  EXPECT_NE(a, c);
  EXPECT_EQ(full1, full2);
  EXPECT_EQ(jobs.Counts().pending, 3u);
}

TEST(MemoryRankJobStoreTest, RunningJobDoesNotAbsorbNewRequest) {
  leaderboard::MemoryRankJobStore jobs;
  auto first = jobs.Enqueue(leaderboard::RankJobScope::kIncremental, 1);
  ASSERT_TRUE(jobs.ClaimNext().has_value());
  auto second = jobs.Enqueue(leaderboard::RankJobScope::kIncremental, 1);
  EXPECT_NE(first, second);
}

TEST(MemoryRankJobStoreTest, ClaimPrefersFullJobs) {
  leaderboard::MemoryRankJobStore jobs;
  jobs.Enqueue(leaderboard::RankJobScope::kIncremental, 1);
  auto full = jobs.Enqueue(leaderboard::RankJobScope::kFull, std::nullopt);
  auto claimed = jobs.ClaimNext();
  ASSERT_TRUE(claimed.has_value());
  EXPECT_EQ(claimed->id, full);
  EXPECT_EQ(claimed->status, leaderboard::RankJobStatus::kRunning);
  auto next = jobs.ClaimNext();
  ASSERT_TRUE(next.has_value());
  EXPECT_EQ(next->scope, leaderboard::RankJobScope::kIncremental);
  EXPECT_FALSE(jobs.ClaimNext().has_value());
}

TEST(MemoryRankJobStoreTest, RescheduledJobWaitsForDelay) {
  leaderboard::MemoryRankJobStore jobs;
  auto id = jobs.Enqueue(leaderboard::RankJobScope::kFull, std::nullopt);
  ASSERT_TRUE(jobs.ClaimNext().has_value());
  jobs.Reschedule(id, 1, 1h, "boom");
  EXPECT_FALSE(jobs.ClaimNext().has_value());
  auto counts = jobs.Counts();
  EXPECT_EQ(counts.pending, 1u);
  EXPECT_EQ(counts.running, 0u);
  EXPECT_EQ(jobs.Find(id)->attempts, 1);
  EXPECT_EQ(jobs.Find(id)->last_error, "boom");
}

TEST(MemoryRankJobStoreTest, ReleaseRunningReturnsJobsToQueue) {
  leaderboard::MemoryRankJobStore jobs;
  jobs.Enqueue(leaderboard::RankJobScope::kIncremental, 1);
  jobs.Enqueue(leaderboard::RankJobScope::kIncremental, 2);
  ASSERT_TRUE(jobs.ClaimNext().has_value());
  ASSERT_TRUE(jobs.ClaimNext().has_value());
  EXPECT_EQ(jobs.Counts().running, 2u);

  EXPECT_EQ(jobs.ReleaseRunning(), 2u);
  EXPECT_EQ(jobs.Counts().pending, 2u);
  EXPECT_TRUE(jobs.ClaimNext().has_value());
}

TEST(MemoryRankJobStoreTest, DeadJobsAreListedNewestFirst) {
  leaderboard::MemoryRankJobStore jobs;
  auto a = jobs.Enqueue(leaderboard::RankJobScope::kIncremental, 1);
  auto b = jobs.Enqueue(leaderboard::RankJobScope::kIncremental, 2);
  jobs.MarkDead(a, 3, "first");
  jobs.MarkDead(b, 3, "second");
  auto dead = jobs.ListDead(10);
  ASSERT_EQ(dead.size(), 2u);
  EXPECT_EQ(dead[0].id, b);
  EXPECT_EQ(dead[1].last_error, "first");
  EXPECT_EQ(jobs.ListDead(1).size(), 1u);
  EXPECT_EQ(jobs.Counts().dead, 2u);
}

TEST(MemoryRankJobStoreTest, PruneCompletedKeepsMostRecent) {
  leaderboard::MemoryRankJobStore jobs;
  for (int player = 1; player <= 3; ++player) {
    auto id = jobs.Enqueue(leaderboard::RankJobScope::kIncremental, player);
    ASSERT_TRUE(jobs.ClaimNext().has_value());
    jobs.MarkCompleted(id);
  }
  EXPECT_EQ(jobs.PruneCompleted(1), 2u);
  EXPECT_EQ(jobs.Counts().completed, 1u);
  EXPECT_TRUE(jobs.Find(3).has_value());
}

TEST(StoreTextTest, TruncateKeepsWholeUtf8Characters) {
  // "가"는 3바이트이므로 4바이트 한도에서는 한 글자만 남는다.
  EXPECT_EQ(leaderboard::TruncateUtf8("가나다", 4), "가");
  EXPECT_EQ(leaderboard::TruncateUtf8("가나다", 6), "가나");
  EXPECT_EQ(leaderboard::TruncateUtf8("a가", 2), "a");
  EXPECT_EQ(leaderboard::TruncateUtf8("abc", 3), "abc");
  EXPECT_EQ(leaderboard::TruncateUtf8("가", 2), "");
}

TEST(MemoryRankJobStoreTest, LongErrorIsTruncatedOnCharacterBoundary) {
  leaderboard::MemoryRankJobStore jobs;
  auto id = jobs.Enqueue(leaderboard::RankJobScope::kFull, std::nullopt);
  ASSERT_TRUE(jobs.ClaimNext().has_value());
  std::string error = "x";
  for (int i = 0; i < 300; ++i) {
    error += "오류";
  }
  jobs.MarkDead(id, 3, error);

  auto stored = jobs.Find(id)->last_error;
  EXPECT_LE(stored.size(), leaderboard::kMaxJobErrorBytes);
  EXPECT_EQ(stored.size(), 499u);
  EXPECT_NO_THROW(nlohmann::json(stored).dump());
}

}  // namespace

#include <chrono>
#include <memory>
#include <mutex>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

#include <boost/asio/io_context.hpp>
#include <gtest/gtest.h>

#include "leaderboard/cache.hpp"
#include "leaderboard/errors.hpp"
#include "leaderboard/leaderboard_service.hpp"
#include "leaderboard/memory_store.hpp"
#include "leaderboard/notification.hpp"
#include "leaderboard/observability.hpp"
#include "leaderboard/rank_engine.hpp"

namespace {

using namespace std::chrono_literals;

class RecordingSink : public leaderboard::ScoreEventSink {
 public:
  void Publish(const leaderboard::ScoreChangedEvent& event) override {
    std::lock_guard<std::mutex> lock(mutex_);
    events_.push_back(event);
  }
  std::vector<leaderboard::ScoreChangedEvent> Events() {
    std::lock_guard<std::mutex> lock(mutex_);
    return events_;
  }

 private:
  std::mutex mutex_;
  std::vector<leaderboard::ScoreChangedEvent> events_;
};

class ThrowingSink : public leaderboard::ScoreEventSink {
 public:
  void Publish(const leaderboard::ScoreChangedEvent&) override { throw std::runtime_error("구독자 전송 실패"); }
};

struct FakeClock {
  std::shared_ptr<std::chrono::steady_clock::time_point> now =
      std::make_shared<std::chrono::steady_clock::time_point>(std::chrono::steady_clock::now());

  leaderboard::TtlCache::Clock Fn() const {
    auto current = now;
    return [current]() { return *current; };
  }
  void Advance(std::chrono::steady_clock::duration d) { *now += d; }
};

class LeaderboardServiceFixture : public ::testing::Test {
 protected:
  LeaderboardServiceFixture() {
    cache_ = std::make_shared<leaderboard::LeaderboardCache>(leaderboard::CacheTtl{60s, 30s}, clock_.Fn());
    leaderboard::RankEngineConfig config;
    config.jobs_per_second = 1000;
    config.backoff_base = 1ms;
    config.full_interval = 0s;
    engine_ = std::make_shared<leaderboard::RankRecomputeEngine>(ioc_, store_, jobs_, cache_, observability_, config);
    service_ = std::make_shared<leaderboard::LeaderboardService>(store_, cache_, engine_, observability_);
    service_->SetEventSink(sink_);
  }

  void Drain() {
    while (engine_->ProcessNext()) {
    }
  }

  boost::asio::io_context ioc_;
  FakeClock clock_;
  std::ostringstream log_;
  std::shared_ptr<leaderboard::MemoryLeaderboardStore> store_ = std::make_shared<leaderboard::MemoryLeaderboardStore>();
  std::shared_ptr<leaderboard::MemoryRankJobStore> jobs_ = std::make_shared<leaderboard::MemoryRankJobStore>();
  std::shared_ptr<leaderboard::Observability> observability_ =
      std::make_shared<leaderboard::Observability>(leaderboard::LogLevel::kDebug, &log_);
  std::shared_ptr<leaderboard::LeaderboardCache> cache_;
  std::shared_ptr<leaderboard::RankRecomputeEngine> engine_;
  std::shared_ptr<leaderboard::LeaderboardService> service_;
  std::shared_ptr<RecordingSink> sink_ = std::make_shared<RecordingSink>();
};

TEST_F(LeaderboardServiceFixture, RejectsInvalidSubmissions) {
  EXPECT_THROW(service_->SubmitScore(0, 10), leaderboard::ValidationError);
  EXPECT_THROW(service_->SubmitScore(-3, 10), leaderboard::ValidationError);
  EXPECT_THROW(service_->SubmitScore(1, -1), leaderboard::ValidationError);
  EXPECT_THROW(service_->SubmitScore(1, 1'000'001), leaderboard::ValidationError);
  EXPECT_THROW(service_->SubmitScore(1, 10, ""), leaderboard::ValidationError);
  EXPECT_THROW(service_->SubmitScore(1, 10, std::string(51, 'm')), leaderboard::ValidationError);

  EXPECT_EQ(store_->SessionCount(1), 0u);
  EXPECT_TRUE(sink_->Events().empty());
  EXPECT_EQ(jobs_->Counts().pending, 0u);
}

TEST_F(LeaderboardServiceFixture, AcceptsBoundaryScores) {
  auto low = service_->SubmitScore(1, 0);
  EXPECT_EQ(low.total_score, 0);
  auto high = service_->SubmitScore(1, 1'000'000, std::string(50, 'm'));
  EXPECT_EQ(high.total_score, 1'000'000);
  EXPECT_EQ(store_->SessionCount(1), 2u);
}

TEST_F(LeaderboardServiceFixture, TotalIsSumOfAllSessions) {
  service_->SubmitScore(1, 100);
  service_->SubmitScore(1, 200);
  auto result = service_->SubmitScore(1, 150);
  EXPECT_EQ(result.player_id, 1);
  EXPECT_EQ(result.total_score, 450);
  EXPECT_EQ(service_->GetRank(1).total_score, 450);
}

TEST_F(LeaderboardServiceFixture, ConcurrentSubmissionsAreNotLost) {
  std::vector<std::thread> threads;
  for (int i = 0; i < 50; ++i) {
    threads.emplace_back([this]() { service_->SubmitScore(7, 1); });
  }
  for (auto& thread : threads) {
    thread.join();
  }
  EXPECT_EQ(store_->FindAggregate(7)->total_score, 50);
  EXPECT_EQ(store_->SessionCount(7), 50u);
  EXPECT_EQ(sink_->Events().size(), 50u);
  // 같은 플레이어의 대기 작업은 하나로 합쳐진다.
  EXPECT_EQ(jobs_->Counts().pending, 1u);
}

TEST_F(LeaderboardServiceFixture, RankingFollowsTotalsAfterEachSubmission) {
  service_->SubmitScore(1, 100);
  service_->SubmitScore(2, 200);

  auto top = service_->GetTop(10);
  ASSERT_EQ(top.size(), 2u);
  EXPECT_EQ(top[0].player_id, 2);
  EXPECT_EQ(top[0].rank, 1);
  EXPECT_EQ(top[1].player_id, 1);
  EXPECT_EQ(top[1].rank, 2);

  service_->SubmitScore(1, 150);
  top = service_->GetTop(10);
  ASSERT_EQ(top.size(), 2u);
  EXPECT_EQ(top[0].player_id, 1);
  EXPECT_EQ(top[0].total_score, 250);
  EXPECT_EQ(top[0].rank, 1);
  EXPECT_EQ(service_->GetRank(2).rank, 2);
}

TEST_F(LeaderboardServiceFixture, TiedTotalsShareDenseRank) {
  service_->SubmitScore(3, 500);
  service_->SubmitScore(1, 500);
  service_->SubmitScore(2, 100);

  auto top = service_->GetTop(10);
  ASSERT_EQ(top.size(), 3u);
  EXPECT_EQ(top[0].player_id, 1);
  EXPECT_EQ(top[1].player_id, 3);
  EXPECT_EQ(top[0].rank, 1);
  EXPECT_EQ(top[1].rank, 1);
  EXPECT_EQ(top[2].rank, 2);

  auto rank = service_->GetRank(2);
  EXPECT_EQ(rank.rank, 2);
  EXPECT_EQ(rank.total_players, 3u);
}

TEST_F(LeaderboardServiceFixture, StoredRanksAreMonotonicAfterFullPass) {
  for (int player = 1; player <= 20; ++player) {
    service_->SubmitScore(player, (player % 7) * 100);
  }
  service_->TriggerFullRecomputation();
  Drain();

  auto rows = store_->ListAggregates();
  for (const auto& a : rows) {
    for (const auto& b : rows) {
      if (a.total_score > b.total_score) {
        EXPECT_LT(*a.rank, *b.rank);
      } else if (a.total_score == b.total_score) {
        EXPECT_EQ(*a.rank, *b.rank);
      }
    }
  }
}

TEST_F(LeaderboardServiceFixture, CachedTopIsServedUntilTtlExpires) {
  service_->SubmitScore(1, 100);
  ASSERT_EQ(service_->GetTop(10).size(), 1u);

  // 서비스를 거치지 않은 변경은 TTL이 지나기 전까지 보이지 않는다.
  store_->RecordSession(2, 900, "solo", std::chrono::system_clock::now());
  clock_.Advance(59s);
  EXPECT_EQ(service_->GetTop(10).size(), 1u);
  clock_.Advance(1s);
  auto top = service_->GetTop(10);
  ASSERT_EQ(top.size(), 2u);
  EXPECT_EQ(top[0].player_id, 2);
}

TEST_F(LeaderboardServiceFixture, CachedRankIsStaleAtMostRankTtl) {
  service_->SubmitScore(1, 100);
  EXPECT_EQ(service_->GetRank(1).total_score, 100);

  store_->RecordSession(1, 50, "solo", std::chrono::system_clock::now());
  clock_.Advance(29s);
  EXPECT_EQ(service_->GetRank(1).total_score, 100);
  clock_.Advance(1s);
  EXPECT_EQ(service_->GetRank(1).total_score, 150);
}

TEST_F(LeaderboardServiceFixture, SubmissionInvalidatesCachedViews) {
  service_->SubmitScore(1, 100);
  service_->GetTop(10);
  service_->GetRank(1);
  ASSERT_TRUE(cache_->GetTop(10).has_value());
  ASSERT_TRUE(cache_->GetRank(1).has_value());

  service_->SubmitScore(1, 10);
  EXPECT_FALSE(cache_->GetTop(10).has_value());
  EXPECT_FALSE(cache_->GetRank(1).has_value());
  EXPECT_EQ(service_->GetRank(1).total_score, 110);
}

TEST_F(LeaderboardServiceFixture, CacheLookupsAreCounted) {
  service_->SubmitScore(1, 100);
  service_->GetTop(10);
  service_->GetTop(10);
  auto metrics = observability_->Snapshot();
  EXPECT_EQ(metrics.cache_misses, 1u);
  EXPECT_EQ(metrics.cache_hits, 1u);
  EXPECT_EQ(metrics.submissions, 1u);
}

TEST_F(LeaderboardServiceFixture, UnknownPlayerIsNotFound) {
  EXPECT_THROW(service_->GetRank(42), leaderboard::NotFoundError);
  EXPECT_THROW(service_->GetRank(0), leaderboard::ValidationError);
  EXPECT_NE(log_.str().find("player_not_found"), std::string::npos);
}

TEST_F(LeaderboardServiceFixture, TopLimitIsValidated) {
  EXPECT_THROW(service_->GetTop(0), leaderboard::ValidationError);
  EXPECT_THROW(service_->GetTop(101), leaderboard::ValidationError);
  EXPECT_NO_THROW(service_->GetTop(100));
  EXPECT_TRUE(service_->GetTop(1).empty());
}

TEST_F(LeaderboardServiceFixture, StatsAggregateSessions) {
  service_->SubmitScore(1, 100);
  service_->SubmitScore(1, 200);
  service_->SubmitScore(2, 301);
  auto stats = service_->GetStats();
  EXPECT_EQ(stats.total_players, 2u);
  EXPECT_EQ(stats.total_sessions, 3u);
  EXPECT_EQ(stats.average_score, 200);
}

TEST_F(LeaderboardServiceFixture, PublishesScoreChangedEvent) {
  service_->SubmitScore(5, 321);
  auto events = sink_->Events();
  ASSERT_EQ(events.size(), 1u);
  EXPECT_EQ(events[0].player_id, 5);
  EXPECT_EQ(events[0].score, 321);
}

TEST_F(LeaderboardServiceFixture, PostCommitFailuresDoNotFailSubmission) {
  cache_->TopCache().SetFailureInjector([](std::string_view op) { return op == "del"; });
  jobs_->SetFailureInjector([](std::string_view op) { return op == "enqueue"; });
  service_->SetEventSink(std::make_shared<ThrowingSink>());

  auto result = service_->SubmitScore(1, 100);
  EXPECT_EQ(result.total_score, 100);
  EXPECT_EQ(store_->SessionCount(1), 1u);

  auto log = log_.str();
  EXPECT_NE(log.find("cache_invalidate_failed"), std::string::npos);
  EXPECT_NE(log.find("rank_enqueue_failed"), std::string::npos);
  EXPECT_NE(log.find("notification_failed"), std::string::npos);
}

TEST_F(LeaderboardServiceFixture, CacheReadFailureFallsBackToStore) {
  service_->SubmitScore(1, 100);
  cache_->TopCache().SetFailureInjector([](std::string_view op) { return op == "get"; });
  auto top = service_->GetTop(10);
  ASSERT_EQ(top.size(), 1u);
  EXPECT_NE(log_.str().find("cache_read_failed"), std::string::npos);
}

TEST_F(LeaderboardServiceFixture, StoreFailurePropagatesWithoutSideEffects) {
  store_->SetFailureInjector([](std::string_view op) { return op == "record_session"; });
  EXPECT_THROW(service_->SubmitScore(1, 100), leaderboard::TransientStoreError);
  EXPECT_TRUE(sink_->Events().empty());
  EXPECT_EQ(jobs_->Counts().pending, 0u);
  EXPECT_EQ(observability_->Snapshot().submissions, 0u);
}

TEST_F(LeaderboardServiceFixture, TriggerReturnsQueuedJob) {
  auto ack = service_->TriggerFullRecomputation();
  auto job = jobs_->Find(ack.job_id);
  ASSERT_TRUE(job.has_value());
  EXPECT_EQ(job->scope, leaderboard::RankJobScope::kFull);
  EXPECT_EQ(job->status, leaderboard::RankJobStatus::kPending);

  auto again = service_->TriggerFullRecomputation();
  EXPECT_EQ(again.job_id, ack.job_id);
  EXPECT_EQ(service_->RecalculationStatus().counts.pending, 1u);
}

TEST_F(LeaderboardServiceFixture, IncrementalEnqueueCanBeDisabled) {
  auto service = std::make_shared<leaderboard::LeaderboardService>(store_, cache_, engine_, observability_, false);
  service->SubmitScore(1, 100);
  EXPECT_EQ(jobs_->Counts().pending, 0u);
  EXPECT_EQ(service->GetRank(1).rank, 1);
}

}  // namespace

#include <chrono>
#include <memory>
#include <string_view>

#include <gtest/gtest.h>

#include "leaderboard/cache.hpp"
#include "leaderboard/errors.hpp"

namespace {

using namespace std::chrono_literals;

struct FakeClock {
  std::shared_ptr<std::chrono::steady_clock::time_point> now =
      std::make_shared<std::chrono::steady_clock::time_point>(std::chrono::steady_clock::now());

  leaderboard::TtlCache::Clock Fn() const {
    auto current = now;
    return [current]() { return *current; };
  }
  void Advance(std::chrono::steady_clock::duration d) { *now += d; }
};

std::vector<leaderboard::RankedEntry> SampleTop() {
  return {{2, "user_2", 200, 1}, {1, "user_1", 100, 2}};
}

TEST(TtlCacheTest, EntryExpiresExactlyAtTtl) {
  FakeClock clock;
  leaderboard::TtlCache cache(clock.Fn());
  cache.Set("k", "v", 30s);
  ASSERT_TRUE(cache.Get("k").has_value());
  clock.Advance(29s);
  EXPECT_EQ(cache.Get("k").value(), "v");
  clock.Advance(1s);
  EXPECT_FALSE(cache.Get("k").has_value());
}

TEST(TtlCacheTest, PurgeExpiredRemovesOnlyExpired) {
  FakeClock clock;
  leaderboard::TtlCache cache(clock.Fn());
  cache.Set("short", "a", 10s);
  cache.Set("long", "b", 60s);
  clock.Advance(11s);
  EXPECT_EQ(cache.PurgeExpired(), 1u);
  EXPECT_EQ(cache.Size(), 1u);
  EXPECT_TRUE(cache.Get("long").has_value());
}

TEST(TtlCacheTest, InjectedFailureSurfacesAsTransientError) {
  leaderboard::TtlCache cache;
  cache.SetFailureInjector([](std::string_view op) { return op == "get"; });
  cache.Set("k", "v", 10s);
  EXPECT_THROW(cache.Get("k"), leaderboard::TransientStoreError);
  cache.SetFailureInjector(nullptr);
  EXPECT_TRUE(cache.Get("k").has_value());
}

TEST(LeaderboardCacheTest, KeysFollowNamingScheme) {
  EXPECT_EQ(leaderboard::LeaderboardCache::TopKey(10), "leaderboard:top:10");
  EXPECT_EQ(leaderboard::LeaderboardCache::RankKey(7), "leaderboard:rank:7");
}

TEST(LeaderboardCacheTest, TopSnapshotRoundTripsAndExpires) {
  FakeClock clock;
  leaderboard::LeaderboardCache cache(leaderboard::CacheTtl{60s, 30s}, clock.Fn());
  cache.PutTop(10, SampleTop());

  auto cached = cache.GetTop(10);
  ASSERT_TRUE(cached.has_value());
  ASSERT_EQ(cached->size(), 2u);
  EXPECT_EQ((*cached)[0].player_id, 2);
  EXPECT_EQ((*cached)[0].display_name, "user_2");
  EXPECT_EQ((*cached)[1].rank, 2);
  EXPECT_FALSE(cache.GetTop(50).has_value());

  clock.Advance(60s);
  EXPECT_FALSE(cache.GetTop(10).has_value());
}

TEST(LeaderboardCacheTest, RankEntryUsesItsOwnTtl) {
  FakeClock clock;
  leaderboard::LeaderboardCache cache(leaderboard::CacheTtl{60s, 30s}, clock.Fn());
  cache.PutRank(leaderboard::PlayerRank{1, "user_1", 250, 1, 2});
  cache.PutTop(10, SampleTop());

  clock.Advance(30s);
  EXPECT_FALSE(cache.GetRank(1).has_value());
  EXPECT_TRUE(cache.GetTop(10).has_value());
}

TEST(LeaderboardCacheTest, InvalidateTopDropsEveryLimitButKeepsPlayers) {
  leaderboard::LeaderboardCache cache(leaderboard::CacheTtl{});
  cache.PutTop(10, SampleTop());
  cache.PutTop(50, SampleTop());
  cache.PutRank(leaderboard::PlayerRank{1, "user_1", 100, 2, 2});

  cache.InvalidateTop();

  EXPECT_FALSE(cache.GetTop(10).has_value());
  EXPECT_FALSE(cache.GetTop(50).has_value());
  auto rank = cache.GetRank(1);
  ASSERT_TRUE(rank.has_value());
  EXPECT_EQ(rank->total_score, 100);
  EXPECT_EQ(rank->total_players, 2u);
}

TEST(LeaderboardCacheTest, InvalidatePlayerOnlyDropsThatPlayer) {
  leaderboard::LeaderboardCache cache(leaderboard::CacheTtl{});
  cache.PutRank(leaderboard::PlayerRank{1, "user_1", 100, 2, 2});
  cache.PutRank(leaderboard::PlayerRank{2, "user_2", 200, 1, 2});

  cache.InvalidatePlayer(1);

  EXPECT_FALSE(cache.GetRank(1).has_value());
  EXPECT_TRUE(cache.GetRank(2).has_value());
}

}  // namespace

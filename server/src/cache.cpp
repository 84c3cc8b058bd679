/*
 * 설명: TTL 캐시와 리더보드 캐시 계층을 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/cache_test.cpp
 */
#include "leaderboard/cache.hpp"

#include <mutex>

#include <nlohmann/json.hpp>

#include "leaderboard/api_response.hpp"
#include "leaderboard/errors.hpp"

namespace leaderboard {

TtlCache::TtlCache(Clock clock) : clock_(std::move(clock)) {}

std::chrono::steady_clock::time_point TtlCache::Now() const {
  return clock_ ? clock_() : std::chrono::steady_clock::now();
}

void TtlCache::MaybeFail(std::string_view op) const {
  if (failure_injector_ && failure_injector_(op)) {
    throw TransientStoreError("캐시 사용 불가: " + std::string(op));
  }
}

void TtlCache::SetFailureInjector(FailureInjector injector) {
  std::unique_lock<std::shared_mutex> lock(mutex_);
  failure_injector_ = std::move(injector);
}

std::optional<std::string> TtlCache::Get(const std::string& key) const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  MaybeFail("get");
  auto it = entries_.find(key);
  if (it == entries_.end() || it->second.expires_at <= Now()) {
    return std::nullopt;
  }
  return it->second.value;
}

void TtlCache::Set(const std::string& key, std::string value, std::chrono::seconds ttl) {
  std::unique_lock<std::shared_mutex> lock(mutex_);
  MaybeFail("set");
  entries_[key] = Entry{std::move(value), Now() + ttl};
}

bool TtlCache::Erase(const std::string& key) {
  std::unique_lock<std::shared_mutex> lock(mutex_);
  MaybeFail("del");
  return entries_.erase(key) > 0;
}

std::size_t TtlCache::EraseAll() {
  std::unique_lock<std::shared_mutex> lock(mutex_);
  MaybeFail("del");
  auto removed = entries_.size();
  entries_.clear();
  return removed;
}

std::size_t TtlCache::PurgeExpired() {
  std::unique_lock<std::shared_mutex> lock(mutex_);
  auto now = Now();
  std::size_t removed = 0;
  for (auto it = entries_.begin(); it != entries_.end();) {
    if (it->second.expires_at <= now) {
      it = entries_.erase(it);
      ++removed;
    } else {
      ++it;
    }
  }
  return removed;
}

std::size_t TtlCache::Size() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return entries_.size();
}

LeaderboardCache::LeaderboardCache(CacheTtl ttl, TtlCache::Clock clock)
    : ttl_(ttl), top_cache_(clock), player_cache_(clock) {}

std::string LeaderboardCache::TopKey(std::size_t limit) { return "leaderboard:top:" + std::to_string(limit); }

std::string LeaderboardCache::RankKey(int player_id) { return "leaderboard:rank:" + std::to_string(player_id); }

std::optional<std::vector<RankedEntry>> LeaderboardCache::GetTop(std::size_t limit) const {
  auto raw = top_cache_.Get(TopKey(limit));
  if (!raw) {
    return std::nullopt;
  }
  return RankedEntriesFromJson(nlohmann::json::parse(*raw));
}

void LeaderboardCache::PutTop(std::size_t limit, const std::vector<RankedEntry>& entries) {
  top_cache_.Set(TopKey(limit), DumpJson(ToJson(entries)), ttl_.top);
}

std::optional<PlayerRank> LeaderboardCache::GetRank(int player_id) const {
  auto raw = player_cache_.Get(RankKey(player_id));
  if (!raw) {
    return std::nullopt;
  }
  return PlayerRankFromJson(nlohmann::json::parse(*raw));
}

void LeaderboardCache::PutRank(const PlayerRank& rank) {
  player_cache_.Set(RankKey(rank.player_id), DumpJson(ToJson(rank)), ttl_.rank);
}

// 상위 N 스냅샷은 N마다 따로 저장되므로 전부 지운다.
void LeaderboardCache::InvalidateTop() { top_cache_.EraseAll(); }

void LeaderboardCache::InvalidatePlayer(int player_id) { player_cache_.Erase(RankKey(player_id)); }

std::size_t LeaderboardCache::PurgeExpired() { return top_cache_.PurgeExpired() + player_cache_.PurgeExpired(); }

}  // namespace leaderboard

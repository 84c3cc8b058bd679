/*
 * 설명: TTL 기반 스냅샷 캐시와 상위 N/플레이어 순위 캐시 계층을 정의한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/cache_test.cpp, server/tests/unit/leaderboard_service_test.cpp
 */
#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "leaderboard/store.hpp"

namespace leaderboard {

// 키 -> 직렬화된 스냅샷 + 만료 시각. 읽기는 공유 잠금만 잡는다.
class TtlCache {
 public:
  using Clock = std::function<std::chrono::steady_clock::time_point()>;
  using FailureInjector = std::function<bool(std::string_view op)>;

  explicit TtlCache(Clock clock = nullptr);

  std::optional<std::string> Get(const std::string& key) const;
  void Set(const std::string& key, std::string value, std::chrono::seconds ttl);
  bool Erase(const std::string& key);
  std::size_t EraseAll();
  std::size_t PurgeExpired();
  std::size_t Size() const;

  void SetFailureInjector(FailureInjector injector);

 private:
  struct Entry {
    std::string value;
    std::chrono::steady_clock::time_point expires_at;
  };

  std::chrono::steady_clock::time_point Now() const;
  void MaybeFail(std::string_view op) const;

  Clock clock_;
  FailureInjector failure_injector_;
  std::unordered_map<std::string, Entry> entries_;
  mutable std::shared_mutex mutex_;
};

struct CacheTtl {
  std::chrono::seconds top{60};
  std::chrono::seconds rank{30};
};

// 상위 N 캐시와 플레이어 순위 캐시는 서로 독립적으로 만료/무효화된다.
class LeaderboardCache {
 public:
  explicit LeaderboardCache(CacheTtl ttl, TtlCache::Clock clock = nullptr);

  std::optional<std::vector<RankedEntry>> GetTop(std::size_t limit) const;
  void PutTop(std::size_t limit, const std::vector<RankedEntry>& entries);
  std::optional<PlayerRank> GetRank(int player_id) const;
  void PutRank(const PlayerRank& rank);

  void InvalidateTop();
  void InvalidatePlayer(int player_id);
  std::size_t PurgeExpired();

  TtlCache& TopCache() { return top_cache_; }

  static std::string TopKey(std::size_t limit);
  static std::string RankKey(int player_id);

 private:
  CacheTtl ttl_;
  TtlCache top_cache_;
  TtlCache player_cache_;
};

}  // namespace leaderboard

/*
 * 설명: 단일 프로세스용 메모리 저장소. 테스트와 로컬 실행에서 MariaDB 대신 사용한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/memory_store_test.cpp, server/tests/unit/leaderboard_service_test.cpp
 */
#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "leaderboard/store.hpp"

namespace leaderboard {

// 연산 이름을 받아 true를 돌려주면 해당 연산이 TransientStoreError로 실패한다.
using FailureInjector = std::function<bool(std::string_view op)>;

class MemoryLeaderboardStore : public LeaderboardStore {
 public:
  void Ping() override;
  SubmissionRecord RecordSession(int player_id, int score, const std::string& mode,
                                 std::chrono::system_clock::time_point submitted_at) override;
  std::vector<RankedEntry> FetchTop(std::size_t limit) override;
  std::optional<PlayerRank> FetchPlayerRank(int player_id) override;
  LeaderboardStats FetchStats() override;
  std::size_t RecomputeAllRanks() override;
  std::optional<int> RecomputePlayerRank(int player_id) override;
  std::optional<AggregateRow> FindAggregate(int player_id) override;
  std::vector<AggregateRow> ListAggregates() override;

  void SetFailureInjector(FailureInjector injector);
  std::size_t SessionCount(int player_id) const;

 private:
  struct PlayerRow {
    std::string display_name;
    std::chrono::system_clock::time_point joined_at;
  };
  struct SessionRow {
    std::int64_t id;
    int player_id;
    int score;
    std::string mode;
    std::chrono::system_clock::time_point submitted_at;
  };

  void MaybeFail(std::string_view op) const;
  std::vector<AggregateRow> SortedLocked() const;
  int DenseRankLocked(std::int64_t total_score) const;

  mutable std::mutex mutex_;
  std::unordered_map<int, PlayerRow> players_;
  // 플레이어별 세션. 합계 재계산은 해당 플레이어의 행만 훑는다.
  std::unordered_map<int, std::vector<SessionRow>> sessions_;
  std::size_t session_count_{0};
  std::int64_t score_sum_{0};
  std::unordered_map<int, AggregateRow> aggregates_;
  std::int64_t next_session_id_{1};
  FailureInjector failure_injector_;
};

class MemoryRankJobStore : public RankJobStore {
 public:
  std::int64_t Enqueue(RankJobScope scope, std::optional<int> player_id) override;
  std::optional<RankJob> ClaimNext() override;
  void MarkCompleted(std::int64_t job_id) override;
  void Reschedule(std::int64_t job_id, int attempts, std::chrono::milliseconds delay,
                  const std::string& error) override;
  void MarkDead(std::int64_t job_id, int attempts, const std::string& error) override;
  std::size_t ReleaseRunning() override;
  std::size_t PruneCompleted(std::size_t keep) override;
  RankJobCounts Counts() override;
  std::vector<RankJob> ListDead(std::size_t limit) override;

  void SetFailureInjector(FailureInjector injector);
  std::optional<RankJob> Find(std::int64_t job_id) const;

 private:
  struct Entry {
    RankJob job;
    std::chrono::steady_clock::time_point available_at;
  };

  void MaybeFail(std::string_view op) const;

  mutable std::mutex mutex_;
  std::map<std::int64_t, Entry> jobs_;
  std::int64_t next_job_id_{1};
  FailureInjector failure_injector_;
};

}  // namespace leaderboard

/*
 * 설명: 점수 기록/집계 테이블과 랭크 재계산 작업 큐에 대한 저장소 경계를 정의한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md, server/sql/schema.sql
 * 테스트: server/tests/unit/memory_store_test.cpp, server/tests/it/submission_it_test.cpp
 */
#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace leaderboard {

struct SubmissionRecord {
  int player_id;
  std::int64_t session_id;
  std::int64_t total_score;
  std::chrono::system_clock::time_point submitted_at;
};

struct RankedEntry {
  int player_id;
  std::string display_name;
  std::int64_t total_score;
  int rank;
};

struct PlayerRank {
  int player_id;
  std::string display_name;
  std::int64_t total_score;
  int rank;
  std::size_t total_players;
};

struct AggregateRow {
  int player_id;
  std::int64_t total_score;
  std::optional<int> rank;
};

struct LeaderboardStats {
  std::size_t total_players;
  std::size_t total_sessions;
  std::int64_t average_score;
};

// 점수 기록(game_sessions)과 집계(leaderboards)에 대한 접근.
// 모든 연산은 일시 장애 시 TransientStoreError를 던진다.
class LeaderboardStore {
 public:
  virtual ~LeaderboardStore() = default;

  virtual void Ping() = 0;

  // 플레이어 upsert, 세션 추가, 합계 재계산, 집계 upsert를 하나의 트랜잭션으로 수행한다.
  // 같은 플레이어에 대한 동시 호출은 플레이어 행 잠금으로 직렬화된다.
  virtual SubmissionRecord RecordSession(int player_id, int score, const std::string& mode,
                                         std::chrono::system_clock::time_point submitted_at) = 0;

  // total_score 내림차순, 동점은 player_id 오름차순. rank는 dense rank.
  virtual std::vector<RankedEntry> FetchTop(std::size_t limit) = 0;
  virtual std::optional<PlayerRank> FetchPlayerRank(int player_id) = 0;
  virtual LeaderboardStats FetchStats() = 0;

  // 모든 집계 행의 rank 컬럼을 dense rank로 다시 쓴다. 갱신 대상 행 수를 돌려준다.
  virtual std::size_t RecomputeAllRanks() = 0;
  // 한 플레이어의 rank 컬럼만 다시 쓴다. 집계 행이 없으면 nullopt.
  virtual std::optional<int> RecomputePlayerRank(int player_id) = 0;

  virtual std::optional<AggregateRow> FindAggregate(int player_id) = 0;
  virtual std::vector<AggregateRow> ListAggregates() = 0;
};

enum class RankJobScope { kIncremental, kFull };

enum class RankJobStatus { kPending, kRunning, kCompleted, kDead };

struct RankJob {
  std::int64_t id;
  RankJobScope scope;
  std::optional<int> player_id;
  int attempts;
  RankJobStatus status;
  std::string last_error;
};

// rank_jobs.last_error 컬럼에 저장하는 최대 바이트 수.
constexpr std::size_t kMaxJobErrorBytes = 500;

struct RankJobCounts {
  std::size_t pending{0};
  std::size_t running{0};
  std::size_t completed{0};
  std::size_t dead{0};
};

// 영속 작업 큐. full 작업이 incremental 작업보다 먼저 꺼내진다.
class RankJobStore {
 public:
  virtual ~RankJobStore() = default;

  // 같은 범위(및 플레이어)의 대기 작업이 이미 있으면 그 id를 돌려준다.
  virtual std::int64_t Enqueue(RankJobScope scope, std::optional<int> player_id) = 0;
  virtual std::optional<RankJob> ClaimNext() = 0;
  virtual void MarkCompleted(std::int64_t job_id) = 0;
  virtual void Reschedule(std::int64_t job_id, int attempts, std::chrono::milliseconds delay,
                          const std::string& error) = 0;
  virtual void MarkDead(std::int64_t job_id, int attempts, const std::string& error) = 0;
  // 이전 프로세스가 실행 중 상태로 남긴 작업을 대기 상태로 되돌린다.
  virtual std::size_t ReleaseRunning() = 0;
  virtual std::size_t PruneCompleted(std::size_t keep) = 0;
  virtual RankJobCounts Counts() = 0;
  virtual std::vector<RankJob> ListDead(std::size_t limit) = 0;
};

const char* ToString(RankJobScope scope);
const char* ToString(RankJobStatus status);
RankJobScope ParseRankJobScope(const std::string& text);
RankJobStatus ParseRankJobStatus(const std::string& text);

// max_bytes 이하로 자르되 UTF-8 문자 중간에서 자르지 않는다. last_error 저장에 쓴다.
std::string TruncateUtf8(const std::string& value, std::size_t max_bytes);

}  // namespace leaderboard

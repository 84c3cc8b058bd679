/*
 * 설명: 세션 기록과 플레이어 집계를 MariaDB에 저장하고 순위를 조회/재계산한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md, server/sql/schema.sql
 * 테스트: server/tests/it/submission_it_test.cpp
 */
#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <mariadb/mysql.h>

#include "leaderboard/db_client.hpp"
#include "leaderboard/store.hpp"

namespace leaderboard {

class MariaDbLeaderboardRepository : public LeaderboardStore {
 public:
  explicit MariaDbLeaderboardRepository(std::shared_ptr<MariaDbClient> db_client);

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

  void ClearAll() const;

 private:
  void Exec(MYSQL* conn, const std::string& sql, const char* ctx) const;
  std::int64_t QueryScalar(MYSQL* conn, const std::string& sql, const char* ctx) const;
  void EnsurePlayerInTx(MYSQL* conn, int player_id) const;
  void LockPlayerInTx(MYSQL* conn, int player_id) const;
  std::int64_t SumSessionsInTx(MYSQL* conn, int player_id) const;
  void UpsertAggregateInTx(MYSQL* conn, int player_id, std::int64_t total_score) const;

  std::shared_ptr<MariaDbClient> db_client_;
};

}  // namespace leaderboard

/*
 * 설명: 랭크 재계산 작업을 MariaDB rank_jobs 테이블에 영속화하는 작업 큐.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md, server/sql/schema.sql
 * 테스트: server/tests/it/rank_job_it_test.cpp
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

class MariaDbRankJobRepository : public RankJobStore {
 public:
  explicit MariaDbRankJobRepository(std::shared_ptr<MariaDbClient> db_client);

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

  void ClearAll() const;

 private:
  void Exec(MYSQL* conn, const std::string& sql, const char* ctx) const;
  RankJob BuildJob(MYSQL_ROW row) const;

  std::shared_ptr<MariaDbClient> db_client_;
};

}  // namespace leaderboard

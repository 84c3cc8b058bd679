/*
 * 설명: rank_jobs 테이블 기반 작업 큐의 적재/점유/재시도/데드레터 처리를 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md, server/sql/schema.sql
 * 테스트: server/tests/it/rank_job_it_test.cpp
 */
#include "leaderboard/rank_job_repository.hpp"

#include <sstream>

#include "leaderboard/errors.hpp"

namespace leaderboard {
namespace {
int ToInt(const char* value) { return value ? std::stoi(value) : 0; }
std::int64_t ToInt64(const char* value) { return value ? std::stoll(value) : 0; }

template <typename Fn>
auto TranslateErrors(const char* op, Fn&& fn) -> decltype(fn()) {
  try {
    return fn();
  } catch (const DbException& ex) {
    if (ex.retryable) {
      throw TransientStoreError(std::string(op) + ": " + ex.what());
    }
    throw;
  }
}

int PriorityOf(RankJobScope scope) { return scope == RankJobScope::kFull ? 1 : 10; }

std::string Truncate(const std::string& value) { return TruncateUtf8(value, kMaxJobErrorBytes); }
}  // namespace

MariaDbRankJobRepository::MariaDbRankJobRepository(std::shared_ptr<MariaDbClient> db_client)
    : db_client_(std::move(db_client)) {}

std::int64_t MariaDbRankJobRepository::Enqueue(RankJobScope scope, std::optional<int> player_id) {
  std::int64_t job_id = 0;
  TranslateErrors("작업 적재", [&] {
    db_client_->ExecuteTransactionWithRetry([&](MYSQL* conn) {
      std::ostringstream existing;
      existing << "SELECT job_id FROM rank_jobs WHERE status='pending' AND scope='" << ToString(scope) << "' AND ";
      if (player_id) {
        existing << "player_id=" << *player_id;
      } else {
        existing << "player_id IS NULL";
      }
      existing << " ORDER BY job_id ASC LIMIT 1 FOR UPDATE;";
      if (mysql_query(conn, existing.str().c_str()) != 0) {
        db_client_->RaiseError(conn, "대기 작업 조회 실패");
      }
      MYSQL_RES* res = mysql_store_result(conn);
      if (!res) {
        db_client_->RaiseError(conn, "대기 작업 결과 없음");
      }
      MYSQL_ROW row = mysql_fetch_row(res);
      if (row) {
        job_id = ToInt64(row[0]);
      }
      mysql_free_result(res);
      if (job_id != 0) {
        return true;
      }

      std::ostringstream insert;
      insert << "INSERT INTO rank_jobs(scope, player_id, priority, status, attempts, available_at, created_at, "
             << "updated_at) VALUES('" << ToString(scope) << "', "
             << (player_id ? std::to_string(*player_id) : std::string("NULL")) << ", " << PriorityOf(scope)
             << ", 'pending', 0, UTC_TIMESTAMP(6), UTC_TIMESTAMP(6), UTC_TIMESTAMP(6));";
      Exec(conn, insert.str(), "작업 적재 실패");
      job_id = static_cast<std::int64_t>(mysql_insert_id(conn));
      return true;
    });
  });
  return job_id;
}

std::optional<RankJob> MariaDbRankJobRepository::ClaimNext() {
  std::optional<RankJob> job;
  TranslateErrors("작업 점유", [&] {
    db_client_->ExecuteTransactionWithRetry([&](MYSQL* conn) {
      job.reset();
      const char* sql =
          "SELECT job_id, scope, player_id, attempts, status, last_error FROM rank_jobs "
          "WHERE status='pending' AND available_at <= UTC_TIMESTAMP(6) "
          "ORDER BY priority ASC, job_id ASC LIMIT 1 FOR UPDATE SKIP LOCKED;";
      if (mysql_query(conn, sql) != 0) {
        db_client_->RaiseError(conn, "작업 점유 조회 실패");
      }
      MYSQL_RES* res = mysql_store_result(conn);
      if (!res) {
        db_client_->RaiseError(conn, "작업 점유 결과 없음");
      }
      MYSQL_ROW row = mysql_fetch_row(res);
      if (row) {
        job = BuildJob(row);
      }
      mysql_free_result(res);
      if (!job) {
        return false;
      }
      std::ostringstream update;
      update << "UPDATE rank_jobs SET status='running', updated_at=UTC_TIMESTAMP(6) WHERE job_id=" << job->id << ";";
      Exec(conn, update.str(), "작업 점유 갱신 실패");
      job->status = RankJobStatus::kRunning;
      return true;
    });
  });
  return job;
}

void MariaDbRankJobRepository::MarkCompleted(std::int64_t job_id) {
  TranslateErrors("작업 완료", [&] {
    db_client_->WithConnectionRetry([&](MYSQL* conn) {
      std::ostringstream oss;
      oss << "UPDATE rank_jobs SET status='completed', attempts=attempts+1, updated_at=UTC_TIMESTAMP(6) WHERE job_id="
          << job_id << ";";
      Exec(conn, oss.str(), "작업 완료 갱신 실패");
    });
  });
}

void MariaDbRankJobRepository::Reschedule(std::int64_t job_id, int attempts, std::chrono::milliseconds delay,
                                          const std::string& error) {
  TranslateErrors("작업 재시도 예약", [&] {
    db_client_->WithConnectionRetry([&](MYSQL* conn) {
      std::ostringstream oss;
      oss << "UPDATE rank_jobs SET status='pending', attempts=" << attempts << ", last_error='"
          << db_client_->Escape(conn, Truncate(error)) << "', available_at=UTC_TIMESTAMP(6) + INTERVAL "
          << delay.count() * 1000 << " MICROSECOND, updated_at=UTC_TIMESTAMP(6) WHERE job_id=" << job_id << ";";
      Exec(conn, oss.str(), "작업 재시도 예약 실패");
    });
  });
}

void MariaDbRankJobRepository::MarkDead(std::int64_t job_id, int attempts, const std::string& error) {
  TranslateErrors("작업 데드레터", [&] {
    db_client_->WithConnectionRetry([&](MYSQL* conn) {
      std::ostringstream oss;
      oss << "UPDATE rank_jobs SET status='dead', attempts=" << attempts << ", last_error='"
          << db_client_->Escape(conn, Truncate(error)) << "', updated_at=UTC_TIMESTAMP(6) WHERE job_id=" << job_id
          << ";";
      Exec(conn, oss.str(), "작업 데드레터 갱신 실패");
    });
  });
}

std::size_t MariaDbRankJobRepository::ReleaseRunning() {
  std::size_t released = 0;
  TranslateErrors("실행 중 작업 해제", [&] {
    db_client_->WithConnectionRetry([&](MYSQL* conn) {
      Exec(conn,
           "UPDATE rank_jobs SET status='pending', available_at=UTC_TIMESTAMP(6), updated_at=UTC_TIMESTAMP(6) "
           "WHERE status='running';",
           "실행 중 작업 해제 실패");
      released = static_cast<std::size_t>(mysql_affected_rows(conn));
    });
  });
  return released;
}

std::size_t MariaDbRankJobRepository::PruneCompleted(std::size_t keep) {
  std::size_t removed = 0;
  TranslateErrors("완료 작업 정리", [&] {
    db_client_->WithConnectionRetry([&](MYSQL* conn) {
      std::ostringstream oss;
      oss << "DELETE FROM rank_jobs WHERE status='completed' AND job_id NOT IN (SELECT job_id FROM ("
          << "SELECT job_id FROM rank_jobs WHERE status='completed' ORDER BY job_id DESC LIMIT " << keep
          << ") recent);";
      Exec(conn, oss.str(), "완료 작업 정리 실패");
      removed = static_cast<std::size_t>(mysql_affected_rows(conn));
    });
  });
  return removed;
}

RankJobCounts MariaDbRankJobRepository::Counts() {
  RankJobCounts counts;
  TranslateErrors("작업 카운트", [&] {
    db_client_->WithConnectionRetry([&](MYSQL* conn) {
      counts = RankJobCounts{};
      const char* sql = "SELECT status, COUNT(*) FROM rank_jobs GROUP BY status;";
      if (mysql_query(conn, sql) != 0) {
        db_client_->RaiseError(conn, "작업 카운트 실패");
      }
      MYSQL_RES* res = mysql_store_result(conn);
      if (!res) {
        db_client_->RaiseError(conn, "작업 카운트 결과 없음");
      }
      MYSQL_ROW row;
      while ((row = mysql_fetch_row(res)) != nullptr) {
        auto count = static_cast<std::size_t>(ToInt64(row[1]));
        switch (ParseRankJobStatus(row[0] ? row[0] : "")) {
          case RankJobStatus::kPending:
            counts.pending = count;
            break;
          case RankJobStatus::kRunning:
            counts.running = count;
            break;
          case RankJobStatus::kCompleted:
            counts.completed = count;
            break;
          case RankJobStatus::kDead:
            counts.dead = count;
            break;
        }
      }
      mysql_free_result(res);
    });
  });
  return counts;
}

std::vector<RankJob> MariaDbRankJobRepository::ListDead(std::size_t limit) {
  std::vector<RankJob> jobs;
  TranslateErrors("데드레터 조회", [&] {
    db_client_->WithConnectionRetry([&](MYSQL* conn) {
      jobs.clear();
      std::ostringstream oss;
      oss << "SELECT job_id, scope, player_id, attempts, status, last_error FROM rank_jobs WHERE status='dead' "
          << "ORDER BY job_id DESC LIMIT " << limit << ";";
      if (mysql_query(conn, oss.str().c_str()) != 0) {
        db_client_->RaiseError(conn, "데드레터 조회 실패");
      }
      MYSQL_RES* res = mysql_store_result(conn);
      if (!res) {
        db_client_->RaiseError(conn, "데드레터 결과 없음");
      }
      MYSQL_ROW row;
      while ((row = mysql_fetch_row(res)) != nullptr) {
        jobs.push_back(BuildJob(row));
      }
      mysql_free_result(res);
    });
  });
  return jobs;
}

void MariaDbRankJobRepository::ClearAll() const {
  db_client_->WithConnectionRetry([&](MYSQL* conn) { Exec(conn, "DELETE FROM rank_jobs;", "작업 삭제 실패"); });
}

void MariaDbRankJobRepository::Exec(MYSQL* conn, const std::string& sql, const char* ctx) const {
  if (mysql_query(conn, sql.c_str()) != 0) {
    db_client_->RaiseError(conn, ctx);
  }
}

RankJob MariaDbRankJobRepository::BuildJob(MYSQL_ROW row) const {
  return RankJob{ToInt64(row[0]),
                 ParseRankJobScope(row[1] ? row[1] : ""),
                 row[2] ? std::optional<int>(ToInt(row[2])) : std::nullopt,
                 ToInt(row[3]),
                 ParseRankJobStatus(row[4] ? row[4] : ""),
                 row[5] ? row[5] : ""};
}

}  // namespace leaderboard

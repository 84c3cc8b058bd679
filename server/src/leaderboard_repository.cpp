/*
 * 설명: 세션 기록/집계 갱신 트랜잭션과 dense rank 조회/재계산 쿼리를 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md, server/sql/schema.sql
 * 테스트: server/tests/it/submission_it_test.cpp
 */
#include "leaderboard/leaderboard_repository.hpp"

#include <cmath>
#include <ctime>
#include <iomanip>
#include <sstream>

#include "leaderboard/errors.hpp"

namespace leaderboard {
namespace {
int ToInt(const char* value) { return value ? std::stoi(value) : 0; }
std::int64_t ToInt64(const char* value) { return value ? std::stoll(value) : 0; }

std::string ToTimestamp(const std::chrono::system_clock::time_point& tp) {
  auto tt = std::chrono::system_clock::to_time_t(tp);
  std::tm tm = *std::gmtime(&tt);
  std::ostringstream oss;
  oss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S");
  return oss.str();
}

// 재시도 가능한 DB 오류를 호출자용 TransientStoreError로 바꾼다.
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

constexpr const char* kSelectRanked =
    "SELECT l.player_id, p.display_name, l.total_score, "
    "DENSE_RANK() OVER (ORDER BY l.total_score DESC) AS dense_rank "
    "FROM leaderboards l INNER JOIN players p ON p.player_id = l.player_id "
    "ORDER BY l.total_score DESC, l.player_id ASC LIMIT ";
}  // namespace

MariaDbLeaderboardRepository::MariaDbLeaderboardRepository(std::shared_ptr<MariaDbClient> db_client)
    : db_client_(std::move(db_client)) {}

void MariaDbLeaderboardRepository::Ping() {
  TranslateErrors("핑", [&] { db_client_->Ping(); });
}

SubmissionRecord MariaDbLeaderboardRepository::RecordSession(int player_id, int score, const std::string& mode,
                                                             std::chrono::system_clock::time_point submitted_at) {
  SubmissionRecord record{player_id, 0, 0, submitted_at};
  TranslateErrors("점수 기록", [&] {
    db_client_->ExecuteTransactionWithRetry([&](MYSQL* conn) {
      EnsurePlayerInTx(conn, player_id);
      LockPlayerInTx(conn, player_id);

      std::ostringstream insert;
      insert << "INSERT INTO game_sessions(player_id, score, game_mode, submitted_at) VALUES(" << player_id << ", "
             << score << ", '" << db_client_->Escape(conn, mode) << "', '" << ToTimestamp(submitted_at) << "');";
      Exec(conn, insert.str(), "세션 저장 실패");
      record.session_id = static_cast<std::int64_t>(mysql_insert_id(conn));

      record.total_score = SumSessionsInTx(conn, player_id);
      UpsertAggregateInTx(conn, player_id, record.total_score);
      return true;
    });
  });
  return record;
}

void MariaDbLeaderboardRepository::EnsurePlayerInTx(MYSQL* conn, int player_id) const {
  std::ostringstream oss;
  oss << "INSERT INTO players(player_id, display_name, joined_at) VALUES(" << player_id << ", 'user_" << player_id
      << "', UTC_TIMESTAMP(6)) ON DUPLICATE KEY UPDATE player_id = player_id;";
  Exec(conn, oss.str(), "플레이어 보장 실패");
}

// 같은 플레이어의 합계 재계산/집계 갱신을 커밋까지 직렬화한다.
void MariaDbLeaderboardRepository::LockPlayerInTx(MYSQL* conn, int player_id) const {
  std::ostringstream oss;
  oss << "SELECT player_id FROM players WHERE player_id=" << player_id << " FOR UPDATE;";
  if (mysql_query(conn, oss.str().c_str()) != 0) {
    db_client_->RaiseError(conn, "플레이어 잠금 실패");
  }
  MYSQL_RES* res = mysql_store_result(conn);
  if (!res) {
    db_client_->RaiseError(conn, "플레이어 잠금 결과 없음");
  }
  mysql_free_result(res);
}

std::int64_t MariaDbLeaderboardRepository::SumSessionsInTx(MYSQL* conn, int player_id) const {
  // 잠금 읽기는 트랜잭션 스냅숏이 아니라 최신 커밋을 본다.
  std::ostringstream oss;
  oss << "SELECT COALESCE(SUM(score), 0) FROM game_sessions WHERE player_id=" << player_id << " LOCK IN SHARE MODE;";
  return QueryScalar(conn, oss.str(), "세션 합계 조회 실패");
}

void MariaDbLeaderboardRepository::UpsertAggregateInTx(MYSQL* conn, int player_id, std::int64_t total_score) const {
  std::ostringstream oss;
  oss << "INSERT INTO leaderboards(player_id, total_score, player_rank, updated_at) VALUES(" << player_id << ", "
      << total_score << ", NULL, UTC_TIMESTAMP(6)) ON DUPLICATE KEY UPDATE total_score = VALUES(total_score), "
      << "updated_at = UTC_TIMESTAMP(6);";
  Exec(conn, oss.str(), "집계 갱신 실패");
}

std::vector<RankedEntry> MariaDbLeaderboardRepository::FetchTop(std::size_t limit) {
  std::vector<RankedEntry> entries;
  TranslateErrors("상위 조회", [&] {
    db_client_->WithConnectionRetry([&](MYSQL* conn) {
      entries.clear();
      std::string sql = std::string(kSelectRanked) + std::to_string(limit) + ";";
      if (mysql_query(conn, sql.c_str()) != 0) {
        db_client_->RaiseError(conn, "리더보드 조회 실패");
      }
      MYSQL_RES* res = mysql_store_result(conn);
      if (!res) {
        db_client_->RaiseError(conn, "리더보드 결과 없음");
      }
      MYSQL_ROW row;
      while ((row = mysql_fetch_row(res)) != nullptr) {
        entries.push_back(RankedEntry{ToInt(row[0]), row[1] ? row[1] : "", ToInt64(row[2]), ToInt(row[3])});
      }
      mysql_free_result(res);
    });
  });
  return entries;
}

std::optional<PlayerRank> MariaDbLeaderboardRepository::FetchPlayerRank(int player_id) {
  std::optional<PlayerRank> result;
  TranslateErrors("순위 조회", [&] {
    db_client_->WithConnectionRetry([&](MYSQL* conn) {
      std::ostringstream oss;
      oss << "SELECT l.player_id, p.display_name, l.total_score, "
          << "(SELECT COUNT(DISTINCT l2.total_score) FROM leaderboards l2 WHERE l2.total_score > l.total_score) + 1, "
          << "(SELECT COUNT(*) FROM leaderboards) "
          << "FROM leaderboards l INNER JOIN players p ON p.player_id = l.player_id WHERE l.player_id=" << player_id
          << " LIMIT 1;";
      if (mysql_query(conn, oss.str().c_str()) != 0) {
        db_client_->RaiseError(conn, "순위 조회 실패");
      }
      MYSQL_RES* res = mysql_store_result(conn);
      if (!res) {
        db_client_->RaiseError(conn, "순위 결과 없음");
      }
      MYSQL_ROW row = mysql_fetch_row(res);
      if (row) {
        result = PlayerRank{ToInt(row[0]), row[1] ? row[1] : "", ToInt64(row[2]), ToInt(row[3]),
                            static_cast<std::size_t>(ToInt64(row[4]))};
      }
      mysql_free_result(res);
    });
  });
  return result;
}

LeaderboardStats MariaDbLeaderboardRepository::FetchStats() {
  LeaderboardStats stats{0, 0, 0};
  TranslateErrors("통계 조회", [&] {
    db_client_->WithConnectionRetry([&](MYSQL* conn) {
      const char* sql =
          "SELECT (SELECT COUNT(*) FROM players), COUNT(*), COALESCE(AVG(score), 0) FROM game_sessions;";
      if (mysql_query(conn, sql) != 0) {
        db_client_->RaiseError(conn, "통계 조회 실패");
      }
      MYSQL_RES* res = mysql_store_result(conn);
      if (!res) {
        db_client_->RaiseError(conn, "통계 결과 없음");
      }
      MYSQL_ROW row = mysql_fetch_row(res);
      if (row) {
        stats.total_players = static_cast<std::size_t>(ToInt64(row[0]));
        stats.total_sessions = static_cast<std::size_t>(ToInt64(row[1]));
        stats.average_score = static_cast<std::int64_t>(std::llround(row[2] ? std::stod(row[2]) : 0.0));
      }
      mysql_free_result(res);
    });
  });
  return stats;
}

std::size_t MariaDbLeaderboardRepository::RecomputeAllRanks() {
  std::size_t rows = 0;
  TranslateErrors("전체 순위 재계산", [&] {
    db_client_->ExecuteTransactionWithRetry([&](MYSQL* conn) {
      Exec(conn,
           "UPDATE leaderboards l INNER JOIN ("
           "SELECT player_id, DENSE_RANK() OVER (ORDER BY total_score DESC) AS dense_rank FROM leaderboards"
           ") ranked ON ranked.player_id = l.player_id SET l.player_rank = ranked.dense_rank;",
           "전체 순위 갱신 실패");
      rows = static_cast<std::size_t>(QueryScalar(conn, "SELECT COUNT(*) FROM leaderboards;", "집계 카운트 실패"));
      return true;
    });
  });
  return rows;
}

std::optional<int> MariaDbLeaderboardRepository::RecomputePlayerRank(int player_id) {
  std::optional<int> rank;
  TranslateErrors("개별 순위 재계산", [&] {
    db_client_->ExecuteTransactionWithRetry([&](MYSQL* conn) {
      rank.reset();
      std::ostringstream select;
      select << "SELECT total_score FROM leaderboards WHERE player_id=" << player_id << " FOR UPDATE;";
      if (mysql_query(conn, select.str().c_str()) != 0) {
        db_client_->RaiseError(conn, "집계 조회 실패");
      }
      MYSQL_RES* res = mysql_store_result(conn);
      if (!res) {
        db_client_->RaiseError(conn, "집계 결과 없음");
      }
      MYSQL_ROW row = mysql_fetch_row(res);
      std::optional<std::int64_t> total;
      if (row) {
        total = ToInt64(row[0]);
      }
      mysql_free_result(res);
      if (!total) {
        return false;
      }

      std::ostringstream count;
      count << "SELECT COUNT(DISTINCT total_score) FROM leaderboards WHERE total_score > " << *total << ";";
      int next_rank = static_cast<int>(QueryScalar(conn, count.str(), "상위 점수 카운트 실패")) + 1;

      std::ostringstream update;
      update << "UPDATE leaderboards SET player_rank=" << next_rank << " WHERE player_id=" << player_id << ";";
      Exec(conn, update.str(), "개별 순위 갱신 실패");
      rank = next_rank;
      return true;
    });
  });
  return rank;
}

std::optional<AggregateRow> MariaDbLeaderboardRepository::FindAggregate(int player_id) {
  std::optional<AggregateRow> result;
  TranslateErrors("집계 조회", [&] {
    db_client_->WithConnectionRetry([&](MYSQL* conn) {
      std::ostringstream oss;
      oss << "SELECT player_id, total_score, player_rank FROM leaderboards WHERE player_id=" << player_id << ";";
      if (mysql_query(conn, oss.str().c_str()) != 0) {
        db_client_->RaiseError(conn, "집계 조회 실패");
      }
      MYSQL_RES* res = mysql_store_result(conn);
      if (!res) {
        db_client_->RaiseError(conn, "집계 결과 없음");
      }
      MYSQL_ROW row = mysql_fetch_row(res);
      if (row) {
        result = AggregateRow{ToInt(row[0]), ToInt64(row[1]),
                              row[2] ? std::optional<int>(ToInt(row[2])) : std::nullopt};
      }
      mysql_free_result(res);
    });
  });
  return result;
}

std::vector<AggregateRow> MariaDbLeaderboardRepository::ListAggregates() {
  std::vector<AggregateRow> rows;
  TranslateErrors("집계 목록 조회", [&] {
    db_client_->WithConnectionRetry([&](MYSQL* conn) {
      rows.clear();
      const char* sql =
          "SELECT player_id, total_score, player_rank FROM leaderboards ORDER BY total_score DESC, player_id ASC;";
      if (mysql_query(conn, sql) != 0) {
        db_client_->RaiseError(conn, "집계 목록 조회 실패");
      }
      MYSQL_RES* res = mysql_store_result(conn);
      if (!res) {
        db_client_->RaiseError(conn, "집계 목록 결과 없음");
      }
      MYSQL_ROW row;
      while ((row = mysql_fetch_row(res)) != nullptr) {
        rows.push_back(AggregateRow{ToInt(row[0]), ToInt64(row[1]),
                                    row[2] ? std::optional<int>(ToInt(row[2])) : std::nullopt});
      }
      mysql_free_result(res);
    });
  });
  return rows;
}

void MariaDbLeaderboardRepository::ClearAll() const {
  db_client_->WithConnectionRetry([&](MYSQL* conn) {
    Exec(conn, "DELETE FROM leaderboards;", "집계 삭제 실패");
    Exec(conn, "DELETE FROM game_sessions;", "세션 삭제 실패");
    Exec(conn, "DELETE FROM players;", "플레이어 삭제 실패");
  });
}

void MariaDbLeaderboardRepository::Exec(MYSQL* conn, const std::string& sql, const char* ctx) const {
  if (mysql_query(conn, sql.c_str()) != 0) {
    db_client_->RaiseError(conn, ctx);
  }
}

std::int64_t MariaDbLeaderboardRepository::QueryScalar(MYSQL* conn, const std::string& sql, const char* ctx) const {
  if (mysql_query(conn, sql.c_str()) != 0) {
    db_client_->RaiseError(conn, ctx);
  }
  MYSQL_RES* res = mysql_store_result(conn);
  if (!res) {
    db_client_->RaiseError(conn, ctx);
  }
  MYSQL_ROW row = mysql_fetch_row(res);
  std::int64_t value = row ? ToInt64(row[0]) : 0;
  mysql_free_result(res);
  return value;
}

}  // namespace leaderboard

/*
 * 설명: 메모리 저장소의 세션/집계 관리, dense rank 계산, 작업 큐 동작을 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/memory_store_test.cpp, server/tests/unit/leaderboard_service_test.cpp
 */
#include "leaderboard/memory_store.hpp"

#include <algorithm>
#include <cmath>
#include <set>

#include "leaderboard/errors.hpp"

namespace leaderboard {

void MemoryLeaderboardStore::SetFailureInjector(FailureInjector injector) {
  std::lock_guard<std::mutex> lock(mutex_);
  failure_injector_ = std::move(injector);
}

void MemoryLeaderboardStore::MaybeFail(std::string_view op) const {
  if (failure_injector_ && failure_injector_(op)) {
    throw TransientStoreError("주입된 저장소 오류: " + std::string(op));
  }
}

void MemoryLeaderboardStore::Ping() {
  std::lock_guard<std::mutex> lock(mutex_);
  MaybeFail("ping");
}

SubmissionRecord MemoryLeaderboardStore::RecordSession(int player_id, int score, const std::string& mode,
                                                       std::chrono::system_clock::time_point submitted_at) {
  std::lock_guard<std::mutex> lock(mutex_);
  MaybeFail("record_session");
  players_.try_emplace(player_id, PlayerRow{"user_" + std::to_string(player_id), submitted_at});

  SessionRow session{next_session_id_++, player_id, score, mode, submitted_at};
  auto& player_sessions = sessions_[player_id];
  player_sessions.push_back(session);
  ++session_count_;
  score_sum_ += score;

  std::int64_t total = 0;
  for (const auto& row : player_sessions) {
    total += row.score;
  }
  auto [it, inserted] = aggregates_.try_emplace(player_id, AggregateRow{player_id, total, std::nullopt});
  if (!inserted) {
    it->second.total_score = total;
  }
  return SubmissionRecord{player_id, session.id, total, submitted_at};
}

std::vector<AggregateRow> MemoryLeaderboardStore::SortedLocked() const {
  std::vector<AggregateRow> rows;
  rows.reserve(aggregates_.size());
  for (const auto& [id, row] : aggregates_) {
    rows.push_back(row);
  }
  std::sort(rows.begin(), rows.end(), [](const AggregateRow& a, const AggregateRow& b) {
    if (a.total_score != b.total_score) {
      return a.total_score > b.total_score;
    }
    return a.player_id < b.player_id;
  });
  return rows;
}

int MemoryLeaderboardStore::DenseRankLocked(std::int64_t total_score) const {
  std::set<std::int64_t> higher;
  for (const auto& [id, row] : aggregates_) {
    if (row.total_score > total_score) {
      higher.insert(row.total_score);
    }
  }
  return static_cast<int>(higher.size()) + 1;
}

std::vector<RankedEntry> MemoryLeaderboardStore::FetchTop(std::size_t limit) {
  std::lock_guard<std::mutex> lock(mutex_);
  MaybeFail("fetch_top");
  std::vector<RankedEntry> entries;
  int rank = 0;
  std::optional<std::int64_t> previous;
  for (const auto& row : SortedLocked()) {
    if (!previous || *previous != row.total_score) {
      ++rank;
      previous = row.total_score;
    }
    if (entries.size() >= limit) {
      break;
    }
    entries.push_back(RankedEntry{row.player_id, players_.at(row.player_id).display_name, row.total_score, rank});
  }
  return entries;
}

std::optional<PlayerRank> MemoryLeaderboardStore::FetchPlayerRank(int player_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  MaybeFail("fetch_player_rank");
  auto it = aggregates_.find(player_id);
  if (it == aggregates_.end()) {
    return std::nullopt;
  }
  return PlayerRank{player_id, players_.at(player_id).display_name, it->second.total_score,
                    DenseRankLocked(it->second.total_score), aggregates_.size()};
}

LeaderboardStats MemoryLeaderboardStore::FetchStats() {
  std::lock_guard<std::mutex> lock(mutex_);
  MaybeFail("fetch_stats");
  std::int64_t average = 0;
  if (session_count_ > 0) {
    average = static_cast<std::int64_t>(
        std::llround(static_cast<double>(score_sum_) / static_cast<double>(session_count_)));
  }
  return LeaderboardStats{players_.size(), session_count_, average};
}

std::size_t MemoryLeaderboardStore::RecomputeAllRanks() {
  std::lock_guard<std::mutex> lock(mutex_);
  MaybeFail("recompute_all");
  int rank = 0;
  std::optional<std::int64_t> previous;
  for (const auto& row : SortedLocked()) {
    if (!previous || *previous != row.total_score) {
      ++rank;
      previous = row.total_score;
    }
    aggregates_.at(row.player_id).rank = rank;
  }
  return aggregates_.size();
}

std::optional<int> MemoryLeaderboardStore::RecomputePlayerRank(int player_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  MaybeFail("recompute_player");
  auto it = aggregates_.find(player_id);
  if (it == aggregates_.end()) {
    return std::nullopt;
  }
  it->second.rank = DenseRankLocked(it->second.total_score);
  return it->second.rank;
}

std::optional<AggregateRow> MemoryLeaderboardStore::FindAggregate(int player_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  MaybeFail("find_aggregate");
  auto it = aggregates_.find(player_id);
  if (it == aggregates_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::vector<AggregateRow> MemoryLeaderboardStore::ListAggregates() {
  std::lock_guard<std::mutex> lock(mutex_);
  MaybeFail("list_aggregates");
  return SortedLocked();
}

std::size_t MemoryLeaderboardStore::SessionCount(int player_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = sessions_.find(player_id);
  return it == sessions_.end() ? 0 : it->second.size();
}

void MemoryRankJobStore::SetFailureInjector(FailureInjector injector) {
  std::lock_guard<std::mutex> lock(mutex_);
  failure_injector_ = std::move(injector);
}

void MemoryRankJobStore::MaybeFail(std::string_view op) const {
  if (failure_injector_ && failure_injector_(op)) {
    throw TransientStoreError("주입된 작업 큐 오류: " + std::string(op));
  }
}

std::int64_t MemoryRankJobStore::Enqueue(RankJobScope scope, std::optional<int> player_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  MaybeFail("enqueue");
  for (const auto& [id, entry] : jobs_) {
    if (entry.job.status == RankJobStatus::kPending && entry.job.scope == scope && entry.job.player_id == player_id) {
      return id;
    }
  }
  std::int64_t id = next_job_id_++;
  jobs_.emplace(id, Entry{RankJob{id, scope, player_id, 0, RankJobStatus::kPending, ""},
                          std::chrono::steady_clock::now()});
  return id;
}

std::optional<RankJob> MemoryRankJobStore::ClaimNext() {
  std::lock_guard<std::mutex> lock(mutex_);
  MaybeFail("claim");
  auto now = std::chrono::steady_clock::now();
  Entry* chosen = nullptr;
  for (auto& [id, entry] : jobs_) {
    if (entry.job.status != RankJobStatus::kPending || entry.available_at > now) {
      continue;
    }
    if (!chosen || (entry.job.scope == RankJobScope::kFull && chosen->job.scope != RankJobScope::kFull)) {
      chosen = &entry;
    }
  }
  if (!chosen) {
    return std::nullopt;
  }
  chosen->job.status = RankJobStatus::kRunning;
  return chosen->job;
}

void MemoryRankJobStore::MarkCompleted(std::int64_t job_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  MaybeFail("complete");
  auto it = jobs_.find(job_id);
  if (it != jobs_.end()) {
    it->second.job.status = RankJobStatus::kCompleted;
    it->second.job.attempts += 1;
  }
}

void MemoryRankJobStore::Reschedule(std::int64_t job_id, int attempts, std::chrono::milliseconds delay,
                                    const std::string& error) {
  std::lock_guard<std::mutex> lock(mutex_);
  MaybeFail("reschedule");
  auto it = jobs_.find(job_id);
  if (it != jobs_.end()) {
    it->second.job.status = RankJobStatus::kPending;
    it->second.job.attempts = attempts;
    it->second.job.last_error = TruncateUtf8(error, kMaxJobErrorBytes);
    it->second.available_at = std::chrono::steady_clock::now() + delay;
  }
}

void MemoryRankJobStore::MarkDead(std::int64_t job_id, int attempts, const std::string& error) {
  std::lock_guard<std::mutex> lock(mutex_);
  MaybeFail("dead");
  auto it = jobs_.find(job_id);
  if (it != jobs_.end()) {
    it->second.job.status = RankJobStatus::kDead;
    it->second.job.attempts = attempts;
    it->second.job.last_error = TruncateUtf8(error, kMaxJobErrorBytes);
  }
}

std::size_t MemoryRankJobStore::ReleaseRunning() {
  std::lock_guard<std::mutex> lock(mutex_);
  MaybeFail("release");
  std::size_t released = 0;
  for (auto& [id, entry] : jobs_) {
    if (entry.job.status == RankJobStatus::kRunning) {
      entry.job.status = RankJobStatus::kPending;
      entry.available_at = std::chrono::steady_clock::now();
      ++released;
    }
  }
  return released;
}

std::size_t MemoryRankJobStore::PruneCompleted(std::size_t keep) {
  std::lock_guard<std::mutex> lock(mutex_);
  std::size_t completed = 0;
  for (const auto& [id, entry] : jobs_) {
    if (entry.job.status == RankJobStatus::kCompleted) {
      ++completed;
    }
  }
  std::size_t removed = 0;
  for (auto it = jobs_.begin(); it != jobs_.end() && completed > keep;) {
    if (it->second.job.status == RankJobStatus::kCompleted) {
      it = jobs_.erase(it);
      --completed;
      ++removed;
    } else {
      ++it;
    }
  }
  return removed;
}

RankJobCounts MemoryRankJobStore::Counts() {
  std::lock_guard<std::mutex> lock(mutex_);
  MaybeFail("counts");
  RankJobCounts counts;
  for (const auto& [id, entry] : jobs_) {
    switch (entry.job.status) {
      case RankJobStatus::kPending:
        ++counts.pending;
        break;
      case RankJobStatus::kRunning:
        ++counts.running;
        break;
      case RankJobStatus::kCompleted:
        ++counts.completed;
        break;
      case RankJobStatus::kDead:
        ++counts.dead;
        break;
    }
  }
  return counts;
}

std::vector<RankJob> MemoryRankJobStore::ListDead(std::size_t limit) {
  std::lock_guard<std::mutex> lock(mutex_);
  MaybeFail("list_dead");
  std::vector<RankJob> dead;
  for (auto it = jobs_.rbegin(); it != jobs_.rend() && dead.size() < limit; ++it) {
    if (it->second.job.status == RankJobStatus::kDead) {
      dead.push_back(it->second.job);
    }
  }
  return dead;
}

std::optional<RankJob> MemoryRankJobStore::Find(std::int64_t job_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = jobs_.find(job_id);
  if (it == jobs_.end()) {
    return std::nullopt;
  }
  return it->second.job;
}

}  // namespace leaderboard

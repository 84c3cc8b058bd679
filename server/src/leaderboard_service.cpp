/*
 * 설명: 제출 검증, 트랜잭션 호출, 커밋 이후 후처리, 캐시 우선 조회를 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/leaderboard_service_test.cpp, server/tests/e2e/leaderboard_flow_test.cpp
 */
#include "leaderboard/leaderboard_service.hpp"

#include "leaderboard/errors.hpp"

namespace leaderboard {

LeaderboardService::LeaderboardService(std::shared_ptr<LeaderboardStore> store, std::shared_ptr<LeaderboardCache> cache,
                                       std::shared_ptr<RankRecomputeEngine> engine,
                                       std::shared_ptr<Observability> observability, bool incremental_enabled)
    : store_(std::move(store)), cache_(std::move(cache)), engine_(std::move(engine)),
      observability_(std::move(observability)), incremental_enabled_(incremental_enabled) {}

void LeaderboardService::SetEventSink(std::shared_ptr<ScoreEventSink> sink) {
  std::lock_guard<std::mutex> lock(sink_mutex_);
  sink_ = std::move(sink);
}

std::shared_ptr<ScoreEventSink> LeaderboardService::Sink() {
  std::lock_guard<std::mutex> lock(sink_mutex_);
  return sink_;
}

SubmitResult LeaderboardService::SubmitScore(int player_id, std::int64_t score, const std::string& mode) {
  if (player_id <= 0) {
    throw ValidationError("user_id는 양의 정수여야 합니다");
  }
  if (score < 0 || score > kMaxScore) {
    throw ValidationError("score는 0 이상 1000000 이하여야 합니다");
  }
  if (mode.empty() || mode.size() > kMaxModeLength) {
    throw ValidationError("game_mode는 1~50자여야 합니다");
  }

  auto started = std::chrono::steady_clock::now();
  auto record = store_->RecordSession(player_id, static_cast<int>(score), mode, std::chrono::system_clock::now());
  observability_->IncrementSubmission();
  SubmitResult result{record.player_id, record.total_score, record.submitted_at};

  AfterCommit(result, score);

  auto latency =
      std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started).count();
  observability_->Log(LogContext{"", player_id, "score_submitted", latency, LogLevel::kInfo,
                                 {{"score", score}, {"totalScore", result.total_score}, {"mode", mode}}});
  return result;
}

void LeaderboardService::AfterCommit(const SubmitResult& result, std::int64_t score) {
  try {
    cache_->InvalidateTop();
    cache_->InvalidatePlayer(result.player_id);
  } catch (const std::exception& ex) {
    observability_->Event(LogLevel::kWarn, "cache_invalidate_failed", {{"error", ex.what()}}, result.player_id);
  }

  if (incremental_enabled_ && engine_) {
    try {
      engine_->EnqueueIncremental(result.player_id);
    } catch (const std::exception& ex) {
      observability_->Event(LogLevel::kWarn, "rank_enqueue_failed", {{"error", ex.what()}}, result.player_id);
    }
  }

  auto sink = Sink();
  if (sink) {
    try {
      sink->Publish(ScoreChangedEvent{result.player_id, score, result.submitted_at});
    } catch (const std::exception& ex) {
      observability_->Event(LogLevel::kWarn, "notification_failed", {{"error", ex.what()}}, result.player_id);
    }
  }
}

std::vector<RankedEntry> LeaderboardService::GetTop(int limit) {
  if (limit < 1 || limit > kMaxTopLimit) {
    throw ValidationError("limit은 1~100 사이여야 합니다");
  }
  auto n = static_cast<std::size_t>(limit);
  try {
    if (auto cached = cache_->GetTop(n)) {
      observability_->RecordCacheLookup(true);
      return *cached;
    }
  } catch (const std::exception& ex) {
    observability_->Event(LogLevel::kWarn, "cache_read_failed", {{"scope", "top"}, {"error", ex.what()}});
  }
  observability_->RecordCacheLookup(false);

  auto entries = store_->FetchTop(n);
  try {
    cache_->PutTop(n, entries);
  } catch (const std::exception& ex) {
    observability_->Event(LogLevel::kWarn, "cache_write_failed", {{"scope", "top"}, {"error", ex.what()}});
  }
  return entries;
}

PlayerRank LeaderboardService::GetRank(int player_id) {
  if (player_id <= 0) {
    throw ValidationError("userId는 양의 정수여야 합니다");
  }
  try {
    if (auto cached = cache_->GetRank(player_id)) {
      observability_->RecordCacheLookup(true);
      return *cached;
    }
  } catch (const std::exception& ex) {
    observability_->Event(LogLevel::kWarn, "cache_read_failed", {{"scope", "rank"}, {"error", ex.what()}}, player_id);
  }
  observability_->RecordCacheLookup(false);

  auto rank = store_->FetchPlayerRank(player_id);
  if (!rank) {
    observability_->Event(LogLevel::kInfo, "player_not_found", nlohmann::json::object(), player_id);
    throw NotFoundError("리더보드에 없는 플레이어입니다");
  }
  try {
    cache_->PutRank(*rank);
  } catch (const std::exception& ex) {
    observability_->Event(LogLevel::kWarn, "cache_write_failed", {{"scope", "rank"}, {"error", ex.what()}}, player_id);
  }
  return *rank;
}

LeaderboardStats LeaderboardService::GetStats() { return store_->FetchStats(); }

RecalculationAck LeaderboardService::TriggerFullRecomputation() {
  if (!engine_) {
    throw TransientStoreError("순위 재계산 엔진이 없습니다");
  }
  auto job_id = engine_->EnqueueFull();
  return RecalculationAck{job_id, std::chrono::system_clock::now()};
}

RankEngineStatus LeaderboardService::RecalculationStatus() {
  if (!engine_) {
    throw TransientStoreError("순위 재계산 엔진이 없습니다");
  }
  return engine_->Status();
}

std::vector<RankJob> LeaderboardService::DeadJobs(std::size_t limit) {
  if (!engine_) {
    return {};
  }
  return engine_->DeadJobs(limit);
}

}  // namespace leaderboard

/*
 * 설명: 점수 제출 파이프라인과 캐시 우선 조회 경로를 묶는 서비스 계층.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/leaderboard_service_test.cpp, server/tests/e2e/leaderboard_flow_test.cpp
 */
#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "leaderboard/cache.hpp"
#include "leaderboard/notification.hpp"
#include "leaderboard/observability.hpp"
#include "leaderboard/rank_engine.hpp"
#include "leaderboard/store.hpp"

namespace leaderboard {

constexpr std::int64_t kMaxScore = 1'000'000;
constexpr int kMaxTopLimit = 100;
constexpr std::size_t kMaxModeLength = 50;

struct SubmitResult {
  int player_id;
  std::int64_t total_score;
  std::chrono::system_clock::time_point submitted_at;
};

struct RecalculationAck {
  std::int64_t job_id;
  std::chrono::system_clock::time_point accepted_at;
};

class LeaderboardService {
 public:
  LeaderboardService(std::shared_ptr<LeaderboardStore> store, std::shared_ptr<LeaderboardCache> cache,
                     std::shared_ptr<RankRecomputeEngine> engine, std::shared_ptr<Observability> observability,
                     bool incremental_enabled = true);

  void SetEventSink(std::shared_ptr<ScoreEventSink> sink);

  // 커밋 이후의 캐시 무효화/작업 등록/알림 실패는 로그만 남기고 제출을 실패시키지 않는다.
  SubmitResult SubmitScore(int player_id, std::int64_t score, const std::string& mode = "solo");
  std::vector<RankedEntry> GetTop(int limit);
  PlayerRank GetRank(int player_id);
  LeaderboardStats GetStats();
  RecalculationAck TriggerFullRecomputation();
  RankEngineStatus RecalculationStatus();
  std::vector<RankJob> DeadJobs(std::size_t limit);

 private:
  void AfterCommit(const SubmitResult& result, std::int64_t score);
  std::shared_ptr<ScoreEventSink> Sink();

  std::shared_ptr<LeaderboardStore> store_;
  std::shared_ptr<LeaderboardCache> cache_;
  std::shared_ptr<RankRecomputeEngine> engine_;
  std::shared_ptr<Observability> observability_;
  bool incremental_enabled_;
  std::shared_ptr<ScoreEventSink> sink_;
  std::mutex sink_mutex_;
};

}  // namespace leaderboard

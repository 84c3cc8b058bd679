/*
 * 설명: 점수 제출 성공 시 발행되는 알림 이벤트와 수신자 인터페이스.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/leaderboard_service_test.cpp, server/tests/e2e/leaderboard_flow_test.cpp
 */
#pragma once

#include <chrono>
#include <cstdint>

namespace leaderboard {

struct ScoreChangedEvent {
  int player_id;
  std::int64_t score;
  std::chrono::system_clock::time_point occurred_at;
};

class ScoreEventSink {
 public:
  virtual ~ScoreEventSink() = default;
  virtual void Publish(const ScoreChangedEvent& event) = 0;
};

}  // namespace leaderboard

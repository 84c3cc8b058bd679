/*
 * 설명: WebSocket 구독자를 관리하고 점수 변경 이벤트를 모든 구독자에게 중계한다.
 * 버전: v1.1.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/leaderboard_flow_test.cpp
 */
#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

#include <nlohmann/json.hpp>

#include "leaderboard/notification.hpp"
#include "leaderboard/observability.hpp"

namespace leaderboard {

class WebSocketSession;

class RealtimeCoordinator : public ScoreEventSink {
 public:
  void SetObservability(const std::shared_ptr<Observability>& observability) { observability_ = observability; }

  std::uint64_t Register(const std::shared_ptr<WebSocketSession>& session);
  void Unregister(std::uint64_t subscriber_id, const WebSocketSession* session);
  void Broadcast(const std::string& event, const nlohmann::json& payload);
  void Publish(const ScoreChangedEvent& event) override;
  std::size_t ActiveConnections() const;

 private:
  struct Entry {
    std::weak_ptr<WebSocketSession> session;
    const WebSocketSession* raw{nullptr};
  };

  std::unordered_map<std::uint64_t, Entry> connections_;
  std::uint64_t next_subscriber_id_{1};
  mutable std::mutex mutex_;
  std::shared_ptr<Observability> observability_;
};

}  // namespace leaderboard

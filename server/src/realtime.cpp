/*
 * 설명: 구독자 등록/해제와 leaderboard:updated 브로드캐스트를 구현한다.
 * 버전: v1.1.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/leaderboard_flow_test.cpp
 */
#include "leaderboard/realtime.hpp"

#include <vector>

#include "leaderboard/api_response.hpp"
#include "leaderboard/websocket_session.hpp"

namespace leaderboard {

std::uint64_t RealtimeCoordinator::Register(const std::shared_ptr<WebSocketSession>& session) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto id = next_subscriber_id_++;
  connections_[id] = Entry{session, session.get()};
  if (observability_) {
    observability_->SetWebsocketActive(connections_.size());
  }
  return id;
}

void RealtimeCoordinator::Unregister(std::uint64_t subscriber_id, const WebSocketSession* session) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = connections_.find(subscriber_id);
  if (it == connections_.end()) {
    return;
  }
  if (it->second.raw == session) {
    connections_.erase(it);
    if (observability_) {
      observability_->SetWebsocketActive(connections_.size());
    }
  }
}

void RealtimeCoordinator::Broadcast(const std::string& event, const nlohmann::json& payload) {
  std::vector<std::shared_ptr<WebSocketSession>> targets;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    targets.reserve(connections_.size());
    for (const auto& [id, entry] : connections_) {
      if (auto session = entry.session.lock()) {
        targets.push_back(std::move(session));
      }
    }
  }
  for (const auto& session : targets) {
    session->SendServerEvent(event, payload);
  }
}

void RealtimeCoordinator::Publish(const ScoreChangedEvent& event) {
  Broadcast("leaderboard:updated",
            {{"userId", event.player_id}, {"score", event.score}, {"timestamp", ToIsoString(event.occurred_at)}});
}

std::size_t RealtimeCoordinator::ActiveConnections() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return connections_.size();
}

}  // namespace leaderboard

/*
 * 설명: 리더보드 구독 WebSocket 연결의 메시지 처리와 송신 큐 백프레셔를 관리한다.
 * 버전: v1.1.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/leaderboard_flow_test.cpp
 */
#pragma once

#include <cstdint>
#include <deque>
#include <memory>
#include <string>
#include <string_view>

#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>

#include "leaderboard/api_response.hpp"
#include "leaderboard/leaderboard_service.hpp"
#include "leaderboard/realtime.hpp"

namespace leaderboard {

class WebSocketSession : public std::enable_shared_from_this<WebSocketSession> {
 public:
  WebSocketSession(boost::beast::websocket::stream<boost::beast::tcp_stream> ws,
                   std::shared_ptr<RealtimeCoordinator> coordinator, std::shared_ptr<LeaderboardService> service,
                   std::shared_ptr<Observability> observability, std::size_t max_queue_messages,
                   std::size_t max_queue_bytes);
  ~WebSocketSession();
  void Run();

  // 다른 스레드에서 호출해도 된다. 송신은 연결의 strand에서 수행된다.
  void SendServerEvent(const std::string& event, const nlohmann::json& payload);

 private:
  void DoRead();
  void OnRead(boost::beast::error_code ec, std::size_t bytes_transferred);
  void HandleLeaderboardRequest(const nlohmann::json& payload, std::uint64_t seq);
  void SendEvent(const std::string& event, const nlohmann::json& payload, std::uint64_t seq);
  void SendError(std::string_view code, std::string_view message, std::uint64_t seq);
  void EnqueueMessage(std::string message);
  void WriteNext();
  void OnWrite(boost::beast::error_code ec);
  void TriggerBackpressureClose();

  boost::beast::websocket::stream<boost::beast::tcp_stream> ws_;
  boost::beast::flat_buffer buffer_;
  std::shared_ptr<RealtimeCoordinator> coordinator_;
  std::shared_ptr<LeaderboardService> service_;
  std::shared_ptr<Observability> observability_;
  std::uint64_t subscriber_id_{0};
  std::deque<std::string> send_queue_;
  std::size_t queued_bytes_{0};
  bool writing_{false};
  bool closing_{false};
  std::size_t max_queue_messages_;
  std::size_t max_queue_bytes_;
};

}  // namespace leaderboard

/*
 * 설명: HTTP 연결을 처리하고 리더보드 REST 엔드포인트와 /ws 업그레이드를 제공한다.
 * 버전: v1.1.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/leaderboard_flow_test.cpp
 */
#pragma once

#include <chrono>
#include <memory>
#include <string>

#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/websocket.hpp>

#include <nlohmann/json.hpp>

#include "leaderboard/config.hpp"
#include "leaderboard/leaderboard_service.hpp"
#include "leaderboard/observability.hpp"
#include "leaderboard/rate_limiter.hpp"
#include "leaderboard/realtime.hpp"

namespace leaderboard {

class HttpSession : public std::enable_shared_from_this<HttpSession> {
 public:
  using Response = boost::beast::http::response<boost::beast::http::string_body>;

  HttpSession(boost::asio::ip::tcp::socket socket, const AppConfig& config,
              std::shared_ptr<LeaderboardService> service, std::shared_ptr<RealtimeCoordinator> coordinator,
              std::shared_ptr<RateLimiter> api_limiter, std::shared_ptr<Observability> observability,
              std::chrono::steady_clock::time_point started_at);
  void Run();

 private:
  void DoRead();
  void OnRead(boost::beast::error_code ec, std::size_t bytes_transferred);
  void HandleRequest();
  void Route(const std::string& path, const std::string& query, Response& res);
  void HandleSubmit(Response& res);
  void HandleTop(const std::string& query, Response& res);
  void HandleRank(const std::string& id_text, Response& res);
  void HandleRecalculationStatus(Response& res);
  void HandleMetrics(Response& res);
  void SendResponse(std::shared_ptr<Response> res);
  void HandleWebSocket();
  std::string RemoteIp();

  boost::beast::tcp_stream stream_;
  boost::beast::flat_buffer buffer_;
  boost::beast::http::request<boost::beast::http::string_body> req_;
  AppConfig config_;
  std::shared_ptr<LeaderboardService> service_;
  std::shared_ptr<RealtimeCoordinator> coordinator_;
  std::shared_ptr<RateLimiter> api_limiter_;
  std::shared_ptr<Observability> observability_;
  std::chrono::steady_clock::time_point started_at_;
  std::chrono::steady_clock::time_point request_start_;
  std::string trace_id_;
};

}  // namespace leaderboard

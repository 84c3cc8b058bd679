/*
 * 설명: 구독 WebSocket 메시지를 읽고 leaderboard:request에 응답하며 서버 이벤트를 전달한다.
 * 버전: v1.1.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/leaderboard_flow_test.cpp
 */
#include "leaderboard/websocket_session.hpp"

#include <boost/asio/post.hpp>
#include <boost/beast/core/buffers_to_string.hpp>
#include <boost/beast/websocket.hpp>

#include "leaderboard/errors.hpp"

namespace leaderboard {
namespace {
constexpr int kDefaultRequestLimit = 10;
}  // namespace

WebSocketSession::WebSocketSession(boost::beast::websocket::stream<boost::beast::tcp_stream> ws,
                                   std::shared_ptr<RealtimeCoordinator> coordinator,
                                   std::shared_ptr<LeaderboardService> service,
                                   std::shared_ptr<Observability> observability, std::size_t max_queue_messages,
                                   std::size_t max_queue_bytes)
    : ws_(std::move(ws)), coordinator_(std::move(coordinator)), service_(std::move(service)),
      observability_(std::move(observability)), max_queue_messages_(max_queue_messages),
      max_queue_bytes_(max_queue_bytes) {}

WebSocketSession::~WebSocketSession() { coordinator_->Unregister(subscriber_id_, this); }

void WebSocketSession::Run() {
  subscriber_id_ = coordinator_->Register(shared_from_this());
  observability_->Event(LogLevel::kDebug, "ws_subscribed", {{"subscriberId", subscriber_id_}});
  SendEvent("leaderboard:subscribed", {{"subscriberId", subscriber_id_}}, 0);
  DoRead();
}

void WebSocketSession::DoRead() {
  if (closing_) {
    return;
  }
  auto self = shared_from_this();
  ws_.async_read(buffer_, [self](boost::beast::error_code ec, std::size_t bytes_transferred) {
    self->OnRead(ec, bytes_transferred);
  });
}

void WebSocketSession::OnRead(boost::beast::error_code ec, std::size_t /*bytes_transferred*/) {
  if (ec == boost::beast::websocket::error::closed || closing_) {
    return;
  }
  if (ec) {
    return;
  }

  auto data = boost::beast::buffers_to_string(buffer_.data());
  buffer_.consume(buffer_.size());
  try {
    auto message = nlohmann::json::parse(data);
    std::uint64_t seq = 0;
    auto seq_it = message.find("seq");
    if (seq_it != message.end() && seq_it->is_number_unsigned()) {
      seq = seq_it->get<std::uint64_t>();
    }
    auto type_it = message.find("t");
    auto event_it = message.find("event");
    if (type_it == message.end() || !type_it->is_string()) {
      SendError("bad_request", "잘못된 메시지 형식", seq);
    } else if (*type_it != "event" || event_it == message.end() || !event_it->is_string()) {
      SendError("bad_request", "알 수 없는 메시지 유형", seq);
    } else if (*event_it == "leaderboard:request") {
      auto payload_it = message.find("p");
      HandleLeaderboardRequest(payload_it != message.end() ? *payload_it : nlohmann::json::object(), seq);
    } else {
      SendError("bad_request", "알 수 없는 이벤트", seq);
    }
  } catch (const nlohmann::json::exception&) {
    SendError("bad_request", "JSON 파싱 오류", 0);
  }

  if (!closing_) {
    DoRead();
  }
}

void WebSocketSession::HandleLeaderboardRequest(const nlohmann::json& payload, std::uint64_t seq) {
  int limit = kDefaultRequestLimit;
  if (payload.is_object() && payload.contains("limit")) {
    if (!payload["limit"].is_number_integer()) {
      SendError("validation_failed", "limit은 정수여야 합니다", seq);
      return;
    }
    auto requested = payload["limit"].get<std::int64_t>();
    if (requested < 1 || requested > kMaxTopLimit) {
      SendEvent("leaderboard:error", {{"code", "validation_failed"}, {"message", "limit은 1~100 사이여야 합니다"}}, seq);
      return;
    }
    limit = static_cast<int>(requested);
  }
  try {
    auto entries = service_->GetTop(limit);
    SendEvent("leaderboard:data", {{"entries", ToJson(entries)}}, seq);
  } catch (const LeaderboardError& ex) {
    observability_->Event(LogLevel::kWarn, "ws_leaderboard_request_failed", {{"code", ex.Code()}, {"error", ex.what()}});
    SendEvent("leaderboard:error", {{"code", ex.Code()}, {"message", ex.what()}}, seq);
  } catch (const std::exception& ex) {
    observability_->Event(LogLevel::kError, "ws_leaderboard_request_failed", {{"error", ex.what()}});
    SendEvent("leaderboard:error", {{"code", "internal_error"}, {"message", "리더보드 조회 실패"}}, seq);
  }
}

void WebSocketSession::SendEvent(const std::string& event, const nlohmann::json& payload, std::uint64_t seq) {
  WsEnvelope env{.type = "event", .event = event, .seq = seq, .payload = payload};
  EnqueueMessage(DumpJson(ToWsJson(env)));
}

void WebSocketSession::SendError(std::string_view code, std::string_view message, std::uint64_t seq) {
  WsEnvelope env{.type = "error", .event = "", .seq = seq, .payload = {{"code", code}, {"message", message}}};
  EnqueueMessage(DumpJson(ToWsJson(env)));
}

void WebSocketSession::SendServerEvent(const std::string& event, const nlohmann::json& payload) {
  WsEnvelope env{.type = "event", .event = event, .seq = 0, .payload = payload};
  boost::asio::post(ws_.get_executor(),
                    [self = shared_from_this(), text = DumpJson(ToWsJson(env))]() mutable {
                      self->EnqueueMessage(std::move(text));
                    });
}

void WebSocketSession::EnqueueMessage(std::string message) {
  if (closing_) {
    return;
  }
  const auto message_size = message.size();
  if (send_queue_.size() >= max_queue_messages_ || queued_bytes_ + message_size > max_queue_bytes_) {
    TriggerBackpressureClose();
    return;
  }
  send_queue_.push_back(std::move(message));
  queued_bytes_ += message_size;
  if (!writing_) {
    WriteNext();
  }
}

void WebSocketSession::WriteNext() {
  if (send_queue_.empty() || closing_) {
    return;
  }
  writing_ = true;
  auto self = shared_from_this();
  ws_.text(true);
  ws_.async_write(boost::asio::buffer(send_queue_.front()),
                  [self](boost::beast::error_code ec, std::size_t /*bytes_transferred*/) { self->OnWrite(ec); });
}

void WebSocketSession::OnWrite(boost::beast::error_code ec) {
  if (!send_queue_.empty()) {
    queued_bytes_ -= send_queue_.front().size();
    send_queue_.pop_front();
  }
  if (ec) {
    closing_ = true;
    return;
  }
  writing_ = false;
  if (!send_queue_.empty()) {
    WriteNext();
  }
}

void WebSocketSession::TriggerBackpressureClose() {
  if (closing_) {
    return;
  }
  closing_ = true;
  send_queue_.clear();
  queued_bytes_ = 0;
  observability_->Event(LogLevel::kWarn, "ws_backpressure_close", {{"subscriberId", subscriber_id_}});
  boost::beast::websocket::close_reason reason{boost::beast::websocket::close_code::policy_error};
  reason.reason = "backpressure_exceeded";
  auto self = shared_from_this();
  ws_.async_close(reason, [self](boost::beast::error_code) {});
}

}  // namespace leaderboard

/*
 * 설명: HTTP 요청을 리더보드 API로 분기하고 오류를 JSON 엔벨로프와 상태 코드로 변환한다.
 * 버전: v1.1.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/leaderboard_flow_test.cpp
 */
#include "leaderboard/http_session.hpp"

#include <algorithm>
#include <cctype>
#include <limits>
#include <optional>
#include <unordered_map>

#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>

#include "leaderboard/api_response.hpp"
#include "leaderboard/errors.hpp"
#include "leaderboard/websocket_session.hpp"

namespace leaderboard {

namespace {
constexpr const char* kServerName = "leaderboard-server";
constexpr const char* kRankPrefix = "/api/leaderboard/rank/";
constexpr std::size_t kDeadJobListLimit = 20;

std::unordered_map<std::string, std::string> ParseQueryParams(const std::string& query) {
  std::unordered_map<std::string, std::string> params;
  std::size_t pos = 0;
  while (pos < query.size()) {
    auto amp = query.find('&', pos);
    std::string pair = query.substr(pos, amp == std::string::npos ? std::string::npos : amp - pos);
    auto eq = pair.find('=');
    if (eq != std::string::npos) {
      params.emplace(pair.substr(0, eq), pair.substr(eq + 1));
    }
    if (amp == std::string::npos) {
      break;
    }
    pos = amp + 1;
  }
  return params;
}

std::optional<long long> ParseDigits(const std::string& value) {
  if (value.empty() || value.size() > 12 ||
      !std::all_of(value.begin(), value.end(), [](unsigned char c) { return std::isdigit(c) != 0; })) {
    return std::nullopt;
  }
  return std::stoll(value);
}

void WriteJson(HttpSession::Response& res, boost::beast::http::status status, const nlohmann::json& body) {
  res.result(status);
  res.body() = DumpJson(body);
  res.content_length(res.body().size());
}

void WriteError(HttpSession::Response& res, boost::beast::http::status status, std::string_view code,
                std::string_view message) {
  WriteJson(res, status, MakeErrorEnvelope(code, message));
}

boost::beast::http::status StatusFor(const LeaderboardError& error) {
  using boost::beast::http::status;
  if (dynamic_cast<const ValidationError*>(&error)) {
    return status::bad_request;
  }
  if (dynamic_cast<const NotFoundError*>(&error)) {
    return status::not_found;
  }
  if (dynamic_cast<const TransientStoreError*>(&error)) {
    return status::service_unavailable;
  }
  return status::internal_server_error;
}

nlohmann::json ToJson(const RankJob& job) {
  return {{"jobId", job.id},
          {"scope", ToString(job.scope)},
          {"userId", job.player_id ? nlohmann::json(*job.player_id) : nlohmann::json(nullptr)},
          {"attempts", job.attempts},
          {"error", job.last_error}};
}
}  // namespace

HttpSession::HttpSession(boost::asio::ip::tcp::socket socket, const AppConfig& config,
                         std::shared_ptr<LeaderboardService> service,
                         std::shared_ptr<RealtimeCoordinator> coordinator, std::shared_ptr<RateLimiter> api_limiter,
                         std::shared_ptr<Observability> observability,
                         std::chrono::steady_clock::time_point started_at)
    : stream_(std::move(socket)), config_(config), service_(std::move(service)),
      coordinator_(std::move(coordinator)), api_limiter_(std::move(api_limiter)),
      observability_(std::move(observability)), started_at_(started_at) {}

void HttpSession::Run() { DoRead(); }

void HttpSession::DoRead() {
  auto self = shared_from_this();
  req_ = {};
  stream_.expires_after(std::chrono::seconds(30));
  boost::beast::http::async_read(
      stream_, buffer_, req_,
      [self](boost::beast::error_code ec, std::size_t bytes_transferred) {
        self->OnRead(ec, bytes_transferred);
      });
}

void HttpSession::OnRead(boost::beast::error_code ec, std::size_t /*bytes_transferred*/) {
  if (ec == boost::beast::http::error::end_of_stream) {
    boost::beast::error_code ignored;
    stream_.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_send, ignored);
    return;
  }
  if (ec) {
    return;
  }

  if (boost::beast::websocket::is_upgrade(req_)) {
    return HandleWebSocket();
  }

  HandleRequest();
}

void HttpSession::HandleRequest() {
  using namespace boost::beast;
  request_start_ = std::chrono::steady_clock::now();
  trace_id_ = observability_->NextTraceId();
  observability_->IncrementRequest();

  auto res = std::make_shared<Response>();
  res->version(req_.version());
  res->set(http::field::server, kServerName);
  res->set(http::field::content_type, "application/json; charset=utf-8");

  std::string target_str = std::string(req_.target());
  std::string path = target_str;
  std::string query;
  auto qpos = target_str.find('?');
  if (qpos != std::string::npos) {
    path = target_str.substr(0, qpos);
    query = target_str.substr(qpos + 1);
  }

  if (path.rfind("/api/", 0) == 0) {
    auto ip = RemoteIp();
    auto now = RateLimiter::Clock::now();
    if (!api_limiter_->Allow(ip, now)) {
      auto retry_after = api_limiter_->RetryAfter(ip, now);
      res->set(http::field::retry_after, std::to_string((retry_after.count() + 999) / 1000));
      WriteError(*res, http::status::too_many_requests, "rate_limited", "요청 한도를 초과했습니다");
      return SendResponse(res);
    }
  }

  try {
    Route(path, query, *res);
  } catch (const LeaderboardError& ex) {
    auto status = StatusFor(ex);
    auto level = status == http::status::not_found || status == http::status::bad_request ? LogLevel::kInfo
                                                                                          : LogLevel::kWarn;
    observability_->Log(LogContext{trace_id_, std::nullopt, "request_failed", 0, level,
                                   {{"path", path}, {"code", ex.Code()}, {"error", ex.what()}}});
    WriteError(*res, status, ex.Code(), ex.what());
  } catch (const std::exception& ex) {
    observability_->Log(LogContext{trace_id_, std::nullopt, "request_failed", 0, LogLevel::kError,
                                   {{"path", path}, {"error", ex.what()}}});
    WriteError(*res, http::status::internal_server_error, "internal_error", "서버 내부 오류가 발생했습니다");
  }
  SendResponse(res);
}

void HttpSession::Route(const std::string& path, const std::string& query, Response& res) {
  using namespace boost::beast;
  const auto method = req_.method();

  if (method == http::verb::get && path == "/health") {
    auto uptime = std::chrono::duration_cast<std::chrono::seconds>(std::chrono::steady_clock::now() - started_at_);
    WriteJson(res, http::status::ok,
              {{"status", "healthy"},
               {"timestamp", ToIsoString(std::chrono::system_clock::now())},
               {"uptimeSeconds", uptime.count()},
               {"storeBackend", config_.store_backend}});
    return;
  }

  if (method == http::verb::get && path == "/metrics") {
    return HandleMetrics(res);
  }

  if (method == http::verb::post && path == "/api/leaderboard/submit") {
    return HandleSubmit(res);
  }

  if (method == http::verb::get && path == "/api/leaderboard/top") {
    return HandleTop(query, res);
  }

  if (method == http::verb::get && path.rfind(kRankPrefix, 0) == 0) {
    return HandleRank(path.substr(std::string(kRankPrefix).size()), res);
  }

  if (method == http::verb::get && path == "/api/leaderboard/stats") {
    WriteJson(res, http::status::ok, MakeSuccessEnvelope(ToJson(service_->GetStats())));
    return;
  }

  if (method == http::verb::post && path == "/api/leaderboard/recalculate") {
    auto ack = service_->TriggerFullRecomputation();
    WriteJson(res, http::status::accepted,
              MakeSuccessEnvelope({{"jobId", ack.job_id}, {"acceptedAt", ToIsoString(ack.accepted_at)}}));
    return;
  }

  if (method == http::verb::get && path == "/api/leaderboard/recalculate/status") {
    return HandleRecalculationStatus(res);
  }

  WriteError(res, http::status::not_found, "not_found", "지원되지 않는 경로입니다");
}

void HttpSession::HandleSubmit(Response& res) {
  nlohmann::json body_json;
  try {
    body_json = nlohmann::json::parse(req_.body());
  } catch (const nlohmann::json::exception&) {
    throw ValidationError("JSON 본문이 올바르지 않습니다");
  }
  if (!body_json.is_object() || !body_json.contains("user_id") || !body_json["user_id"].is_number_integer()) {
    throw ValidationError("user_id는 양의 정수여야 합니다");
  }
  if (!body_json.contains("score") || !body_json["score"].is_number_integer()) {
    throw ValidationError("score는 0 이상 1000000 이하여야 합니다");
  }
  std::string mode = "solo";
  if (body_json.contains("game_mode")) {
    if (!body_json["game_mode"].is_string()) {
      throw ValidationError("game_mode는 1~50자여야 합니다");
    }
    mode = body_json["game_mode"].get<std::string>();
  }
  auto user_id = body_json["user_id"].get<long long>();
  if (user_id <= 0 || user_id > std::numeric_limits<int>::max()) {
    throw ValidationError("user_id는 양의 정수여야 합니다");
  }

  auto result = service_->SubmitScore(static_cast<int>(user_id), body_json["score"].get<std::int64_t>(), mode);
  WriteJson(res, boost::beast::http::status::ok,
            MakeSuccessEnvelope({{"userId", result.player_id},
                                 {"totalScore", result.total_score},
                                 {"submittedAt", ToIsoString(result.submitted_at)}}));
}

void HttpSession::HandleTop(const std::string& query, Response& res) {
  int limit = 10;
  auto params = ParseQueryParams(query);
  auto it = params.find("limit");
  if (it != params.end()) {
    auto parsed = ParseDigits(it->second);
    if (!parsed || *parsed < 1 || *parsed > kMaxTopLimit) {
      throw ValidationError("limit은 1~100 사이여야 합니다");
    }
    limit = static_cast<int>(*parsed);
  }
  auto entries = service_->GetTop(limit);
  auto data = MakeSuccessEnvelope(ToJson(entries));
  data["count"] = entries.size();
  WriteJson(res, boost::beast::http::status::ok, data);
}

void HttpSession::HandleRank(const std::string& id_text, Response& res) {
  auto parsed = ParseDigits(id_text);
  if (!parsed || *parsed <= 0 || *parsed > std::numeric_limits<int>::max()) {
    throw ValidationError("userId는 양의 정수여야 합니다");
  }
  auto rank = service_->GetRank(static_cast<int>(*parsed));
  WriteJson(res, boost::beast::http::status::ok, MakeSuccessEnvelope(ToJson(rank)));
}

void HttpSession::HandleRecalculationStatus(Response& res) {
  auto status = service_->RecalculationStatus();
  nlohmann::json dead = nlohmann::json::array();
  for (const auto& job : service_->DeadJobs(kDeadJobListLimit)) {
    dead.push_back(ToJson(job));
  }
  nlohmann::json data{{"engineRunning", status.running},
                      {"queue",
                       {{"pending", status.counts.pending},
                        {"running", status.counts.running},
                        {"completed", status.counts.completed},
                        {"dead", status.counts.dead}}},
                      {"incrementalSinceFull", status.incremental_since_full},
                      {"lastFullAt", status.last_full_at ? nlohmann::json(ToIsoString(*status.last_full_at))
                                                         : nlohmann::json(nullptr)},
                      {"lastFullRows", status.last_full_rows},
                      {"deadJobs", dead}};
  WriteJson(res, boost::beast::http::status::ok, MakeSuccessEnvelope(data));
}

void HttpSession::HandleMetrics(Response& res) {
  auto snapshot = observability_->Snapshot();
  nlohmann::json data{{"requests", {{"total", snapshot.request_total}, {"errors", snapshot.request_errors}}},
                      {"connections", {{"websocket", snapshot.websocket_active}}},
                      {"submissions", snapshot.submissions},
                      {"cache", {{"hits", snapshot.cache_hits}, {"misses", snapshot.cache_misses}}},
                      {"jobs",
                       {{"completed", snapshot.jobs_completed},
                        {"failed", snapshot.jobs_failed},
                        {"dead", snapshot.jobs_dead}}}};
  WriteJson(res, boost::beast::http::status::ok, MakeSuccessEnvelope(data));
}

void HttpSession::SendResponse(std::shared_ptr<Response> res) {
  auto self = shared_from_this();
  const auto status = static_cast<unsigned>(res->result_int());
  if (status >= 400) {
    observability_->IncrementError();
  }
  auto latency =
      std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - request_start_).count();
  observability_->Log(LogContext{trace_id_, std::nullopt, "http_request", latency, LogLevel::kInfo,
                                 {{"method", std::string(req_.method_string())},
                                  {"target", std::string(req_.target())},
                                  {"status", status}}});
  boost::beast::http::async_write(
      stream_, *res,
      [self, res](boost::beast::error_code ec, std::size_t /*bytes_transferred*/) {
        if (ec) {
          return;
        }
        self->stream_.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_send, ec);
      });
}

void HttpSession::HandleWebSocket() {
  std::string path = std::string(req_.target());
  auto qpos = path.find('?');
  if (qpos != std::string::npos) {
    path.resize(qpos);
  }
  if (path != "/ws") {
    request_start_ = std::chrono::steady_clock::now();
    auto res = std::make_shared<Response>();
    res->version(req_.version());
    res->set(boost::beast::http::field::content_type, "application/json; charset=utf-8");
    WriteError(*res, boost::beast::http::status::not_found, "not_found", "WS 업그레이드는 /ws에서만 가능합니다");
    return SendResponse(res);
  }
  boost::beast::websocket::stream<boost::beast::tcp_stream> ws{std::move(stream_)};
  ws.set_option(boost::beast::websocket::stream_base::timeout::suggested(boost::beast::role_type::server));
  ws.set_option(boost::beast::websocket::stream_base::decorator([](boost::beast::websocket::response_type& res) {
    res.set(boost::beast::http::field::server, kServerName);
  }));
  boost::beast::error_code ec;
  ws.accept(req_, ec);
  if (ec) {
    observability_->Event(LogLevel::kWarn, "ws_accept_failed", {{"error", ec.message()}});
    return;
  }
  std::make_shared<WebSocketSession>(std::move(ws), coordinator_, service_, observability_,
                                     config_.ws_queue_limit_messages, config_.ws_queue_limit_bytes)
      ->Run();
}

std::string HttpSession::RemoteIp() {
  boost::beast::error_code ec;
  auto endpoint = stream_.socket().remote_endpoint(ec);
  if (ec) {
    return "unknown";
  }
  return endpoint.address().to_string();
}

}  // namespace leaderboard

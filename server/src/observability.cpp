/*
 * 설명: 구조화 로그와 간단한 메트릭 카운터를 관리한다.
 * 버전: v1.1.0
 * 관련 문서: DESIGN.md
 */
#include "leaderboard/observability.hpp"

#include <chrono>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>

namespace leaderboard {
namespace {
std::mutex& OutputMutex() {
  static std::mutex mutex;
  return mutex;
}
}  // namespace

LogLevel ParseLogLevel(const std::string& text) {
  if (text == "debug") {
    return LogLevel::kDebug;
  }
  if (text == "warn" || text == "warning") {
    return LogLevel::kWarn;
  }
  if (text == "error") {
    return LogLevel::kError;
  }
  return LogLevel::kInfo;
}

const char* ToString(LogLevel level) {
  switch (level) {
    case LogLevel::kDebug:
      return "debug";
    case LogLevel::kInfo:
      return "info";
    case LogLevel::kWarn:
      return "warn";
    case LogLevel::kError:
      return "error";
  }
  return "info";
}

Observability::Observability() : Observability(LogLevel::kInfo, nullptr) {}

Observability::Observability(LogLevel min_level, std::ostream* out) : min_level_(min_level), out_(out) {}

std::string Observability::NextTraceId() {
  auto now = std::chrono::steady_clock::now().time_since_epoch().count();
  std::ostringstream oss;
  oss << std::hex << now << "-" << trace_counter_.fetch_add(1);
  return oss.str();
}

void Observability::IncrementRequest() { request_total_.fetch_add(1); }

void Observability::IncrementError() { request_errors_.fetch_add(1); }

void Observability::SetWebsocketActive(std::uint64_t count) { websocket_active_.store(count); }

void Observability::IncrementSubmission() { submissions_.fetch_add(1); }

void Observability::RecordCacheLookup(bool hit) {
  if (hit) {
    cache_hits_.fetch_add(1);
  } else {
    cache_misses_.fetch_add(1);
  }
}

void Observability::IncrementJobCompleted() { jobs_completed_.fetch_add(1); }

void Observability::IncrementJobFailed() { jobs_failed_.fetch_add(1); }

void Observability::IncrementJobDead() { jobs_dead_.fetch_add(1); }

MetricsSnapshot Observability::Snapshot() const {
  MetricsSnapshot snapshot;
  snapshot.request_total = request_total_.load();
  snapshot.request_errors = request_errors_.load();
  snapshot.websocket_active = websocket_active_.load();
  snapshot.submissions = submissions_.load();
  snapshot.cache_hits = cache_hits_.load();
  snapshot.cache_misses = cache_misses_.load();
  snapshot.jobs_completed = jobs_completed_.load();
  snapshot.jobs_failed = jobs_failed_.load();
  snapshot.jobs_dead = jobs_dead_.load();
  return snapshot;
}

void Observability::Log(const LogContext& ctx) const {
  if (!Enabled(ctx.level)) {
    return;
  }
  nlohmann::json log_json;
  log_json["traceId"] = ctx.trace_id;
  log_json["level"] = ToString(ctx.level);
  log_json["eventName"] = ctx.name;
  log_json["latencyMs"] = ctx.latency_ms;
  if (ctx.player_id) {
    log_json["playerId"] = *ctx.player_id;
  }
  if (ctx.fields.is_object() && !ctx.fields.empty()) {
    log_json["fields"] = ctx.fields;
  }
  std::lock_guard<std::mutex> lock(OutputMutex());
  std::ostream& out = out_ ? *out_ : std::cout;
  out << log_json.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace) << std::endl;
}

void Observability::Event(LogLevel level, const std::string& name, nlohmann::json fields,
                          std::optional<int> player_id) const {
  if (!Enabled(level)) {
    return;
  }
  LogContext ctx;
  ctx.player_id = player_id;
  ctx.name = name;
  ctx.level = level;
  ctx.fields = std::move(fields);
  Log(ctx);
}

}  // namespace leaderboard

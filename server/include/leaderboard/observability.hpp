/*
 * 설명: 구조화 로그와 간단한 메트릭 카운터를 관리한다.
 * 버전: v1.1.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/observability_test.cpp
 */
#pragma once

#include <atomic>
#include <cstdint>
#include <optional>
#include <ostream>
#include <string>

#include <nlohmann/json.hpp>

namespace leaderboard {

enum class LogLevel { kDebug = 0, kInfo = 1, kWarn = 2, kError = 3 };

LogLevel ParseLogLevel(const std::string& text);
const char* ToString(LogLevel level);

struct LogContext {
  std::string trace_id;
  std::optional<int> player_id;
  std::string name;
  long latency_ms{0};
  LogLevel level{LogLevel::kInfo};
  nlohmann::json fields;
};

struct MetricsSnapshot {
  std::uint64_t request_total{0};
  std::uint64_t request_errors{0};
  std::uint64_t websocket_active{0};
  std::uint64_t submissions{0};
  std::uint64_t cache_hits{0};
  std::uint64_t cache_misses{0};
  std::uint64_t jobs_completed{0};
  std::uint64_t jobs_failed{0};
  std::uint64_t jobs_dead{0};
};

class Observability {
 public:
  Observability();
  explicit Observability(LogLevel min_level, std::ostream* out = nullptr);

  std::string NextTraceId();
  void IncrementRequest();
  void IncrementError();
  void SetWebsocketActive(std::uint64_t count);
  void IncrementSubmission();
  void RecordCacheLookup(bool hit);
  void IncrementJobCompleted();
  void IncrementJobFailed();
  void IncrementJobDead();
  MetricsSnapshot Snapshot() const;

  void Log(const LogContext& ctx) const;
  void Event(LogLevel level, const std::string& name, nlohmann::json fields = nlohmann::json::object(),
             std::optional<int> player_id = std::nullopt) const;
  bool Enabled(LogLevel level) const { return level >= min_level_; }

 private:
  LogLevel min_level_;
  std::ostream* out_;
  std::atomic<std::uint64_t> request_total_{0};
  std::atomic<std::uint64_t> request_errors_{0};
  std::atomic<std::uint64_t> websocket_active_{0};
  std::atomic<std::uint64_t> submissions_{0};
  std::atomic<std::uint64_t> cache_hits_{0};
  std::atomic<std::uint64_t> cache_misses_{0};
  std::atomic<std::uint64_t> jobs_completed_{0};
  std::atomic<std::uint64_t> jobs_failed_{0};
  std::atomic<std::uint64_t> jobs_dead_{0};
  std::atomic<std::uint64_t> trace_counter_{0};
};

}  // namespace leaderboard

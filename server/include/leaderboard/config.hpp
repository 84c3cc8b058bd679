/*
 * 설명: 서버 환경설정 로딩과 기본값을 정의한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/config_test.cpp, server/tests/e2e/leaderboard_flow_test.cpp
 */
#pragma once

#include <cstddef>
#include <string>

namespace leaderboard {

struct AppConfig {
  unsigned short port;
  std::string store_backend;
  std::string db_host;
  unsigned short db_port;
  std::string db_user;
  std::string db_password;
  std::string db_name;
  std::size_t db_tx_timeout_seconds;
  std::string log_level;
  std::size_t leaderboard_cache_ttl_seconds;
  std::size_t rank_cache_ttl_seconds;
  bool rank_recalculation_enabled;
  std::size_t rank_worker_concurrency;
  std::size_t rank_jobs_per_second;
  std::size_t rank_job_attempts;
  std::size_t rank_job_backoff_ms;
  std::size_t full_recalc_interval_seconds;
  std::size_t full_recalc_incremental_threshold;
  std::size_t rate_limit_window_seconds;
  std::size_t rate_limit_max_requests;
  std::size_t ws_queue_limit_messages;
  std::size_t ws_queue_limit_bytes;
};

AppConfig LoadConfigFromEnv();

}  // namespace leaderboard

/*
 * 설명: 저장소/캐시/재계산 엔진/HTTP 리스너를 조립하고 서버 수명주기를 관리한다.
 * 버전: v1.2.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/leaderboard_flow_test.cpp
 */
#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <memory>
#include <thread>
#include <vector>

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/signal_set.hpp>

#include "leaderboard/cache.hpp"
#include "leaderboard/config.hpp"
#include "leaderboard/leaderboard_service.hpp"
#include "leaderboard/observability.hpp"
#include "leaderboard/rank_engine.hpp"
#include "leaderboard/rate_limiter.hpp"
#include "leaderboard/realtime.hpp"
#include "leaderboard/store.hpp"

namespace leaderboard {

class Listener;

class ServerApp {
 public:
  explicit ServerApp(const AppConfig& config);
  ~ServerApp();

  // 저장소에 연결할 수 없으면 FatalConfigurationError를 던진다.
  void Run();
  void Stop();

  boost::asio::io_context& GetContext() { return ioc_; }
  const AppConfig& GetConfig() const { return config_; }
  std::shared_ptr<LeaderboardService> GetService() { return service_; }
  std::shared_ptr<RankRecomputeEngine> GetEngine() { return engine_; }
  std::shared_ptr<LeaderboardStore> GetStore() { return store_; }
  std::shared_ptr<LeaderboardCache> GetCache() { return cache_; }
  std::shared_ptr<RealtimeCoordinator> GetCoordinator() { return coordinator_; }
  std::shared_ptr<Observability> GetObservability() { return observability_; }

 private:
  void BuildStores();
  void RunWorkers();
  void RunIoLoop();
  void WaitForSignal();
  void Shutdown();

  AppConfig config_;
  boost::asio::io_context ioc_;
  boost::asio::executor_work_guard<boost::asio::io_context::executor_type> work_guard_;
  boost::asio::signal_set signals_;
  std::chrono::steady_clock::time_point started_at_;
  std::shared_ptr<Listener> listener_;
  std::shared_ptr<Observability> observability_;
  std::shared_ptr<LeaderboardStore> store_;
  std::shared_ptr<RankJobStore> job_store_;
  std::shared_ptr<LeaderboardCache> cache_;
  std::shared_ptr<RankRecomputeEngine> engine_;
  std::shared_ptr<LeaderboardService> service_;
  std::shared_ptr<RealtimeCoordinator> coordinator_;
  std::shared_ptr<RateLimiter> api_limiter_;
  std::vector<std::thread> workers_;
  std::atomic<bool> running_{false};
};

}  // namespace leaderboard

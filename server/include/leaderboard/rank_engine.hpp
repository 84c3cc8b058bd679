/*
 * 설명: 영속 작업 큐를 소비해 rank 컬럼을 재계산하는 백그라운드 엔진.
 *       워커 수와 초당 처리량을 제한하고, 실패한 작업은 지수 백오프로 재시도한 뒤 데드레터로 보낸다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/rank_engine_test.cpp, server/tests/it/rank_job_it_test.cpp
 */
#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>
#include <vector>

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>

#include "leaderboard/cache.hpp"
#include "leaderboard/observability.hpp"
#include "leaderboard/rate_limiter.hpp"
#include "leaderboard/store.hpp"

namespace leaderboard {

struct RankEngineConfig {
  std::size_t worker_count{2};
  std::size_t jobs_per_second{5};
  int max_attempts{3};
  std::chrono::milliseconds backoff_base{2000};
  // 0이면 주기적 전체 재계산을 끈다.
  std::chrono::seconds full_interval{300};
  // 0이면 누적 incremental 기준 전체 재계산을 끈다.
  std::size_t incremental_threshold{100};
  std::chrono::milliseconds idle_poll{200};
  std::size_t completed_retention{100};
  std::vector<std::size_t> warm_limits{10, 50};
};

struct RankEngineStatus {
  RankJobCounts counts;
  std::size_t incremental_since_full{0};
  std::optional<std::chrono::system_clock::time_point> last_full_at;
  std::size_t last_full_rows{0};
  bool running{false};
};

class RankRecomputeEngine : public std::enable_shared_from_this<RankRecomputeEngine> {
 public:
  RankRecomputeEngine(boost::asio::io_context& ioc, std::shared_ptr<LeaderboardStore> store,
                      std::shared_ptr<RankJobStore> jobs, std::shared_ptr<LeaderboardCache> cache,
                      std::shared_ptr<Observability> observability, RankEngineConfig config);
  ~RankRecomputeEngine();

  void Start();
  void Stop();

  std::int64_t EnqueueIncremental(int player_id);
  std::int64_t EnqueueFull();

  // 실행 가능한 작업 하나를 점유해 처리한다. 처리량 제한은 적용하지 않는다.
  bool ProcessNext();
  bool WaitIdle(std::chrono::milliseconds timeout);

  RankEngineStatus Status();
  std::vector<RankJob> DeadJobs(std::size_t limit);
  std::chrono::milliseconds BackoffDelay(int attempt) const;

 private:
  void WorkerLoop();
  void Run(const RankJob& job);
  void Execute(const RankJob& job);
  void ExecuteFull();
  void ExecuteIncremental(int player_id);
  void HandleFailure(const RankJob& job, const std::string& error);
  void WarmCache();
  void AcquireSlot();
  void WaitForWork();
  void Wake();
  void ScheduleMaintenance();
  void OnMaintenanceTick(const boost::system::error_code& ec);

  boost::asio::steady_timer timer_;
  std::shared_ptr<LeaderboardStore> store_;
  std::shared_ptr<RankJobStore> jobs_;
  std::shared_ptr<LeaderboardCache> cache_;
  std::shared_ptr<Observability> observability_;
  RankEngineConfig config_;
  RateLimiter throttle_;

  std::vector<std::thread> workers_;
  std::atomic<bool> running_{false};
  std::atomic<std::size_t> in_flight_{0};
  std::atomic<std::size_t> incremental_since_full_{0};
  std::mutex mutex_;
  std::condition_variable wake_cv_;
  bool wake_pending_{false};
  std::optional<std::chrono::system_clock::time_point> last_full_at_;
  std::size_t last_full_rows_{0};
};

}  // namespace leaderboard

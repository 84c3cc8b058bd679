/*
 * 설명: 랭크 재계산 작업의 점유/실행/재시도/데드레터 처리와 주기적 전체 재계산을 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/rank_engine_test.cpp, server/tests/it/rank_job_it_test.cpp
 */
#include "leaderboard/rank_engine.hpp"

#include <algorithm>
#include <stdexcept>

#include "leaderboard/api_response.hpp"

namespace leaderboard {
namespace {
constexpr const char* kThrottleKey = "rank-jobs";
}  // namespace

RankRecomputeEngine::RankRecomputeEngine(boost::asio::io_context& ioc, std::shared_ptr<LeaderboardStore> store,
                                         std::shared_ptr<RankJobStore> jobs, std::shared_ptr<LeaderboardCache> cache,
                                         std::shared_ptr<Observability> observability, RankEngineConfig config)
    : timer_(ioc), store_(std::move(store)), jobs_(std::move(jobs)), cache_(std::move(cache)),
      observability_(std::move(observability)), config_(std::move(config)),
      throttle_(std::max<std::size_t>(1, config_.jobs_per_second), std::chrono::milliseconds(1000)) {}

RankRecomputeEngine::~RankRecomputeEngine() { Stop(); }

void RankRecomputeEngine::Start() {
  if (running_.exchange(true)) {
    return;
  }
  try {
    auto released = jobs_->ReleaseRunning();
    if (released > 0) {
      observability_->Event(LogLevel::kWarn, "rank_jobs_released", {{"count", released}});
    }
  } catch (const std::exception& ex) {
    observability_->Event(LogLevel::kError, "rank_jobs_release_failed", {{"error", ex.what()}});
  }
  const std::size_t worker_count = std::max<std::size_t>(1, config_.worker_count);
  for (std::size_t i = 0; i < worker_count; ++i) {
    workers_.emplace_back([this]() { WorkerLoop(); });
  }
  ScheduleMaintenance();
  observability_->Event(LogLevel::kInfo, "rank_engine_started",
                        {{"workers", worker_count}, {"jobsPerSecond", config_.jobs_per_second}});
}

void RankRecomputeEngine::Stop() {
  if (!running_.exchange(false)) {
    return;
  }
  Wake();
  for (auto& worker : workers_) {
    if (worker.joinable()) {
      worker.join();
    }
  }
  workers_.clear();
  timer_.cancel();
  observability_->Event(LogLevel::kInfo, "rank_engine_stopped");
}

std::int64_t RankRecomputeEngine::EnqueueIncremental(int player_id) {
  auto job_id = jobs_->Enqueue(RankJobScope::kIncremental, player_id);
  Wake();
  return job_id;
}

std::int64_t RankRecomputeEngine::EnqueueFull() {
  auto job_id = jobs_->Enqueue(RankJobScope::kFull, std::nullopt);
  observability_->Event(LogLevel::kInfo, "rank_full_enqueued", {{"jobId", job_id}});
  Wake();
  return job_id;
}

bool RankRecomputeEngine::ProcessNext() {
  auto job = jobs_->ClaimNext();
  if (!job) {
    return false;
  }
  Run(*job);
  return true;
}

void RankRecomputeEngine::Run(const RankJob& job) {
  in_flight_.fetch_add(1);
  auto started = std::chrono::steady_clock::now();
  try {
    Execute(job);
    jobs_->MarkCompleted(job.id);
    observability_->IncrementJobCompleted();
    auto latency =
        std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started).count();
    observability_->Log(LogContext{"", job.player_id, "rank_job_completed", latency, LogLevel::kDebug,
                                   {{"jobId", job.id}, {"scope", ToString(job.scope)}}});
  } catch (const std::exception& ex) {
    HandleFailure(job, ex.what());
  }
  in_flight_.fetch_sub(1);
}

void RankRecomputeEngine::Execute(const RankJob& job) {
  switch (job.scope) {
    case RankJobScope::kFull:
      ExecuteFull();
      return;
    case RankJobScope::kIncremental:
      if (!job.player_id) {
        throw std::invalid_argument("incremental 작업에 player_id가 없습니다");
      }
      ExecuteIncremental(*job.player_id);
      return;
  }
}

void RankRecomputeEngine::ExecuteFull() {
  auto rows = store_->RecomputeAllRanks();
  {
    std::lock_guard<std::mutex> lock(mutex_);
    last_full_at_ = std::chrono::system_clock::now();
    last_full_rows_ = rows;
  }
  incremental_since_full_.store(0);
  try {
    cache_->InvalidateTop();
  } catch (const std::exception& ex) {
    observability_->Event(LogLevel::kWarn, "cache_invalidate_failed", {{"scope", "top"}, {"error", ex.what()}});
  }
  WarmCache();
  observability_->Event(LogLevel::kInfo, "rank_full_completed", {{"rows", rows}});
}

void RankRecomputeEngine::ExecuteIncremental(int player_id) {
  auto rank = store_->RecomputePlayerRank(player_id);
  if (!rank) {
    observability_->Event(LogLevel::kDebug, "rank_incremental_skipped", nlohmann::json::object(), player_id);
    return;
  }
  auto pending = incremental_since_full_.fetch_add(1) + 1;
  if (config_.incremental_threshold > 0 && pending >= config_.incremental_threshold) {
    incremental_since_full_.store(0);
    EnqueueFull();
  }
}

void RankRecomputeEngine::WarmCache() {
  for (auto limit : config_.warm_limits) {
    try {
      cache_->PutTop(limit, store_->FetchTop(limit));
    } catch (const std::exception& ex) {
      observability_->Event(LogLevel::kWarn, "cache_warm_failed", {{"limit", limit}, {"error", ex.what()}});
    }
  }
}

void RankRecomputeEngine::HandleFailure(const RankJob& job, const std::string& error) {
  int attempts = job.attempts + 1;
  observability_->IncrementJobFailed();
  try {
    if (attempts >= config_.max_attempts) {
      jobs_->MarkDead(job.id, attempts, error);
      observability_->IncrementJobDead();
      observability_->Log(LogContext{"", job.player_id, "rank_job_dead", 0, LogLevel::kError,
                                     {{"jobId", job.id}, {"scope", ToString(job.scope)}, {"attempts", attempts},
                                      {"error", error}}});
      return;
    }
    auto delay = BackoffDelay(attempts);
    jobs_->Reschedule(job.id, attempts, delay, error);
    observability_->Log(LogContext{"", job.player_id, "rank_job_retry", 0, LogLevel::kWarn,
                                   {{"jobId", job.id}, {"attempts", attempts}, {"delayMs", delay.count()},
                                    {"error", error}}});
  } catch (const std::exception& ex) {
    // 큐 자체가 응답하지 않으면 작업은 running으로 남고 다음 기동 때 해제된다.
    observability_->Event(LogLevel::kError, "rank_job_failure_unrecorded",
                          {{"jobId", job.id}, {"error", error}, {"queueError", ex.what()}});
  }
}

std::chrono::milliseconds RankRecomputeEngine::BackoffDelay(int attempt) const {
  int exponent = std::clamp(attempt - 1, 0, 20);
  return config_.backoff_base * (1LL << exponent);
}

void RankRecomputeEngine::WorkerLoop() {
  while (running_) {
    AcquireSlot();
    if (!running_) {
      break;
    }
    std::optional<RankJob> job;
    try {
      job = jobs_->ClaimNext();
    } catch (const std::exception& ex) {
      observability_->Event(LogLevel::kWarn, "rank_job_claim_failed", {{"error", ex.what()}});
    }
    if (!job) {
      WaitForWork();
      continue;
    }
    // 점유 후 토큰을 소모한다. 다른 워커와 경합해 실패하면 다음 윈도까지 기다린다.
    while (!throttle_.Allow(kThrottleKey, RateLimiter::Clock::now())) {
      std::this_thread::sleep_for(
          std::max(std::chrono::milliseconds(1), throttle_.RetryAfter(kThrottleKey, RateLimiter::Clock::now())));
    }
    Run(*job);
  }
}

void RankRecomputeEngine::AcquireSlot() {
  auto wait = throttle_.RetryAfter(kThrottleKey, RateLimiter::Clock::now());
  if (wait.count() <= 0) {
    return;
  }
  std::unique_lock<std::mutex> lock(mutex_);
  wake_cv_.wait_for(lock, wait, [this]() { return !running_; });
}

void RankRecomputeEngine::WaitForWork() {
  std::unique_lock<std::mutex> lock(mutex_);
  wake_cv_.wait_for(lock, config_.idle_poll, [this]() { return !running_ || wake_pending_; });
  wake_pending_ = false;
}

void RankRecomputeEngine::Wake() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    wake_pending_ = true;
  }
  wake_cv_.notify_all();
}

bool RankRecomputeEngine::WaitIdle(std::chrono::milliseconds timeout) {
  auto deadline = std::chrono::steady_clock::now() + timeout;
  while (std::chrono::steady_clock::now() < deadline) {
    auto counts = jobs_->Counts();
    if (counts.pending == 0 && counts.running == 0 && in_flight_.load() == 0) {
      return true;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
  }
  return false;
}

RankEngineStatus RankRecomputeEngine::Status() {
  RankEngineStatus status;
  status.counts = jobs_->Counts();
  status.incremental_since_full = incremental_since_full_.load();
  status.running = running_.load();
  std::lock_guard<std::mutex> lock(mutex_);
  status.last_full_at = last_full_at_;
  status.last_full_rows = last_full_rows_;
  return status;
}

std::vector<RankJob> RankRecomputeEngine::DeadJobs(std::size_t limit) { return jobs_->ListDead(limit); }

void RankRecomputeEngine::ScheduleMaintenance() {
  if (config_.full_interval.count() <= 0) {
    return;
  }
  timer_.expires_after(config_.full_interval);
  auto self = shared_from_this();
  timer_.async_wait([self](const boost::system::error_code& ec) { self->OnMaintenanceTick(ec); });
}

void RankRecomputeEngine::OnMaintenanceTick(const boost::system::error_code& ec) {
  if (ec || !running_) {
    return;
  }
  try {
    EnqueueFull();
    jobs_->PruneCompleted(config_.completed_retention);
  } catch (const std::exception& ex) {
    observability_->Event(LogLevel::kWarn, "rank_maintenance_failed", {{"error", ex.what()}});
  }
  auto purged = cache_->PurgeExpired();
  if (purged > 0) {
    observability_->Event(LogLevel::kDebug, "cache_purged", {{"entries", purged}});
  }
  ScheduleMaintenance();
}

}  // namespace leaderboard

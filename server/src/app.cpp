/*
 * 설명: 서버 구성요소 조립, 기동 점검, 리스닝 스레드와 종료 신호 처리를 구현한다.
 * 버전: v1.2.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/leaderboard_flow_test.cpp, server/tests/unit/config_test.cpp
 */
#include "leaderboard/app.hpp"

#include <algorithm>
#include <charconv>
#include <csignal>
#include <cstdint>
#include <cstdlib>
#include <limits>

#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>

#include "leaderboard/db_client.hpp"
#include "leaderboard/errors.hpp"
#include "leaderboard/http_session.hpp"
#include "leaderboard/leaderboard_repository.hpp"
#include "leaderboard/memory_store.hpp"
#include "leaderboard/rank_job_repository.hpp"

namespace leaderboard {

namespace {
// 초/밀리초 값이 chrono 변환에서 넘치지 않는 상한 (약 31년).
constexpr std::uint64_t kMaxConfigValue = 1'000'000'000;
}  // namespace

class Listener : public std::enable_shared_from_this<Listener> {
 public:
  Listener(boost::asio::io_context& ioc, const boost::asio::ip::tcp::endpoint& endpoint, const AppConfig& config,
           std::shared_ptr<LeaderboardService> service, std::shared_ptr<RealtimeCoordinator> coordinator,
           std::shared_ptr<RateLimiter> api_limiter, std::shared_ptr<Observability> observability,
           std::chrono::steady_clock::time_point started_at)
      : ioc_(ioc), acceptor_(boost::asio::make_strand(ioc)), config_(config), service_(std::move(service)),
        coordinator_(std::move(coordinator)), api_limiter_(std::move(api_limiter)),
        observability_(std::move(observability)), started_at_(started_at) {
    boost::beast::error_code ec;

    acceptor_.open(endpoint.protocol(), ec);
    if (ec) {
      throw boost::beast::system_error{ec};
    }

    acceptor_.set_option(boost::asio::socket_base::reuse_address(true), ec);
    if (ec) {
      throw boost::beast::system_error{ec};
    }

    acceptor_.bind(endpoint, ec);
    if (ec) {
      throw boost::beast::system_error{ec};
    }

    acceptor_.listen(boost::asio::socket_base::max_listen_connections, ec);
    if (ec) {
      throw boost::beast::system_error{ec};
    }
  }

  void Run() { DoAccept(); }

  void Stop() {
    boost::beast::error_code ec;
    acceptor_.close(ec);
  }

 private:
  void DoAccept() {
    acceptor_.async_accept(
        boost::asio::make_strand(ioc_),
        [self = shared_from_this()](boost::beast::error_code ec, boost::asio::ip::tcp::socket socket) {
          if (!ec) {
            std::make_shared<HttpSession>(std::move(socket), self->config_, self->service_, self->coordinator_,
                                          self->api_limiter_, self->observability_, self->started_at_)
                ->Run();
          }
          if (self->acceptor_.is_open()) {
            self->DoAccept();
          }
        });
  }

  boost::asio::io_context& ioc_;
  boost::asio::ip::tcp::acceptor acceptor_;
  AppConfig config_;
  std::shared_ptr<LeaderboardService> service_;
  std::shared_ptr<RealtimeCoordinator> coordinator_;
  std::shared_ptr<RateLimiter> api_limiter_;
  std::shared_ptr<Observability> observability_;
  std::chrono::steady_clock::time_point started_at_;
};

ServerApp::ServerApp(const AppConfig& config)
    : config_(config), ioc_(), work_guard_(boost::asio::make_work_guard(ioc_)), signals_(ioc_, SIGINT, SIGTERM),
      started_at_(std::chrono::steady_clock::now()) {
  observability_ = std::make_shared<Observability>(ParseLogLevel(config.log_level));
  BuildStores();

  CacheTtl ttl;
  ttl.top = std::chrono::seconds(config.leaderboard_cache_ttl_seconds);
  ttl.rank = std::chrono::seconds(config.rank_cache_ttl_seconds);
  cache_ = std::make_shared<LeaderboardCache>(ttl);

  RankEngineConfig engine_config;
  engine_config.worker_count = config.rank_worker_concurrency;
  engine_config.jobs_per_second = config.rank_jobs_per_second;
  engine_config.max_attempts = static_cast<int>(config.rank_job_attempts);
  engine_config.backoff_base = std::chrono::milliseconds(config.rank_job_backoff_ms);
  engine_config.full_interval = std::chrono::seconds(config.full_recalc_interval_seconds);
  engine_config.incremental_threshold = config.full_recalc_incremental_threshold;
  engine_ = std::make_shared<RankRecomputeEngine>(ioc_, store_, job_store_, cache_, observability_, engine_config);

  service_ = std::make_shared<LeaderboardService>(store_, cache_, engine_, observability_,
                                                  config.rank_recalculation_enabled);
  coordinator_ = std::make_shared<RealtimeCoordinator>();
  coordinator_->SetObservability(observability_);
  service_->SetEventSink(coordinator_);

  api_limiter_ = std::make_shared<RateLimiter>(config.rate_limit_max_requests,
                                               std::chrono::seconds(config.rate_limit_window_seconds));
}

ServerApp::~ServerApp() { Stop(); }

void ServerApp::BuildStores() {
  if (config_.store_backend == "memory") {
    store_ = std::make_shared<MemoryLeaderboardStore>();
    job_store_ = std::make_shared<MemoryRankJobStore>();
    return;
  }
  if (config_.store_backend != "mariadb") {
    throw FatalConfigurationError("알 수 없는 STORE_BACKEND: " + config_.store_backend);
  }
  DbConfig db_config{config_.db_host, config_.db_port, config_.db_user, config_.db_password, config_.db_name};
  db_config.transaction_timeout = std::chrono::seconds(config_.db_tx_timeout_seconds);
  auto db_client = std::make_shared<MariaDbClient>(db_config);
  store_ = std::make_shared<MariaDbLeaderboardRepository>(db_client);
  job_store_ = std::make_shared<MariaDbRankJobRepository>(db_client);
}

void ServerApp::Run() {
  try {
    store_->Ping();
  } catch (const std::exception& ex) {
    observability_->Event(LogLevel::kError, "store_unreachable",
                          {{"backend", config_.store_backend}, {"error", ex.what()}});
    throw FatalConfigurationError(std::string("저장소에 연결할 수 없습니다: ") + ex.what());
  }

  running_ = true;
  boost::asio::ip::tcp::endpoint endpoint{boost::asio::ip::tcp::v4(), config_.port};
  listener_ = std::make_shared<Listener>(ioc_, endpoint, config_, service_, coordinator_, api_limiter_,
                                         observability_, started_at_);
  listener_->Run();
  engine_->Start();
  WaitForSignal();
  observability_->Event(LogLevel::kInfo, "server_started",
                        {{"port", config_.port}, {"storeBackend", config_.store_backend}});
  RunWorkers();
  RunIoLoop();
}

void ServerApp::RunWorkers() {
  const unsigned int thread_count = std::max(1u, std::thread::hardware_concurrency());
  // 현재 스레드도 run()을 호출하므로 워커는 thread_count - 1개만 생성한다.
  for (unsigned int i = 0; i + 1 < thread_count; ++i) {
    workers_.emplace_back([this]() { RunIoLoop(); });
  }
}

// 핸들러에서 빠져나온 예외는 기록하고 같은 스레드에서 루프를 다시 돈다. stop() 이후에만 반환한다.
void ServerApp::RunIoLoop() {
  for (;;) {
    try {
      ioc_.run();
      return;
    } catch (const std::exception& ex) {
      observability_->Event(LogLevel::kError, "io_handler_failed", {{"error", ex.what()}});
    }
  }
}

void ServerApp::WaitForSignal() {
  signals_.async_wait([this](const boost::system::error_code& ec, int signal_number) {
    if (ec) {
      return;
    }
    observability_->Event(LogLevel::kInfo, "shutdown_signal", {{"signal", signal_number}});
    Shutdown();
  });
}

// 재계산 워커를 먼저 멈춘 뒤 I/O 루프를 정지한다. I/O 스레드 안에서도 호출할 수 있다.
void ServerApp::Shutdown() {
  if (listener_) {
    listener_->Stop();
  }
  engine_->Stop();
  work_guard_.reset();
  ioc_.stop();
}

void ServerApp::Stop() {
  if (!running_.exchange(false)) {
    return;
  }
  boost::system::error_code ec;
  signals_.cancel(ec);
  Shutdown();
  for (auto& worker : workers_) {
    if (worker.joinable()) {
      worker.join();
    }
  }
  workers_.clear();
  observability_->Event(LogLevel::kInfo, "server_stopped");
}

AppConfig LoadConfigFromEnv() {
  auto get_env = [](const char* key, const char* def) -> std::string {
    const char* val = std::getenv(key);
    return val ? std::string{val} : std::string{def};
  };
  // 부호 없는 10진수 전체가 [min, max] 안에 있어야 한다.
  auto get_number = [&](const char* key, const char* def, std::uint64_t min,
                        std::uint64_t max) -> std::uint64_t {
    auto text = get_env(key, def);
    std::uint64_t value = 0;
    const char* first = text.data();
    const char* last = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(first, last, value);
    if (text.empty() || ec != std::errc() || ptr != last || value < min || value > max) {
      throw FatalConfigurationError(std::string(key) + " 값이 올바르지 않습니다: " + text + " (허용 범위 " +
                                    std::to_string(min) + "~" + std::to_string(max) + ")");
    }
    return value;
  };
  auto get_size = [&](const char* key, const char* def) -> std::size_t {
    return static_cast<std::size_t>(get_number(key, def, 0, kMaxConfigValue));
  };
  auto get_port = [&](const char* key, const char* def) -> unsigned short {
    return static_cast<unsigned short>(get_number(key, def, 1, std::numeric_limits<unsigned short>::max()));
  };
  auto get_bool = [&](const char* key, const char* def) -> bool {
    auto text = get_env(key, def);
    return !(text == "false" || text == "0" || text == "no" || text == "off");
  };

  AppConfig cfg;
  cfg.port = get_port("SERVER_PORT", "8000");
  cfg.store_backend = get_env("STORE_BACKEND", "mariadb");
  cfg.db_host = get_env("DB_HOST", "mariadb");
  cfg.db_port = get_port("DB_PORT", "3306");
  cfg.db_user = get_env("DB_USER", "app");
  cfg.db_password = get_env("DB_PASSWORD", "app_pass");
  cfg.db_name = get_env("DB_NAME", "leaderboard_db");
  cfg.db_tx_timeout_seconds = get_number("DB_TX_TIMEOUT_SECONDS", "30", 1, kMaxConfigValue);
  cfg.log_level = get_env("LOG_LEVEL", "info");
  cfg.leaderboard_cache_ttl_seconds = get_size("LEADERBOARD_CACHE_TTL", "60");
  cfg.rank_cache_ttl_seconds = get_size("RANK_CACHE_TTL", "30");
  cfg.rank_recalculation_enabled = get_bool("RANK_RECALCULATION_ENABLED", "true");
  cfg.rank_worker_concurrency = get_number("RANK_WORKER_CONCURRENCY", "2", 1, 64);
  cfg.rank_jobs_per_second = get_number("RANK_JOBS_PER_SECOND", "5", 1, kMaxConfigValue);
  cfg.rank_job_attempts = get_number("RANK_JOB_ATTEMPTS", "3", 1, 100);
  cfg.rank_job_backoff_ms = get_size("RANK_JOB_BACKOFF_MS", "2000");
  cfg.full_recalc_interval_seconds = get_size("FULL_RECALC_INTERVAL_SECONDS", "300");
  cfg.full_recalc_incremental_threshold = get_size("FULL_RECALC_INCREMENTAL_THRESHOLD", "100");
  cfg.rate_limit_window_seconds = get_number("RATE_LIMIT_WINDOW_SECONDS", "60", 1, kMaxConfigValue);
  cfg.rate_limit_max_requests = get_number("RATE_LIMIT_MAX_REQUESTS", "100", 1, kMaxConfigValue);
  cfg.ws_queue_limit_messages = get_number("WS_QUEUE_LIMIT_MESSAGES", "32", 1, kMaxConfigValue);
  cfg.ws_queue_limit_bytes = get_number("WS_QUEUE_LIMIT_BYTES", "262144", 1, kMaxConfigValue);
  return cfg;
}

}  // namespace leaderboard

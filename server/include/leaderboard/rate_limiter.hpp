/*
 * 설명: 키별 고정 윈도 레이트리미터. API 요청 제한과 재계산 작업 처리량 상한에 쓴다.
 * 버전: v1.2.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/rate_limiter_test.cpp
 */
#pragma once

#include <chrono>
#include <cstddef>
#include <mutex>
#include <string>
#include <unordered_map>

namespace leaderboard {

// 윈도는 steady_clock 기준으로 잰다.
class RateLimiter {
 public:
  using Clock = std::chrono::steady_clock;

  RateLimiter(std::size_t max_attempts, std::chrono::milliseconds window);

  bool Allow(const std::string& key, Clock::time_point now);
  // 현재 윈도가 끝날 때까지 남은 시간. 허용 여유가 있으면 0.
  std::chrono::milliseconds RetryAfter(const std::string& key, Clock::time_point now);

 private:
  struct Bucket {
    std::size_t count{0};
    bool started{false};
    Clock::time_point window_start{};
  };
  std::unordered_map<std::string, Bucket> buckets_;
  std::size_t max_attempts_;
  std::chrono::milliseconds window_;
  std::mutex mutex_;
};

}  // namespace leaderboard

/*
 * 설명: 고정 윈도 레이트리미터를 구현한다.
 * 버전: v1.2.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/rate_limiter_test.cpp
 */
#include "leaderboard/rate_limiter.hpp"

namespace leaderboard {

RateLimiter::RateLimiter(std::size_t max_attempts, std::chrono::milliseconds window)
    : max_attempts_(max_attempts), window_(window) {}

bool RateLimiter::Allow(const std::string& key, Clock::time_point now) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto& bucket = buckets_[key];
  // 윈도 시작이 now보다 뒤에 있으면 새 윈도로 본다.
  if (!bucket.started || now < bucket.window_start || now - bucket.window_start >= window_) {
    bucket.started = true;
    bucket.window_start = now;
    bucket.count = 0;
  }
  if (bucket.count >= max_attempts_) {
    return false;
  }
  ++bucket.count;
  return true;
}

std::chrono::milliseconds RateLimiter::RetryAfter(const std::string& key, Clock::time_point now) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = buckets_.find(key);
  if (it == buckets_.end() || it->second.count < max_attempts_ || now < it->second.window_start) {
    return std::chrono::milliseconds(0);
  }
  auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(now - it->second.window_start);
  if (elapsed >= window_) {
    return std::chrono::milliseconds(0);
  }
  return window_ - elapsed;
}

}  // namespace leaderboard

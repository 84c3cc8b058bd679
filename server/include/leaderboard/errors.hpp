/*
 * 설명: 리더보드 엔진이 호출자에게 전달하는 오류 분류를 정의한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/leaderboard_service_test.cpp, server/tests/e2e/leaderboard_flow_test.cpp
 */
#pragma once

#include <stdexcept>
#include <string>
#include <utility>

namespace leaderboard {

class LeaderboardError : public std::runtime_error {
 public:
  LeaderboardError(std::string code, const std::string& message)
      : std::runtime_error(message), code_(std::move(code)) {}

  const std::string& Code() const { return code_; }

 private:
  std::string code_;
};

// 잘못된 입력. 재시도하지 않는다.
class ValidationError : public LeaderboardError {
 public:
  explicit ValidationError(const std::string& message) : LeaderboardError("validation_failed", message) {}
};

class NotFoundError : public LeaderboardError {
 public:
  explicit NotFoundError(const std::string& message) : LeaderboardError("not_found", message) {}
};

// 저장소/캐시 일시 장애 또는 타임아웃. 호출자나 백그라운드 재시도 정책이 처리한다.
class TransientStoreError : public LeaderboardError {
 public:
  explicit TransientStoreError(const std::string& message) : LeaderboardError("store_unavailable", message) {}
};

// 기동 시 저장소 연결 불가. 프로세스를 종료한다.
class FatalConfigurationError : public LeaderboardError {
 public:
  explicit FatalConfigurationError(const std::string& message) : LeaderboardError("fatal_configuration", message) {}
};

}  // namespace leaderboard

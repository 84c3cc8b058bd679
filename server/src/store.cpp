/*
 * 설명: 랭크 작업 범위/상태의 문자열 표현과 오류 메시지 절단을 처리한다.
 * 버전: v1.0.0
 * 관련 문서: server/sql/schema.sql
 */
#include "leaderboard/store.hpp"

#include <stdexcept>

namespace leaderboard {

const char* ToString(RankJobScope scope) {
  switch (scope) {
    case RankJobScope::kIncremental:
      return "incremental";
    case RankJobScope::kFull:
      return "full";
  }
  return "incremental";
}

const char* ToString(RankJobStatus status) {
  switch (status) {
    case RankJobStatus::kPending:
      return "pending";
    case RankJobStatus::kRunning:
      return "running";
    case RankJobStatus::kCompleted:
      return "completed";
    case RankJobStatus::kDead:
      return "dead";
  }
  return "pending";
}

RankJobScope ParseRankJobScope(const std::string& text) {
  if (text == "full") {
    return RankJobScope::kFull;
  }
  if (text == "incremental") {
    return RankJobScope::kIncremental;
  }
  throw std::invalid_argument("알 수 없는 작업 범위: " + text);
}

RankJobStatus ParseRankJobStatus(const std::string& text) {
  if (text == "pending") {
    return RankJobStatus::kPending;
  }
  if (text == "running") {
    return RankJobStatus::kRunning;
  }
  if (text == "completed") {
    return RankJobStatus::kCompleted;
  }
  if (text == "dead") {
    return RankJobStatus::kDead;
  }
  throw std::invalid_argument("알 수 없는 작업 상태: " + text);
}

std::string TruncateUtf8(const std::string& value, std::size_t max_bytes) {
  if (value.size() <= max_bytes) {
    return value;
  }
  std::size_t cut = max_bytes;
  // 잘리는 첫 바이트가 연속 바이트(10xxxxxx)면 그 문자의 선두 바이트 앞까지 물러난다.
  while (cut > 0 && (static_cast<unsigned char>(value[cut]) & 0xC0) == 0x80) {
    --cut;
  }
  return value.substr(0, cut);
}

}  // namespace leaderboard

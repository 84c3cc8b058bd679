/*
 * 설명: REST/WS 응답 엔벨로프와 리더보드 스냅샷 직렬화를 담당한다.
 * 버전: v1.1.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/json_envelope_test.cpp
 */
#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "leaderboard/store.hpp"

namespace leaderboard {

// 잘못된 UTF-8 바이트는 U+FFFD로 바꿔 직렬화한다.
std::string DumpJson(const nlohmann::json& j);

nlohmann::json MakeSuccessEnvelope(const nlohmann::json& data);
nlohmann::json MakeErrorEnvelope(std::string_view code, std::string_view message);

struct WsEnvelope {
  std::string type;
  std::string event;
  std::uint64_t seq;
  nlohmann::json payload;
};

nlohmann::json ToWsJson(const WsEnvelope& env);

std::string ToIsoString(std::chrono::system_clock::time_point tp);

nlohmann::json ToJson(const RankedEntry& entry);
nlohmann::json ToJson(const std::vector<RankedEntry>& entries);
nlohmann::json ToJson(const PlayerRank& rank);
nlohmann::json ToJson(const LeaderboardStats& stats);

std::vector<RankedEntry> RankedEntriesFromJson(const nlohmann::json& j);
PlayerRank PlayerRankFromJson(const nlohmann::json& j);

}  // namespace leaderboard

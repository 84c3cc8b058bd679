/*
 * 설명: JSON 응답 엔벨로프를 생성하고 리더보드 스냅샷을 직렬화/역직렬화한다.
 * 버전: v1.1.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/json_envelope_test.cpp
 */
#include "leaderboard/api_response.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>

namespace leaderboard {

std::string ToIsoString(std::chrono::system_clock::time_point tp) {
  auto tt = std::chrono::system_clock::to_time_t(tp);
  std::tm tm = *std::gmtime(&tt);
  std::ostringstream oss;
  oss << std::put_time(&tm, "%FT%TZ");
  return oss.str();
}

std::string DumpJson(const nlohmann::json& j) {
  return j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

nlohmann::json MakeSuccessEnvelope(const nlohmann::json& data) {
  nlohmann::json envelope;
  envelope["success"] = true;
  envelope["data"] = data;
  envelope["error"] = nullptr;
  envelope["meta"] = {{"timestamp", ToIsoString(std::chrono::system_clock::now())}};
  return envelope;
}

nlohmann::json MakeErrorEnvelope(std::string_view code, std::string_view message) {
  nlohmann::json envelope;
  envelope["success"] = false;
  envelope["data"] = nullptr;
  envelope["error"] = {{"code", code}, {"message", message}, {"detail", nullptr}};
  envelope["meta"] = {{"timestamp", ToIsoString(std::chrono::system_clock::now())}};
  return envelope;
}

nlohmann::json ToWsJson(const WsEnvelope& env) {
  nlohmann::json j;
  j["t"] = env.type;
  j["seq"] = env.seq;
  if (env.type == "event") {
    j["event"] = env.event;
  } else {
    j["event"] = nullptr;
  }
  j["p"] = env.payload;
  return j;
}

nlohmann::json ToJson(const RankedEntry& entry) {
  return {{"userId", entry.player_id},
          {"username", entry.display_name},
          {"totalScore", entry.total_score},
          {"rank", entry.rank}};
}

nlohmann::json ToJson(const std::vector<RankedEntry>& entries) {
  nlohmann::json arr = nlohmann::json::array();
  for (const auto& entry : entries) {
    arr.push_back(ToJson(entry));
  }
  return arr;
}

nlohmann::json ToJson(const PlayerRank& rank) {
  return {{"userId", rank.player_id},
          {"username", rank.display_name},
          {"totalScore", rank.total_score},
          {"rank", rank.rank},
          {"totalPlayers", rank.total_players}};
}

nlohmann::json ToJson(const LeaderboardStats& stats) {
  return {{"totalPlayers", stats.total_players},
          {"totalSessions", stats.total_sessions},
          {"averageScore", stats.average_score}};
}

std::vector<RankedEntry> RankedEntriesFromJson(const nlohmann::json& j) {
  std::vector<RankedEntry> entries;
  entries.reserve(j.size());
  for (const auto& item : j) {
    entries.push_back(RankedEntry{item.at("userId").get<int>(), item.at("username").get<std::string>(),
                                  item.at("totalScore").get<std::int64_t>(), item.at("rank").get<int>()});
  }
  return entries;
}

PlayerRank PlayerRankFromJson(const nlohmann::json& j) {
  return PlayerRank{j.at("userId").get<int>(), j.at("username").get<std::string>(),
                    j.at("totalScore").get<std::int64_t>(), j.at("rank").get<int>(),
                    j.at("totalPlayers").get<std::size_t>()};
}

}  // namespace leaderboard

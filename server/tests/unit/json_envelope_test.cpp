#include <chrono>
#include <string>

#include <gtest/gtest.h>

#include "leaderboard/api_response.hpp"

TEST(JsonEnvelopeTest, SuccessShape) {
  nlohmann::json payload{{"status", "ok"}};
  auto env = leaderboard::MakeSuccessEnvelope(payload);
  EXPECT_TRUE(env["success"].get<bool>());
  EXPECT_EQ(env["data"], payload);
  EXPECT_TRUE(env["error"].is_null());
  EXPECT_TRUE(env.contains("meta"));
  EXPECT_TRUE(env["meta"].contains("timestamp"));
}

TEST(JsonEnvelopeTest, ErrorShape) {
  auto env = leaderboard::MakeErrorEnvelope("validation_failed", "에러");
  EXPECT_FALSE(env["success"].get<bool>());
  EXPECT_TRUE(env["data"].is_null());
  EXPECT_EQ(env["error"]["code"], "validation_failed");
  EXPECT_EQ(env["error"]["message"], "에러");
  EXPECT_TRUE(env["error"].contains("detail"));
}

TEST(JsonEnvelopeTest, WsEventShape) {
  auto j = leaderboard::ToWsJson({"event", "leaderboard:updated", 3, {{"userId", 1}}});
  EXPECT_EQ(j["t"], "event");
  EXPECT_EQ(j["event"], "leaderboard:updated");
  EXPECT_EQ(j["seq"], 3);
  EXPECT_EQ(j["p"]["userId"], 1);

  auto ack = leaderboard::ToWsJson({"ack", "", 4, nlohmann::json::object()});
  EXPECT_TRUE(ack["event"].is_null());
}

TEST(JsonEnvelopeTest, RankedEntryUsesApiFieldNames) {
  auto j = leaderboard::ToJson(leaderboard::RankedEntry{5, "user_5", 1200, 2});
  EXPECT_EQ(j["userId"], 5);
  EXPECT_EQ(j["username"], "user_5");
  EXPECT_EQ(j["totalScore"], 1200);
  EXPECT_EQ(j["rank"], 2);
}

TEST(JsonEnvelopeTest, PlayerRankIncludesTotalPlayers) {
  auto j = leaderboard::ToJson(leaderboard::PlayerRank{5, "user_5", 1200, 2, 9});
  EXPECT_EQ(j["totalPlayers"], 9);
  auto parsed = leaderboard::PlayerRankFromJson(j);
  EXPECT_EQ(parsed.total_players, 9u);
  EXPECT_EQ(parsed.display_name, "user_5");
}

TEST(JsonEnvelopeTest, IsoTimestampIsUtc) {
  std::chrono::system_clock::time_point epoch{};
  EXPECT_EQ(leaderboard::ToIsoString(epoch), "1970-01-01T00:00:00Z");
}

TEST(JsonEnvelopeTest, DumpReplacesInvalidUtf8) {
  auto env = leaderboard::MakeErrorEnvelope("not_found", std::string("경로 \xff"));
  std::string text;
  ASSERT_NO_THROW(text = leaderboard::DumpJson(env));
  auto parsed = nlohmann::json::parse(text);
  EXPECT_EQ(parsed["error"]["message"], "경로 \xEF\xBF\xBD");
}

#include <chrono>
#include <regex>
#include <string>

#include <gtest/gtest.h>

#include "wallet/api_response.hpp"

TEST(JsonEnvelopeTest, HealthShape) {
  auto body = wallet::MakeHealthBody("wallet-service", "1.2.3");
  EXPECT_EQ(body["status"], "healthy");
  EXPECT_EQ(body["service"], "wallet-service");
  EXPECT_EQ(body["version"], "1.2.3");
  ASSERT_TRUE(body["timestamp"].is_string());
}

TEST(JsonEnvelopeTest, NotFoundShape) {
  auto body = wallet::MakeNotFoundBody("/unknown/path?x=1");
  EXPECT_EQ(body["error"], "Not Found");
  EXPECT_EQ(body["message"], "Route /unknown/path?x=1 not found");
  EXPECT_EQ(body["code"], "ROUTE_NOT_FOUND");
}

TEST(JsonEnvelopeTest, ErrorShape) {
  auto body = wallet::MakeErrorBody("boom", "INTERNAL_ERROR");
  EXPECT_EQ(body["error"], "boom");
  EXPECT_EQ(body["code"], "INTERNAL_ERROR");
  EXPECT_EQ(body.size(), 2u);
}

TEST(JsonEnvelopeTest, IsoTimestampHasMillisecondsAndUtcSuffix) {
  using namespace std::chrono;
  system_clock::time_point tp{seconds(1700000000) + milliseconds(7)};
  EXPECT_EQ(wallet::ToIsoString(tp), "2023-11-14T22:13:20.007Z");

  std::regex iso(R"(^\d{4}-\d{2}-\d{2}T\d{2}:\d{2}:\d{2}\.\d{3}Z$)");
  EXPECT_TRUE(std::regex_match(wallet::CurrentTimestamp(), iso));
}

TEST(JsonEnvelopeTest, WriteJsonSetsContentTypeAndLength) {
  wallet::HttpResponse res;
  wallet::WriteJson(res, boost::beast::http::status::created, nlohmann::json{{"ok", true}});
  EXPECT_EQ(res.result(), boost::beast::http::status::created);
  EXPECT_EQ(std::string(res[boost::beast::http::field::content_type]), "application/json; charset=utf-8");
  EXPECT_EQ(nlohmann::json::parse(res.body())["ok"], true);
  EXPECT_EQ(std::string(res[boost::beast::http::field::content_length]), std::to_string(res.body().size()));
}

TEST(JsonEnvelopeTest, NotFoundBodyWithRawBytesStillSerializes) {
  wallet::HttpResponse res;
  EXPECT_NO_THROW(
      wallet::WriteJson(res, boost::beast::http::status::not_found, wallet::MakeNotFoundBody("/\xff\xfe")));
  auto body = nlohmann::json::parse(res.body());
  EXPECT_EQ(body["code"], "ROUTE_NOT_FOUND");
  EXPECT_NE(body["message"].get<std::string>().find("\xEF\xBF\xBD"), std::string::npos);
}

#include <fnexec/engine/response.hpp>

#include <json/json.h>

#include <gtest/gtest.h>

using namespace fnexec::engine;

namespace {

  Json::Value parse(const std::string& text)
  {
    auto value = json::parse(text);
    EXPECT_TRUE(value.has_value()) << text;
    return value.value_or(Json::Value{});
  }

} // namespace

TEST(Normalize, PlainResponse)
{
  auto response = normalize(parse(R"({"statusCode": 201, "headers": {"x-a": "b"}, "body": "ok"})"));

  EXPECT_EQ(response.status_code, 201);
  ASSERT_EQ(response.headers.size(), 1);
  EXPECT_EQ(response.headers["x-a"], "b");
  EXPECT_EQ(response.body, "ok");
}

TEST(Normalize, BodyIsSerialized)
{
  auto response = normalize(parse(R"({"statusCode": 200, "body": {"result": 15}})"));

  EXPECT_EQ(response.status_code, 200);
  EXPECT_TRUE(response.headers.empty());
  EXPECT_EQ(response.body, R"({"result":15})");

  EXPECT_EQ(normalize(parse(R"({"body": [1, true, null]})")).body, "[1,true,null]");
  EXPECT_EQ(normalize(parse(R"({"body": 2.5})")).body, "2.5");
  EXPECT_EQ(normalize(parse(R"({"body": "ünïcode"})")).body, "ünïcode");
}

TEST(Normalize, MissingFields)
{
  auto response = normalize(Json::Value{Json::objectValue});

  EXPECT_EQ(response.status_code, 200);
  EXPECT_TRUE(response.headers.empty());
  EXPECT_EQ(response.body, "null");
}

TEST(Normalize, NonObjectValues)
{
  for (const auto& text : {"null", "[1,2]", "\"text\"", "42", "true"}) {
    auto response = normalize(parse(text));
    EXPECT_EQ(response.status_code, 200) << text;
    EXPECT_TRUE(response.headers.empty()) << text;
    EXPECT_EQ(response.body, "null") << text;
  }
}

TEST(Normalize, StatusCodeCoercion)
{
  EXPECT_EQ(normalize(parse(R"({"statusCode": "404"})")).status_code, 404);
  EXPECT_EQ(normalize(parse(R"({"statusCode": " 302 "})")).status_code, 302);
  EXPECT_EQ(normalize(parse(R"({"statusCode": 418.9})")).status_code, 418);
  EXPECT_EQ(normalize(parse(R"({"statusCode": 0})")).status_code, 0);

  EXPECT_EQ(normalize(parse(R"({"statusCode": "abc"})")).status_code, 200);
  EXPECT_EQ(normalize(parse(R"({"statusCode": "12abc"})")).status_code, 200);
  EXPECT_EQ(normalize(parse(R"({"statusCode": ""})")).status_code, 200);
  EXPECT_EQ(normalize(parse(R"({"statusCode": -1})")).status_code, 200);
  EXPECT_EQ(normalize(parse(R"({"statusCode": 1e300})")).status_code, 200);
  EXPECT_EQ(normalize(parse(R"({"statusCode": 99999999999})")).status_code, 200);
  EXPECT_EQ(normalize(parse(R"({"statusCode": null})")).status_code, 200);
  EXPECT_EQ(normalize(parse(R"({"statusCode": true})")).status_code, 200);
  EXPECT_EQ(normalize(parse(R"({"statusCode": {"code": 1}})")).status_code, 200);
  EXPECT_EQ(normalize(parse(R"({"statusCode": [500]})")).status_code, 200);
}

TEST(Normalize, HeadersMustBeObject)
{
  EXPECT_TRUE(normalize(parse(R"({"headers": ["a", "b"]})")).headers.empty());
  EXPECT_TRUE(normalize(parse(R"({"headers": "x-a: b"})")).headers.empty());
  EXPECT_TRUE(normalize(parse(R"({"headers": 5})")).headers.empty());

  auto response =
      normalize(parse(R"({"headers": {"n": 5, "b": true, "z": null, "o": {"k": [1]}}})"));
  ASSERT_EQ(response.headers.size(), 4);
  EXPECT_EQ(response.headers["n"], "5");
  EXPECT_EQ(response.headers["b"], "true");
  EXPECT_EQ(response.headers["z"], "");
  EXPECT_EQ(response.headers["o"], R"({"k":[1]})");
}

TEST(Normalize, ToJson)
{
  CanonicalResponse response;
  response.status_code = 400;
  response.headers["content-type"] = "text/plain";
  response.body = "bad";

  auto json = response.to_json();
  EXPECT_EQ(json["statusCode"].asInt(), 400);
  EXPECT_EQ(json["headers"]["content-type"].asString(), "text/plain");
  EXPECT_EQ(json["body"].asString(), "bad");

  // Already canonical values pass through unchanged.
  EXPECT_EQ(normalize(json), response);
}

TEST(Normalize, ErrorResponse)
{
  auto response = error_response("Execution timed out after 200 ms");

  EXPECT_EQ(response.status_code, 500);
  EXPECT_EQ(response.headers["content-type"], "application/json");

  auto body = parse(response.body);
  EXPECT_EQ(body["error"].asString(), "Execution timed out after 200 ms");
}

TEST(Json, ParseRejectsTrailingData)
{
  std::string error;
  EXPECT_FALSE(json::parse("{} {}", &error).has_value());
  EXPECT_FALSE(error.empty());
  EXPECT_FALSE(json::parse("", &error).has_value());
  EXPECT_FALSE(json::parse("{\"a\":", &error).has_value());
  EXPECT_TRUE(json::parse(" {\"a\": 1}\n").has_value());
}

#include <fnexec/common/exceptions.hpp>
#include <fnexec/engine/config.hpp>
#include <fnexec/engine/engine.hpp>
#include <fnexec/engine/invocation.hpp>
#include <fnexec/engine/response.hpp>

#include <filesystem>

#include <unistd.h>

#include <fmt/format.h>
#include <json/json.h>

#include <gtest/gtest.h>

using namespace fnexec::engine;

namespace {

  Json::Value parse(const std::string& text)
  {
    return json::parse(text).value_or(Json::Value{});
  }

  std::string error_of(const std::variant<InvocationRequest, ValidationError>& parsed)
  {
    auto* error = std::get_if<ValidationError>(&parsed);
    return error != nullptr ? error->message : "";
  }

} // namespace

TEST(ParseRequest, Complete)
{
  auto parsed = parse_request(parse(R"(
    {
      "runtime": "python",
      "code": "def main(e): return e",
      "event": {"key1": 10, "key2": 5},
      "handler": "main",
      "timeoutMs": 200
    }
  )"));
  ASSERT_TRUE(std::holds_alternative<InvocationRequest>(parsed));

  auto& request = std::get<InvocationRequest>(parsed);
  EXPECT_EQ(request.runtime, "python");
  EXPECT_EQ(request.code, "def main(e): return e");
  EXPECT_EQ(request.event["key1"].asInt(), 10);
  EXPECT_EQ(request.handler_name, "main");
  ASSERT_TRUE(request.timeout.has_value());
  EXPECT_EQ(request.timeout.value(), std::chrono::milliseconds{200});
}

TEST(ParseRequest, Defaults)
{
  auto parsed = parse_request(parse(R"({"runtime": "javascript", "code": "x"})"));
  ASSERT_TRUE(std::holds_alternative<InvocationRequest>(parsed));

  auto& request = std::get<InvocationRequest>(parsed);
  EXPECT_TRUE(request.event.isObject());
  EXPECT_TRUE(request.event.empty());
  EXPECT_EQ(request.handler_name, "handler");
  EXPECT_FALSE(request.timeout.has_value());

  // Explicit null is the same as a missing event.
  parsed = parse_request(parse(R"({"runtime": "javascript", "code": "x", "event": null})"));
  ASSERT_TRUE(std::holds_alternative<InvocationRequest>(parsed));
  EXPECT_TRUE(std::get<InvocationRequest>(parsed).event.isObject());

  // Any JSON value is a valid event.
  parsed = parse_request(parse(R"({"runtime": "javascript", "code": "x", "event": [1, 2]})"));
  ASSERT_TRUE(std::holds_alternative<InvocationRequest>(parsed));
  EXPECT_TRUE(std::get<InvocationRequest>(parsed).event.isArray());
}

TEST(ParseRequest, ShapeErrors)
{
  EXPECT_EQ(error_of(parse_request(parse("[]"))), "Request body must be a JSON object");
  EXPECT_EQ(error_of(parse_request(parse(R"({"code": "x"})"))), "Missing field 'runtime'");
  EXPECT_EQ(error_of(parse_request(parse(R"({"runtime": "python"})"))), "Missing field 'code'");
  EXPECT_EQ(
      error_of(parse_request(parse(R"({"runtime": 5, "code": "x"})"))),
      "Field 'runtime' must be a string"
  );
  EXPECT_EQ(
      error_of(parse_request(parse(R"({"runtime": "python", "code": ["x"]})"))),
      "Field 'code' must be a string"
  );
  EXPECT_EQ(
      error_of(parse_request(parse(R"({"runtime": "python", "code": "x", "handler": 1})"))),
      "Field 'handler' must be a string"
  );

  for (const auto& timeout : {"0", "-5", "1.5", "\"100\"", "true"}) {
    auto text = fmt::format(R"({{"runtime": "python", "code": "x", "timeoutMs": {}}})", timeout);
    EXPECT_EQ(error_of(parse_request(parse(text))), "Field 'timeoutMs' must be a positive integer")
        << timeout;
  }
}

TEST(WireFormat, ExecutionResult)
{
  ExecutionResult result;
  result.logs = {"one", "two"};
  result.response.status_code = 201;
  result.response.body = "created";
  result.exit_code = 0;
  result.duration = std::chrono::milliseconds{42};

  auto json = to_json(result);
  EXPECT_TRUE(json["ok"].asBool());
  EXPECT_EQ(json["response"]["statusCode"].asInt(), 201);
  EXPECT_EQ(json["response"]["body"].asString(), "created");
  EXPECT_TRUE(json["response"]["headers"].isObject());
  ASSERT_EQ(json["logs"].size(), 2);
  EXPECT_EQ(json["logs"][0].asString(), "one");
  EXPECT_EQ(json["logs"][1].asString(), "two");
  EXPECT_EQ(json["exitCode"].asInt(), 0);
  EXPECT_EQ(json["durationMs"].asInt64(), 42);
  EXPECT_FALSE(json["timedOut"].asBool());
  EXPECT_FALSE(json["resultFallback"].asBool());
  EXPECT_FALSE(json.isMember("error"));

  result.error = "Execution timed out after 200 ms";
  result.timed_out = true;
  json = to_json(result);
  EXPECT_FALSE(json["ok"].asBool());
  EXPECT_TRUE(json["timedOut"].asBool());
  EXPECT_EQ(json["error"].asString(), "Execution timed out after 200 ms");
}

TEST(WireFormat, ValidationError)
{
  InvocationOutcome outcome = ValidationError{"Unsupported runtime 'ruby'"};
  auto json = to_json(outcome);

  EXPECT_FALSE(json["ok"].asBool());
  EXPECT_EQ(json["error"].asString(), "Unsupported runtime 'ruby'");
  EXPECT_FALSE(json.isMember("response"));
}

class EngineValidationTest : public ::testing::Test {
protected:
  void SetUp() override
  {
    root = std::filesystem::temp_directory_path() /
           ("fnexec-engine-test-" + std::to_string(getpid()));
    std::filesystem::create_directories(root);

    cfg.workspace_root = root.string();
    cfg.default_timeout_ms = 1000;
    cfg.max_timeout_ms = 2000;
    // No interpreter can be found, nothing gets spawned.
    cfg.interpreters.javascript = "/nonexistent/node";
    cfg.interpreters.typescript = "/nonexistent/bun";
    cfg.interpreters.python = "/nonexistent/python3";
  }

  void TearDown() override
  {
    std::error_code ec;
    std::filesystem::remove_all(root, ec);
  }

  bool root_empty() const
  {
    return std::filesystem::directory_iterator{root} == std::filesystem::directory_iterator{};
  }

  static InvocationRequest request(std::string runtime, std::string code)
  {
    InvocationRequest req;
    req.runtime = std::move(runtime);
    req.code = std::move(code);
    return req;
  }

  std::filesystem::path root;
  config::Engine cfg;
};

TEST_F(EngineValidationTest, RejectsBeforeProvisioning)
{
  Engine engine{cfg};

  auto outcome = engine.invoke(request("ruby", "puts 1"));
  ASSERT_TRUE(std::holds_alternative<ValidationError>(outcome));
  EXPECT_NE(std::get<ValidationError>(outcome).message.find("Unsupported runtime 'ruby'"), std::string::npos);

  outcome = engine.invoke(request("python", " \n\t "));
  ASSERT_TRUE(std::holds_alternative<ValidationError>(outcome));
  EXPECT_EQ(std::get<ValidationError>(outcome).message, "Field 'code' must not be empty");

  outcome = engine.invoke(request("python", ""));
  ASSERT_TRUE(std::holds_alternative<ValidationError>(outcome));

  auto req = request("python", "x = 1");
  req.handler_name = "$handler";
  outcome = engine.invoke(req);
  ASSERT_TRUE(std::holds_alternative<ValidationError>(outcome));
  EXPECT_EQ(std::get<ValidationError>(outcome).message, "Invalid handler name '$handler'");

  req = request("javascript", "x");
  req.timeout = std::chrono::milliseconds{0};
  ASSERT_TRUE(engine.validate(req).has_value());

  EXPECT_TRUE(root_empty());
}

TEST_F(EngineValidationTest, Timeouts)
{
  Engine engine{cfg};

  auto req = request("javascript", "x");
  EXPECT_EQ(engine.effective_timeout(req), std::chrono::milliseconds{1000});

  req.timeout = std::chrono::milliseconds{200};
  EXPECT_EQ(engine.effective_timeout(req), std::chrono::milliseconds{200});

  req.timeout = std::chrono::milliseconds{100000};
  EXPECT_EQ(engine.effective_timeout(req), std::chrono::milliseconds{2000});
}

TEST_F(EngineValidationTest, MissingInterpreter)
{
  Engine engine{cfg};
  EXPECT_FALSE(engine.interpreter(runtime::Runtime::PYTHON).has_value());
  EXPECT_EQ(engine.isolation().name(), "process");

  auto outcome = engine.invoke(request("py", "def handler(e):\n  return {}\n"));
  ASSERT_TRUE(std::holds_alternative<ExecutionResult>(outcome));

  auto& result = std::get<ExecutionResult>(outcome);
  EXPECT_FALSE(result.ok());
  EXPECT_EQ(result.error.value(), "No interpreter available for runtime python");
  EXPECT_EQ(result.response.status_code, 500);
  EXPECT_EQ(result.response.headers.at("content-type"), "application/json");
  EXPECT_EQ(parse(result.response.body)["error"].asString(), "No interpreter available for runtime python");

  EXPECT_TRUE(root_empty());
}

TEST_F(EngineValidationTest, ProvisioningFailure)
{
  // The interpreter exists, but the workspace root disappears after start-up.
  cfg.interpreters.python = "/bin/sh";
  Engine engine{cfg};
  ASSERT_TRUE(engine.interpreter(runtime::Runtime::PYTHON).has_value());
  std::filesystem::remove_all(root);

  auto outcome = engine.invoke(request("python", "def handler(e):\n  return {}\n"));
  ASSERT_TRUE(std::holds_alternative<ExecutionResult>(outcome));

  auto& result = std::get<ExecutionResult>(outcome);
  EXPECT_FALSE(result.ok());
  EXPECT_EQ(result.response.status_code, 500);
  EXPECT_EQ(result.exit_code, Executor::KILLED_EXIT_CODE);
  EXPECT_NE(result.error.value().find("Could not create workspace under"), std::string::npos);
  EXPECT_EQ(parse(result.response.body)["error"].asString(), result.error.value());
  EXPECT_FALSE(std::filesystem::exists(root));
}

TEST_F(EngineValidationTest, InvalidConfiguration)
{
  cfg.isolation = "microvm";
  EXPECT_THROW(Engine{cfg}, fnexec::common::InvalidConfigurationError);

  cfg.isolation = "process";
  cfg.workspace_root = (root / "missing").string();
  EXPECT_THROW(Engine{cfg}, fnexec::common::InvalidConfigurationError);
}

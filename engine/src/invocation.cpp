#include <fnexec/engine/invocation.hpp>

#include <fnexec/common/util.hpp>

#include <fmt/format.h>

namespace fnexec::engine {

  namespace {

    ValidationError wrong_type(std::string_view field, std::string_view expected)
    {
      return ValidationError{fmt::format("Field '{}' must be {}", field, expected)};
    }

  } // namespace

  std::variant<InvocationRequest, ValidationError> parse_request(const Json::Value& body)
  {
    if (!body.isObject()) {
      return ValidationError{"Request body must be a JSON object"};
    }

    InvocationRequest request;

    const Json::Value& runtime = body["runtime"];
    if (runtime.isNull()) {
      return ValidationError{"Missing field 'runtime'"};
    }
    if (!runtime.isString()) {
      return wrong_type("runtime", "a string");
    }
    request.runtime = runtime.asString();

    const Json::Value& code = body["code"];
    if (code.isNull()) {
      return ValidationError{"Missing field 'code'"};
    }
    if (!code.isString()) {
      return wrong_type("code", "a string");
    }
    request.code = code.asString();

    if (body.isMember("event") && !body["event"].isNull()) {
      request.event = body["event"];
    }

    if (body.isMember("handler") && !body["handler"].isNull()) {
      if (!body["handler"].isString()) {
        return wrong_type("handler", "a string");
      }
      request.handler_name = body["handler"].asString();
    }

    if (body.isMember("timeoutMs") && !body["timeoutMs"].isNull()) {
      const Json::Value& timeout = body["timeoutMs"];
      // isInt64 also holds for reals without a fractional part.
      if (!timeout.isInt64() || timeout.asInt64() <= 0) {
        return wrong_type("timeoutMs", "a positive integer");
      }
      request.timeout = std::chrono::milliseconds{timeout.asInt64()};
    }

    return request;
  }

  Json::Value to_json(const ExecutionResult& result)
  {
    Json::Value json{Json::objectValue};
    json["ok"] = result.ok();
    json["response"] = result.response.to_json();

    Json::Value logs{Json::arrayValue};
    for (const auto& line : result.logs) {
      logs.append(line);
    }
    json["logs"] = std::move(logs);

    json["exitCode"] = result.exit_code;
    json["durationMs"] = static_cast<Json::Int64>(result.duration.count());
    json["timedOut"] = result.timed_out;
    json["resultFallback"] = result.result_fallback;
    if (result.error.has_value()) {
      json["error"] = result.error.value();
    }

    return json;
  }

  Json::Value to_json(const ValidationError& error)
  {
    Json::Value json{Json::objectValue};
    json["ok"] = false;
    json["error"] = error.message;
    return json;
  }

  Json::Value to_json(const InvocationOutcome& outcome)
  {
    return std::visit(
        common::util::overloaded{
            [](const ExecutionResult& result) { return to_json(result); },
            [](const ValidationError& error) { return to_json(error); }},
        outcome
    );
  }

} // namespace fnexec::engine

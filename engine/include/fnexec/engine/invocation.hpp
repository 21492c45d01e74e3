#ifndef FNEXEC_ENGINE_INVOCATION_HPP
#define FNEXEC_ENGINE_INVOCATION_HPP

#include <fnexec/engine/response.hpp>

#include <chrono>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include <json/value.h>

namespace fnexec::engine {

  struct InvocationRequest {

    static constexpr char DEFAULT_HANDLER[] = "handler";

    // As received; validated against the supported runtimes by the engine.
    std::string runtime;
    std::string code;
    Json::Value event{Json::objectValue};
    std::string handler_name = DEFAULT_HANDLER;

    // Unset: the configured default applies.
    std::optional<std::chrono::milliseconds> timeout{};
  };

  // Rejected before anything is provisioned or spawned.
  struct ValidationError {
    std::string message;
  };

  struct ExecutionResult {

    // Both streams, in the order the lines were read.
    std::vector<std::string> logs;
    CanonicalResponse response;
    int exit_code = 0;

    std::chrono::milliseconds duration{0};

    bool timed_out = false;
    bool cancelled = false;

    // The runner's result was missing or malformed and {} was normalized instead.
    bool result_fallback = false;

    // Engine-level failure: provisioning, spawn, timeout or cancellation.
    std::optional<std::string> error{};

    bool ok() const
    {
      return !error.has_value();
    }
  };

  using InvocationOutcome = std::variant<ExecutionResult, ValidationError>;

  ////////////////////////////////////////////////////////////////////////////////
  /// @brief Reads an invocation request from its JSON form:
  /// { runtime: str, code: str, event?: any, handler?: str, timeoutMs?: int }.
  ///
  /// Only the JSON shape is checked here; the meaning of the fields (supported
  /// runtime, non-empty code, handler syntax) is validated by the engine.
  ////////////////////////////////////////////////////////////////////////////////
  std::variant<InvocationRequest, ValidationError> parse_request(const Json::Value& body);

  // { ok, response, logs, exitCode, durationMs, timedOut, resultFallback, error? }
  Json::Value to_json(const ExecutionResult& result);

  // { ok: false, error }
  Json::Value to_json(const ValidationError& error);

  Json::Value to_json(const InvocationOutcome& outcome);

} // namespace fnexec::engine

#endif

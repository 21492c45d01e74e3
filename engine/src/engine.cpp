#include <fnexec/engine/engine.hpp>

#include <fnexec/common/exceptions.hpp>
#include <fnexec/common/util.hpp>
#include <fnexec/engine/framing.hpp>
#include <fnexec/engine/response.hpp>
#include <fnexec/engine/workspace.hpp>

#include <fmt/format.h>

namespace fnexec::engine {

  namespace {

    bool blank(std::string_view text)
    {
      return text.find_first_not_of(" \t\r\n\f\v") == std::string_view::npos;
    }

  } // namespace

  Engine::Engine(const config::Engine& cfg)
      : _config(cfg), _root(cfg.workspace_directory()), _isolation(make_isolation(cfg.isolation)),
        _executor(*_isolation, cfg.max_log_bytes)
  {
    _config.validate();
    _logger = common::util::create_logger("Engine");

    std::error_code ec;
    if (!std::filesystem::is_directory(_root, ec)) {
      throw common::InvalidConfigurationError{
          fmt::format("Workspace root {} is not a directory", _root.string())};
    }

    for (runtime::Runtime rt : runtime::RUNTIMES) {

      auto& slot = _interpreters[static_cast<int>(rt)];
      slot = runtime::adapter_for(rt).resolve_interpreter(_config.interpreters.get(rt));

      if (slot.has_value()) {
        _logger->info(
            "Runtime {} uses interpreter {}", runtime::runtime_to_string(rt), slot->executable
        );
      } else {
        _logger->warn("Runtime {} has no interpreter available", runtime::runtime_to_string(rt));
      }
    }

    _logger->info(
        "Engine ready, workspaces in {}, isolation {}, default timeout {} ms", _root.string(),
        _isolation->name(), _config.default_timeout_ms
    );
  }

  std::optional<ValidationError> Engine::validate(const InvocationRequest& request) const
  {
    auto rt = runtime::string_to_runtime(request.runtime);
    if (!rt.has_value()) {
      return ValidationError{fmt::format(
          "Unsupported runtime '{}', expected one of: javascript, typescript, python",
          request.runtime
      )};
    }

    if (blank(request.code)) {
      return ValidationError{"Field 'code' must not be empty"};
    }

    if (!runtime::adapter_for(rt.value()).valid_handler_name(request.handler_name)) {
      return ValidationError{fmt::format("Invalid handler name '{}'", request.handler_name)};
    }

    if (request.timeout.has_value() && request.timeout->count() <= 0) {
      return ValidationError{"Field 'timeoutMs' must be a positive integer"};
    }

    return std::nullopt;
  }

  std::chrono::milliseconds Engine::effective_timeout(const InvocationRequest& request) const
  {
    if (!request.timeout.has_value()) {
      return _config.default_timeout();
    }
    return std::min(request.timeout.value(), _config.max_timeout());
  }

  const std::optional<runtime::Interpreter>& Engine::interpreter(runtime::Runtime runtime) const
  {
    return _interpreters.at(static_cast<int>(runtime));
  }

  InvocationOutcome Engine::invoke(const InvocationRequest& request, const CancellationToken* token)
  {
    if (auto error = validate(request); error.has_value()) {
      SPDLOG_LOGGER_DEBUG(_logger, "Rejected invocation: {}", error->message);
      return error.value();
    }

    runtime::Runtime rt = runtime::string_to_runtime(request.runtime).value();
    const runtime::RuntimeAdapter& adapter = runtime::adapter_for(rt);
    std::chrono::milliseconds timeout = effective_timeout(request);
    std::string id = _ids.generate_str();

    _logger->info(
        "Invocation {} started, runtime {}, handler {}, timeout {} ms", id,
        runtime::runtime_to_string(rt), request.handler_name, timeout.count()
    );

    const auto& interpreter = this->interpreter(rt);
    if (!interpreter.has_value()) {
      auto message =
          fmt::format("No interpreter available for runtime {}", runtime::runtime_to_string(rt));
      _logger->error("Invocation {} failed: {}", id, message);
      return _failure(message);
    }

    std::optional<Workspace> workspace;
    try {
      workspace.emplace(Workspace::provision(
          _root, adapter, request.code, request.event, request.handler_name, _ids
      ));
    } catch (std::exception& exc) {
      // Provisioning errors and anything the filesystem or allocator throws.
      _logger->error("Invocation {} failed: {}", id, exc.what());
      return _failure(exc.what());
    }

    ExecutionResult result =
        _executor.execute(workspace.value(), adapter, interpreter.value(), timeout, token);
    workspace->reap();

    _logger->info(
        "Invocation {} finished, status code {}, exit code {}, {} ms{}", id,
        result.response.status_code, result.exit_code, result.duration.count(),
        result.ok() ? "" : fmt::format(", error: {}", result.error.value())
    );

    return result;
  }

  ExecutionResult Engine::_failure(const std::string& message) const
  {
    ExecutionResult result;
    result.response = error_response(message);
    result.exit_code = Executor::KILLED_EXIT_CODE;
    result.error = message;
    result.logs.emplace_back(fmt::format("{}{}", framing::ENGINE_PREFIX, message));
    return result;
  }

} // namespace fnexec::engine

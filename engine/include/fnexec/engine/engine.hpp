#ifndef FNEXEC_ENGINE_ENGINE_HPP
#define FNEXEC_ENGINE_ENGINE_HPP

#include <fnexec/common/uuid.hpp>
#include <fnexec/engine/config.hpp>
#include <fnexec/engine/executor.hpp>
#include <fnexec/engine/invocation.hpp>
#include <fnexec/engine/isolation.hpp>
#include <fnexec/engine/runtime.hpp>

#include <array>
#include <filesystem>
#include <memory>
#include <optional>

#include <spdlog/spdlog.h>

namespace fnexec::engine {

  struct CancellationToken;

  ////////////////////////////////////////////////////////////////////////////////
  /// @brief Entry point of the engine: validates a request, provisions its
  /// workspace, runs the interpreter and reaps the workspace.
  ///
  /// Invocations share no mutable state besides the identifier generator, so
  /// invoke() can be called from many threads at once.
  ///
  /// Interpreters are resolved once, at construction.
  ////////////////////////////////////////////////////////////////////////////////
  struct Engine {

    // Throws common::InvalidConfigurationError.
    explicit Engine(const config::Engine& cfg);

    ////////////////////////////////////////////////////////////////////////////////
    /// @brief Runs one invocation to completion.
    ///
    /// Returns ValidationError for an unsupported runtime, blank code, an invalid
    /// handler name or a non-positive timeout; nothing is written or spawned then.
    /// Every other failure ends in an ExecutionResult with a 500 response, and the
    /// workspace is gone from disk once this returns.
    ////////////////////////////////////////////////////////////////////////////////
    InvocationOutcome invoke(const InvocationRequest& request, const CancellationToken* token = nullptr);

    std::optional<ValidationError> validate(const InvocationRequest& request) const;

    // The request's timeout capped by the maximum, or the default.
    std::chrono::milliseconds effective_timeout(const InvocationRequest& request) const;

    const std::optional<runtime::Interpreter>& interpreter(runtime::Runtime runtime) const;

    const Isolation& isolation() const
    {
      return *_isolation;
    }

    const config::Engine& configuration() const
    {
      return _config;
    }

  private:
    ExecutionResult _failure(const std::string& message) const;

    config::Engine _config;
    std::filesystem::path _root;
    std::unique_ptr<Isolation> _isolation;
    Executor _executor;

    std::array<std::optional<runtime::Interpreter>, runtime::RUNTIMES.size()> _interpreters;

    common::UUID _ids;
    std::shared_ptr<spdlog::logger> _logger;
  };

} // namespace fnexec::engine

#endif

#ifndef FNEXEC_ENGINE_EXECUTOR_HPP
#define FNEXEC_ENGINE_EXECUTOR_HPP

#include <fnexec/engine/framing.hpp>
#include <fnexec/engine/invocation.hpp>

#include <chrono>
#include <memory>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>

namespace fnexec::engine {

  struct CancellationToken;
  struct Isolation;
  struct Workspace;

  namespace runtime {
    struct Interpreter;
    struct RuntimeAdapter;
  } // namespace runtime

  ////////////////////////////////////////////////////////////////////////////////
  /// @brief Runs one interpreter process against a provisioned workspace.
  ///
  /// The runner script is passed as the only argument after the interpreter's
  /// own arguments; user code is never part of a command line. Both output
  /// streams and the process exit are watched with one epoll loop, raced
  /// against the deadline and an optional cancellation token. On timeout or
  /// cancellation the whole process group is killed with SIGKILL; after a normal
  /// exit, processes the handler left behind in its group are killed as well.
  ///
  /// execute() never throws: spawn and system failures become a 500 result with
  /// the error set. When it returns, the child has been reaped.
  ////////////////////////////////////////////////////////////////////////////////
  struct Executor {

    // Exit status reported when the engine had to kill the interpreter.
    static constexpr int KILLED_EXIT_CODE = -1;

    // Used only when pidfd_open is not available.
    static constexpr std::chrono::milliseconds EXIT_POLL_INTERVAL{10};

    static constexpr size_t READ_BUFFER_SIZE = 64 * 1024;

    // How long the pipes may stay open after the interpreter has exited.
    static constexpr std::chrono::milliseconds OUTPUT_GRACE_PERIOD{200};

    Executor(
        const Isolation& isolation,
        size_t max_log_bytes = framing::OutputCollector::DEFAULT_MAX_LOG_BYTES
    );

    ExecutionResult execute(
        const Workspace& workspace, const runtime::RuntimeAdapter& adapter,
        const runtime::Interpreter& interpreter, std::chrono::milliseconds timeout,
        const CancellationToken* token = nullptr
    ) const noexcept;

  private:
    ExecutionResult _execute(
        const Workspace& workspace, const runtime::RuntimeAdapter& adapter,
        const runtime::Interpreter& interpreter, std::chrono::milliseconds timeout,
        const CancellationToken* token
    ) const;

    const Isolation& _isolation;
    size_t _max_log_bytes;

    std::shared_ptr<spdlog::logger> _logger;
  };

  namespace detail {

    // "KEY=VALUE" entries: the base environment with the overridden keys replaced.
    std::vector<std::string> build_environment(
        char** base, const std::vector<std::pair<std::string, std::string>>& overrides
    );

  } // namespace detail

} // namespace fnexec::engine

#endif

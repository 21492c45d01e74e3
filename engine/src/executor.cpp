#include <fnexec/engine/executor.hpp>

#include <fnexec/common/exceptions.hpp>
#include <fnexec/common/util.hpp>
#include <fnexec/engine/cancellation.hpp>
#include <fnexec/engine/isolation.hpp>
#include <fnexec/engine/response.hpp>
#include <fnexec/engine/runtime.hpp>
#include <fnexec/engine/workspace.hpp>

#include <algorithm>
#include <array>
#include <cerrno>
#include <climits>
#include <csignal>
#include <cstring>

#include <fcntl.h>
#include <sys/epoll.h>
#include <sys/syscall.h>
#include <sys/wait.h>
#include <unistd.h>

#include <fmt/format.h>

extern char** environ;

namespace fnexec::engine {

  namespace {

    struct FileDescriptor {

      FileDescriptor() = default;
      explicit FileDescriptor(int fd) : _fd(fd) {}

      FileDescriptor(const FileDescriptor&) = delete;
      FileDescriptor& operator=(const FileDescriptor&) = delete;

      FileDescriptor(FileDescriptor&& other) noexcept : _fd(other._fd)
      {
        other._fd = -1;
      }

      FileDescriptor& operator=(FileDescriptor&& other) noexcept
      {
        if (this != &other) {
          reset();
          _fd = other._fd;
          other._fd = -1;
        }
        return *this;
      }

      ~FileDescriptor()
      {
        reset();
      }

      int get() const
      {
        return _fd;
      }

      bool valid() const
      {
        return _fd >= 0;
      }

      void reset()
      {
        if (_fd >= 0) {
          close(_fd);
          _fd = -1;
        }
      }

    private:
      int _fd = -1;
    };

    struct Pipe {
      FileDescriptor read;
      FileDescriptor write;

      static Pipe create()
      {
        int fds[2];
        if (pipe2(fds, O_CLOEXEC) < 0) {
          throw common::SpawnError{
              fmt::format("Could not create pipe, reason: {}", strerror(errno))};
        }
        return Pipe{FileDescriptor{fds[0]}, FileDescriptor{fds[1]}};
      }
    };

    // Sent by the child over the close-on-exec status pipe when it cannot exec.
    struct SpawnFailure {

      enum Stage : int { ISOLATION = 0, EXEC = 1 };

      int stage;
      int error;
    };

    // The interpreter process; killed and reaped on destruction at the latest.
    struct ChildProcess {

      ChildProcess(pid_t pid, bool group) : _pid(pid), _group(group) {}

      ChildProcess(const ChildProcess&) = delete;
      ChildProcess& operator=(const ChildProcess&) = delete;

      ~ChildProcess()
      {
        if (!_reaped) {
          kill();
          wait();
        }
      }

      pid_t pid() const
      {
        return _pid;
      }

      void kill() const
      {
        ::kill(_group ? -_pid : _pid, SIGKILL);
      }

      // Kills whatever the interpreter left behind in its process group.
      void kill_leftovers() const
      {
        if (_group) {
          ::kill(-_pid, SIGKILL);
        }
      }

      // Non-blocking; the child stays a zombie, so its pid and group cannot be reused yet.
      bool exited() const
      {
        siginfo_t info{};
        if (waitid(P_PID, static_cast<id_t>(_pid), &info, WEXITED | WNOHANG | WNOWAIT) < 0) {
          return errno == ECHILD;
        }
        return info.si_pid == _pid;
      }

      void wait()
      {
        while (waitpid(_pid, &_status, 0) < 0) {
          if (errno != EINTR) {
            spdlog::error("waitpid on {} failed, reason: {}", _pid, strerror(errno));
            _status = 0;
            break;
          }
        }
        _reaped = true;
      }

      int status() const
      {
        return _status;
      }

    private:
      pid_t _pid;
      bool _group;
      bool _reaped = false;
      int _status = 0;
    };

    std::vector<char*> pointers(std::vector<std::string>& strings)
    {
      std::vector<char*> ptrs;
      ptrs.reserve(strings.size() + 1);
      for (auto& str : strings) {
        ptrs.push_back(str.data());
      }
      ptrs.push_back(nullptr);
      return ptrs;
    }

    // Runs in the forked child: only async-signal-safe calls from here on.
    [[noreturn]] void run_child(
        const Isolation& isolation, const char* working_directory, char* const* argv,
        char* const* envp, int out_fd, int err_fd, int status_fd
    )
    {
      sigset_t mask;
      sigemptyset(&mask);
      sigprocmask(SIG_SETMASK, &mask, nullptr);
      signal(SIGPIPE, SIG_DFL);

      SpawnFailure failure{SpawnFailure::ISOLATION, 0};
      if (dup2(out_fd, STDOUT_FILENO) < 0 || dup2(err_fd, STDERR_FILENO) < 0 ||
          !isolation.apply(working_directory)) {
        failure.error = errno;
      } else {
        execve(argv[0], argv, envp);
        failure = SpawnFailure{SpawnFailure::EXEC, errno};
      }

      // Nobody to report to if this fails; the parent then sees a missing result.
      if (write(status_fd, &failure, sizeof(failure)) < 0) {
        _exit(126);
      }
      _exit(127);
    }

    void set_nonblocking(int fd)
    {
      int flags = fcntl(fd, F_GETFL);
      if (flags < 0 || fcntl(fd, F_SETFL, flags | O_NONBLOCK) < 0) {
        throw common::FnexecException{
            fmt::format("Could not set pipe non-blocking, reason: {}", strerror(errno))};
      }
    }

    void epoll_add(int epoll_fd, int fd)
    {
      epoll_event event{};
      event.events = EPOLLIN;
      event.data.fd = fd;
      if (epoll_ctl(epoll_fd, EPOLL_CTL_ADD, fd, &event) == -1) {
        throw common::FnexecException{
            fmt::format("Adding descriptor to epoll failed, reason: {}", strerror(errno))};
      }
    }

    // Reads until the pipe is empty. Returns false on end of file.
    bool drain(
        int fd, framing::Stream stream, framing::OutputCollector& collector,
        std::vector<char>& buffer
    )
    {
      while (true) {
        ssize_t count = read(fd, buffer.data(), buffer.size());
        if (count > 0) {
          collector.feed(stream, std::string_view{buffer.data(), static_cast<size_t>(count)});
        } else if (count == 0) {
          return false;
        } else if (errno == EAGAIN || errno == EWOULDBLOCK) {
          return true;
        } else if (errno != EINTR) {
          throw common::FnexecException{
              fmt::format("Reading interpreter output failed, reason: {}", strerror(errno))};
        }
      }
    }

    FileDescriptor open_pidfd([[maybe_unused]] pid_t pid)
    {
#ifdef SYS_pidfd_open
      return FileDescriptor{static_cast<int>(syscall(SYS_pidfd_open, pid, 0))};
#else
      return FileDescriptor{};
#endif
    }

    // jsoncpp reports errors over several lines; the first one is enough for a log line.
    std::string first_line(const std::string& text)
    {
      std::string_view view{text};
      size_t begin = view.find_first_not_of("* \t\r\n");
      if (begin == std::string_view::npos) {
        return "parse error";
      }
      view = view.substr(begin);
      return std::string{view.substr(0, view.find_first_of("\r\n"))};
    }

    Json::Value parse_result(framing::OutputCollector& collector, bool& fallback)
    {
      if (!collector.result().has_value()) {
        fallback = true;
        collector.add_engine_log("runner produced no result, using {}");
        return Json::Value{Json::objectValue};
      }

      std::string error;
      auto parsed = json::parse(collector.result().value(), &error);
      if (!parsed.has_value()) {
        fallback = true;
        collector.add_engine_log(
            fmt::format("result is not valid JSON ({}), using {{}}", first_line(error))
        );
        return Json::Value{Json::objectValue};
      }

      return std::move(parsed.value());
    }

  } // namespace

  Executor::Executor(const Isolation& isolation, size_t max_log_bytes)
      : _isolation(isolation), _max_log_bytes(max_log_bytes)
  {
    _logger = common::util::create_logger("Executor");
  }

  ExecutionResult Executor::execute(
      const Workspace& workspace, const runtime::RuntimeAdapter& adapter,
      const runtime::Interpreter& interpreter, std::chrono::milliseconds timeout,
      const CancellationToken* token
  ) const noexcept
  {
    try {
      return _execute(workspace, adapter, interpreter, timeout, token);
    } catch (std::exception& exc) {

      _logger->error(
          "Execution in {} failed, reason: {}", workspace.directory().string(), exc.what()
      );

      ExecutionResult result;
      result.response = error_response(exc.what());
      result.exit_code = KILLED_EXIT_CODE;
      result.error = exc.what();
      result.logs.emplace_back(fmt::format("{}{}", framing::ENGINE_PREFIX, exc.what()));
      return result;
    }
  }

  ExecutionResult Executor::_execute(
      const Workspace& workspace, const runtime::RuntimeAdapter& adapter,
      const runtime::Interpreter& interpreter, std::chrono::milliseconds timeout,
      const CancellationToken* token
  ) const
  {
    ExecutionResult result;
    framing::OutputCollector collector{_max_log_bytes};
    std::vector<char> buffer(READ_BUFFER_SIZE);

    // Everything the child needs is prepared before fork.
    std::vector<std::string> arguments{interpreter.executable};
    arguments.insert(arguments.end(), interpreter.args.begin(), interpreter.args.end());
    arguments.push_back(workspace.runner_path().string());
    std::vector<std::string> environment =
        detail::build_environment(environ, adapter.environment(workspace.handler_name()));
    std::vector<char*> argv = pointers(arguments);
    std::vector<char*> envp = pointers(environment);
    std::string working_directory = workspace.directory().string();

    Pipe out = Pipe::create();
    Pipe err = Pipe::create();
    Pipe status = Pipe::create();

    auto begin = std::chrono::steady_clock::now();
    auto deadline = begin + timeout;

    pid_t pid = fork();
    if (pid < 0) {
      throw common::SpawnError{fmt::format("Fork failed, reason: {}", strerror(errno))};
    }
    if (pid == 0) {
      run_child(
          _isolation, working_directory.c_str(), argv.data(), envp.data(), out.write.get(),
          err.write.get(), status.write.get()
      );
    }

    ChildProcess child{pid, _isolation.owns_process_group()};
    out.write.reset();
    err.write.reset();
    status.write.reset();

    // The status pipe is closed by a successful exec, so this only blocks until then.
    SpawnFailure failure{};
    ssize_t count = 0;
    do {
      count = read(status.read.get(), &failure, sizeof(failure));
    } while (count < 0 && errno == EINTR);

    if (count == sizeof(failure)) {
      throw common::SpawnError{fmt::format(
          "Could not {} {}, reason: {}", failure.stage == SpawnFailure::EXEC ? "start" : "isolate",
          interpreter.executable, strerror(failure.error)
      )};
    }

    SPDLOG_LOGGER_DEBUG(
        _logger, "Started {} with PID {} in {}", interpreter.name(), pid, working_directory
    );

    set_nonblocking(out.read.get());
    set_nonblocking(err.read.get());

    FileDescriptor epoll{epoll_create1(EPOLL_CLOEXEC)};
    if (!epoll.valid()) {
      throw common::FnexecException{
          fmt::format("Incorrect epoll initialization, reason: {}", strerror(errno))};
    }
    epoll_add(epoll.get(), out.read.get());
    epoll_add(epoll.get(), err.read.get());

    // Without a pidfd, the exit is detected by polling.
    FileDescriptor pidfd = open_pidfd(pid);
    if (pidfd.valid()) {
      epoll_add(epoll.get(), pidfd.get());
    }

    bool token_watched = token != nullptr;
    if (token_watched) {
      epoll_add(epoll.get(), token->fd());
    }

    int open_streams = 2;
    bool exited = false;
    std::array<epoll_event, 4> events{};

    // After the exit, the pipes are drained until EOF for a short grace period at most.
    while (!exited || open_streams > 0) {

      if (token_watched && token->cancelled()) {
        if (!exited) {
          result.cancelled = true;
          break;
        }
        epoll_ctl(epoll.get(), EPOLL_CTL_DEL, token->fd(), nullptr);
        token_watched = false;
      }

      auto now = std::chrono::steady_clock::now();
      if (now >= deadline) {
        result.timed_out = !exited;
        break;
      }

      auto remaining = std::chrono::ceil<std::chrono::milliseconds>(deadline - now).count();
      int wait_ms = static_cast<int>(std::min<long long>(remaining, INT_MAX));
      if (!pidfd.valid() && !exited) {
        wait_ms = std::min(wait_ms, static_cast<int>(EXIT_POLL_INTERVAL.count()));
      }

      int ready = epoll_wait(epoll.get(), events.data(), static_cast<int>(events.size()), wait_ms);
      if (ready < 0) {
        if (errno == EINTR) {
          continue;
        }
        throw common::FnexecException{fmt::format("epoll_wait failed, reason: {}", strerror(errno))};
      }

      for (int i = 0; i < ready; ++i) {

        int fd = events[i].data.fd;
        if (fd != out.read.get() && fd != err.read.get()) {
          continue;
        }

        Pipe& pipe = fd == out.read.get() ? out : err;
        auto stream = fd == out.read.get() ? framing::Stream::STDOUT : framing::Stream::STDERR;
        if (!drain(fd, stream, collector, buffer)) {
          epoll_ctl(epoll.get(), EPOLL_CTL_DEL, fd, nullptr);
          pipe.read.reset();
          --open_streams;
        }
      }

      if (!exited && child.exited()) {
        exited = true;
        child.kill_leftovers();
        child.wait();
        // A pidfd of a reaped child stays readable.
        pidfd.reset();
        // A process that left the group may hold the pipes open; do not wait for it.
        deadline = std::min(deadline, std::chrono::steady_clock::now() + OUTPUT_GRACE_PERIOD);
      }
    }

    if (result.timed_out || result.cancelled) {
      child.kill();
      child.wait();
    }

    // Output written before the kill, or before we stopped waiting for EOF, still belongs to the logs.
    for (auto [pipe, stream] :
         {std::make_pair(&out, framing::Stream::STDOUT),
          std::make_pair(&err, framing::Stream::STDERR)}) {
      if (pipe->read.valid() && !drain(pipe->read.get(), stream, collector, buffer)) {
        pipe->read.reset();
      }
    }
    if (exited && (out.read.valid() || err.read.valid())) {
      collector.add_engine_log("output is still held open by a detached process, the rest is dropped");
      _logger->warn(
          "{} with PID {} exited, but its output stayed open; a detached process is still running",
          interpreter.name(), pid
      );
    }
    collector.finish();

    result.duration =
        std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - begin);

    if (result.timed_out || result.cancelled) {

      std::string message = result.timed_out
                                ? fmt::format("Execution timed out after {} ms", timeout.count())
                                : std::string{"Invocation cancelled"};
      collector.add_engine_log(message);
      _logger->warn("{}, killed {} with PID {}", message, interpreter.name(), pid);

      result.exit_code = KILLED_EXIT_CODE;
      result.response = error_response(message);
      result.error = std::move(message);

    } else {

      int exit_status = child.status();
      if (WIFEXITED(exit_status)) {
        result.exit_code = WEXITSTATUS(exit_status);
        if (result.exit_code != 0) {
          collector.add_engine_log(
              fmt::format("{} exited with code {}", interpreter.name(), result.exit_code)
          );
        }
      } else if (WIFSIGNALED(exit_status)) {
        result.exit_code = 128 + WTERMSIG(exit_status);
        collector.add_engine_log(
            fmt::format("{} terminated by signal {}", interpreter.name(), WTERMSIG(exit_status))
        );
      }

      result.response = normalize(parse_result(collector, result.result_fallback));
      if (result.result_fallback) {
        _logger->warn("Runner in {} produced no usable result", working_directory);
      }
    }

    result.logs = collector.take_logs();

    SPDLOG_LOGGER_DEBUG(
        _logger, "PID {} finished with exit code {} after {} ms", pid, result.exit_code,
        result.duration.count()
    );

    return result;
  }

  namespace detail {

    std::vector<std::string> build_environment(
        char** base, const std::vector<std::pair<std::string, std::string>>& overrides
    )
    {
      std::vector<std::string> environment;

      for (char** entry = base; entry != nullptr && *entry != nullptr; ++entry) {

        std::string_view variable{*entry};
        std::string_view key = variable.substr(0, variable.find('='));

        bool overridden = std::any_of(overrides.begin(), overrides.end(), [&](const auto& val) {
          return val.first == key;
        });
        if (!overridden) {
          environment.emplace_back(variable);
        }
      }

      for (const auto& [key, value] : overrides) {
        environment.emplace_back(fmt::format("{}={}", key, value));
      }

      return environment;
    }

  } // namespace detail

} // namespace fnexec::engine

#include <fnexec/engine/runtime.hpp>

#include <fnexec/common/exceptions.hpp>

#include <cerrno>
#include <cstdlib>
#include <filesystem>
#include <thread>

#include <fcntl.h>
#include <signal.h>
#include <spawn.h>
#include <sys/wait.h>
#include <unistd.h>

#include <fmt/format.h>
#include <json/json.h>

extern char** environ;

namespace fnexec::engine::runtime {

  std::string runtime_to_string(Runtime val)
  {
    switch (val) {
    case Runtime::JAVASCRIPT:
      return "javascript";
    case Runtime::TYPESCRIPT:
      return "typescript";
    case Runtime::PYTHON:
      return "python";
    }
    return "";
  }

  std::optional<Runtime> string_to_runtime(std::string_view name)
  {
    if (name == "javascript" || name == "node" || name == "js") {
      return Runtime::JAVASCRIPT;
    }
    if (name == "typescript" || name == "ts" || name == "bun") {
      return Runtime::TYPESCRIPT;
    }
    if (name == "python" || name == "python3" || name == "py") {
      return Runtime::PYTHON;
    }
    return std::nullopt;
  }

  InterpreterCandidate InterpreterCandidate::parse(std::string_view command_line)
  {
    InterpreterCandidate candidate;

    size_t pos = 0;
    while (pos < command_line.size()) {

      size_t begin = command_line.find_first_not_of(" \t", pos);
      if (begin == std::string_view::npos) {
        break;
      }
      size_t end = command_line.find_first_of(" \t", begin);
      if (end == std::string_view::npos) {
        end = command_line.size();
      }

      std::string token{command_line.substr(begin, end - begin)};
      if (candidate.command.empty()) {
        candidate.command = std::move(token);
      } else {
        candidate.args.emplace_back(std::move(token));
      }
      pos = end;
    }

    return candidate;
  }

  std::string Interpreter::name() const
  {
    return std::filesystem::path{executable}.filename().string();
  }

  namespace {

    bool is_executable(const std::filesystem::path& path)
    {
      std::error_code ec;
      return std::filesystem::is_regular_file(path, ec) && access(path.c_str(), X_OK) == 0;
    }

  } // namespace

  std::optional<std::string> find_executable(std::string_view command, std::string_view path_list)
  {
    if (command.empty()) {
      return std::nullopt;
    }

    if (command.find('/') != std::string_view::npos) {
      std::filesystem::path path{command};
      if (is_executable(path)) {
        return std::filesystem::absolute(path).string();
      }
      return std::nullopt;
    }

    size_t pos = 0;
    while (pos <= path_list.size()) {

      size_t end = path_list.find(':', pos);
      if (end == std::string_view::npos) {
        end = path_list.size();
      }

      // Empty entries of PATH mean the current directory; we never resolve against it.
      std::string_view dir = path_list.substr(pos, end - pos);
      if (!dir.empty()) {
        auto path = std::filesystem::path{dir} / command;
        if (is_executable(path)) {
          return std::filesystem::absolute(path).string();
        }
      }
      pos = end + 1;
    }

    return std::nullopt;
  }

  std::optional<std::string> find_executable(std::string_view command)
  {
    const char* path_list = std::getenv("PATH");
    return find_executable(command, path_list ? path_list : "/usr/local/bin:/usr/bin:/bin");
  }

  bool check_interpreter(
      const std::string& executable, const std::vector<std::string>& args,
      std::chrono::milliseconds timeout
  )
  {
    std::vector<char*> argv;
    argv.emplace_back(const_cast<char*>(executable.c_str()));
    for (const auto& arg : args) {
      argv.emplace_back(const_cast<char*>(arg.c_str()));
    }
    argv.emplace_back(nullptr);

    posix_spawn_file_actions_t actions;
    if (posix_spawn_file_actions_init(&actions) != 0) {
      return false;
    }
    for (int fd : {STDIN_FILENO, STDOUT_FILENO, STDERR_FILENO}) {
      posix_spawn_file_actions_addopen(&actions, fd, "/dev/null", fd == STDIN_FILENO ? O_RDONLY : O_WRONLY, 0);
    }

    pid_t pid = -1;
    int ret = posix_spawn(&pid, executable.c_str(), &actions, nullptr, argv.data(), environ);
    posix_spawn_file_actions_destroy(&actions);
    if (ret != 0) {
      return false;
    }

    auto deadline = std::chrono::steady_clock::now() + timeout;
    int status = 0;
    while (true) {
      pid_t waited = waitpid(pid, &status, WNOHANG);
      if (waited == pid) {
        break;
      }
      if (waited == -1 && errno != EINTR) {
        return false;
      }
      if (std::chrono::steady_clock::now() >= deadline) {
        kill(pid, SIGKILL);
        waitpid(pid, &status, 0);
        return false;
      }
      std::this_thread::sleep_for(std::chrono::milliseconds{10});
    }

    return WIFEXITED(status) && WEXITSTATUS(status) == 0;
  }

  std::vector<std::pair<std::string, std::string>>
  RuntimeAdapter::environment(std::string_view handler_name) const
  {
    return {{"HANDLER_NAME", std::string{handler_name}}};
  }

  std::optional<Interpreter> RuntimeAdapter::resolve_interpreter(const std::string& override_command
  ) const
  {
    const char* path_list = std::getenv("PATH");
    return resolve_interpreter(
        override_command, path_list ? path_list : "/usr/local/bin:/usr/bin:/bin"
    );
  }

  std::optional<Interpreter> RuntimeAdapter::resolve_interpreter(
      const std::string& override_command, std::string_view path_list
  ) const
  {
    std::vector<InterpreterCandidate> options;
    if (!override_command.empty()) {
      options.emplace_back(InterpreterCandidate::parse(override_command));
    } else {
      options = candidates();
    }

    for (auto& candidate : options) {
      auto path = find_executable(candidate.command, path_list);
      if (!path.has_value()) {
        continue;
      }
      if (!candidate.check_args.empty() && !check_interpreter(path.value(), candidate.check_args)) {
        continue;
      }
      return Interpreter{std::move(path.value()), std::move(candidate.args)};
    }

    return std::nullopt;
  }

  const RuntimeAdapter& adapter_for(Runtime runtime)
  {
    static const JavaScriptAdapter javascript;
    static const TypeScriptAdapter typescript;
    static const PythonAdapter python;

    switch (runtime) {
    case Runtime::JAVASCRIPT:
      return javascript;
    case Runtime::TYPESCRIPT:
      return typescript;
    case Runtime::PYTHON:
      return python;
    }

    throw common::NotSupportedError{
        fmt::format("No adapter for runtime value {}", static_cast<int>(runtime))};
  }

  namespace detail {

    std::string render_template(
        std::string_view tmpl, const std::vector<std::pair<std::string_view, std::string>>& values
    )
    {
      std::string output{tmpl};
      for (const auto& [key, value] : values) {

        std::string token = fmt::format("@{}@", key);
        size_t pos = 0;
        while ((pos = output.find(token, pos)) != std::string::npos) {
          output.replace(pos, token.size(), value);
          pos += value.size();
        }
      }
      return output;
    }

    std::string quote(std::string_view value)
    {
      return Json::valueToQuotedString(std::string{value}.c_str());
    }

  } // namespace detail

} // namespace fnexec::engine::runtime

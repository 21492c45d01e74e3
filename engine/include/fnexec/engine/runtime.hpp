#ifndef FNEXEC_ENGINE_RUNTIME_HPP
#define FNEXEC_ENGINE_RUNTIME_HPP

#include <array>
#include <chrono>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace fnexec::engine::runtime {

  enum class Runtime { JAVASCRIPT = 0, TYPESCRIPT, PYTHON };

  constexpr std::array<Runtime, 3> RUNTIMES = {
      Runtime::JAVASCRIPT, Runtime::TYPESCRIPT, Runtime::PYTHON};

  std::string runtime_to_string(Runtime val);

  // Accepts the canonical identifiers and their aliases ("node", "py", ...).
  std::optional<Runtime> string_to_runtime(std::string_view name);

  // A command as configured or as known to an adapter, before PATH lookup.
  struct InterpreterCandidate {
    std::string command;
    std::vector<std::string> args;
    // When set, the executable is run once with these arguments and is used
    // only if that exits with 0.
    std::vector<std::string> check_args;

    static InterpreterCandidate parse(std::string_view command_line);
  };

  struct Interpreter {
    // Absolute path of the executable.
    std::string executable;
    std::vector<std::string> args;

    // Basename, used in log lines ("node exited with code 1").
    std::string name() const;
  };

  // Locate an executable: commands containing a slash are checked directly,
  // everything else is searched in the colon-separated path list.
  std::optional<std::string> find_executable(std::string_view command, std::string_view path_list);

  std::optional<std::string> find_executable(std::string_view command);

  // Runs the executable with the arguments and all standard streams on /dev/null.
  // False when it cannot be started, exits with a non-zero code or runs past the timeout.
  bool check_interpreter(
      const std::string& executable, const std::vector<std::string>& args,
      std::chrono::milliseconds timeout = std::chrono::seconds{10}
  );

  struct RuntimeAdapter {

    virtual ~RuntimeAdapter() = default;

    virtual Runtime runtime() const = 0;

    // File name of the user's source inside the workspace.
    virtual std::string_view source_file() const = 0;

    // File name of the generated runner inside the workspace.
    virtual std::string_view runner_file() const = 0;

    // Interpreters in order of preference.
    virtual std::vector<InterpreterCandidate> candidates() const = 0;

    virtual bool valid_handler_name(std::string_view name) const = 0;

    virtual std::string render_runner(std::string_view handler_name) const = 0;

    // Extra environment of the interpreter process.
    virtual std::vector<std::pair<std::string, std::string>>
    environment(std::string_view handler_name) const;

    // With an override, only the override is considered; no fallback to the defaults.
    // Candidates failing their check are skipped.
    std::optional<Interpreter> resolve_interpreter(const std::string& override_command = "") const;

    std::optional<Interpreter>
    resolve_interpreter(const std::string& override_command, std::string_view path_list) const;
  };

  struct JavaScriptAdapter : RuntimeAdapter {

    Runtime runtime() const override;
    std::string_view source_file() const override;
    std::string_view runner_file() const override;
    std::vector<InterpreterCandidate> candidates() const override;
    bool valid_handler_name(std::string_view name) const override;
    std::string render_runner(std::string_view handler_name) const override;
    std::vector<std::pair<std::string, std::string>>
    environment(std::string_view handler_name) const override;
  };

  // Same runner as JavaScript, only the source extension and the interpreters differ.
  struct TypeScriptAdapter : JavaScriptAdapter {

    Runtime runtime() const override;
    std::string_view source_file() const override;
    std::vector<InterpreterCandidate> candidates() const override;
  };

  struct PythonAdapter : RuntimeAdapter {

    Runtime runtime() const override;
    std::string_view source_file() const override;
    std::string_view runner_file() const override;
    std::vector<InterpreterCandidate> candidates() const override;
    bool valid_handler_name(std::string_view name) const override;
    std::string render_runner(std::string_view handler_name) const override;
    std::vector<std::pair<std::string, std::string>>
    environment(std::string_view handler_name) const override;
  };

  // Throws common::NotSupportedError for a value outside of the enumeration.
  const RuntimeAdapter& adapter_for(Runtime runtime);

  namespace detail {

    // Replace every "@KEY@" token of a runner template.
    std::string render_template(
        std::string_view tmpl, const std::vector<std::pair<std::string_view, std::string>>& values
    );

    // Double-quoted literal, valid both in JavaScript and in Python.
    std::string quote(std::string_view value);

  } // namespace detail

} // namespace fnexec::engine::runtime

#endif

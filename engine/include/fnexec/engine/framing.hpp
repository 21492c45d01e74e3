#ifndef FNEXEC_ENGINE_FRAMING_HPP
#define FNEXEC_ENGINE_FRAMING_HPP

#include <array>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace fnexec::engine::framing {

  // Both markers must appear on a line of their own.
  constexpr std::string_view RESULT_START = "___RESULT_START___";
  constexpr std::string_view RESULT_END = "___RESULT_END___";

  // Prefix of log lines produced by the engine itself.
  constexpr std::string_view ENGINE_PREFIX = "[fnexec] ";

  enum class Stream { STDOUT = 0, STDERR = 1 };

  // Splits the child's output into log lines and the framed result blob.
  //
  // Chunks of each stream are fed as they are read; lines are cut per stream.
  // On stdout, a start marker (re)opens the result region and drops the text
  // captured so far, and an end marker closes it; the last closed region is
  // the result. Everything else, including all of stderr, becomes a log line.
  struct OutputCollector {

    static constexpr size_t DEFAULT_MAX_LOG_BYTES = 1024 * 1024;

    // A log line longer than this is cut even without a newline.
    static constexpr size_t MAX_LINE_BYTES = 16 * 1024 * 1024;

    // A larger result blob is discarded.
    static constexpr size_t MAX_RESULT_BYTES = 4 * MAX_LINE_BYTES;

    explicit OutputCollector(size_t max_log_bytes = DEFAULT_MAX_LOG_BYTES);

    void feed(Stream stream, std::string_view chunk);

    // Flush unterminated lines; a result region still open is discarded.
    void finish();

    // Engine-generated line; ignores the size limit.
    void add_engine_log(std::string_view line);

    const std::vector<std::string>& logs() const
    {
      return _logs;
    }

    std::vector<std::string> take_logs()
    {
      return std::move(_logs);
    }

    const std::optional<std::string>& result() const
    {
      return _result;
    }

    bool truncated() const
    {
      return _truncated;
    }

  private:
    void _line(Stream stream, std::string_view line);
    void _log(std::string_view line);

    std::array<std::string, 2> _partial;

    bool _in_result = false;
    std::string _candidate;
    std::optional<std::string> _result;

    std::vector<std::string> _logs;
    size_t _log_bytes = 0;
    size_t _max_log_bytes;
    bool _truncated = false;
  };

} // namespace fnexec::engine::framing

#endif

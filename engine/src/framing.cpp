#include <fnexec/engine/framing.hpp>

#include <fmt/format.h>

namespace fnexec::engine::framing {

  namespace {

    bool blank(std::string_view line)
    {
      return line.find_first_not_of(" \t\r\n\f\v") == std::string_view::npos;
    }

  } // namespace

  OutputCollector::OutputCollector(size_t max_log_bytes) : _max_log_bytes(max_log_bytes) {}

  void OutputCollector::feed(Stream stream, std::string_view chunk)
  {
    std::string& partial = _partial[static_cast<int>(stream)];

    size_t pos = 0;
    while (pos < chunk.size()) {

      size_t end = chunk.find('\n', pos);
      if (end == std::string_view::npos) {
        partial.append(chunk.substr(pos));
        break;
      }

      if (partial.empty()) {
        _line(stream, chunk.substr(pos, end - pos));
      } else {
        partial.append(chunk.substr(pos, end - pos));
        _line(stream, partial);
        partial.clear();
      }
      pos = end + 1;
    }

    // Inside the result region a cut would change the blob, so only the result limit applies.
    size_t limit = stream == Stream::STDOUT && _in_result ? MAX_RESULT_BYTES : MAX_LINE_BYTES;
    if (partial.size() > limit) {
      _line(stream, partial);
      partial.clear();
    }
  }

  void OutputCollector::finish()
  {
    for (int i = 0; i < static_cast<int>(_partial.size()); ++i) {
      if (!_partial[i].empty()) {
        _line(static_cast<Stream>(i), _partial[i]);
        _partial[i].clear();
      }
    }

    if (_in_result) {
      _in_result = false;
      _candidate.clear();
    }
  }

  void OutputCollector::add_engine_log(std::string_view line)
  {
    _logs.emplace_back(fmt::format("{}{}", ENGINE_PREFIX, line));
  }

  void OutputCollector::_line(Stream stream, std::string_view line)
  {
    if (!line.empty() && line.back() == '\r') {
      line.remove_suffix(1);
    }

    if (stream == Stream::STDOUT) {

      if (line == RESULT_START) {
        _in_result = true;
        _candidate.clear();
        return;
      }

      if (line == RESULT_END && _in_result) {
        _in_result = false;
        _result = std::move(_candidate);
        _candidate.clear();
        return;
      }

      if (_in_result) {

        if (_candidate.size() + line.size() > MAX_RESULT_BYTES) {
          _in_result = false;
          _candidate.clear();
          add_engine_log(fmt::format("result exceeds {} bytes, discarded", MAX_RESULT_BYTES));
          return;
        }

        if (!_candidate.empty()) {
          _candidate.push_back('\n');
        }
        _candidate.append(line);
        return;
      }
    }

    _log(line);
  }

  void OutputCollector::_log(std::string_view line)
  {
    if (_truncated || blank(line)) {
      return;
    }

    if (_log_bytes + line.size() > _max_log_bytes) {
      _truncated = true;
      add_engine_log("log output truncated");
      return;
    }

    _log_bytes += line.size();
    _logs.emplace_back(line);
  }

} // namespace fnexec::engine::framing

#include <fnexec/common/util.hpp>

#include <spdlog/sinks/stdout_color_sinks.h>

namespace fnexec::common::util {

  void traceback()
  {
    void* array[10];
    int size = backtrace(array, 10);
    char** trace = backtrace_symbols(array, size);
    if (!trace) {
      return;
    }
    for (int i = 0; i < size; ++i)
      spdlog::warn("Traceback {}: {}", i, trace[i]);
    free(trace);
  }

  std::shared_ptr<spdlog::logger> create_logger(std::string_view name)
  {
    // Invocations run on many threads at once.
    auto sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    auto logger = std::make_shared<spdlog::logger>(std::string{name}, sink);
    logger->set_pattern("[%H:%M:%S:%f] [%n] [P %P] [T %t] [%l] %v ");
    logger->set_level(spdlog::get_level());
    return logger;
  }

} // namespace fnexec::common::util

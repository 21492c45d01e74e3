#include <fnexec/engine/isolation.hpp>

#include <fnexec/common/exceptions.hpp>

#include <csignal>

#include <fcntl.h>
#include <sys/prctl.h>
#include <unistd.h>

#include <fmt/format.h>

namespace fnexec::engine {

  std::string_view ProcessIsolation::name() const
  {
    return NAME;
  }

  bool ProcessIsolation::apply(const char* working_directory) const noexcept
  {
    if (setsid() < 0) {
      return false;
    }

    // Make sure the interpreter dies with us.
    if (prctl(PR_SET_PDEATHSIG, SIGKILL) < 0) {
      return false;
    }

    int null_fd = open("/dev/null", O_RDONLY);
    if (null_fd < 0) {
      return false;
    }
    if (dup2(null_fd, STDIN_FILENO) < 0) {
      return false;
    }
    if (null_fd != STDIN_FILENO) {
      close(null_fd);
    }

    return chdir(working_directory) == 0;
  }

  bool ProcessIsolation::owns_process_group() const
  {
    return true;
  }

  std::unique_ptr<Isolation> make_isolation(std::string_view name)
  {
    if (name == ProcessIsolation::NAME) {
      return std::make_unique<ProcessIsolation>();
    }

    throw common::InvalidConfigurationError{fmt::format(
        "Unknown isolation policy {}, supported: {}", name, ProcessIsolation::NAME
    )};
  }

} // namespace fnexec::engine

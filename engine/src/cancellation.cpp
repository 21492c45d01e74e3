#include <fnexec/engine/cancellation.hpp>

#include <fnexec/common/exceptions.hpp>
#include <fnexec/common/util.hpp>

#include <cstdint>

#include <sys/eventfd.h>
#include <unistd.h>

namespace fnexec::engine {

  CancellationToken::CancellationToken()
  {
    _event_fd = eventfd(0, EFD_CLOEXEC | EFD_NONBLOCK);
    if (_event_fd < 0) {
      throw common::FnexecException{
          fmt::format("Could not create cancellation eventfd, reason: {}", strerror(errno))};
    }
  }

  CancellationToken::~CancellationToken()
  {
    close(_event_fd);
  }

  void CancellationToken::cancel()
  {
    if (_cancelled.exchange(true)) {
      return;
    }

    // Never read back, so the descriptor stays readable for every poller.
    uint64_t tmp = 1;
    common::util::expect_other(write(_event_fd, &tmp, sizeof(tmp)), -1);
  }

} // namespace fnexec::engine

#ifndef FNEXEC_ENGINE_CANCELLATION_HPP
#define FNEXEC_ENGINE_CANCELLATION_HPP

#include <atomic>

namespace fnexec::engine {

  // Thread-safe, one-shot cancellation signal. The descriptor becomes readable
  // once cancel() has been called, so it can be polled next to the child's pipes.
  struct CancellationToken {

    CancellationToken();
    ~CancellationToken();

    CancellationToken(const CancellationToken&) = delete;
    CancellationToken& operator=(const CancellationToken&) = delete;
    CancellationToken(CancellationToken&&) = delete;
    CancellationToken& operator=(CancellationToken&&) = delete;

    void cancel();

    bool cancelled() const
    {
      return _cancelled.load();
    }

    int fd() const
    {
      return _event_fd;
    }

  private:
    std::atomic<bool> _cancelled{};
    int _event_fd;
  };

} // namespace fnexec::engine

#endif

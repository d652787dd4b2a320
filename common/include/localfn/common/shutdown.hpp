#ifndef LOCALFN_COMMON_SHUTDOWN_HPP
#define LOCALFN_COMMON_SHUTDOWN_HPP

#include <atomic>

namespace localfn::common {

  /**
   * @brief Broadcast cancellation token shared by every task.
   *
   * Once triggered, the descriptor stays readable forever: the counter is never
   * consumed, so any number of epoll sets can observe it independently.
   * `trigger` only performs an atomic store and a write(2) and can be called
   * from a signal handler.
   */
  class ShutdownSignal {
  public:
    ShutdownSignal();
    ~ShutdownSignal();

    ShutdownSignal(const ShutdownSignal&) = delete;
    ShutdownSignal(ShutdownSignal&&) = delete;
    ShutdownSignal& operator=(const ShutdownSignal&) = delete;
    ShutdownSignal& operator=(ShutdownSignal&&) = delete;

    void trigger();

    bool requested() const
    {
      return _requested.load();
    }

    int fd() const
    {
      return _event_fd;
    }

  private:
    std::atomic<bool> _requested{false};

    int _event_fd;
  };

} // namespace localfn::common

#endif

#ifndef LOCALFN_COMMON_POLLER_HPP
#define LOCALFN_COMMON_POLLER_HPP

#include <cstdint>
#include <vector>

namespace localfn::common {

  // Thin wrapper over a level-triggered epoll set. Every registered
  // descriptor is identified by a caller-chosen tag.
  class Poller {
  public:
    static constexpr int MAX_EPOLL_EVENTS = 32;

    Poller();
    ~Poller();

    Poller(const Poller&) = delete;
    Poller(Poller&&) = delete;
    Poller& operator=(const Poller&) = delete;
    Poller& operator=(Poller&&) = delete;

    void add(int fd, uint64_t tag);

    /**
     * @brief Wait until at least one descriptor is readable.
     *
     * @param timeout_ms epoll timeout; -1 blocks indefinitely
     * @return tags of ready descriptors; empty on timeout or interruption
     */
    std::vector<uint64_t> wait(int timeout_ms = -1);

  private:
    int _epoll_fd;
  };

} // namespace localfn::common

#endif

#include <localfn/common/poller.hpp>

#include <localfn/common/exceptions.hpp>

#include <array>
#include <cstring>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <sys/epoll.h>
#include <unistd.h>

namespace localfn::common {

  Poller::Poller()
  {
    _epoll_fd = epoll_create1(EPOLL_CLOEXEC);
    if (_epoll_fd < 0) {
      throw LocalFnException(fmt::format("Incorrect epoll initialization! {}", strerror(errno)));
    }
  }

  Poller::~Poller()
  {
    close(_epoll_fd);
  }

  void Poller::add(int fd, uint64_t tag)
  {
    SPDLOG_DEBUG("Adding to epoll descriptor {}, tag {}", fd, tag);

    epoll_event event{};
    memset(&event, 0, sizeof(epoll_event));
    event.events = EPOLLIN | EPOLLPRI;
    event.data.u64 = tag;

    if (epoll_ctl(_epoll_fd, EPOLL_CTL_ADD, fd, &event) == -1) {
      throw LocalFnException(
          fmt::format("Adding descriptor {} to epoll failed, reason: {}", fd, strerror(errno))
      );
    }
  }

  std::vector<uint64_t> Poller::wait(int timeout_ms)
  {
    std::array<epoll_event, MAX_EPOLL_EVENTS> events;
    std::vector<uint64_t> ready;

    int events_count = epoll_wait(_epoll_fd, events.data(), MAX_EPOLL_EVENTS, timeout_ms);

    if (events_count == -1) {
      if (errno != EINTR) {
        throw LocalFnException(fmt::format("epoll_wait failed, reason: {}", strerror(errno)));
      }
      return ready;
    }

    ready.reserve(events_count);
    for (int i = 0; i < events_count; ++i) {
      ready.push_back(events[i].data.u64);
    }
    return ready;
  }

} // namespace localfn::common

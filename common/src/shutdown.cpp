#include <localfn/common/shutdown.hpp>

#include <localfn/common/exceptions.hpp>

#include <cstdint>
#include <cstring>

#include <fmt/format.h>

#include <sys/eventfd.h>
#include <unistd.h>

namespace localfn::common {

  ShutdownSignal::ShutdownSignal()
  {
    _event_fd = eventfd(0, EFD_CLOEXEC | EFD_NONBLOCK);
    if (_event_fd == -1) {
      throw LocalFnException{
          fmt::format("Could not create shutdown eventfd, reason: {}", strerror(errno))};
    }
  }

  ShutdownSignal::~ShutdownSignal()
  {
    close(_event_fd);
  }

  void ShutdownSignal::trigger()
  {
    if (_requested.exchange(true)) {
      return;
    }

    uint64_t tmp = 1;
    [[maybe_unused]] auto ret = write(_event_fd, &tmp, sizeof(tmp));
  }

} // namespace localfn::common

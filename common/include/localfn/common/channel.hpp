#ifndef LOCALFN_COMMON_CHANNEL_HPP
#define LOCALFN_COMMON_CHANNEL_HPP

#include <localfn/common/exceptions.hpp>

#include <cstdint>
#include <cstring>
#include <deque>
#include <mutex>
#include <optional>

#include <fmt/format.h>

#include <sys/eventfd.h>
#include <unistd.h>

namespace localfn::common {

  /**
   * @brief Unbounded multi-producer, single-consumer message queue.
   *
   * Every successful send increments an eventfd counter, so the consumer can
   * wait for messages on several channels at once with epoll. The consumer
   * acknowledges the notification with `consume_notification` and then drains
   * the queue with `try_receive` until it is empty.
   */
  template <typename T>
  class Channel {
  public:
    Channel()
    {
      _event_fd = eventfd(0, EFD_CLOEXEC | EFD_NONBLOCK);
      if (_event_fd == -1) {
        throw LocalFnException{
            fmt::format("Could not create channel eventfd, reason: {}", strerror(errno))};
      }
    }

    ~Channel()
    {
      close(_event_fd);
    }

    Channel(const Channel&) = delete;
    Channel(Channel&&) = delete;
    Channel& operator=(const Channel&) = delete;
    Channel& operator=(Channel&&) = delete;

    /**
     * @return false if the channel has been closed; the message is not delivered.
     */
    bool send(T&& msg)
    {
      {
        std::lock_guard<std::mutex> lock(_lock);
        if (_closed) {
          return false;
        }
        _queue.push_back(std::move(msg));
      }

      uint64_t tmp = 1;
      // The counter can only overflow after 2^64 - 1 messages.
      [[maybe_unused]] auto ret = write(_event_fd, &tmp, sizeof(tmp));
      return true;
    }

    std::optional<T> try_receive()
    {
      std::lock_guard<std::mutex> lock(_lock);
      if (_queue.empty()) {
        return std::nullopt;
      }

      T msg = std::move(_queue.front());
      _queue.pop_front();
      return msg;
    }

    // Resets the eventfd counter; messages sent afterwards make it readable again.
    void consume_notification()
    {
      uint64_t tmp{};
      [[maybe_unused]] auto ret = read(_event_fd, &tmp, sizeof(tmp));
    }

    // Rejects all future messages. Messages already queued can still be received.
    void close_channel()
    {
      std::lock_guard<std::mutex> lock(_lock);
      _closed = true;
    }

    bool closed() const
    {
      std::lock_guard<std::mutex> lock(_lock);
      return _closed;
    }

    size_t size() const
    {
      std::lock_guard<std::mutex> lock(_lock);
      return _queue.size();
    }

    int fd() const
    {
      return _event_fd;
    }

  private:
    mutable std::mutex _lock;
    std::deque<T> _queue;
    bool _closed{};

    int _event_fd;
  };

} // namespace localfn::common

#endif

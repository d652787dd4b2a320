#ifndef LOCALFN_SCHEDULER_REQUESTS_HPP
#define LOCALFN_SCHEDULER_REQUESTS_HPP

#include <localfn/scheduler/concurrent_table.hpp>
#include <localfn/scheduler/invocation.hpp>

#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace localfn::scheduler {

  // Pending invocations of a single function, in submission order.
  // Unbounded: submitters never block on a slow function.
  class InvocationQueue {
  public:
    void push(Invocation&& invocation);

    std::optional<Invocation> pop();

    std::vector<Invocation> drain();

    size_t size() const;

  private:
    mutable std::mutex _lock;
    std::deque<Invocation> _invocations;
  };

  struct NewFunction {
    std::string function_name;
    std::string runtime_api;
  };

  class InvocationRegistry {
  public:
    using queue_ptr_t = std::shared_ptr<InvocationQueue>;
    using rw_acc_t = typename ConcurrentTable<queue_ptr_t>::rw_acc_t;

    InvocationRegistry(std::string server_address) : _server_address(std::move(server_address))
    {
    }

    ////////////////////////////////////////////////////////////////////////////////
    /// @brief Enqueues an invocation for its function.
    ///
    /// The lookup and the insertion of a new queue happen under a single
    /// exclusive accessor, so concurrent submissions for an unseen function
    /// produce exactly one result.
    ///
    /// @param[in] invocation request to enqueue
    /// @return function name and its runtime API address if the function had no
    /// queue before and its process must be started; empty otherwise
    ////////////////////////////////////////////////////////////////////////////////
    std::optional<NewFunction> upsert(Invocation&& invocation);

    // Like upsert, but only creates an empty queue. Used to start a function
    // before its first invocation arrives.
    std::optional<NewFunction> reserve(const std::string& function_name);

    std::optional<Invocation> pop(const std::string& function_name);

    ////////////////////////////////////////////////////////////////////////////////
    /// @brief Removes the function; the next invocation will start a new process.
    ///
    /// @return invocations that were still waiting in the queue, oldest first
    ////////////////////////////////////////////////////////////////////////////////
    std::vector<Invocation> clean(const std::string& function_name);

    // Removes every function and returns all invocations that were still
    // queued. Must not run concurrently with upsert or reserve.
    std::vector<Invocation> drain();

    bool contains(const std::string& function_name) const;

    size_t size() const;

    std::string runtime_api(const std::string& function_name) const;

    const std::string& server_address() const
    {
      return _server_address;
    }

  private:
    std::string _server_address;

    ConcurrentTable<queue_ptr_t>::table_t _queues;
  };

} // namespace localfn::scheduler

#endif

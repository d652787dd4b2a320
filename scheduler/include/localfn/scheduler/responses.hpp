#ifndef LOCALFN_SCHEDULER_RESPONSES_HPP
#define LOCALFN_SCHEDULER_RESPONSES_HPP

#include <localfn/scheduler/concurrent_table.hpp>
#include <localfn/scheduler/invocation.hpp>

#include <optional>
#include <string>
#include <vector>

namespace localfn::scheduler {

  // Callbacks of invocations that have been handed to a function process
  // and are waiting for its response.
  class ResponseRegistry {
  public:
    using rw_acc_t = typename ConcurrentTable<callback_t>::rw_acc_t;

    // Overwrites an existing callback with the same id.
    void push(const std::string& request_id, callback_t&& callback);

    std::optional<callback_t> pop(const std::string& request_id);

    ////////////////////////////////////////////////////////////////////////////////
    /// @brief Delivers the response to the caller waiting on the request id.
    ///
    /// The callback is removed before it is called, so each id can be resolved
    /// at most once. Unknown ids are ignored.
    ///
    /// @return true if a waiting caller received the response
    ////////////////////////////////////////////////////////////////////////////////
    bool resolve(const std::string& request_id, const response_t& response);

    // Removes all waiting callbacks without calling them.
    // Must not run concurrently with push.
    std::vector<callback_t> drain();

    size_t size() const;

  private:
    ConcurrentTable<callback_t>::table_t _callbacks;
  };

} // namespace localfn::scheduler

#endif

#ifndef LOCALFN_SCHEDULER_SCHEDULER_HPP
#define LOCALFN_SCHEDULER_SCHEDULER_HPP

#include <localfn/common/channel.hpp>
#include <localfn/common/shutdown.hpp>
#include <localfn/common/tasks.hpp>
#include <localfn/scheduler/command.hpp>
#include <localfn/scheduler/config.hpp>
#include <localfn/scheduler/invocation.hpp>
#include <localfn/scheduler/metadata.hpp>
#include <localfn/scheduler/requests.hpp>
#include <localfn/scheduler/responses.hpp>
#include <localfn/scheduler/supervisor.hpp>

#include <memory>
#include <optional>
#include <string>
#include <thread>

#include <spdlog/spdlog.h>

namespace localfn::scheduler {

  /**
   * @brief Starts function processes on demand and routes invocations to them.
   *
   * Submissions and process exits are consumed by a single loop thread. The
   * first invocation of a function starts a supervisor task for it; the
   * supervisor's process fetches invocations with `next_invocation` and
   * answers them with `resolve`. When the process exits, the function is
   * removed and the next invocation starts it again.
   */
  class Scheduler {
  public:
    Scheduler(
        const config::Scheduler& cfg, std::shared_ptr<const CommandBuilder> commands,
        std::shared_ptr<const MetadataSource> metadata, common::ShutdownSignal& shutdown
    );

    // Default collaborators: run command and JSON manifest.
    Scheduler(const config::Scheduler& cfg, common::ShutdownSignal& shutdown);

    ~Scheduler();

    Scheduler(const Scheduler&) = delete;
    Scheduler(Scheduler&&) = delete;
    Scheduler& operator=(const Scheduler&) = delete;
    Scheduler& operator=(Scheduler&&) = delete;

    void start();

    // Triggers the shared shutdown signal.
    void shutdown();

    // Waits for the loop and all supervisors to finish, then answers every
    // invocation that is still waiting with an error.
    void wait();

    // Fire-and-forget; after shutdown the invocation is answered with an error.
    void submit(Invocation&& invocation);

    // Starts the function process without waiting for an invocation.
    bool prestart(const std::string& function_name);

    ////////////////////////////////////////////////////////////////////////////////
    /// @brief Next pending invocation of a function, for the runtime API poll.
    ///
    /// The callback of the returned invocation is moved to the response
    /// registry, where `resolve` finds it under the request id.
    ///
    /// @return the oldest pending invocation; empty if there is none
    ////////////////////////////////////////////////////////////////////////////////
    std::optional<Invocation> next_invocation(const std::string& function_name);

    // Returns false for unknown or already resolved requests.
    bool resolve(const std::string& request_id, const response_t& response);

    InvocationRegistry& requests()
    {
      return _requests;
    }

    ResponseRegistry& responses()
    {
      return _responses;
    }

    // Number of supervisors that still run.
    int active_supervisors() const
    {
      return _supervisors.active();
    }

  private:
    void _loop();

    void _process_submissions();

    void _process_exits();

    bool _start_function(NewFunction&& function);

    void _fail_pending(std::vector<Invocation>&& invocations, const std::string& reason);

    void _fail_remaining();

    config::Scheduler _cfg;

    std::shared_ptr<const CommandBuilder> _commands;
    std::shared_ptr<const MetadataSource> _metadata;

    common::ShutdownSignal& _shutdown;

    InvocationRegistry _requests;
    ResponseRegistry _responses;

    common::Channel<Invocation> _submissions;
    std::shared_ptr<exit_channel_t> _exits;

    common::TaskGroup _supervisors;

    std::thread _worker;

    std::shared_ptr<spdlog::logger> _logger;
  };

} // namespace localfn::scheduler

#endif

#ifndef LOCALFN_SCHEDULER_SUPERVISOR_HPP
#define LOCALFN_SCHEDULER_SUPERVISOR_HPP

#include <localfn/common/channel.hpp>
#include <localfn/common/shutdown.hpp>
#include <localfn/scheduler/command.hpp>
#include <localfn/scheduler/metadata.hpp>
#include <localfn/scheduler/process.hpp>

#include <memory>
#include <optional>
#include <string>

#include <spdlog/spdlog.h>

namespace localfn::scheduler {

  namespace env {

    // Forwarded from our own environment, empty if unset.
    constexpr char LOG_LEVEL[] = "SPDLOG_LEVEL";

    // Defaults of the emulated platform, can be changed by function metadata.
    constexpr char FUNCTION_VERSION[] = "FUNCTION_VERSION";
    constexpr char FUNCTION_MEMORY_SIZE[] = "FUNCTION_MEMORY_SIZE";
    constexpr char DEFAULT_FUNCTION_VERSION[] = "1";
    constexpr char DEFAULT_FUNCTION_MEMORY_SIZE[] = "4096";

    // Always set by the scheduler.
    constexpr char RUNTIME_API[] = "RUNTIME_API";
    constexpr char FUNCTION_NAME[] = "FUNCTION_NAME";

  } // namespace env

  struct FunctionExit {

    enum class Reason { EXITED = 0, SPAWN_FAILED };

    std::string function_name;

    Reason reason;

    // Exit code, or the negated signal number.
    int exit_code{};
  };

  using exit_channel_t = common::Channel<FunctionExit>;

  class ProcessSupervisor {
  public:
    ProcessSupervisor(
        std::string function_name, std::string runtime_api, std::string manifest_path,
        std::shared_ptr<const CommandBuilder> commands,
        std::shared_ptr<const MetadataSource> metadata, std::shared_ptr<exit_channel_t> exits,
        common::ShutdownSignal& shutdown
    );

    ////////////////////////////////////////////////////////////////////////////////
    /// @brief Runs the function process until it exits or shutdown is requested.
    ///
    /// A process that exits on its own is reported on the exit channel. On
    /// shutdown, the process is killed and nothing is reported.
    ///
    /// @throws common::SpawnError if the process could not be started; the
    /// failure is reported on the exit channel first, as are errors of the
    /// command builder
    ////////////////////////////////////////////////////////////////////////////////
    void run();

    Command command() const;

    // Inherited environment with all emulated platform variables applied.
    Environment environment() const;

    // Emulated platform variables applied on top of base.
    Environment environment(Environment base) const;

    const std::string& function_name() const
    {
      return _function_name;
    }

    const std::string& runtime_api() const
    {
      return _runtime_api;
    }

  private:
    std::optional<std::string> _binary() const;

    env_t _metadata() const;

    void _notify(FunctionExit::Reason reason, int exit_code);

    std::string _function_name;
    std::string _runtime_api;
    std::string _manifest_path;

    std::shared_ptr<const CommandBuilder> _commands;
    std::shared_ptr<const MetadataSource> _metadata_source;
    std::shared_ptr<exit_channel_t> _exits;

    common::ShutdownSignal& _shutdown;

    std::shared_ptr<spdlog::logger> _logger;
  };

} // namespace localfn::scheduler

#endif

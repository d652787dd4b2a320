#include <localfn/scheduler/supervisor.hpp>

#include <localfn/common/exceptions.hpp>
#include <localfn/common/poller.hpp>
#include <localfn/common/util.hpp>

#include <algorithm>
#include <cstdlib>
#include <exception>

namespace localfn::scheduler {

  namespace {

    constexpr uint64_t CHILD_EVENT = 0;
    constexpr uint64_t SHUTDOWN_EVENT = 1;

  } // namespace

  ProcessSupervisor::ProcessSupervisor(
      std::string function_name, std::string runtime_api, std::string manifest_path,
      std::shared_ptr<const CommandBuilder> commands,
      std::shared_ptr<const MetadataSource> metadata, std::shared_ptr<exit_channel_t> exits,
      common::ShutdownSignal& shutdown
  )
      : _function_name(std::move(function_name)), _runtime_api(std::move(runtime_api)),
        _manifest_path(std::move(manifest_path)), _commands(std::move(commands)),
        _metadata_source(std::move(metadata)), _exits(std::move(exits)), _shutdown(shutdown)
  {
    _logger = common::util::create_logger("Supervisor");
  }

  std::optional<std::string> ProcessSupervisor::_binary() const
  {
    if (is_valid_bin_name(_function_name)) {
      return _function_name;
    }
    return std::nullopt;
  }

  Command ProcessSupervisor::command() const
  {
    return _commands->build(_binary());
  }

  env_t ProcessSupervisor::_metadata() const
  {
    try {
      return _metadata_source->environment(_manifest_path, _binary());
    } catch (common::LocalFnException& exc) {
      _logger->warn(
          "Ignoring invalid function metadata of {}, reason: {}", _function_name, exc.what()
      );
      return {};
    }
  }

  Environment ProcessSupervisor::environment() const
  {
    return environment(Environment::inherit());
  }

  Environment ProcessSupervisor::environment(Environment env) const
  {
    const char* log_level = std::getenv(env::LOG_LEVEL);
    env.set(env::LOG_LEVEL, log_level ? log_level : "");
    env.set(env::FUNCTION_VERSION, env::DEFAULT_FUNCTION_VERSION);
    env.set(env::FUNCTION_MEMORY_SIZE, env::DEFAULT_FUNCTION_MEMORY_SIZE);

    // Variables above can be updated by the metadata.
    env.set(_metadata());

    // Variables below cannot be updated by the metadata.
    env.set(env::RUNTIME_API, _runtime_api);
    env.set(env::FUNCTION_NAME, _function_name);

    return env;
  }

  void ProcessSupervisor::_notify(FunctionExit::Reason reason, int exit_code)
  {
    if (!_exits->send(FunctionExit{_function_name, reason, exit_code})) {
      _logger->error(
          "Failed to send message to cleanup dead function {}, the channel is closed",
          _function_name
      );
    }
  }

  void ProcessSupervisor::run()
  {
    if (_shutdown.requested()) {
      _logger->info("Not starting function {}, shutdown in progress", _function_name);
      return;
    }

    _logger->info("Starting function {}, manifest {}", _function_name, _manifest_path);

    common::Poller poller;
    poller.add(_shutdown.fd(), SHUTDOWN_EVENT);

    std::optional<ChildProcess> child;
    try {
      Command cmd = command();
      Environment env = environment();
      SPDLOG_LOGGER_DEBUG(_logger, "Spawning command {}, API {}", cmd.str(), _runtime_api);

      child = ChildProcess::spawn(cmd, env);
    } catch (std::exception&) {
      // Lets the scheduler drop the function and fail its invocations.
      _notify(FunctionExit::Reason::SPAWN_FAILED, 0);
      throw;
    }
    poller.add(child->fd(), CHILD_EVENT);

    _logger->info("Function {} runs with PID {}", _function_name, child->pid());

    while (true) {

      auto events = poller.wait();

      bool shutdown = _shutdown.requested() ||
                      std::find(events.begin(), events.end(), SHUTDOWN_EVENT) != events.end();
      if (shutdown) {
        _logger->info("Terminating function {}", _function_name);
        child->kill();
        return;
      }

      if (std::find(events.begin(), events.end(), CHILD_EVENT) != events.end()) {
        int exit_code = ChildProcess::exit_code(child->wait());
        _logger->info("Function {} exited with code {}", _function_name, exit_code);
        _notify(FunctionExit::Reason::EXITED, exit_code);
        return;
      }
    }
  }

} // namespace localfn::scheduler

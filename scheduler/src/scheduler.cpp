#include <localfn/scheduler/scheduler.hpp>

#include <localfn/common/exceptions.hpp>
#include <localfn/common/poller.hpp>
#include <localfn/common/util.hpp>

#include <algorithm>
#include <chrono>
#include <exception>

#include <fmt/format.h>

namespace localfn::scheduler {

  namespace {

    constexpr uint64_t SUBMISSION_EVENT = 0;
    constexpr uint64_t EXIT_EVENT = 1;
    constexpr uint64_t SHUTDOWN_EVENT = 2;

    bool has_event(const std::vector<uint64_t>& events, uint64_t event)
    {
      return std::find(events.begin(), events.end(), event) != events.end();
    }

    // Errors of the caller's callback must not stop the scheduler.
    void respond(
        const callback_t& callback, const response_t& response,
        const std::shared_ptr<spdlog::logger>& logger
    )
    {
      if (!callback) {
        return;
      }

      try {
        callback(response);
      } catch (std::exception& exc) {
        logger->error("Invocation callback failed, reason: {}", exc.what());
      }
    }

  } // namespace

  Scheduler::Scheduler(
      const config::Scheduler& cfg, std::shared_ptr<const CommandBuilder> commands,
      std::shared_ptr<const MetadataSource> metadata, common::ShutdownSignal& shutdown
  )
      : _cfg(cfg), _commands(std::move(commands)), _metadata(std::move(metadata)),
        _shutdown(shutdown), _requests(cfg.server_address),
        _exits(std::make_shared<exit_channel_t>())
  {
    _logger = common::util::create_logger("Scheduler");
  }

  Scheduler::Scheduler(const config::Scheduler& cfg, common::ShutdownSignal& shutdown)
      : Scheduler(
            cfg, std::make_shared<RunCommandBuilder>(cfg.build, cfg.watch),
            std::make_shared<ManifestMetadata>(), shutdown
        )
  {
  }

  Scheduler::~Scheduler()
  {
    shutdown();
    wait();
  }

  void Scheduler::start()
  {
    if (_worker.joinable()) {
      _logger->error("Scheduler thread is already running!");
      return;
    }

    _logger->info("Starting scheduler, runtime API at {}", _cfg.server_address);
    _worker = std::thread(&Scheduler::_loop, this);
  }

  void Scheduler::shutdown()
  {
    _shutdown.trigger();
  }

  void Scheduler::wait()
  {
    if (_worker.joinable()) {
      _worker.join();
    }
    _supervisors.join_all();

    if (_shutdown.requested()) {
      _fail_remaining();
    }
  }

  void Scheduler::submit(Invocation&& invocation)
  {
    SPDLOG_LOGGER_DEBUG(
        _logger, "Submit invocation {} of function {}", invocation.request_id,
        invocation.function_name
    );

    // A failed send leaves the invocation untouched.
    if (!_submissions.send(std::move(invocation))) {
      respond(
          invocation.callback,
          failed_response("Scheduler is shutting down", drogon::k503ServiceUnavailable), _logger
      );
    }
  }

  bool Scheduler::prestart(const std::string& function_name)
  {
    auto function = _requests.reserve(function_name);
    if (!function.has_value()) {
      return false;
    }

    return _start_function(std::move(function.value()));
  }

  std::optional<Invocation> Scheduler::next_invocation(const std::string& function_name)
  {
    auto invocation = _requests.pop(function_name);
    if (!invocation.has_value()) {
      return std::nullopt;
    }

    SPDLOG_LOGGER_DEBUG(
        _logger, "Deliver invocation {} to function {}", invocation->request_id, function_name
    );

    _responses.push(
        invocation->request_id,
        [callback = std::move(invocation->callback), start = invocation->start,
         request_id = invocation->request_id, logger = _logger](const response_t& response) {
          auto duration = std::chrono::duration_cast<std::chrono::microseconds>(
                              std::chrono::high_resolution_clock::now() - start
          )
                              .count();
          SPDLOG_LOGGER_DEBUG(logger, "Invocation {} finished, took {} us", request_id, duration);

          if (callback) {
            callback(response);
          }
        }
    );

    return invocation;
  }

  bool Scheduler::resolve(const std::string& request_id, const response_t& response)
  {
    return _responses.resolve(request_id, response);
  }

  void Scheduler::_loop()
  {
    try {

      common::Poller poller;
      poller.add(_submissions.fd(), SUBMISSION_EVENT);
      poller.add(_exits->fd(), EXIT_EVENT);
      poller.add(_shutdown.fd(), SHUTDOWN_EVENT);

      while (!_shutdown.requested()) {

        auto events = poller.wait();

        if (has_event(events, SHUTDOWN_EVENT)) {
          break;
        }

        if (has_event(events, SUBMISSION_EVENT)) {
          _submissions.consume_notification();
          _process_submissions();
        }

        if (has_event(events, EXIT_EVENT)) {
          _exits->consume_notification();
          _process_exits();
        }
      }

    } catch (common::LocalFnException& exc) {
      _logger->error("Scheduler loop failed, reason: {}", exc.what());
      _shutdown.trigger();
    } catch (std::exception& exc) {
      _logger->error("Scheduler loop failed with an unexpected error: {}", exc.what());
      _shutdown.trigger();
    }

    _logger->info("Terminating scheduler");

    _submissions.close_channel();
    _exits->close_channel();
  }

  void Scheduler::_process_submissions()
  {
    while (auto invocation = _submissions.try_receive()) {

      auto function = _requests.upsert(std::move(invocation.value()));
      if (function.has_value()) {
        _start_function(std::move(function.value()));
      }
    }
  }

  void Scheduler::_process_exits()
  {
    while (auto exit = _exits->try_receive()) {

      auto pending = _requests.clean(exit->function_name);

      if (exit->reason == FunctionExit::Reason::SPAWN_FAILED) {
        _logger->warn(
            "Function {} could not be started, dropping {} pending invocations",
            exit->function_name, pending.size()
        );
        _fail_pending(
            std::move(pending),
            fmt::format("Process of function {} could not be started", exit->function_name)
        );
      } else {
        _logger->info(
            "Function {} exited with code {}, {} invocations were not handled",
            exit->function_name, exit->exit_code, pending.size()
        );
        _fail_pending(
            std::move(pending),
            fmt::format(
                "Process of function {} exited before handling the invocation",
                exit->function_name
            )
        );
      }
    }
  }

  bool Scheduler::_start_function(NewFunction&& function)
  {
    try {

      auto supervisor = std::make_shared<ProcessSupervisor>(
          function.function_name, function.runtime_api, _cfg.manifest_path, _commands, _metadata,
          _exits, _shutdown
      );

      _supervisors.start(
          fmt::format("function {}", function.function_name),
          [supervisor = std::move(supervisor)]() { supervisor->run(); }
      );
      return true;

    } catch (std::exception& exc) {
      // Thread creation fails on resource exhaustion; treated as a failed spawn.
      _logger->error(
          "Could not start supervisor of function {}, reason: {}", function.function_name,
          exc.what()
      );
      _fail_pending(
          _requests.clean(function.function_name),
          fmt::format("Process of function {} could not be started", function.function_name)
      );
      return false;
    }
  }

  void Scheduler::_fail_pending(std::vector<Invocation>&& invocations, const std::string& reason)
  {
    for (auto& invocation : invocations) {
      respond(invocation.callback, failed_response(reason, drogon::k502BadGateway), _logger);
    }
  }

  void Scheduler::_fail_remaining()
  {
    _submissions.close_channel();

    std::vector<Invocation> invocations = _requests.drain();
    while (auto invocation = _submissions.try_receive()) {
      invocations.push_back(std::move(invocation.value()));
    }

    std::vector<callback_t> callbacks = _responses.drain();

    if (!invocations.empty() || !callbacks.empty()) {
      _logger->info(
          "Answering {} queued and {} running invocations after shutdown", invocations.size(),
          callbacks.size()
      );
    }

    for (auto& invocation : invocations) {
      respond(
          invocation.callback,
          failed_response("Scheduler is shutting down", drogon::k503ServiceUnavailable), _logger
      );
    }
    for (auto& callback : callbacks) {
      respond(
          callback, failed_response("Scheduler is shutting down", drogon::k503ServiceUnavailable),
          _logger
      );
    }
  }

} // namespace localfn::scheduler

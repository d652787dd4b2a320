#include <localfn/common/exceptions.hpp>
#include <localfn/common/shutdown.hpp>
#include <localfn/common/util.hpp>
#include <localfn/scheduler/config.hpp>
#include <localfn/scheduler/scheduler.hpp>

#include <csignal>
#include <cstring>
#include <exception>

#include <spdlog/spdlog.h>

localfn::common::ShutdownSignal* instance = nullptr;

void signal_handler(int) // NOLINT
{
  if (instance) {
    instance->trigger();
  }
}

void set_signals()
{
  struct sigaction sigIntHandler {};
  sigIntHandler.sa_handler = &signal_handler;
  sigemptyset(&sigIntHandler.sa_mask);
  sigIntHandler.sa_flags = 0;
  sigaction(SIGINT, &sigIntHandler, nullptr);
  sigaction(SIGTERM, &sigIntHandler, nullptr);
}

int main(int argc, char** argv)
{
  localfn::scheduler::config::Scheduler config;
  try {
    config = localfn::scheduler::config::Scheduler::deserialize(argc, argv);
  } catch (localfn::common::InvalidConfigurationError& exc) {
    spdlog::error("Incorrect configuration, reason: {}", exc.what());
    return 1;
  } catch (std::exception& exc) {
    // cxxopts parsing errors
    spdlog::error("Incorrect arguments, reason: {}", exc.what());
    return 1;
  }

  localfn::common::util::set_log_level(config.verbose);
  spdlog::info("Executing localfn scheduler!");

  localfn::common::ShutdownSignal shutdown;
  instance = &shutdown;
  set_signals();

  localfn::scheduler::Scheduler scheduler{config, shutdown};
  scheduler.start();

  for (const auto& function : config.functions) {
    scheduler.prestart(function);
  }

  scheduler.wait();
  instance = nullptr;

  spdlog::info("Scheduler is closing down");
  return 0;
}

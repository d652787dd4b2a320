#include <localfn/common/util.hpp>

#include <spdlog/sinks/stdout_color_sinks.h>

namespace localfn::common::util {

  std::shared_ptr<spdlog::logger> create_logger(std::string_view name)
  {
    auto sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    auto logger = std::make_shared<spdlog::logger>(std::string{name}, sink);
    logger->set_pattern("[%H:%M:%S:%f] [%n] [P %P] [T %t] [%l] %v ");
    logger->set_level(spdlog::get_level());
    return logger;
  }

  void set_log_level(bool verbose)
  {
    if (verbose) {
      spdlog::set_level(spdlog::level::debug);
    } else {
      spdlog::set_level(spdlog::level::info);
    }
    spdlog::set_pattern("[%H:%M:%S:%f] [P %P] [T %t] [%l] %v ");
  }

} // namespace localfn::common::util

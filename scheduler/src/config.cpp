#include <localfn/scheduler/config.hpp>

#include <localfn/common/exceptions.hpp>
#include <localfn/common/util.hpp>

#include <fstream>

#include <cereal/archives/json.hpp>
#include <cereal/details/helpers.hpp>
#include <cereal/types/string.hpp>
#include <cereal/types/vector.hpp>
#include <cxxopts.hpp>
#include <fmt/core.h>
#include <spdlog/spdlog.h>

namespace localfn::scheduler::config {

  void Build::load(cereal::JSONInputArchive& archive)
  {
    // All arguments are optional
    common::util::cereal_load_value(archive, "program", program);
    common::util::cereal_load_value(archive, "release", release);

    std::string features;
    if (common::util::cereal_load_value(archive, "features", features) && !features.empty()) {
      this->features = std::move(features);
    }
  }

  void Build::set_defaults()
  {
    program = DEFAULT_PROGRAM;
    features = std::nullopt;
    release = false;
  }

  void Watch::load(cereal::JSONInputArchive& archive)
  {
    common::util::cereal_load_value(archive, "enabled", enabled);
    common::util::cereal_load_value(archive, "args", args);
  }

  void Watch::set_defaults()
  {
    enabled = true;
    args.clear();
  }

  void Scheduler::load(cereal::JSONInputArchive& archive)
  {
    common::util::cereal_load_value(archive, "verbose", verbose);
    common::util::cereal_load_value(archive, "server-address", server_address);
    common::util::cereal_load_value(archive, "manifest-path", manifest_path);
    common::util::cereal_load_value(archive, "functions", functions);

    common::util::cereal_load_optional(archive, "build", build);
    common::util::cereal_load_optional(archive, "watch", watch);

    if (server_address.empty()) {
      throw common::InvalidConfigurationError("Server address cannot be empty!");
    }
    if (build.program.empty()) {
      throw common::InvalidConfigurationError("Build program cannot be empty!");
    }
  }

  void Scheduler::set_defaults()
  {
    verbose = false;
    server_address = DEFAULT_SERVER_ADDRESS;
    manifest_path = DEFAULT_MANIFEST_PATH;
    functions.clear();

    build.set_defaults();
    watch.set_defaults();
  }

  Scheduler Scheduler::deserialize(std::istream& in_stream)
  {
    Scheduler cfg;
    cereal::JSONInputArchive archive_in(in_stream);
    cfg.load(archive_in);
    return cfg;
  }

  Scheduler Scheduler::deserialize(int argc, char** argv)
  {
    cxxopts::Options options(
        "localfn-scheduler", "Starts function processes on demand and routes their invocations."
    );
    options.add_options()
      ("c,config", "JSON config.", cxxopts::value<std::string>()->default_value(""))
      ("v,verbose", "Verbose output", cxxopts::value<bool>()->default_value("false"))
      ("no-reload", "Run functions without the file watcher", cxxopts::value<bool>()->default_value("false"))
      ("release", "Build functions in release mode", cxxopts::value<bool>()->default_value("false"))
      ("features", "Features to enable in the build", cxxopts::value<std::string>())
      ("server-address", "Base of runtime API addresses", cxxopts::value<std::string>())
      ("manifest-path", "Path to the project manifest", cxxopts::value<std::string>())
      ("f,function", "Start a function eagerly", cxxopts::value<std::vector<std::string>>());
    auto parsed_options = options.parse(argc, argv);

    std::string config_file{parsed_options["config"].as<std::string>()};

    Scheduler cfg;
    if (config_file.length() > 0) {
      std::ifstream in_stream{config_file};
      if (!in_stream.is_open()) {
        throw common::InvalidConfigurationError(
            fmt::format("Could not open config file {}", config_file)
        );
      }

      cereal::JSONInputArchive archive_in(in_stream);
      cfg.load(archive_in);
    } else {

      cfg.set_defaults();
    }

    // Command line overrides the file.
    if (parsed_options["verbose"].as<bool>()) {
      cfg.verbose = true;
    }
    if (parsed_options["no-reload"].as<bool>()) {
      cfg.watch.enabled = false;
    }
    if (parsed_options["release"].as<bool>()) {
      cfg.build.release = true;
    }
    if (parsed_options.count("features")) {
      cfg.build.features = parsed_options["features"].as<std::string>();
    }
    if (parsed_options.count("server-address")) {
      cfg.server_address = parsed_options["server-address"].as<std::string>();
    }
    if (parsed_options.count("manifest-path")) {
      cfg.manifest_path = parsed_options["manifest-path"].as<std::string>();
    }
    if (parsed_options.count("function")) {
      auto functions = parsed_options["function"].as<std::vector<std::string>>();
      cfg.functions.insert(cfg.functions.end(), functions.begin(), functions.end());
    }

    return cfg;
  }

} // namespace localfn::scheduler::config

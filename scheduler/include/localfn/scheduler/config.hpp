#ifndef LOCALFN_SCHEDULER_CONFIG_HPP
#define LOCALFN_SCHEDULER_CONFIG_HPP

#include <istream>
#include <optional>
#include <string>
#include <vector>

namespace cereal {
  class JSONInputArchive;
} // namespace cereal

namespace localfn::scheduler::config {

  struct Build {

    static constexpr char DEFAULT_PROGRAM[] = "cargo";

    Build()
    {
      set_defaults();
    }

    // Tool providing the "run" (and, with live reload, the "watch") subcommand.
    std::string program;
    std::optional<std::string> features;
    bool release;

    void load(cereal::JSONInputArchive& archive);
    void set_defaults();
  };

  struct Watch {

    Watch()
    {
      set_defaults();
    }

    bool enabled;
    std::vector<std::string> args;

    void load(cereal::JSONInputArchive& archive);
    void set_defaults();
  };

  struct Scheduler {

    static constexpr char DEFAULT_SERVER_ADDRESS[] = "127.0.0.1:9000/.rt";
    static constexpr char DEFAULT_MANIFEST_PATH[] = "Cargo.toml";

    Scheduler()
    {
      set_defaults();
    }

    bool verbose;

    // Base of every runtime API address: {server_address}/{function}.
    std::string server_address;

    // Project manifest with per-function environment metadata.
    std::string manifest_path;

    Build build;
    Watch watch;

    // Functions started eagerly, before their first invocation.
    std::vector<std::string> functions;

    void load(cereal::JSONInputArchive& archive);
    void set_defaults();

    static Scheduler deserialize(int argc, char** argv);
    static Scheduler deserialize(std::istream& in);
  };

} // namespace localfn::scheduler::config

#endif

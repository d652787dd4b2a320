#ifndef LOCALFN_SCHEDULER_COMMAND_HPP
#define LOCALFN_SCHEDULER_COMMAND_HPP

#include <localfn/scheduler/config.hpp>

#include <optional>
#include <string>
#include <vector>

namespace localfn::scheduler {

  // Binary name reserved for the default package function - the run command
  // picks the binary on its own.
  constexpr char DEFAULT_PACKAGE_FUNCTION[] = "_";

  bool is_valid_bin_name(const std::string& name);

  struct Command {
    std::vector<std::string> args;

    std::string str() const;
  };

  struct CommandBuilder {

    CommandBuilder() = default;
    CommandBuilder(const CommandBuilder&) = default;
    CommandBuilder(CommandBuilder&&) = delete;
    CommandBuilder& operator=(const CommandBuilder&) = default;
    CommandBuilder& operator=(CommandBuilder&&) = delete;
    virtual ~CommandBuilder() = default;

    /**
     * @brief Builds the command that compiles and runs a function.
     *
     * @param binary binary to run; no value lets the tool select it
     */
    virtual Command build(const std::optional<std::string>& binary) const = 0;
  };

  /**
   * Produces `{program} run [--features F] [--release] [--bin NAME]`. With live
   * reload, the command is wrapped in the file watcher:
   * `{program} watch {args...} -- {program} run ...`.
   */
  struct RunCommandBuilder : CommandBuilder {

    RunCommandBuilder(config::Build build, config::Watch watch)
        : _build(std::move(build)), _watch(std::move(watch))
    {
    }

    Command build(const std::optional<std::string>& binary) const override;

  private:
    config::Build _build;
    config::Watch _watch;
  };

} // namespace localfn::scheduler

#endif

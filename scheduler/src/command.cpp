#include <localfn/scheduler/command.hpp>

#include <fmt/format.h>
#include <fmt/ranges.h>

namespace localfn::scheduler {

  bool is_valid_bin_name(const std::string& name)
  {
    return !name.empty() && name != DEFAULT_PACKAGE_FUNCTION;
  }

  std::string Command::str() const
  {
    return fmt::format("{}", fmt::join(args, " "));
  }

  Command RunCommandBuilder::build(const std::optional<std::string>& binary) const
  {
    Command cmd;
    cmd.args.push_back(_build.program);

    if (_watch.enabled) {
      cmd.args.emplace_back("watch");
      cmd.args.insert(cmd.args.end(), _watch.args.begin(), _watch.args.end());
      cmd.args.emplace_back("--");
      cmd.args.push_back(_build.program);
    }
    cmd.args.emplace_back("run");

    if (_build.features.has_value()) {
      cmd.args.emplace_back("--features");
      cmd.args.push_back(_build.features.value());
    }

    if (_build.release) {
      cmd.args.emplace_back("--release");
    }

    if (binary.has_value()) {
      cmd.args.emplace_back("--bin");
      cmd.args.push_back(binary.value());
    }

    return cmd;
  }

} // namespace localfn::scheduler

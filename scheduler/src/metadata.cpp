#include <localfn/scheduler/metadata.hpp>

#include <localfn/common/exceptions.hpp>

#include <fstream>
#include <istream>
#include <utility>

#include <fmt/format.h>
#include <toml++/toml.hpp>

namespace localfn::scheduler {

  namespace {

    const toml::table* section(toml::node_view<const toml::node> node, const std::string& where)
    {
      if (!node) {
        return nullptr;
      }

      const toml::table* table = node.as_table();
      if (!table) {
        throw common::InvalidConfigurationError{
            fmt::format("Section {} of the project manifest must be a table!", where)};
      }
      return table;
    }

    void read_env(const toml::table* table, const std::string& where, env_t& env)
    {
      if (!table) {
        return;
      }

      for (auto&& [key, value] : *table) {
        const auto* str = value.as_string();
        if (!str) {
          throw common::InvalidConfigurationError{
              fmt::format("Variable {} in section {} must be a string!", key.str(), where)};
        }
        env[std::string{key.str()}] = str->get();
      }
    }

  } // namespace

  env_t ManifestMetadata::environment(
      const std::string& manifest_path, const std::optional<std::string>& binary
  ) const
  {
    std::ifstream in_stream{manifest_path};
    if (!in_stream.is_open()) {
      throw common::ObjectDoesNotExist{
          fmt::format("Could not open the project manifest {}", manifest_path)};
    }

    return parse(in_stream, binary);
  }

  env_t ManifestMetadata::parse(std::istream& in, const std::optional<std::string>& binary)
  {
    toml::table root;
    try {
      root = toml::parse(in);
    } catch (const toml::parse_error& err) {
      throw common::InvalidConfigurationError{
          fmt::format("Could not parse the project manifest, reason: {}", err.description())};
    }

    const toml::table* lambda =
        section(std::as_const(root)["package"]["metadata"]["lambda"], "package.metadata.lambda");
    if (!lambda) {
      return {};
    }

    env_t env;
    read_env(section((*lambda)["env"], "package.metadata.lambda.env"), "env", env);

    if (!binary.has_value()) {
      return env;
    }

    const toml::table* bins = section((*lambda)["bin"], "package.metadata.lambda.bin");
    if (!bins) {
      return env;
    }

    std::string where = fmt::format("package.metadata.lambda.bin.{}", binary.value());
    const toml::table* bin = section((*bins)[binary.value()], where);
    if (!bin) {
      return env;
    }

    where += ".env";
    read_env(section((*bin)["env"], where), where, env);

    return env;
  }

} // namespace localfn::scheduler

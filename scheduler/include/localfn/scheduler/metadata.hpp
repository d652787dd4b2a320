#ifndef LOCALFN_SCHEDULER_METADATA_HPP
#define LOCALFN_SCHEDULER_METADATA_HPP

#include <iosfwd>
#include <map>
#include <optional>
#include <string>

namespace localfn::scheduler {

  using env_t = std::map<std::string, std::string>;

  struct MetadataSource {

    MetadataSource() = default;
    MetadataSource(const MetadataSource&) = default;
    MetadataSource(MetadataSource&&) = delete;
    MetadataSource& operator=(const MetadataSource&) = default;
    MetadataSource& operator=(MetadataSource&&) = delete;
    virtual ~MetadataSource() = default;

    /**
     * @brief Environment variables that the project declares for a function.
     *
     * @param manifest_path project manifest
     * @param binary function binary; no value returns package-level variables only
     * @throws common::ObjectDoesNotExist if the manifest cannot be opened
     * @throws common::InvalidConfigurationError if the manifest is malformed
     */
    virtual env_t
    environment(const std::string& manifest_path, const std::optional<std::string>& binary) const = 0;
  };

  /**
   * Reads the function tables of the Cargo manifest:
   *
   * [package.metadata.lambda.env]
   * KEY = "VALUE"
   *
   * [package.metadata.lambda.bin.<binary>.env]
   * KEY = "VALUE"
   *
   * Variables of a binary override package-level ones.
   */
  struct ManifestMetadata : MetadataSource {

    env_t environment(const std::string& manifest_path, const std::optional<std::string>& binary)
        const override;

    static env_t parse(std::istream& in, const std::optional<std::string>& binary);

  };

} // namespace localfn::scheduler

#endif

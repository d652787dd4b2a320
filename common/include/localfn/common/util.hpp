#ifndef LOCALFN_COMMON_UTIL_HPP
#define LOCALFN_COMMON_UTIL_HPP

#include <localfn/common/exceptions.hpp>

#include <memory>
#include <string_view>

#include <cereal/archives/json.hpp>
#include <spdlog/spdlog.h>

namespace localfn::common::util {

  std::shared_ptr<spdlog::logger> create_logger(std::string_view name);

  void set_log_level(bool verbose);

  template <typename T>
  void cereal_load_optional(cereal::JSONInputArchive& archive, const std::string& name, T& obj)
  {

    // Unfortunately, Cereal does not allow to skip non-existing objects easily.
    // There is also no separate exception type for this.
    try {
      archive(cereal::make_nvp(name, obj));
    } catch (cereal::Exception& exc) {

      // Catch non existing object
      if (std::string_view{exc.what()}.find(fmt::format("({}) not found", name)) !=
          std::string::npos) {

        archive.setNextName(nullptr);
        obj.set_defaults();

      } else {
        throw common::InvalidConfigurationError(
            fmt::format("Could not parse configuration of {}, reason: {}", name, exc.what())
        );
      }
    }
  }

  // Variant for plain values without set_defaults - a missing value keeps its
  // current content. Returns false if the value was not found.
  template <typename T>
  bool cereal_load_value(cereal::JSONInputArchive& archive, const std::string& name, T& obj)
  {
    try {
      archive(cereal::make_nvp(name, obj));
      return true;
    } catch (cereal::Exception& exc) {

      if (std::string_view{exc.what()}.find(fmt::format("({}) not found", name)) !=
          std::string::npos) {
        archive.setNextName(nullptr);
        return false;
      } else {
        throw common::InvalidConfigurationError(
            fmt::format("Could not parse configuration of {}, reason: {}", name, exc.what())
        );
      }
    }
  }

} // namespace localfn::common::util

#endif

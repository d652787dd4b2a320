#ifndef LOCALFN_COMMON_EXCEPTIONS_HPP
#define LOCALFN_COMMON_EXCEPTIONS_HPP

#include <stdexcept>

namespace localfn::common {

  struct LocalFnException : std::runtime_error {

    LocalFnException(const std::string& msg) : std::runtime_error(msg) {}
  };

  struct InvalidConfigurationError : LocalFnException {

    InvalidConfigurationError(const std::string& msg) : LocalFnException(msg) {}
  };

  struct ObjectDoesNotExist : LocalFnException {

    ObjectDoesNotExist(const std::string& name) : LocalFnException(name) {}
  };

  struct SpawnError : LocalFnException {

    SpawnError(const std::string& msg) : LocalFnException(msg) {}
  };

} // namespace localfn::common

#endif

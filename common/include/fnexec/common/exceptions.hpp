#ifndef FNEXEC_COMMON_EXCEPTIONS_HPP
#define FNEXEC_COMMON_EXCEPTIONS_HPP

#include <stdexcept>
#include <string>

namespace fnexec::common {

  struct FnexecException : std::runtime_error {

    FnexecException(const std::string& msg) : std::runtime_error(msg) {}
  };

  struct InvalidConfigurationError : FnexecException {

    InvalidConfigurationError(const std::string& msg) : FnexecException(msg) {}
  };

  // Adapter lookup of a runtime that has no adapter.
  struct NotSupportedError : FnexecException {

    NotSupportedError(const std::string& name) : FnexecException(name) {}
  };

  struct ProvisioningError : FnexecException {

    ProvisioningError(const std::string& msg) : FnexecException(msg) {}
  };

  struct SpawnError : FnexecException {

    SpawnError(const std::string& msg) : FnexecException(msg) {}
  };

} // namespace fnexec::common

#endif

#ifndef FNRUN_COMMON_EXCEPTIONS_HPP
#define FNRUN_COMMON_EXCEPTIONS_HPP

#include <stdexcept>
#include <string>

namespace fnrun::common {

  struct FnRunException : std::runtime_error {

    FnRunException(const std::string& msg) : std::runtime_error(msg) {}
  };

  struct InvalidConfigurationError : FnRunException {

    InvalidConfigurationError(const std::string& msg) : FnRunException(msg) {}
  };

  struct InvalidArgument : FnRunException {

    InvalidArgument(const std::string& msg) : FnRunException(msg) {}
  };

  struct InvalidJSON : FnRunException {

    InvalidJSON(const std::string& msg) : FnRunException(msg) {}
  };

  // Failure to create or supervise a sandbox process.
  struct SandboxError : FnRunException {

    SandboxError(const std::string& msg) : FnRunException(msg) {}
  };

} // namespace fnrun::common

#endif

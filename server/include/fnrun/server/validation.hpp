#ifndef FNRUN_SERVER_VALIDATION_HPP
#define FNRUN_SERVER_VALIDATION_HPP

#include <fnrun/sandbox/environment.hpp>
#include <fnrun/server/registry.hpp>

#include <optional>
#include <string>
#include <string_view>

namespace Json {
  class Value;
} // namespace Json

// Checks applied to deploy requests before anything is stored.
namespace fnrun::server::validation {

  static constexpr size_t MAX_NAME_LENGTH = 100;
  static constexpr size_t MAX_ENV_VARS = 50;
  static constexpr size_t MAX_ENV_VALUE_LENGTH = 10000;

  struct DeployRequest {
    DeploymentKey key;
    std::string code;
    sandbox::Environment::values_t env;
  };

  // Python identifier that is not a keyword.
  bool valid_function_name(std::string_view name);

  bool valid_owner(std::string_view owner);

  bool valid_repo(std::string_view repo);

  // Names read by the dynamic loader and the interpreter of the sandbox host.
  bool reserved_env_name(std::string_view name);

  // Uppercase letters, digits and underscores; must not start with a digit or be reserved.
  bool valid_env_name(std::string_view name);

  bool valid_env_value(std::string_view value);

  ////////////////////////////////////////////////////////////////////////////////
  /// @brief Validates the body of a deploy request.
  ///
  /// @param[in] body parsed JSON body
  /// @param[out] request validated request, untouched on failure
  /// @return error message when the request is rejected
  ////////////////////////////////////////////////////////////////////////////////
  std::optional<std::string> parse_deploy(const Json::Value& body, DeployRequest& request);

} // namespace fnrun::server::validation

#endif

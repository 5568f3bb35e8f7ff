#include <fnrun/server/validation.hpp>

#include <algorithm>
#include <array>
#include <cctype>

#include <fmt/format.h>
#include <json/value.h>

namespace fnrun::server::validation {

  namespace {

    constexpr std::array<std::string_view, 35> PYTHON_KEYWORDS = {
        "false",  "none",   "true",    "and",      "as",     "assert", "async",
        "await",  "break",  "class",   "continue", "def",    "del",    "elif",
        "else",   "except", "finally", "for",      "from",   "global", "if",
        "import", "in",     "is",      "lambda",   "nonlocal", "not",  "or",
        "pass",   "raise",  "return",  "try",      "while",  "with",   "yield"};

    bool all_of(std::string_view str, bool (*pred)(char))
    {
      return std::all_of(str.begin(), str.end(), pred);
    }

    bool is_alnum(char c)
    {
      return std::isalnum(static_cast<unsigned char>(c));
    }

    std::optional<std::string> read_env_value(const Json::Value& value, std::string& out)
    {
      switch (value.type()) {
      case Json::stringValue:
        out = value.asString();
        return std::nullopt;
      case Json::intValue:
        out = std::to_string(value.asInt64());
        return std::nullopt;
      case Json::uintValue:
        out = std::to_string(value.asUInt64());
        return std::nullopt;
      case Json::realValue:
        out = fmt::format("{}", value.asDouble());
        return std::nullopt;
      case Json::booleanValue:
        out = value.asBool() ? "true" : "false";
        return std::nullopt;
      default:
        return "environment variable values must be strings, numbers or booleans";
      }
    }

  } // namespace

  bool valid_function_name(std::string_view name)
  {
    if (name.empty() || name.size() > MAX_NAME_LENGTH) {
      return false;
    }
    if (std::isdigit(static_cast<unsigned char>(name[0]))) {
      return false;
    }
    if (!all_of(name, [](char c) { return is_alnum(c) || c == '_'; })) {
      return false;
    }

    std::string lower{name};
    std::transform(lower.begin(), lower.end(), lower.begin(), [](unsigned char c) {
      return std::tolower(c);
    });
    return std::find(PYTHON_KEYWORDS.begin(), PYTHON_KEYWORDS.end(), lower) ==
           PYTHON_KEYWORDS.end();
  }

  bool valid_owner(std::string_view owner)
  {
    return !owner.empty() && owner.size() <= MAX_NAME_LENGTH &&
           all_of(owner, [](char c) { return is_alnum(c) || c == '_' || c == '-'; });
  }

  bool valid_repo(std::string_view repo)
  {
    return !repo.empty() && repo.size() <= MAX_NAME_LENGTH &&
           all_of(repo, [](char c) { return is_alnum(c) || c == '_' || c == '-' || c == '.'; });
  }

  bool reserved_env_name(std::string_view name)
  {
    return name.starts_with("LD_") || name.starts_with("PYTHON");
  }

  bool valid_env_name(std::string_view name)
  {
    if (name.empty() || name.size() > MAX_NAME_LENGTH || reserved_env_name(name)) {
      return false;
    }
    if (std::isdigit(static_cast<unsigned char>(name[0]))) {
      return false;
    }
    return all_of(name, [](char c) {
      return (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') || c == '_';
    });
  }

  bool valid_env_value(std::string_view value)
  {
    return value.size() <= MAX_ENV_VALUE_LENGTH && value.find('\0') == std::string_view::npos;
  }

  std::optional<std::string> parse_deploy(const Json::Value& body, DeployRequest& request)
  {
    if (!body.isObject()) {
      return "request body must be a JSON object";
    }

    if (!body["code"].isString()) {
      return "code is required and must be a string";
    }

    if (!body["function_name"].isString()) {
      return "function_name is required and must be a string";
    }
    std::string function_name = body["function_name"].asString();
    if (!valid_function_name(function_name)) {
      return fmt::format(
          "invalid function name '{}', it must be a Python identifier of at most {} "
          "characters and not a keyword",
          function_name, MAX_NAME_LENGTH
      );
    }

    const Json::Value& owner = body["owner"];
    const Json::Value& repo = body["repo"];
    bool has_owner = !owner.isNull();
    bool has_repo = !repo.isNull();
    if (has_owner != has_repo) {
      return "owner and repo must be given together";
    }

    DeployRequest result;
    if (has_owner) {
      if (!owner.isString() || !valid_owner(owner.asString())) {
        return "invalid owner, allowed are letters, digits, '_' and '-'";
      }
      if (!repo.isString() || !valid_repo(repo.asString())) {
        return "invalid repo, allowed are letters, digits, '_', '-' and '.'";
      }
      result.key = DeploymentKey::namespaced(owner.asString(), repo.asString(), function_name);
    } else {
      result.key = DeploymentKey::bare(function_name);
    }

    const Json::Value& env_vars = body["env_vars"];
    if (!env_vars.isNull()) {

      if (!env_vars.isObject()) {
        return "env_vars must be a JSON object";
      }
      if (env_vars.size() > MAX_ENV_VARS) {
        return fmt::format("too many environment variables, at most {} are allowed", MAX_ENV_VARS);
      }

      for (const std::string& name : env_vars.getMemberNames()) {
        if (reserved_env_name(name)) {
          return fmt::format(
              "environment variable '{}' is reserved, names starting with LD_ or PYTHON are "
              "not allowed",
              name
          );
        }
        if (!valid_env_name(name)) {
          return fmt::format(
              "invalid environment variable name '{}', allowed are uppercase letters, digits "
              "and underscores",
              name
          );
        }

        std::string value;
        if (auto err = read_env_value(env_vars[name], value); err.has_value()) {
          return err;
        }
        if (!valid_env_value(value)) {
          return fmt::format(
              "invalid value of environment variable {}, it is longer than {} characters or "
              "contains a NUL byte",
              name, MAX_ENV_VALUE_LENGTH
          );
        }
        result.env.emplace(name, std::move(value));
      }
    }

    result.code = body["code"].asString();
    request = std::move(result);
    return std::nullopt;
  }

} // namespace fnrun::server::validation

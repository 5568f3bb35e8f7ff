#ifndef FNRUN_SANDBOX_RESULT_HPP
#define FNRUN_SANDBOX_RESULT_HPP

#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include <json/value.h>

namespace fnrun::sandbox {

  enum class ErrorKind {
    NOT_FOUND = 0,
    INVALID_ARGUMENTS,
    EXECUTION_ERROR,
    RESOURCE_EXCEEDED,
    SERIALIZATION_ERROR,
    INTERNAL_ERROR
  };

  std::string_view kind_to_string(ErrorKind kind);

  // Unknown names map to INTERNAL_ERROR.
  ErrorKind string_to_kind(std::string_view kind);

  struct Success {
    Json::Value value;
  };

  struct Failure {
    ErrorKind kind;
    std::string message;

    // Callable top-level names; filled only when the entry point was not found.
    std::vector<std::string> available{};

    static Failure not_found(std::string message)
    {
      return Failure{ErrorKind::NOT_FOUND, std::move(message)};
    }

    static Failure invalid_arguments(std::string message)
    {
      return Failure{ErrorKind::INVALID_ARGUMENTS, std::move(message)};
    }

    static Failure execution_error(std::string message)
    {
      return Failure{ErrorKind::EXECUTION_ERROR, std::move(message)};
    }

    static Failure resource_exceeded(std::string message)
    {
      return Failure{ErrorKind::RESOURCE_EXCEEDED, std::move(message)};
    }

    static Failure serialization_error(std::string message)
    {
      return Failure{ErrorKind::SERIALIZATION_ERROR, std::move(message)};
    }

    static Failure internal_error(std::string message)
    {
      return Failure{ErrorKind::INTERNAL_ERROR, std::move(message)};
    }
  };

  using InvocationResult = std::variant<Success, Failure>;

  inline bool succeeded(const InvocationResult& result)
  {
    return std::holds_alternative<Success>(result);
  }

  std::string format_available(const std::vector<std::string>& names);

} // namespace fnrun::sandbox

#endif

#include <fnrun/sandbox/result.hpp>

#include <fmt/format.h>
#include <fmt/ranges.h>

namespace fnrun::sandbox {

  std::string_view kind_to_string(ErrorKind kind)
  {
    switch (kind) {
    case ErrorKind::NOT_FOUND:
      return "NotFound";
    case ErrorKind::INVALID_ARGUMENTS:
      return "InvalidArguments";
    case ErrorKind::EXECUTION_ERROR:
      return "ExecutionError";
    case ErrorKind::RESOURCE_EXCEEDED:
      return "ResourceExceeded";
    case ErrorKind::SERIALIZATION_ERROR:
      return "SerializationError";
    case ErrorKind::INTERNAL_ERROR:
      return "InternalError";
    }
    return "InternalError";
  }

  ErrorKind string_to_kind(std::string_view kind)
  {
    if (kind == "NotFound") {
      return ErrorKind::NOT_FOUND;
    }
    if (kind == "InvalidArguments") {
      return ErrorKind::INVALID_ARGUMENTS;
    }
    if (kind == "ExecutionError") {
      return ErrorKind::EXECUTION_ERROR;
    }
    if (kind == "ResourceExceeded") {
      return ErrorKind::RESOURCE_EXCEEDED;
    }
    if (kind == "SerializationError") {
      return ErrorKind::SERIALIZATION_ERROR;
    }
    return ErrorKind::INTERNAL_ERROR;
  }

  std::string format_available(const std::vector<std::string>& names)
  {
    return fmt::format("[{}]", fmt::join(names, ", "));
  }

} // namespace fnrun::sandbox

#ifndef FNRUN_SANDBOX_INTERNAL_CONVERSION_HPP
#define FNRUN_SANDBOX_INTERNAL_CONVERSION_HPP

#include <fnrun/common/exceptions.hpp>

#include <json/value.h>
#include <pybind11/pytypes.h>

namespace fnrun::sandbox::internal {

  // Value that has no exact JSON representation.
  struct ConversionError : common::FnRunException {

    ConversionError(const std::string& msg) : common::FnRunException(msg) {}
  };

  // Deeper values are rejected; this also catches self-referencing containers.
  static constexpr int MAX_NESTING_DEPTH = 100;

  pybind11::object to_python(const Json::Value& value);

  ////////////////////////////////////////////////////////////////////////////////
  /// @brief Strict conversion of a returned Python value to JSON.
  ///
  /// Accepts None, bool, int within 64 bits, finite float, str, list, tuple
  /// and dict with str keys. Nothing is coerced: sets, NaN, other key types
  /// and arbitrary objects raise ConversionError.
  ///
  /// Must be called with the GIL held.
  ////////////////////////////////////////////////////////////////////////////////
  Json::Value to_json(pybind11::handle obj, int depth = 0);

} // namespace fnrun::sandbox::internal

#endif

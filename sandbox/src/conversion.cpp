#include <fnrun/sandbox/internal/conversion.hpp>

#include <cmath>
#include <cstdint>

#include <fmt/format.h>
#include <pybind11/pybind11.h>

namespace py = pybind11;

namespace fnrun::sandbox::internal {

  namespace {

    std::string type_name(py::handle obj)
    {
      return Py_TYPE(obj.ptr())->tp_name;
    }

    // Lone surrogates have no UTF-8 encoding.
    std::string utf8(py::handle obj, const char* what)
    {
      try {
        return obj.cast<std::string>();
      } catch (py::cast_error&) {
        throw ConversionError{fmt::format("{} is not encodable as UTF-8", what)};
      }
    }

  } // namespace

  py::object to_python(const Json::Value& value)
  {
    switch (value.type()) {
    case Json::nullValue:
      return py::none();
    case Json::intValue:
      return py::int_(value.asInt64());
    case Json::uintValue:
      return py::int_(value.asUInt64());
    case Json::realValue:
      return py::float_(value.asDouble());
    case Json::stringValue:
      return py::str(value.asString());
    case Json::booleanValue:
      return py::bool_(value.asBool());
    case Json::arrayValue: {
      py::list list;
      for (const Json::Value& item : value) {
        list.append(to_python(item));
      }
      return std::move(list);
    }
    case Json::objectValue: {
      py::dict dict;
      for (const std::string& name : value.getMemberNames()) {
        dict[py::str(name)] = to_python(value[name]);
      }
      return std::move(dict);
    }
    }

    throw ConversionError{fmt::format("Unknown JSON value type {}", static_cast<int>(value.type()))};
  }

  Json::Value to_json(py::handle obj, int depth)
  {
    if (depth > MAX_NESTING_DEPTH) {
      throw ConversionError{fmt::format(
          "value is nested deeper than {} levels or contains a cycle", MAX_NESTING_DEPTH
      )};
    }

    if (obj.is_none()) {
      return Json::Value{Json::nullValue};
    }

    // bool is a subclass of int.
    if (py::isinstance<py::bool_>(obj)) {
      return Json::Value{obj.cast<bool>()};
    }

    if (py::isinstance<py::int_>(obj)) {
      try {
        return Json::Value{static_cast<Json::Int64>(obj.cast<int64_t>())};
      } catch (py::cast_error&) {
      }
      try {
        return Json::Value{static_cast<Json::UInt64>(obj.cast<uint64_t>())};
      } catch (py::cast_error&) {
        throw ConversionError{"integer does not fit in 64 bits"};
      }
    }

    if (py::isinstance<py::float_>(obj)) {
      double value = obj.cast<double>();
      if (!std::isfinite(value)) {
        throw ConversionError{fmt::format("float value {} is not allowed in JSON", value)};
      }
      return Json::Value{value};
    }

    if (py::isinstance<py::str>(obj)) {
      return Json::Value{utf8(obj, "string")};
    }

    if (py::isinstance<py::list>(obj) || py::isinstance<py::tuple>(obj)) {
      Json::Value array{Json::arrayValue};
      for (py::handle item : obj) {
        array.append(to_json(item, depth + 1));
      }
      return array;
    }

    if (py::isinstance<py::dict>(obj)) {
      Json::Value object{Json::objectValue};
      for (auto [key, item] : obj.cast<py::dict>()) {
        if (!py::isinstance<py::str>(key)) {
          throw ConversionError{
              fmt::format("dictionary key of type {} is not a string", type_name(key))};
        }
        object[utf8(key, "dictionary key")] = to_json(item, depth + 1);
      }
      return object;
    }

    throw ConversionError{fmt::format("value of type {} is not JSON serializable", type_name(obj))};
  }

} // namespace fnrun::sandbox::internal

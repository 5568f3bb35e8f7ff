#include <fnrun/sandbox/environment.hpp>

#include <fnrun/common/exceptions.hpp>

#include <fmt/format.h>

namespace fnrun::sandbox {

  Environment::Block::Block(const values_t& values)
  {
    _storage.reserve(values.size());
    for (const auto& [name, value] : values) {
      _storage.emplace_back(fmt::format("{}={}", name, value));
    }

    // Pointers are taken only after all strings are in place.
    _pointers.reserve(_storage.size() + 1);
    for (std::string& entry : _storage) {
      _pointers.push_back(entry.data());
    }
    _pointers.push_back(nullptr);
  }

  Environment Environment::from_entries(const std::vector<std::string>& entries)
  {
    Environment env;
    for (const std::string& entry : entries) {

      auto pos = entry.find('=');
      if (pos == std::string::npos) {
        throw common::InvalidConfigurationError(
            fmt::format("Environment entry {} is not in the NAME=value form", entry)
        );
      }

      env.set(entry.substr(0, pos), entry.substr(pos + 1));
    }
    return env;
  }

  void Environment::set(const std::string& name, const std::string& value)
  {
    if (!valid_name(name)) {
      throw common::InvalidArgument(fmt::format("Invalid environment variable name '{}'", name));
    }
    if (!valid_value(value)) {
      throw common::InvalidArgument(
          fmt::format("Value of environment variable {} contains a NUL byte", name)
      );
    }

    _values[name] = value;
  }

  void Environment::overlay(const values_t& values)
  {
    for (const auto& [name, value] : values) {
      set(name, value);
    }
  }

  std::optional<std::string> Environment::get(const std::string& name) const
  {
    auto it = _values.find(name);
    if (it == _values.end()) {
      return std::nullopt;
    }
    return it->second;
  }

  bool Environment::valid_name(std::string_view name)
  {
    return !name.empty() && name.find('=') == std::string_view::npos &&
           name.find('\0') == std::string_view::npos;
  }

  bool Environment::valid_value(std::string_view value)
  {
    return value.find('\0') == std::string_view::npos;
  }

} // namespace fnrun::sandbox

#ifndef FNRUN_COMMON_UTIL_HPP
#define FNRUN_COMMON_UTIL_HPP

#include <fnrun/common/exceptions.hpp>

#include <cerrno>
#include <cstring>
#include <memory>
#include <string_view>

#include <cereal/archives/json.hpp>
#include <spdlog/spdlog.h>

namespace fnrun::common::util {

  void traceback();

  std::shared_ptr<spdlog::logger> create_logger(std::string_view name);

  template <typename U>
  bool expect_zero(U&& u)
  {
    if (u) {
      spdlog::error("Expected zero, found: {}, errno {}, message {}", u, errno, strerror(errno));
      traceback();
      return false;
    }
    return true;
  }

  template <typename T>
  void cereal_load_optional(cereal::JSONInputArchive& archive, const std::string& name, T& obj)
  {

    // Unfortunately, Cereal does not allow to skip non-existing objects easily.
    // There is also no separate exception type for this.
    try {
      archive(cereal::make_nvp(name, obj));
    } catch (cereal::Exception& exc) {

      // Catch non existing object
      if (std::string_view{exc.what()}.find(fmt::format("({}) not found", name)) !=
          std::string::npos) {

        archive.setNextName(nullptr);
        obj.set_defaults();

      } else {
        throw common::InvalidConfigurationError(
            fmt::format("Could not parse configuration of {}, reason: {}", name, exc.what())
        );
      }
    }
  }

  // Same as above, for plain values that keep their current value when missing.
  template <typename T>
  void cereal_load_value(cereal::JSONInputArchive& archive, const std::string& name, T& obj)
  {
    try {
      archive(cereal::make_nvp(name, obj));
    } catch (cereal::Exception& exc) {

      if (std::string_view{exc.what()}.find(fmt::format("({}) not found", name)) !=
          std::string::npos) {
        archive.setNextName(nullptr);
      } else {
        throw common::InvalidConfigurationError(
            fmt::format("Could not parse configuration value {}, reason: {}", name, exc.what())
        );
      }
    }
  }

} // namespace fnrun::common::util

#endif

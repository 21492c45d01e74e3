#ifndef FNEXEC_COMMON_UTIL_HPP
#define FNEXEC_COMMON_UTIL_HPP

#include <fnexec/common/exceptions.hpp>

#include <cerrno>
#include <cstring>
#include <memory>
#include <string>
#include <string_view>

#include <execinfo.h>

#include <cereal/archives/json.hpp>
#include <spdlog/spdlog.h>

namespace fnexec::common::util {

  // Visitor built from a set of lambdas, for std::visit over the engine's variants.
  template <class... Ts>
  struct overloaded : Ts... {
    using Ts::operator()...;
  };
  template <class... Ts>
  overloaded(Ts...) -> overloaded<Ts...>;

  std::shared_ptr<spdlog::logger> create_logger(std::string_view name);

  void traceback();

  template <typename U>
  bool expect_other(U&& u, int val)
  {
    if (u == val) {
      spdlog::error(
          "Expected value other than {}, found: {}, errno {}, message {}", val, u, errno,
          strerror(errno)
      );
      traceback();
      return false;
    }
    return true;
  }

  // Cereal has no separate exception type for a missing field, so we match on the message.
  inline bool cereal_missing_field(const cereal::Exception& exc, const std::string& name)
  {
    return std::string_view{exc.what()}.find(fmt::format("({}) not found", name)) !=
           std::string::npos;
  }

  // Load a nested object; a missing object keeps its defaults.
  template <typename T>
  void cereal_load_optional(cereal::JSONInputArchive& archive, const std::string& name, T& obj)
  {
    try {
      archive(cereal::make_nvp(name, obj));
    } catch (cereal::Exception& exc) {

      if (cereal_missing_field(exc, name)) {
        archive.setNextName(nullptr);
        obj.set_defaults();
      } else {
        throw common::InvalidConfigurationError(
            fmt::format("Could not parse configuration of {}, reason: {}", name, exc.what())
        );
      }
    }
  }

  // Load a single field; a missing field leaves the current value untouched.
  template <typename T>
  bool cereal_load_optional_value(cereal::JSONInputArchive& archive, const std::string& name, T& val)
  {
    try {
      archive(cereal::make_nvp(name, val));
      return true;
    } catch (cereal::Exception& exc) {

      if (cereal_missing_field(exc, name)) {
        archive.setNextName(nullptr);
        return false;
      }
      throw common::InvalidConfigurationError(
          fmt::format("Could not parse configuration field {}, reason: {}", name, exc.what())
      );
    }
  }

} // namespace fnexec::common::util

#endif

#ifndef FAASBOX_COMMON_UTIL_HPP
#define FAASBOX_COMMON_UTIL_HPP

#include <faasbox/common/exceptions.hpp>

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include <cereal/archives/json.hpp>
#include <spdlog/spdlog.h>

namespace faasbox::common::util {

  std::shared_ptr<spdlog::logger> create_logger(std::string_view name);

  // Deadlines are added to steady_clock time points; longer values are rejected.
  constexpr std::chrono::milliseconds MAX_DURATION = std::chrono::hours{24 * 365 * 10};

  ////////////////////////////////////////////////////////////////////////////////
  /// @brief Parses a duration written as an integer followed by a unit:
  /// "ms", "s", "m" or "h". A bare integer is interpreted as seconds.
  ///
  /// @param[in] value textual duration, e.g. "120s", "2m", "500ms"
  /// @return parsed duration; empty optional if the value is malformed or
  /// exceeds MAX_DURATION
  ////////////////////////////////////////////////////////////////////////////////
  std::optional<std::chrono::milliseconds> parse_duration(std::string_view value);

  std::string format_duration(std::chrono::milliseconds value);

  // Current wall-clock time in seconds since the UNIX epoch.
  long unix_timestamp();

  // RFC3339 representation of the current time in UTC.
  std::string rfc3339_now();

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

} // namespace faasbox::common::util

#endif

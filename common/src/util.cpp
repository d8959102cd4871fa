#include <faasbox/common/util.hpp>

#include <charconv>
#include <ctime>

#include <spdlog/sinks/stdout_color_sinks.h>

namespace faasbox::common::util {

  std::shared_ptr<spdlog::logger> create_logger(std::string_view name)
  {
    auto sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    auto logger = std::make_shared<spdlog::logger>(std::string{name}, sink);
    logger->set_pattern("[%H:%M:%S:%f] [%n] [P %P] [T %t] [%l] %v ");
    logger->set_level(spdlog::get_level());
    return logger;
  }

  std::optional<std::chrono::milliseconds> parse_duration(std::string_view value)
  {
    long long count = 0;
    auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), count);
    if (ec != std::errc{} || ptr == value.data() || count < 0) {
      return std::nullopt;
    }

    std::string_view unit{ptr, static_cast<size_t>(value.data() + value.size() - ptr)};
    long long factor = 0;
    if (unit.empty() || unit == "s") {
      factor = 1000;
    } else if (unit == "ms") {
      factor = 1;
    } else if (unit == "m") {
      factor = 60 * 1000;
    } else if (unit == "h") {
      factor = 60 * 60 * 1000;
    } else {
      return std::nullopt;
    }

    if (count > MAX_DURATION.count() / factor) {
      return std::nullopt;
    }
    return std::chrono::milliseconds{count * factor};
  }

  std::string format_duration(std::chrono::milliseconds value)
  {
    if (value.count() % 1000 == 0) {
      return fmt::format("{}s", value.count() / 1000);
    }
    return fmt::format("{}ms", value.count());
  }

  long unix_timestamp()
  {
    return std::chrono::duration_cast<std::chrono::seconds>(
               std::chrono::system_clock::now().time_since_epoch()
    )
        .count();
  }

  std::string rfc3339_now()
  {
    std::time_t now = std::time(nullptr);
    std::tm utc{};
    gmtime_r(&now, &utc);

    char buffer[32];
    std::strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%SZ", &utc);
    return buffer;
  }

} // namespace faasbox::common::util

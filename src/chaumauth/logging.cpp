#include "chaumauth/logging.hpp"

#include <format>  // for format

#include <spdlog/sinks/stdout_color_sinks.h>  // for stdout_color_mt
#include <spdlog/spdlog.h>                    // for get, set_level

#include <array>  // for array
#include <mutex>  // for mutex, scoped_lock

namespace chaumauth::logging {

namespace {

std::string_view constexpr log_pattern = "%Y-%m-%dT%H:%M:%S.%e|%^%-5l%$|%n|%t|%v";

// spdlog::get followed by a create is not atomic.
std::mutex logger_creation_mutex;

}  // namespace

[[nodiscard]]
auto get_logger(std::string const &name) -> Logger {
  std::scoped_lock const lock{logger_creation_mutex};
  Logger logger = spdlog::get(name);
  if (logger == nullptr) {
    logger = spdlog::stdout_color_mt(name);
    logger->set_pattern(std::string{log_pattern});
  }
  return logger;
}

[[nodiscard]]
auto set_log_level(std::string_view const level) noexcept
    -> std::expected<void, std::string> {
  static std::array<std::string_view, 7> constexpr known_levels{
      "trace", "debug", "info", "warn", "error", "critical", "off"};

  bool known = false;
  for (auto const candidate : known_levels) {
    known = known or candidate == level;
  }
  if (not known) {
    return std::unexpected(
        std::format("({}): (unknown log level \"{}\")", __FUNCTION__, level));
  }
  spdlog::set_level(spdlog::level::from_str(std::string{level}));
  return {};
}

}  // namespace chaumauth::logging

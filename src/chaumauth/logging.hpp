#pragma once

#ifndef CHAUMAUTH_LOGGING_HPP
#define CHAUMAUTH_LOGGING_HPP

#include <expected>     // for expected
#include <memory>       // for shared_ptr
#include <string>       // for string
#include <string_view>  // for string_view

#include <spdlog/logger.h>  // for logger

namespace chaumauth::logging {

using Logger = std::shared_ptr<spdlog::logger>;

// Named stdout logger, created on first use. Safe to call from any thread.
[[nodiscard]]
auto get_logger(std::string const &name) -> Logger;

// trace, debug, info, warn, error, critical or off. Applies to every logger,
// existing and future.
[[nodiscard]]
auto set_log_level(std::string_view level) noexcept
    -> std::expected<void, std::string>;

}  // namespace chaumauth::logging

#endif /* CHAUMAUTH_LOGGING_HPP */

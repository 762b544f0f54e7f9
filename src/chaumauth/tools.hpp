#pragma once

#ifndef CHAUMAUTH_TOOLS_HPP
#define CHAUMAUTH_TOOLS_HPP

#include <cstddef>      // for size_t
#include <expected>     // for expected
#include <string>       // for string
#include <string_view>  // for string_view

namespace chaumauth {

// Alphanumeric string drawn from the OpenSSL CSPRNG. Used for attempt tokens
// and session credentials.
[[nodiscard("Must use generate_random_string return value")]]
auto generate_random_string(std::size_t length) noexcept
    -> std::expected<std::string, std::string>;

// First characters of a token followed by an ellipsis, for log lines.
// Control characters are escaped.
[[nodiscard]]
auto abbreviate(std::string const &token, std::size_t keep = 4) noexcept
    -> std::string;

// Caller-supplied text quoted for a log line: quotes and backslashes are
// escaped, control bytes become \xNN, so one value never spans two lines.
[[nodiscard]]
auto printable(std::string_view text) -> std::string;

}  // namespace chaumauth
#endif /* CHAUMAUTH_TOOLS_HPP */

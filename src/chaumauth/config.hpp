#pragma once

#ifndef CHAUMAUTH_CONFIG_HPP
#define CHAUMAUTH_CONFIG_HPP

#include <chrono>    // for seconds, milliseconds
#include <cstddef>   // for size_t
#include <expected>  // for expected
#include <optional>  // for optional
#include <string>    // for string

namespace chaumauth {

struct ServiceConfig {
  std::string group_name{"toy"};
  std::chrono::seconds challenge_ttl{300};
  std::chrono::seconds session_ttl{3600};
  std::chrono::milliseconds reap_interval{1000};
  std::size_t provers{4};
  std::string log_level{"info"};
  // when set, exchanged messages are dumped as JSON using this schema
  std::optional<std::string> schema_file;
  // filled when --help was given; the caller prints it and exits
  std::optional<std::string> usage;
};

// Command line first, then the optional --config file for whatever the
// command line left unset.
[[nodiscard]]
auto parse_service_config(int argc, char const *const *argv)
    -> std::expected<ServiceConfig, std::string>;

}  // namespace chaumauth

#endif /* CHAUMAUTH_CONFIG_HPP */

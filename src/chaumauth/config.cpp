#include "chaumauth/config.hpp"

#include <boost/program_options/errors.hpp>             // for error
#include <boost/program_options/options_description.hpp>  // for options_description
#include <boost/program_options/parsers.hpp>            // for parse_command_line
#include <boost/program_options/value_semantic.hpp>     // for value
#include <boost/program_options/variables_map.hpp>      // for variables_map

#include <format>   // for format
#include <fstream>  // for ifstream
#include <sstream>  // for ostringstream
#include <string>   // for to_string

#include "chaumauth/challenge_store.hpp"   // for max_expiry_delay
#include "chaumauth/group_parameters.hpp"  // for toy_group_name

namespace po = boost::program_options;

namespace chaumauth {

namespace {

// Notifier rejecting delays outside [1, max_expiry_delay] seconds.
[[nodiscard]]
auto expiry_delay_check(char const *const option_name) {
  return [option_name](std::size_t const seconds) {
    if (seconds == 0 or
        seconds > static_cast<std::size_t>(max_expiry_delay.count())) {
      throw po::validation_error{po::validation_error::invalid_option_value,
                                 option_name, std::to_string(seconds)};
    }
  };
}

[[nodiscard]]
auto describe_options() -> po::options_description {
  auto desc = po::options_description("Allowed options");
  // clang-format off
  desc.add_options()
    ("help,h", "Print this help message")
    ("config",
     po::value<std::string>(),
     "INI file holding any of the options below; the command line wins")
    ("group",
     po::value<std::string>()->default_value(std::string{toy_group_name}),
     "Group parameters: toy or rfc5114-1024-160")
    ("challenge-ttl",
     po::value<std::size_t>()->default_value(300)->notifier(
         expiry_delay_check("challenge-ttl")),
     "Seconds an unanswered challenge stays valid, at most 30 days")
    ("session-ttl",
     po::value<std::size_t>()->default_value(3600)->notifier(
         expiry_delay_check("session-ttl")),
     "Seconds a session credential stays valid, at most 30 days")
    ("reap-interval",
     po::value<std::size_t>()->default_value(1000)->notifier([](std::size_t v) {
       auto constexpr max_interval =
           std::chrono::milliseconds{max_expiry_delay}.count();
       if (v == 0 or v > static_cast<std::size_t>(max_interval)) {
         throw po::validation_error{po::validation_error::invalid_option_value,
                                    "reap-interval", std::to_string(v)};
       }
     }),
     "Milliseconds between two purges of expired challenges and sessions")
    ("provers",
     po::value<std::size_t>()->default_value(4),
     "Number of concurrent demo provers")
    ("log-level",
     po::value<std::string>()->default_value("info"),
     "trace, debug, info, warn, error, critical or off")
    ("schema",
     po::value<std::string>(),
     "Path of auth_messages.fbs; exchanged messages are then logged as JSON");
  // clang-format on
  return desc;
}

}  // namespace

[[nodiscard]]
auto parse_service_config(int const argc, char const *const *const argv)
    -> std::expected<ServiceConfig, std::string> {
  auto const desc = describe_options();
  auto options = po::variables_map{};

  try {
    po::store(po::parse_command_line(argc, argv, desc), options);

    if (options.contains("config")) {
      auto const &path = options["config"].as<std::string>();
      std::ifstream config_file{path};
      if (not config_file) {
        return std::unexpected(
            std::format("cannot open configuration file {}", path));
      }
      // values already stored from the command line are kept
      po::store(po::parse_config_file(config_file, desc), options);
    }
    po::notify(options);
  } catch (po::error const &e) {
    return std::unexpected(std::string{e.what()});
  }

  ServiceConfig config;
  if (options.contains("help")) {
    std::ostringstream usage;
    usage << desc;
    config.usage = usage.str();
    return config;
  }

  config.group_name = options["group"].as<std::string>();
  // both bounded by max_expiry_delay in their notifiers
  config.challenge_ttl = std::chrono::seconds{
      static_cast<std::chrono::seconds::rep>(
          options["challenge-ttl"].as<std::size_t>())};
  config.session_ttl = std::chrono::seconds{
      static_cast<std::chrono::seconds::rep>(
          options["session-ttl"].as<std::size_t>())};
  config.reap_interval = std::chrono::milliseconds{
      static_cast<std::chrono::milliseconds::rep>(
          options["reap-interval"].as<std::size_t>())};
  config.provers = options["provers"].as<std::size_t>();
  config.log_level = options["log-level"].as<std::string>();
  if (options.contains("schema")) {
    config.schema_file = options["schema"].as<std::string>();
  }

  if (config.group_name not_eq toy_group_name and
      config.group_name not_eq rfc5114_group_name) {
    return std::unexpected(std::format("unknown group \"{}\"", config.group_name));
  }
  if (config.provers == 0) {
    return std::unexpected(std::string{"--provers must be at least 1"});
  }
  return config;
}

}  // namespace chaumauth

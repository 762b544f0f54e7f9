#pragma once

#ifndef CHAUMAUTH_ERRORS_HPP
#define CHAUMAUTH_ERRORS_HPP

#include <cstdint>      // for uint8_t
#include <string>       // for string
#include <string_view>  // for string_view

namespace chaumauth {

enum class ErrorKind : uint8_t {
  // unknown identity, unknown / consumed / expired attempt token
  NotFound,
  // malformed or out of range encodings
  InvalidArgument,
  // the verification predicate evaluated to false
  InvalidProof,
  // consistency violation or cryptographic backend failure
  Internal,
};

struct AuthError {
  ErrorKind kind;
  std::string message;
};

[[nodiscard]]
auto to_string(ErrorKind kind) noexcept -> std::string_view;

// Canonical gRPC status code name and number for the transport that embeds
// the service.
[[nodiscard]]
auto grpc_status_name(ErrorKind kind) noexcept -> std::string_view;

[[nodiscard]]
auto grpc_status_code(ErrorKind kind) noexcept -> int;

}  // namespace chaumauth

#endif /* CHAUMAUTH_ERRORS_HPP */

#include "chaumauth/auth_service.hpp"

#include <format>       // for format
#include <string>       // for string
#include <string_view>  // for string_view
#include <utility>      // for move

#include "chaumauth/macro_tools.hpp"                // for AUTH_ASSIGN_OR_UNEXPECTED
#include "chaumauth/tools.hpp"                      // for printable
#include "chaumauth/wire_messages.hpp"              // for flatbuffer_to_struct
#include "flatbuffers/auth_messages_generated.h"  // for RegisterRequest...

namespace chaumauth {

namespace {

[[nodiscard]]
auto bytes_of(flatbuffers::Vector<uint8_t> const *const vector) noexcept
    -> std::span<uint8_t const> {
  return {vector->data(), vector->size()};
}

[[nodiscard]]
auto log_failure(logging::Logger const &logger, std::string_view const call,
                 AuthError error) -> AuthError {
  logger->debug("{} failed with {}: {}", call, grpc_status_name(error.kind),
                printable(error.message));
  return error;
}

}  // namespace

AuthService::AuthService(AuthCoordinator &coordinator)
    : _coordinator(coordinator),
      _logger(logging::get_logger("chaumauth.service")) {}

[[nodiscard]]
auto AuthService::handle_register(std::span<uint8_t const> const request)
    -> std::expected<std::vector<uint8_t>, AuthError> {
  AUTH_ASSIGN_OR_UNEXPECTED(
      auto const *const message,
      flatbuffer_to_struct<wire::RegisterRequest>(request),
      ErrorKind::InvalidArgument)

  auto registered = _coordinator.register_user(
      message->user()->str(), bytes_of(message->y1()), bytes_of(message->y2()));
  if (not registered.has_value()) {
    return std::unexpected(
        log_failure(_logger, "Register", std::move(registered.error())));
  }
  return flatbuffer_bytes(flatbuffer_build_register_response());
}

[[nodiscard]]
auto AuthService::handle_create_challenge(std::span<uint8_t const> const request)
    -> std::expected<std::vector<uint8_t>, AuthError> {
  AUTH_ASSIGN_OR_UNEXPECTED(
      auto const *const message,
      flatbuffer_to_struct<wire::ChallengeRequest>(request),
      ErrorKind::InvalidArgument)

  auto issued = _coordinator.create_challenge(
      message->user()->str(), bytes_of(message->r1()), bytes_of(message->r2()));
  if (not issued.has_value()) {
    return std::unexpected(
        log_failure(_logger, "CreateChallenge", std::move(issued.error())));
  }
  return flatbuffer_bytes(
      flatbuffer_build_challenge_response(issued->auth_id, issued->challenge));
}

[[nodiscard]]
auto AuthService::handle_verify_answer(std::span<uint8_t const> const request)
    -> std::expected<std::vector<uint8_t>, AuthError> {
  AUTH_ASSIGN_OR_UNEXPECTED(
      auto const *const message,
      flatbuffer_to_struct<wire::AnswerRequest>(request),
      ErrorKind::InvalidArgument)

  auto session_id = _coordinator.verify_answer(message->auth_id()->str(),
                                               bytes_of(message->s()));
  if (not session_id.has_value()) {
    return std::unexpected(
        log_failure(_logger, "VerifyAnswer", std::move(session_id.error())));
  }
  return flatbuffer_bytes(flatbuffer_build_answer_response(session_id.value()));
}

}  // namespace chaumauth

#pragma once

#ifndef CHAUMAUTH_AUTH_SERVICE_HPP
#define CHAUMAUTH_AUTH_SERVICE_HPP

#include <cstdint>   // for uint8_t
#include <expected>  // for expected
#include <span>      // for span
#include <vector>    // for vector

#include "chaumauth/auth_coordinator.hpp"  // for AuthCoordinator
#include "chaumauth/errors.hpp"            // for AuthError
#include "chaumauth/logging.hpp"           // for Logger

namespace chaumauth {

/*
 * Byte level surface of the three protocol calls. Each handler takes a
 * serialized request table (see flatb/auth_messages.fbs) and answers with a
 * serialized response table, or with an AuthError whose kind maps onto a
 * gRPC status through grpc_status_code().
 *
 *   Register         RegisterRequest   -> RegisterResponse
 *   CreateChallenge  ChallengeRequest  -> ChallengeResponse
 *   VerifyAnswer     AnswerRequest     -> AnswerResponse
 *
 * A buffer that fails flatbuffers verification is InvalidArgument.
 */
class AuthService {
 public:
  explicit AuthService(AuthCoordinator &coordinator);

  [[nodiscard]]
  auto handle_register(std::span<uint8_t const> request)
      -> std::expected<std::vector<uint8_t>, AuthError>;

  [[nodiscard]]
  auto handle_create_challenge(std::span<uint8_t const> request)
      -> std::expected<std::vector<uint8_t>, AuthError>;

  [[nodiscard]]
  auto handle_verify_answer(std::span<uint8_t const> request)
      -> std::expected<std::vector<uint8_t>, AuthError>;

 private:
  AuthCoordinator &_coordinator;
  logging::Logger _logger;
};

}  // namespace chaumauth

#endif /* CHAUMAUTH_AUTH_SERVICE_HPP */

#include <print>  // for println

#include <atomic>     // for atomic
#include <cstddef>    // for size_t
#include <cstdint>    // for uint8_t
#include <cstdio>     // for stderr
#include <cstdlib>    // for EXIT_FAILURE, EXIT_SUCCESS
#include <exception>  // for exception
#include <expected>   // for expected
#include <format>     // for format
#include <optional>   // for optional
#include <span>       // for span
#include <string>     // for string
#include <string_view>  // for string_view
#include <thread>     // for jthread
#include <utility>    // for move
#include <vector>     // for vector

#include <openssl/bn.h>    // for BN_add_word, BN_nnmod
#include <spdlog/common.h>  // for level

#include "chaumauth/auth_coordinator.hpp"           // for AuthCoordinator
#include "chaumauth/auth_service.hpp"               // for AuthService
#include "chaumauth/config.hpp"                     // for parse_service_config
#include "chaumauth/crypto_tools.hpp"               // for BN_unique_ptr
#include "chaumauth/encoding.hpp"                   // for BIGNUM_to_bytes, BIGNUM_to_hex
#include "chaumauth/errors.hpp"                     // for ErrorKind
#include "chaumauth/group_parameters.hpp"           // for group_parameters_by_name
#include "chaumauth/logging.hpp"                    // for get_logger
#include "chaumauth/macro_tools.hpp"                // for ASSIGN_OR_UNEXPECTED
#include "chaumauth/periodic_task.hpp"              // for PeriodicTask
#include "chaumauth/tools.hpp"                      // for generate_random_string
#include "chaumauth/wire_messages.hpp"              // for flatbuffer_build_...
#include "chaumauth/zkp_engine.hpp"                 // for ZkpEngine
#include "flatbuffers/auth_messages_generated.h"  // for ChallengeResponse

namespace {

using chaumauth::AuthError;
using chaumauth::AuthService;
using chaumauth::BN_CTX_unique_ptr;
using chaumauth::BN_unique_ptr;
using chaumauth::ErrorKind;
using chaumauth::ZkpEngine;

// Prover side of one demo user: knows x, talks to the verifier only through
// serialized messages.
class DemoProver {
 public:
  DemoProver(std::string identity, ZkpEngine const &engine,
             AuthService &service, chaumauth::logging::Logger logger,
             std::optional<std::string> schema_file)
      : _identity(std::move(identity)),
        _engine(engine),
        _service(service),
        _logger(std::move(logger)),
        _schema_file(std::move(schema_file)) {}

  [[nodiscard]] auto run() -> std::expected<void, std::string> {
    ASSIGN_OR_UNEXPECTED(auto const salt, chaumauth::generate_random_string(8))
    ASSIGN_OR_UNEXPECTED(
        auto secret,
        _engine.secret_from_passphrase(salt, "passphrase of " + _identity))

    CHECK_OR_UNEXPECTED(enroll(secret))

    ASSIGN_OR_UNEXPECTED(auto const attempt, request_challenge())
    ASSIGN_OR_UNEXPECTED(auto const answer, answer_request(attempt, secret))
    auto const accepted = _service.handle_verify_answer(answer);
    UNEXPECTED_IF(not accepted.has_value(),
                  std::format("proof of {} refused: {}", _identity,
                              accepted.error().message))
    ASSIGN_OR_UNEXPECTED(
        auto const *const session,
        chaumauth::flatbuffer_to_struct<chaumauth::wire::AnswerResponse>(
            accepted.value()))
    _logger->info("{} authenticated, session {}", _identity,
                  chaumauth::abbreviate(session->session_id()->str()));

    // the same answer a second time
    CHECK_OR_UNEXPECTED(expect_failure(_service.handle_verify_answer(answer),
                                       ErrorKind::NotFound, "replayed answer"))

    CHECK_OR_UNEXPECTED(answer_with_wrong_secret(secret))
    return {};
  }

 private:
  using Attempt = struct {
    std::string auth_id;
    BN_unique_ptr nonce;
    BN_unique_ptr challenge;
  };

  [[nodiscard]] auto enroll(BN_unique_ptr const &secret)
      -> std::expected<void, std::string> {
    ASSIGN_OR_UNEXPECTED(auto const commitment, _engine.commitment_pair(secret))
    ASSIGN_OR_UNEXPECTED(auto y1, chaumauth::BIGNUM_to_bytes(commitment.first))
    ASSIGN_OR_UNEXPECTED(auto y2, chaumauth::BIGNUM_to_bytes(commitment.second))

    auto const request = chaumauth::flatbuffer_bytes(
        chaumauth::flatbuffer_build_register_request(
            {.user = _identity, .y1 = std::move(y1), .y2 = std::move(y2)}));
    dump<chaumauth::wire::RegisterRequest>(request);

    auto const registered = _service.handle_register(request);
    UNEXPECTED_IF(not registered.has_value(),
                  std::format("registration of {} refused: {}", _identity,
                              registered.error().message))
    return {};
  }

  [[nodiscard]] auto request_challenge() -> std::expected<Attempt, std::string> {
    ASSIGN_OR_UNEXPECTED(auto nonce,
                         ZkpEngine::generate_random_below(_engine.group().q))
    ASSIGN_OR_UNEXPECTED(auto const commitment, _engine.commitment_pair(nonce))
    ASSIGN_OR_UNEXPECTED(auto r1, chaumauth::BIGNUM_to_bytes(commitment.first))
    ASSIGN_OR_UNEXPECTED(auto r2, chaumauth::BIGNUM_to_bytes(commitment.second))

    auto const request = chaumauth::flatbuffer_bytes(
        chaumauth::flatbuffer_build_challenge_request(
            {.user = _identity, .r1 = std::move(r1), .r2 = std::move(r2)}));
    dump<chaumauth::wire::ChallengeRequest>(request);

    auto const issued = _service.handle_create_challenge(request);
    UNEXPECTED_IF(not issued.has_value(),
                  std::format("challenge for {} refused: {}", _identity,
                              issued.error().message))
    dump<chaumauth::wire::ChallengeResponse>(issued.value());

    ASSIGN_OR_UNEXPECTED(
        auto const *const response,
        chaumauth::flatbuffer_to_struct<chaumauth::wire::ChallengeResponse>(
            issued.value()))
    std::span<uint8_t const> const c_bytes{response->c()->data(),
                                           response->c()->size()};
    ASSIGN_OR_UNEXPECTED(auto challenge,
                         chaumauth::bytes_to_BIGNUM(c_bytes, _engine.group().q))
    if (_logger->should_log(spdlog::level::debug)) {
      ASSIGN_OR_UNEXPECTED(auto const challenge_hex,
                           chaumauth::BIGNUM_to_hex(challenge))
      _logger->debug("{} got challenge c = 0x{}", _identity, challenge_hex);
    }

    return Attempt{.auth_id = response->auth_id()->str(),
                   .nonce = std::move(nonce),
                   .challenge = std::move(challenge)};
  }

  [[nodiscard]] auto answer_request(Attempt const &attempt,
                                    BN_unique_ptr const &secret)
      -> std::expected<std::vector<uint8_t>, std::string> {
    ASSIGN_OR_UNEXPECTED(
        auto const response,
        _engine.solve(attempt.nonce, attempt.challenge, secret))
    ASSIGN_OR_UNEXPECTED(auto s, chaumauth::BIGNUM_to_bytes(response))
    return chaumauth::flatbuffer_bytes(
        chaumauth::flatbuffer_build_answer_request(
            {.auth_id = attempt.auth_id, .s = std::move(s)}));
  }

  // x + 1 only passes when c = 0, so such challenges are skipped.
  [[nodiscard]] auto answer_with_wrong_secret(BN_unique_ptr const &secret)
      -> std::expected<void, std::string> {
    BN_CTX_unique_ptr const bn_ctx{BN_CTX_new(), ::BN_CTX_free};
    OSSL_CHECK_NULL_OR_UNEXPECTED(bn_ctx, "Cannot create a BIG NUMBER Context")
    BN_unique_ptr const wrong{BN_dup(secret.get()), ::BN_clear_free};
    OSSL_CHECK_NULL_OR_UNEXPECTED(wrong, "Cannot duplicate secret")
    OSSL_CHECK_OR_UNEXPECTED(BN_add_word(wrong.get(), 1), "BN_add_word error")
    OSSL_CHECK_OR_UNEXPECTED(BN_nnmod(wrong.get(), wrong.get(),
                                      _engine.group().q.get(), bn_ctx.get()),
                             "BN_nnmod error")

    static constexpr int max_draws = 16;
    for (int draw = 0; draw < max_draws; ++draw) {
      ASSIGN_OR_UNEXPECTED(auto const attempt, request_challenge())
      ASSIGN_OR_UNEXPECTED(auto const answer, answer_request(attempt, wrong))
      if (BN_is_zero(attempt.challenge.get()) == 1) {
        // spend the attempt anyway, it would succeed
        static_cast<void>(_service.handle_verify_answer(answer));
        continue;
      }
      return expect_failure(_service.handle_verify_answer(answer),
                            ErrorKind::InvalidProof, "answer with wrong secret");
    }
    return std::unexpected(
        std::format("{} zero challenges in a row", max_draws));
  }

  [[nodiscard]] auto expect_failure(
      std::expected<std::vector<uint8_t>, AuthError> const &result,
      ErrorKind const expected_kind, std::string_view const what) const
      -> std::expected<void, std::string> {
    UNEXPECTED_IF(result.has_value(),
                  std::format("{} of {} was accepted", what, _identity))
    UNEXPECTED_IF(result.error().kind not_eq expected_kind,
                  std::format("{} of {} failed with {} instead of {}", what,
                              _identity, to_string(result.error().kind),
                              to_string(expected_kind)))
    _logger->info("{} of {} rejected with {}", what, _identity,
                  chaumauth::grpc_status_name(expected_kind));
    return {};
  }

  template <chaumauth::WireMessage MessageType>
  auto dump(std::vector<uint8_t> const &buffer) const -> void {
    if (not _logger->should_log(spdlog::level::debug)) {
      return;
    }
    if (auto const b64 = chaumauth::base64Encode(buffer); b64.has_value()) {
      _logger->debug("{} sends {}", _identity, b64.value());
    }
    if (not _schema_file.has_value()) {
      return;
    }
    auto const json = chaumauth::flatbuffer_to_json<MessageType>(
        buffer, _schema_file.value());
    _logger->debug("--- {} ---\n{}", _identity,
                   json.has_value() ? json.value() : json.error());
  }

  std::string _identity;
  ZkpEngine const &_engine;
  AuthService &_service;
  chaumauth::logging::Logger _logger;
  std::optional<std::string> _schema_file;
};

auto run(chaumauth::ServiceConfig const &config) -> int {
  auto const logger = chaumauth::logging::get_logger("chaumauth.main");

  auto group = chaumauth::group_parameters_by_name(config.group_name);
  if (not group.has_value()) {
    logger->critical("cannot load group {}: {}", config.group_name,
                     group.error());
    return EXIT_FAILURE;
  }
  if (auto const valid = chaumauth::validate_group_parameters(group.value());
      not valid.has_value()) {
    logger->critical("group {} rejected: {}", config.group_name, valid.error());
    return EXIT_FAILURE;
  }

  chaumauth::AuthCoordinator coordinator{
      ZkpEngine{std::move(group.value())},
      {.challenge_ttl = config.challenge_ttl,
       .session_ttl = config.session_ttl}};
  AuthService service{coordinator};

  chaumauth::PeriodicTask const reaper{
      [&coordinator] {
        coordinator.purge_expired_challenges();
        coordinator.purge_expired_sessions();
      },
      config.reap_interval};

  logger->info("group {}, {} provers", config.group_name, config.provers);

  std::atomic<std::size_t> failures{};
  {
    std::vector<std::jthread> provers;
    provers.reserve(config.provers);
    for (std::size_t index = 0; index < config.provers; ++index) {
      provers.emplace_back([&, index] {
        DemoProver prover{std::format("prover-{}", index), coordinator.engine(),
                          service, logger, config.schema_file};
        if (auto const outcome = prover.run(); not outcome.has_value()) {
          logger->error("{}", outcome.error());
          ++failures;
        }
      });
    }
  }

  // challenge for an identity nobody registered
  auto const stranger = service.handle_create_challenge(
      chaumauth::flatbuffer_bytes(chaumauth::flatbuffer_build_challenge_request(
          {.user = "nobody", .r1 = {0x01}, .r2 = {0x01}})));
  if (stranger.has_value() or stranger.error().kind not_eq ErrorKind::NotFound) {
    logger->error("challenge for an unregistered identity was not NOT_FOUND");
    ++failures;
  }

  // malformed message
  std::vector<uint8_t> const garbage{0xde, 0xad, 0xbe, 0xef};
  auto const malformed = service.handle_verify_answer(garbage);
  if (malformed.has_value() or
      malformed.error().kind not_eq ErrorKind::InvalidArgument) {
    logger->error("malformed answer was not INVALID_ARGUMENT");
    ++failures;
  }

  logger->info("{} users registered, {} challenges pending, {} sessions",
               coordinator.registered_users(), coordinator.live_challenges(),
               coordinator.live_sessions());

  if (failures.load() not_eq 0) {
    logger->error("{} unexpected outcomes", failures.load());
    return EXIT_FAILURE;
  }
  logger->info("every prover authenticated and every forgery was rejected");
  return EXIT_SUCCESS;
}

}  // namespace

auto main(int argc, char const **argv) -> int {
  auto const config = chaumauth::parse_service_config(argc, argv);
  if (not config.has_value()) {
    std::println(stderr, "{}", config.error());
    return EXIT_FAILURE;
  }
  if (config->usage.has_value()) {
    std::println("{}", config->usage.value());
    return EXIT_SUCCESS;
  }
  if (auto const level = chaumauth::logging::set_log_level(config->log_level);
      not level.has_value()) {
    std::println(stderr, "{}", level.error());
    return EXIT_FAILURE;
  }

  try {
    return run(config.value());
  } catch (std::exception const &e) {
    chaumauth::logging::get_logger("chaumauth.main")
        ->critical("unhandled exception: {}", e.what());
    return EXIT_FAILURE;
  }
}

#include "chaumauth/auth_coordinator.hpp"

#include <format>  // for format

#include <algorithm>  // for clamp, max
#include <utility>    // for move

#include "chaumauth/encoding.hpp"     // for bytes_to_BIGNUM, BIGNUM_to_bytes
#include "chaumauth/macro_tools.hpp"  // for AUTH_UNEXPECTED_IF
#include "chaumauth/tools.hpp"        // for abbreviate, printable

namespace chaumauth {

namespace {

[[nodiscard]]
auto clamp_delay(std::chrono::seconds const delay) -> std::chrono::seconds {
  return std::clamp(delay, std::chrono::seconds{1}, max_expiry_delay);
}

}  // namespace

AuthCoordinator::AuthCoordinator(ZkpEngine engine, CoordinatorConfig config)
    : _engine(std::move(engine)),
      _config(std::move(config)),
      _logger(logging::get_logger("chaumauth.coordinator")) {
  if (_config.token_length < min_token_length or
      _config.session_length < min_token_length) {
    _logger->warn("token lengths below {} raised to {}", min_token_length,
                  min_token_length);
    _config.token_length = std::max(_config.token_length, min_token_length);
    _config.session_length = std::max(_config.session_length, min_token_length);
  }
  _config.max_token_attempts = std::max<std::size_t>(_config.max_token_attempts, 1);

  auto const challenge_ttl = clamp_delay(_config.challenge_ttl);
  auto const session_ttl = clamp_delay(_config.session_ttl);
  if (challenge_ttl not_eq _config.challenge_ttl or
      session_ttl not_eq _config.session_ttl) {
    _logger->warn("expiry delays clamped to [1, {}] seconds",
                  max_expiry_delay.count());
    _config.challenge_ttl = challenge_ttl;
    _config.session_ttl = session_ttl;
  }
}

[[nodiscard]]
auto AuthCoordinator::register_user(std::string const &identity,
                                    std::span<uint8_t const> const y1,
                                    std::span<uint8_t const> const y2)
    -> std::expected<void, AuthError> {
  AUTH_UNEXPECTED_IF(identity.empty(), ErrorKind::InvalidArgument,
                     "identity is empty")

  auto const &group = _engine.group();
  AUTH_ASSIGN_OR_UNEXPECTED(auto y1_value, bytes_to_BIGNUM(y1, group.p),
                            ErrorKind::InvalidArgument)
  AUTH_ASSIGN_OR_UNEXPECTED(auto y2_value, bytes_to_BIGNUM(y2, group.p),
                            ErrorKind::InvalidArgument)

  _registry.register_user(identity, std::move(y1_value), std::move(y2_value));
  _logger->info("registered user {}", printable(identity));
  return {};
}

[[nodiscard]]
auto AuthCoordinator::create_challenge(std::string const &identity,
                                       std::span<uint8_t const> const r1,
                                       std::span<uint8_t const> const r2)
    -> std::expected<ChallengeIssued, AuthError> {
  auto const &group = _engine.group();
  AUTH_ASSIGN_OR_UNEXPECTED(auto r1_value, bytes_to_BIGNUM(r1, group.p),
                            ErrorKind::InvalidArgument)
  AUTH_ASSIGN_OR_UNEXPECTED(auto r2_value, bytes_to_BIGNUM(r2, group.p),
                            ErrorKind::InvalidArgument)

  if (_registry.lookup(identity) == nullptr) {
    _logger->info("challenge refused, user {} is not registered",
                  printable(identity));
    return std::unexpected(AuthError{
        .kind = ErrorKind::NotFound,
        .message = std::format("User: {} not found.", identity)});
  }

  AUTH_ASSIGN_OR_UNEXPECTED(auto challenge, _engine.generate_challenge(),
                            ErrorKind::Internal)
  AUTH_ASSIGN_OR_UNEXPECTED(auto challenge_bytes, BIGNUM_to_bytes(challenge),
                            ErrorKind::Internal)

  ChallengeRecord record{.identity = identity,
                         .r1 = std::move(r1_value),
                         .r2 = std::move(r2_value),
                         .c = std::move(challenge),
                         .expires_at = _config.clock() + _config.challenge_ttl};

  for (std::size_t attempt{}; attempt < _config.max_token_attempts; ++attempt) {
    AUTH_ASSIGN_OR_UNEXPECTED(auto auth_id,
                              ZkpEngine::generate_token(_config.token_length),
                              ErrorKind::Internal)

    if (_challenges.insert(auth_id, std::move(record))) {
      _logger->debug("issued challenge {} to user {}", abbreviate(auth_id),
                     printable(identity));
      return ChallengeIssued{.auth_id = std::move(auth_id),
                             .challenge = std::move(challenge_bytes)};
    }
    _logger->warn("attempt token collision, drawing a new one");
  }

  _logger->error("no unique attempt token after {} draws",
                 _config.max_token_attempts);
  return std::unexpected(
      AuthError{.kind = ErrorKind::Internal,
                .message = "could not allocate a unique attempt token"});
}

[[nodiscard]]
auto AuthCoordinator::verify_answer(std::string const &auth_id,
                                    std::span<uint8_t const> const s)
    -> std::expected<std::string, AuthError> {
  AUTH_ASSIGN_OR_UNEXPECTED(auto const response,
                            bytes_to_BIGNUM(s, _engine.group().q),
                            ErrorKind::InvalidArgument)

  // the attempt is consumed here, whatever the outcome below
  auto const challenge = _challenges.take(auth_id, _config.clock());
  if (not challenge.has_value()) {
    _logger->info("unknown, consumed or expired auth id {}",
                  abbreviate(auth_id));
    return std::unexpected(
        AuthError{.kind = ErrorKind::NotFound,
                  .message = std::format("Auth ID: {} not found.", auth_id)});
  }

  auto const user = _registry.lookup(challenge->identity);
  if (user == nullptr) {
    _logger->error("auth id {} refers to unknown user {}", abbreviate(auth_id),
                   printable(challenge->identity));
    return std::unexpected(AuthError{
        .kind = ErrorKind::Internal,
        .message = std::format("User: {} vanished between challenge and answer",
                               challenge->identity)});
  }

  AUTH_ASSIGN_OR_UNEXPECTED(
      auto const verified,
      _engine.verify(challenge->r1, challenge->r2, user->y1, user->y2,
                     challenge->c, response),
      ErrorKind::Internal)

  if (not verified) {
    _logger->warn("rejected proof of user {}",
                  printable(challenge->identity));
    return std::unexpected(AuthError{
        .kind = ErrorKind::InvalidProof,
        .message = std::format("Proof of user {} rejected", challenge->identity)});
  }

  for (std::size_t attempt{}; attempt < _config.max_token_attempts; ++attempt) {
    AUTH_ASSIGN_OR_UNEXPECTED(auto session_id,
                              ZkpEngine::generate_token(_config.session_length),
                              ErrorKind::Internal)
    SessionRecord session{
        .identity = challenge->identity,
        .expires_at = _config.clock() + _config.session_ttl};
    if (_sessions.try_emplace(session_id, std::move(session))) {
      _logger->info("user {} authenticated", printable(challenge->identity));
      return session_id;
    }
  }
  return std::unexpected(
      AuthError{.kind = ErrorKind::Internal,
                .message = "could not allocate a unique session id"});
}

[[nodiscard]]
auto AuthCoordinator::authenticated_identity(std::string const &session_id) const
    -> std::expected<std::string, AuthError> {
  auto session = _sessions.find(session_id);
  AUTH_UNEXPECTED_IF(not session.has_value(), ErrorKind::NotFound,
                     "unknown session id")
  // left in place for purge_expired_sessions
  AUTH_UNEXPECTED_IF(session->expires_at <= _config.clock(),
                     ErrorKind::NotFound, "expired session id")
  return std::move(session->identity);
}

auto AuthCoordinator::purge_expired_challenges() -> std::size_t {
  auto const purged = _challenges.purge_expired(_config.clock());
  if (purged > 0) {
    _logger->debug("purged {} expired challenges", purged);
  }
  return purged;
}

auto AuthCoordinator::purge_expired_sessions() -> std::size_t {
  auto const now = _config.clock();
  auto const purged =
      _sessions.erase_if([now](SessionRecord const &session) -> bool {
        return session.expires_at <= now;
      });
  if (purged > 0) {
    _logger->debug("purged {} expired sessions", purged);
  }
  return purged;
}

[[nodiscard]] auto AuthCoordinator::live_challenges() const -> std::size_t {
  return _challenges.size();
}

[[nodiscard]] auto AuthCoordinator::live_sessions() const -> std::size_t {
  return _sessions.size();
}

[[nodiscard]] auto AuthCoordinator::registered_users() const -> std::size_t {
  return _registry.size();
}

}  // namespace chaumauth

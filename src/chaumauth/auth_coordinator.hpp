#pragma once

#ifndef CHAUMAUTH_AUTH_COORDINATOR_HPP
#define CHAUMAUTH_AUTH_COORDINATOR_HPP

#include <chrono>      // for seconds
#include <cstddef>     // for size_t
#include <cstdint>     // for uint8_t
#include <expected>    // for expected
#include <functional>  // for function
#include <span>        // for span
#include <string>      // for string
#include <vector>      // for vector

#include "chaumauth/challenge_store.hpp"  // for ChallengeStore, Clock
#include "chaumauth/errors.hpp"           // for AuthError
#include "chaumauth/logging.hpp"          // for Logger
#include "chaumauth/sharded_map.hpp"      // for ShardedMap
#include "chaumauth/user_registry.hpp"    // for UserRegistry
#include "chaumauth/zkp_engine.hpp"       // for ZkpEngine

namespace chaumauth {

inline constexpr std::size_t min_token_length = 12;

// Delays are clamped to [1s, max_expiry_delay].
struct CoordinatorConfig {
  // unanswered challenges are dropped after this delay
  std::chrono::seconds challenge_ttl{300};
  // credentials stop resolving this long after VerifyAnswer issued them
  std::chrono::seconds session_ttl{3600};
  std::size_t token_length{16};
  std::size_t session_length{32};
  // redraws allowed when a fresh token collides with a live one
  std::size_t max_token_attempts{8};
  std::function<Clock::time_point()> clock{[] { return Clock::now(); }};
};

using SessionRecord = struct {
  std::string identity;
  Clock::time_point expires_at;
};

using ChallengeIssued = struct {
  std::string auth_id;
  std::vector<uint8_t> challenge;
};

/*
 * Verifier side of the protocol. Per attempt:
 *
 *   Unregistered --register_user--> Registered(identity)
 *   Registered --create_challenge--> Challenged(token)
 *   Challenged --verify_answer--> Verified | Rejected
 *
 * Integers cross this interface as canonical big-endian byte strings (see
 * encoding.hpp). Every method may be called concurrently from any thread.
 */
class AuthCoordinator {
 public:
  explicit AuthCoordinator(ZkpEngine engine, CoordinatorConfig config = {});

  // Stores or replaces the commitment (y1, y2) of identity.
  [[nodiscard]]
  auto register_user(std::string const &identity,
                     std::span<uint8_t const> y1,
                     std::span<uint8_t const> y2)
      -> std::expected<void, AuthError>;

  // Binds the prover commitment (r1, r2) to a fresh random challenge c and
  // attempt token.
  [[nodiscard]]
  auto create_challenge(std::string const &identity,
                        std::span<uint8_t const> r1,
                        std::span<uint8_t const> r2)
      -> std::expected<ChallengeIssued, AuthError>;

  // Consumes the attempt token and checks the response s. Returns a session
  // credential when the proof holds.
  [[nodiscard]]
  auto verify_answer(std::string const &auth_id, std::span<uint8_t const> s)
      -> std::expected<std::string, AuthError>;

  // Identity a session credential was issued to, until the credential
  // expires.
  [[nodiscard]]
  auto authenticated_identity(std::string const &session_id) const
      -> std::expected<std::string, AuthError>;

  auto purge_expired_challenges() -> std::size_t;
  auto purge_expired_sessions() -> std::size_t;

  [[nodiscard]] auto live_challenges() const -> std::size_t;
  [[nodiscard]] auto live_sessions() const -> std::size_t;
  [[nodiscard]] auto registered_users() const -> std::size_t;

  [[nodiscard]] auto engine() const noexcept -> ZkpEngine const & {
    return _engine;
  }

 private:
  ZkpEngine _engine;
  CoordinatorConfig _config;
  UserRegistry _registry;
  ChallengeStore _challenges;
  ShardedMap<std::string, SessionRecord> _sessions;
  logging::Logger _logger;
};

}  // namespace chaumauth

#endif /* CHAUMAUTH_AUTH_COORDINATOR_HPP */

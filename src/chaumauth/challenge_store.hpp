#pragma once

#ifndef CHAUMAUTH_CHALLENGE_STORE_HPP
#define CHAUMAUTH_CHALLENGE_STORE_HPP

#include <chrono>    // for steady_clock, seconds, days
#include <cstddef>   // for size_t
#include <optional>  // for optional
#include <string>    // for string

#include "chaumauth/crypto_tools.hpp"  // for BN_unique_ptr
#include "chaumauth/sharded_map.hpp"   // for ShardedMap

namespace chaumauth {

using Clock = std::chrono::steady_clock;

// Upper bound of every expiry delay. now() + delay stays far from the limit
// of Clock::duration, whose nanosecond count would overflow after ~292 years.
inline constexpr std::chrono::seconds max_expiry_delay{std::chrono::days{30}};

// State of one authentication attempt between CreateChallenge and
// VerifyAnswer.
struct ChallengeRecord {
  std::string identity;
  BN_unique_ptr r1;
  BN_unique_ptr r2;
  BN_unique_ptr c;
  Clock::time_point expires_at;
};

/*
 * attempt token -> ChallengeRecord. A record is handed out at most once:
 * take() removes it under the shard lock, so a replayed token finds nothing.
 */
class ChallengeStore {
 public:
  // false if token is already live; record is then left to the caller.
  [[nodiscard]] auto insert(std::string const &token, ChallengeRecord &&record)
      -> bool;

  // Removes the record. Expired records are removed as well but not returned.
  [[nodiscard]] auto take(std::string const &token, Clock::time_point now)
      -> std::optional<ChallengeRecord>;

  auto purge_expired(Clock::time_point now) -> std::size_t;

  [[nodiscard]] auto size() const -> std::size_t;

 private:
  ShardedMap<std::string, ChallengeRecord> _challenges;
};

}  // namespace chaumauth

#endif /* CHAUMAUTH_CHALLENGE_STORE_HPP */

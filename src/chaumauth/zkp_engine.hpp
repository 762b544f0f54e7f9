#pragma once

#ifndef CHAUMAUTH_ZKP_ENGINE_HPP
#define CHAUMAUTH_ZKP_ENGINE_HPP

#include <cstddef>   // for size_t
#include <expected>  // for expected
#include <string>    // for string
#include <utility>   // for pair

#include "chaumauth/crypto_tools.hpp"      // for BN_unique_ptr
#include "chaumauth/group_parameters.hpp"  // for GroupParameters

namespace chaumauth {

/*
 * Chaum-Pedersen proof of equality of discrete logarithms.
 *
 *   registration  y1 = alpha^x,  y2 = beta^x             (mod p)
 *   commitment    r1 = alpha^k,  r2 = beta^k             (mod p)
 *   challenge     c uniform in [0, q)
 *   response      s  = k - c * x                         (mod q)
 *   check         r1 == alpha^s * y1^c,  r2 == beta^s * y2^c  (mod p)
 *
 * Every method is a pure function of its arguments and the group; the engine
 * can be shared between threads.
 */
class ZkpEngine {
 public:
  explicit ZkpEngine(GroupParameters group) noexcept;

  [[nodiscard]] auto group() const noexcept -> GroupParameters const & {
    return _group;
  }

  // n^e mod m. Constant time in e when m is odd. e = 0 gives 1, m <= 1 is an
  // error.
  [[nodiscard("Must use exponentiate return value")]]
  static auto exponentiate(BN_unique_ptr const &base,
                           BN_unique_ptr const &exponent,
                           BN_unique_ptr const &modulus) noexcept
      -> std::expected<BN_unique_ptr, std::string>;

  // s = (k - c * x) mod q, always in [0, q).
  [[nodiscard("Must use solve return value")]]
  auto solve(BN_unique_ptr const &nonce, BN_unique_ptr const &challenge,
             BN_unique_ptr const &secret) const noexcept
      -> std::expected<BN_unique_ptr, std::string>;

  [[nodiscard("Must use verify return value")]]
  auto verify(BN_unique_ptr const &r1, BN_unique_ptr const &r2,
              BN_unique_ptr const &y1, BN_unique_ptr const &y2,
              BN_unique_ptr const &challenge,
              BN_unique_ptr const &response) const noexcept
      -> std::expected<bool, std::string>;

  // (alpha^e mod p, beta^e mod p). Gives (y1, y2) for e = x and (r1, r2) for
  // e = k.
  [[nodiscard("Must use commitment_pair return value")]]
  auto commitment_pair(BN_unique_ptr const &exponent) const noexcept
      -> std::expected<std::pair<BN_unique_ptr, BN_unique_ptr>, std::string>;

  // Uniform in [0, bound) from the OpenSSL CSPRNG.
  [[nodiscard("Must use generate_random_below return value")]]
  static auto generate_random_below(BN_unique_ptr const &bound) noexcept
      -> std::expected<BN_unique_ptr, std::string>;

  // Prover secret x = SHA-256(salt || passphrase) mod q.
  [[nodiscard("Must use secret_from_passphrase return value")]]
  auto secret_from_passphrase(std::string const &salt,
                              std::string const &passphrase) const noexcept
      -> std::expected<BN_unique_ptr, std::string>;

  // Uniform in [0, q).
  [[nodiscard("Must use generate_challenge return value")]]
  auto generate_challenge() const noexcept
      -> std::expected<BN_unique_ptr, std::string>;

  [[nodiscard("Must use generate_token return value")]]
  static auto generate_token(std::size_t length) noexcept
      -> std::expected<std::string, std::string>;

 private:
  GroupParameters _group;
};

}  // namespace chaumauth

#endif /* CHAUMAUTH_ZKP_ENGINE_HPP */

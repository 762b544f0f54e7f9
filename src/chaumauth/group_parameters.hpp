#pragma once

#ifndef CHAUMAUTH_GROUP_PARAMETERS_HPP
#define CHAUMAUTH_GROUP_PARAMETERS_HPP

#include <expected>     // for expected
#include <string>       // for string
#include <string_view>  // for string_view
#include <vector>       // for vector

#include "chaumauth/crypto_tools.hpp"  // for BN_unique_ptr

namespace chaumauth {

/*
 * Domain constants shared by prover and verifier, agreed out of band.
 *
 * p      prime modulus
 * q      prime order of the subgroup of Z_p^* the protocol works in
 * alpha  generator of the order q subgroup
 * beta   second generator of the same subgroup
 *
 * Soundness requires that nobody knows log_alpha(beta). That cannot be checked
 * here; it is a property of how beta was chosen.
 */
struct GroupParameters {
  BN_unique_ptr p;
  BN_unique_ptr q;
  BN_unique_ptr alpha;
  BN_unique_ptr beta;
};

struct GroupParametersHex {
  std::string p_hex;
  std::string q_hex;
  std::string alpha_hex;
  std::string beta_hex;
};

// Names accepted by group_parameters_by_name.
inline constexpr std::string_view toy_group_name{"toy"};
inline constexpr std::string_view rfc5114_group_name{"rfc5114-1024-160"};

[[nodiscard("Must use make_group_parameters return value")]]
auto make_group_parameters(GroupParametersHex const &params) noexcept
    -> std::expected<GroupParameters, std::string>;

// p = 23, q = 11, alpha = 4, beta = 9. Only meant for tests and examples.
[[nodiscard("Must use toy_group_parameters return value")]]
auto toy_group_parameters() noexcept
    -> std::expected<GroupParameters, std::string>;

// RFC 5114 section 2.1 group, alpha = g, beta derived from a public seed.
[[nodiscard("Must use rfc5114_group_parameters return value")]]
auto rfc5114_group_parameters() noexcept
    -> std::expected<GroupParameters, std::string>;

[[nodiscard("Must use group_parameters_by_name return value")]]
auto group_parameters_by_name(std::string_view name) noexcept
    -> std::expected<GroupParameters, std::string>;

[[nodiscard]]
auto validate_group_parameters(GroupParameters const &params) noexcept
    -> std::expected<void, std::string>;

// Generator of the order q subgroup nobody knows a discrete log of:
// (H(seed, counter) mod p)^((p - 1) / q) mod p for the first counter giving
// an element different from 1.
[[nodiscard("Must use derive_generator return value")]]
auto derive_generator(BN_unique_ptr const &p, BN_unique_ptr const &q,
                      std::string_view seed) noexcept
    -> std::expected<BN_unique_ptr, std::string>;

// SHA-256 over the concatenation of data, as a non negative integer.
[[nodiscard("Must use hash_to_BIGNUM return value")]]
auto hash_to_BIGNUM(std::vector<std::string> const &data) noexcept
    -> std::expected<BN_unique_ptr, std::string>;

}  // namespace chaumauth

#endif /* CHAUMAUTH_GROUP_PARAMETERS_HPP */

#include "chaumauth/zkp_engine.hpp"

#include <format>  // for format

#include <openssl/bn.h>  // for BN_mod_exp_mont_consttime, BN_mod_mul

#include <utility>  // for move, pair

#include "chaumauth/group_parameters.hpp"  // for hash_to_BIGNUM
#include "chaumauth/macro_tools.hpp"       // for OSSL_CHECK_OR_UNEXPECTED
#include "chaumauth/tools.hpp"             // for generate_random_string

namespace chaumauth {

ZkpEngine::ZkpEngine(GroupParameters group) noexcept
    : _group(std::move(group)) {}

[[nodiscard("Must use exponentiate return value")]]
auto ZkpEngine::exponentiate(BN_unique_ptr const &base,
                             BN_unique_ptr const &exponent,
                             BN_unique_ptr const &modulus) noexcept
    -> std::expected<BN_unique_ptr, std::string> {
  OSSL_CHECK_NULL_OR_UNEXPECTED(base, "base parameter is null")
  OSSL_CHECK_NULL_OR_UNEXPECTED(exponent, "exponent parameter is null")
  OSSL_CHECK_NULL_OR_UNEXPECTED(modulus, "modulus parameter is null")
  UNEXPECTED_IF(BN_is_negative(base.get()) == 1 or
                    BN_is_negative(exponent.get()) == 1,
                "negative operands are not supported")
  UNEXPECTED_IF(BN_is_negative(modulus.get()) == 1 or
                    BN_is_zero(modulus.get()) == 1 or
                    BN_is_one(modulus.get()) == 1,
                "modulus must be greater than 1")

  BN_CTX_unique_ptr const bn_ctx{BN_CTX_new(), ::BN_CTX_free};
  OSSL_CHECK_NULL_OR_UNEXPECTED(bn_ctx, "Cannot create a BIG NUMBER Context : ")

  BN_unique_ptr result{BN_new(), ::BN_free};
  OSSL_CHECK_NULL_OR_UNEXPECTED(result, "Cannot allocate result")

  if (BN_is_odd(modulus.get()) == 1) {
    OSSL_CHECK_OR_UNEXPECTED(
        BN_mod_exp_mont_consttime(result.get(), base.get(), exponent.get(),
                                  modulus.get(), bn_ctx.get(), nullptr),
        "Bad execution of BN_mod_exp_mont_consttime ")
  } else {
    // Montgomery reduction needs an odd modulus; group moduli are always odd.
    OSSL_CHECK_OR_UNEXPECTED(BN_mod_exp(result.get(), base.get(),
                                        exponent.get(), modulus.get(),
                                        bn_ctx.get()),
                             "Bad execution of BN_mod_exp ")
  }
  return result;
}

[[nodiscard("Must use solve return value")]]
auto ZkpEngine::solve(BN_unique_ptr const &nonce,
                      BN_unique_ptr const &challenge,
                      BN_unique_ptr const &secret) const noexcept
    -> std::expected<BN_unique_ptr, std::string> {
  OSSL_CHECK_NULL_OR_UNEXPECTED(nonce, "nonce parameter is null")
  OSSL_CHECK_NULL_OR_UNEXPECTED(challenge, "challenge parameter is null")
  OSSL_CHECK_NULL_OR_UNEXPECTED(secret, "secret parameter is null")
  UNEXPECTED_IF(BN_is_negative(nonce.get()) == 1 or
                    BN_is_negative(challenge.get()) == 1 or
                    BN_is_negative(secret.get()) == 1,
                "negative operands are not supported")

  BN_CTX_unique_ptr const bn_ctx{BN_CTX_new(), ::BN_CTX_free};
  OSSL_CHECK_NULL_OR_UNEXPECTED(bn_ctx, "Cannot create a BIG NUMBER Context : ")

  // c * x carries the secret
  BN_unique_ptr const product{BN_new(), ::BN_clear_free};
  BN_unique_ptr const difference{BN_new(), ::BN_clear_free};
  BN_unique_ptr response{BN_new(), ::BN_free};
  OSSL_CHECK_NULL_OR_UNEXPECTED(product, "Cannot allocate product")
  OSSL_CHECK_NULL_OR_UNEXPECTED(difference, "Cannot allocate difference")
  OSSL_CHECK_NULL_OR_UNEXPECTED(response, "Cannot allocate response")

  OSSL_CHECK_OR_UNEXPECTED(
      BN_mul(product.get(), challenge.get(), secret.get(), bn_ctx.get()),
      "solve BN_mul error ")

  if (BN_cmp(nonce.get(), product.get()) >= 0) {
    // s = (k - c * x) mod q
    OSSL_CHECK_OR_UNEXPECTED(
        BN_sub(difference.get(), nonce.get(), product.get()),
        "solve BN_sub error ")
    OSSL_CHECK_OR_UNEXPECTED(BN_nnmod(response.get(), difference.get(),
                                      _group.q.get(), bn_ctx.get()),
                             "solve BN_nnmod error ")
    return response;
  }

  // s = q - ((c * x - k) mod q), folded back to 0 when the inner residue is 0
  OSSL_CHECK_OR_UNEXPECTED(BN_sub(difference.get(), product.get(), nonce.get()),
                           "solve BN_sub error ")
  OSSL_CHECK_OR_UNEXPECTED(BN_nnmod(difference.get(), difference.get(),
                                    _group.q.get(), bn_ctx.get()),
                           "solve BN_nnmod error ")
  if (BN_is_zero(difference.get()) == 1) {
    BN_zero(response.get());
    return response;
  }
  OSSL_CHECK_OR_UNEXPECTED(
      BN_sub(response.get(), _group.q.get(), difference.get()),
      "solve BN_sub error ")
  return response;
}

[[nodiscard("Must use verify return value")]]
auto ZkpEngine::verify(BN_unique_ptr const &r1, BN_unique_ptr const &r2,
                       BN_unique_ptr const &y1, BN_unique_ptr const &y2,
                       BN_unique_ptr const &challenge,
                       BN_unique_ptr const &response) const noexcept
    -> std::expected<bool, std::string> {
  OSSL_CHECK_NULL_OR_UNEXPECTED(r1, "r1 parameter is null")
  OSSL_CHECK_NULL_OR_UNEXPECTED(r2, "r2 parameter is null")

  BN_CTX_unique_ptr const bn_ctx{BN_CTX_new(), ::BN_CTX_free};
  OSSL_CHECK_NULL_OR_UNEXPECTED(bn_ctx, "Cannot create a BIG NUMBER Context : ")

  // generator^s * commitment^c mod p
  auto const recompute =
      [&](BN_unique_ptr const &generator, BN_unique_ptr const &commitment)
      -> std::expected<BN_unique_ptr, std::string> {
    ASSIGN_OR_UNEXPECTED(auto const masked,
                         exponentiate(generator, response, _group.p))
    ASSIGN_OR_UNEXPECTED(auto const bound,
                         exponentiate(commitment, challenge, _group.p))
    BN_unique_ptr product{BN_new(), ::BN_free};
    OSSL_CHECK_NULL_OR_UNEXPECTED(product, "Cannot allocate product")
    OSSL_CHECK_OR_UNEXPECTED(BN_mod_mul(product.get(), masked.get(),
                                        bound.get(), _group.p.get(),
                                        bn_ctx.get()),
                             "verify BN_mod_mul error ")
    return product;
  };

  ASSIGN_OR_UNEXPECTED(auto const expected_r1, recompute(_group.alpha, y1))
  ASSIGN_OR_UNEXPECTED(auto const expected_r2, recompute(_group.beta, y2))

  bool const first_leg = BN_cmp(r1.get(), expected_r1.get()) == 0;
  bool const second_leg = BN_cmp(r2.get(), expected_r2.get()) == 0;
  return first_leg and second_leg;
}

[[nodiscard("Must use commitment_pair return value")]]
auto ZkpEngine::commitment_pair(BN_unique_ptr const &exponent) const noexcept
    -> std::expected<std::pair<BN_unique_ptr, BN_unique_ptr>, std::string> {
  ASSIGN_OR_UNEXPECTED(auto first, exponentiate(_group.alpha, exponent, _group.p))
  ASSIGN_OR_UNEXPECTED(auto second, exponentiate(_group.beta, exponent, _group.p))
  return std::make_pair(std::move(first), std::move(second));
}

[[nodiscard("Must use generate_random_below return value")]]
auto ZkpEngine::generate_random_below(BN_unique_ptr const &bound) noexcept
    -> std::expected<BN_unique_ptr, std::string> {
  OSSL_CHECK_NULL_OR_UNEXPECTED(bound, "bound parameter is null")
  UNEXPECTED_IF(BN_is_negative(bound.get()) == 1 or
                    BN_is_zero(bound.get()) == 1,
                "bound must be positive")

  BN_unique_ptr random_value{BN_new(), ::BN_free};
  OSSL_CHECK_NULL_OR_UNEXPECTED(random_value, "Cannot allocate random value")
  OSSL_CHECK_OR_UNEXPECTED(BN_priv_rand_range(random_value.get(), bound.get()),
                           "Bad execution of BN_priv_rand_range ")
  return random_value;
}

[[nodiscard("Must use secret_from_passphrase return value")]]
auto ZkpEngine::secret_from_passphrase(std::string const &salt,
                                       std::string const &passphrase) const
    noexcept -> std::expected<BN_unique_ptr, std::string> {
  ASSIGN_OR_UNEXPECTED(auto const digest, hash_to_BIGNUM({salt, passphrase}))

  BN_CTX_unique_ptr const bn_ctx{BN_CTX_new(), ::BN_CTX_free};
  OSSL_CHECK_NULL_OR_UNEXPECTED(bn_ctx, "Cannot create a BIG NUMBER Context : ")

  BN_unique_ptr secret{BN_new(), ::BN_clear_free};
  OSSL_CHECK_NULL_OR_UNEXPECTED(secret, "Cannot allocate secret")
  OSSL_CHECK_OR_UNEXPECTED(
      BN_nnmod(secret.get(), digest.get(), _group.q.get(), bn_ctx.get()),
      "Bad execution of BN_nnmod ")
  return secret;
}

[[nodiscard("Must use generate_challenge return value")]]
auto ZkpEngine::generate_challenge() const noexcept
    -> std::expected<BN_unique_ptr, std::string> {
  return generate_random_below(_group.q);
}

[[nodiscard("Must use generate_token return value")]]
auto ZkpEngine::generate_token(std::size_t const length) noexcept
    -> std::expected<std::string, std::string> {
  return generate_random_string(length);
}

}  // namespace chaumauth

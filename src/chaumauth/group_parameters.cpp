#include "chaumauth/group_parameters.hpp"

#include <format>  // for format

#include <openssl/bn.h>   // for BN_check_prime, BN_mod_exp
#include <openssl/evp.h>  // for EVP_DigestUpdate
#include <openssl/sha.h>  // for SHA256_DIGEST_LENGTH

#include <array>    // for array
#include <cstdint>  // for uint8_t, uint32_t
#include <utility>  // for move

#include "chaumauth/encoding.hpp"     // for hex_to_BIGNUM
#include "chaumauth/macro_tools.hpp"  // for ASSIGN_OR_UNEXPECTED

namespace chaumauth {

namespace {

// RFC 5114, 2.1. 1024-bit MODP Group with 160-bit Prime Order Subgroup
std::string_view constexpr rfc5114_p_hex =
    "B10B8F96A080E01DDE92DE5EAE5D54EC52C99FBCFB06A3C6"
    "9A6A9DCA52D23B616073E28675A23D189838EF1E2EE652C0"
    "13ECB4AEA906112324975C3CD49B83BFACCBDD7D90C4BD70"
    "98488E9C219A73724EFFD6FAE5644738FAA31A4FF55BCCC0"
    "A151AF5F0DC8B4BD45BF37DF365C1A65E68CFDA76D4DA708"
    "DF1FB2BC2E4A4371";
std::string_view constexpr rfc5114_g_hex =
    "A4D1CBD5C3FD34126765A442EFB99905F8104DD258AC507F"
    "D6406CFF14266D31266FEA1E5C41564B777E690F5504F213"
    "160217B4B01B886A5E91547F9E2749F4D7FBD7D3B9A92EE1"
    "909D0D2263F80A76A6A24C087A091F531DBF0A0169B6A28A"
    "D662A4D18E73AFA32D779D5918D08BC8858F4DCEF97C2A24"
    "855E6EEB22B3B2E5";
std::string_view constexpr rfc5114_q_hex =
    "F518AA8781A8DF278ABA4E7D64B7CB9D49462353";

std::string_view constexpr rfc5114_beta_seed =
    "chaumauth rfc5114-1024-160 beta generator";

// Bound on derive_generator retries; each try hits 1 with probability ~1/q.
uint32_t constexpr max_generator_attempts = 64U;

// SHA-256(seed || counter || block) for block = 0, 1, ... until length bytes
// have been produced.
[[nodiscard]]
auto expand_seed(std::string_view const seed, uint32_t const counter,
                 std::size_t const length) noexcept
    -> std::expected<std::vector<uint8_t>, std::string> {
  EVP_MD_unique_ptr const evp_md{EVP_MD_fetch(nullptr, "SHA256", nullptr),
                                 ::EVP_MD_free};
  OSSL_CHECK_NULL_OR_UNEXPECTED(evp_md, "EVP_MD_fetch SHA256 fail ")

  std::vector<uint8_t> stream;
  stream.reserve(length + SHA256_DIGEST_LENGTH);

  for (uint32_t block{}; stream.size() < length; ++block) {
    EVP_MD_CTX_unique_ptr const mdctx{EVP_MD_CTX_new(), ::EVP_MD_CTX_free};
    OSSL_CHECK_NULL_OR_UNEXPECTED(mdctx, "EVP_MD_CTX_new fail ")

    std::array<uint8_t, 8> const suffix{
        static_cast<uint8_t>(counter >> 24U), static_cast<uint8_t>(counter >> 16U),
        static_cast<uint8_t>(counter >> 8U),  static_cast<uint8_t>(counter),
        static_cast<uint8_t>(block >> 24U),   static_cast<uint8_t>(block >> 16U),
        static_cast<uint8_t>(block >> 8U),    static_cast<uint8_t>(block)};

    OSSL_CHECK_OR_UNEXPECTED(
        EVP_DigestInit_ex(mdctx.get(), evp_md.get(), nullptr),
        "EVP_DigestInit_ex fail ")
    OSSL_CHECK_OR_UNEXPECTED(
        EVP_DigestUpdate(mdctx.get(), seed.data(), seed.size()),
        "EVP_DigestUpdate fail ")
    OSSL_CHECK_OR_UNEXPECTED(
        EVP_DigestUpdate(mdctx.get(), suffix.data(), suffix.size()),
        "EVP_DigestUpdate fail ")

    std::array<uint8_t, SHA256_DIGEST_LENGTH> hash{};
    OSSL_CHECK_OR_UNEXPECTED(
        EVP_DigestFinal_ex(mdctx.get(), hash.data(), nullptr),
        "EVP_DigestFinal_ex fail ")
    stream.insert(stream.end(), hash.begin(), hash.end());
  }
  stream.resize(length);
  return stream;
}

}  // namespace

[[nodiscard("Must use hash_to_BIGNUM return value")]]
auto hash_to_BIGNUM(std::vector<std::string> const &data) noexcept
    -> std::expected<BN_unique_ptr, std::string> {
  std::array<uint8_t, SHA256_DIGEST_LENGTH> hash{};
  EVP_MD_CTX_unique_ptr const mdctx{EVP_MD_CTX_new(), ::EVP_MD_CTX_free};
  EVP_MD_unique_ptr const evp_md{EVP_MD_fetch(nullptr, "SHA256", nullptr),
                                 ::EVP_MD_free};
  OSSL_CHECK_NULL_OR_UNEXPECTED(mdctx, "EVP_MD_CTX_new fail ")
  OSSL_CHECK_NULL_OR_UNEXPECTED(evp_md, "EVP_MD_fetch SHA256 fail ")

  OSSL_CHECK_OR_UNEXPECTED(
      EVP_DigestInit_ex(mdctx.get(), evp_md.get(), nullptr),
      "hash_to_BIGNUM EVP_DigestInit_ex fail ");

  for (auto const &element : data) {
    OSSL_CHECK_OR_UNEXPECTED(
        EVP_DigestUpdate(mdctx.get(), element.data(), element.length()),
        "hash_to_BIGNUM EVP_DigestUpdate fail ");
  }

  OSSL_CHECK_OR_UNEXPECTED(
      EVP_DigestFinal_ex(mdctx.get(), hash.data(), nullptr),
      "hash_to_BIGNUM EVP_DigestFinal_ex fail ");
  BN_unique_ptr hash_number(
      BN_bin2bn(hash.data(), SHA256_DIGEST_LENGTH, nullptr), ::BN_free);
  OSSL_CHECK_NULL_OR_UNEXPECTED(hash_number, "hash_to_BIGNUM BN_bin2bn fail ")
  return hash_number;
}

[[nodiscard("Must use derive_generator return value")]]
auto derive_generator(BN_unique_ptr const &p, BN_unique_ptr const &q,
                      std::string_view const seed) noexcept
    -> std::expected<BN_unique_ptr, std::string> {
  OSSL_CHECK_NULL_OR_UNEXPECTED(p, "p parameter is null")
  OSSL_CHECK_NULL_OR_UNEXPECTED(q, "q parameter is null")

  BN_CTX_unique_ptr const bn_ctx{BN_CTX_new(), ::BN_CTX_free};
  OSSL_CHECK_NULL_OR_UNEXPECTED(bn_ctx, "Cannot create a BIG NUMBER Context : ")

  // cofactor = (p - 1) / q
  BN_unique_ptr const cofactor{BN_new(), ::BN_free};
  BN_unique_ptr const remainder{BN_new(), ::BN_free};
  BN_unique_ptr const p_minus_one{BN_dup(p.get()), ::BN_free};
  OSSL_CHECK_NULL_OR_UNEXPECTED(cofactor, "Cannot allocate cofactor")
  OSSL_CHECK_NULL_OR_UNEXPECTED(remainder, "Cannot allocate remainder")
  OSSL_CHECK_NULL_OR_UNEXPECTED(p_minus_one, "Cannot allocate p - 1")
  OSSL_CHECK_OR_UNEXPECTED(BN_sub_word(p_minus_one.get(), 1),
                           "Bad execution of BN_sub_word ")
  OSSL_CHECK_OR_UNEXPECTED(BN_div(cofactor.get(), remainder.get(),
                                  p_minus_one.get(), q.get(), bn_ctx.get()),
                           "Bad execution of BN_div ")
  UNEXPECTED_IF(BN_is_zero(remainder.get()) not_eq 1, "q does not divide p - 1")

  // 16 extra bytes keep the reduction modulo p close to uniform
  auto const stream_length = static_cast<std::size_t>(BN_num_bytes(p.get())) + 16UL;

  for (uint32_t counter{}; counter < max_generator_attempts; ++counter) {
    ASSIGN_OR_UNEXPECTED(auto const stream,
                         expand_seed(seed, counter, stream_length))

    BN_unique_ptr const candidate{
        BN_bin2bn(stream.data(), static_cast<int>(stream.size()), nullptr),
        ::BN_free};
    OSSL_CHECK_NULL_OR_UNEXPECTED(candidate, "BN_bin2bn fail ")
    OSSL_CHECK_OR_UNEXPECTED(
        BN_nnmod(candidate.get(), candidate.get(), p.get(), bn_ctx.get()),
        "Bad execution of BN_nnmod ")

    BN_unique_ptr generator{BN_new(), ::BN_free};
    OSSL_CHECK_NULL_OR_UNEXPECTED(generator, "Cannot allocate generator")
    OSSL_CHECK_OR_UNEXPECTED(BN_mod_exp(generator.get(), candidate.get(),
                                        cofactor.get(), p.get(), bn_ctx.get()),
                             "Bad execution of BN_mod_exp ")

    if (not BN_is_one(generator.get()) and not BN_is_zero(generator.get())) {
      return generator;
    }
  }
  return std::unexpected(std::format(
      "({}): (no generator found after {} attempts)", __FUNCTION__,
      max_generator_attempts));
}

[[nodiscard]]
auto validate_group_parameters(GroupParameters const &params) noexcept
    -> std::expected<void, std::string> {
  OSSL_CHECK_NULL_OR_UNEXPECTED(params.p, "p is null")
  OSSL_CHECK_NULL_OR_UNEXPECTED(params.q, "q is null")
  OSSL_CHECK_NULL_OR_UNEXPECTED(params.alpha, "alpha is null")
  OSSL_CHECK_NULL_OR_UNEXPECTED(params.beta, "beta is null")

  BN_CTX_unique_ptr const bn_ctx{BN_CTX_new(), ::BN_CTX_free};
  OSSL_CHECK_NULL_OR_UNEXPECTED(bn_ctx, "Cannot create a BIG NUMBER Context : ")

  auto const is_prime = [&bn_ctx](BIGNUM const *const candidate)
      -> std::expected<bool, std::string> {
    switch (BN_check_prime(candidate, bn_ctx.get(), nullptr)) {
      case 1:
        return true;
      case 0:
        return false;
      default:
        return std::unexpected("BN_check_prime error");
    }
  };

  ASSIGN_OR_UNEXPECTED(auto const p_is_prime, is_prime(params.p.get()))
  UNEXPECTED_IF(not p_is_prime, "p is not prime")
  ASSIGN_OR_UNEXPECTED(auto const q_is_prime, is_prime(params.q.get()))
  UNEXPECTED_IF(not q_is_prime, "q is not prime")

  BN_unique_ptr const p_minus_one{BN_dup(params.p.get()), ::BN_free};
  BN_unique_ptr const remainder{BN_new(), ::BN_free};
  OSSL_CHECK_NULL_OR_UNEXPECTED(p_minus_one, "Cannot allocate p - 1")
  OSSL_CHECK_NULL_OR_UNEXPECTED(remainder, "Cannot allocate remainder")
  OSSL_CHECK_OR_UNEXPECTED(BN_sub_word(p_minus_one.get(), 1),
                           "Bad execution of BN_sub_word ")
  OSSL_CHECK_OR_UNEXPECTED(BN_mod(remainder.get(), p_minus_one.get(),
                                  params.q.get(), bn_ctx.get()),
                           "Bad execution of BN_mod ")
  UNEXPECTED_IF(BN_is_zero(remainder.get()) not_eq 1, "q does not divide p - 1")

  auto const check_generator =
      [&](BN_unique_ptr const &generator,
          std::string_view const name) -> std::expected<void, std::string> {
    UNEXPECTED_IF(BN_is_negative(generator.get()) == 1 or
                      BN_is_zero(generator.get()) == 1 or
                      BN_is_one(generator.get()) == 1 or
                      BN_cmp(generator.get(), params.p.get()) >= 0,
                  std::format("{} is not in ]1, p[", name))

    BN_unique_ptr const order_check{BN_new(), ::BN_free};
    OSSL_CHECK_NULL_OR_UNEXPECTED(order_check, "Cannot allocate order check")
    OSSL_CHECK_OR_UNEXPECTED(
        BN_mod_exp(order_check.get(), generator.get(), params.q.get(),
                   params.p.get(), bn_ctx.get()),
        "Bad execution of BN_mod_exp ")
    UNEXPECTED_IF(BN_is_one(order_check.get()) not_eq 1,
                  std::format("{} does not generate the order q subgroup", name))
    return {};
  };

  CHECK_OR_UNEXPECTED(check_generator(params.alpha, "alpha"))
  CHECK_OR_UNEXPECTED(check_generator(params.beta, "beta"))

  UNEXPECTED_IF(BN_cmp(params.alpha.get(), params.beta.get()) == 0,
                "alpha and beta must be distinct generators")
  return {};
}

[[nodiscard("Must use make_group_parameters return value")]]
auto make_group_parameters(GroupParametersHex const &params) noexcept
    -> std::expected<GroupParameters, std::string> {
  ASSIGN_OR_UNEXPECTED(auto p, hex_to_BIGNUM(params.p_hex))
  ASSIGN_OR_UNEXPECTED(auto q, hex_to_BIGNUM(params.q_hex))
  ASSIGN_OR_UNEXPECTED(auto alpha, hex_to_BIGNUM(params.alpha_hex))
  ASSIGN_OR_UNEXPECTED(auto beta, hex_to_BIGNUM(params.beta_hex))

  GroupParameters group{.p = std::move(p),
                        .q = std::move(q),
                        .alpha = std::move(alpha),
                        .beta = std::move(beta)};

  CHECK_OR_UNEXPECTED(validate_group_parameters(group))
  return group;
}

[[nodiscard("Must use toy_group_parameters return value")]]
auto toy_group_parameters() noexcept
    -> std::expected<GroupParameters, std::string> {
  return make_group_parameters(
      {.p_hex = "17", .q_hex = "B", .alpha_hex = "4", .beta_hex = "9"});
}

[[nodiscard("Must use rfc5114_group_parameters return value")]]
auto rfc5114_group_parameters() noexcept
    -> std::expected<GroupParameters, std::string> {
  ASSIGN_OR_UNEXPECTED(auto p, hex_to_BIGNUM(std::string{rfc5114_p_hex}))
  ASSIGN_OR_UNEXPECTED(auto q, hex_to_BIGNUM(std::string{rfc5114_q_hex}))
  ASSIGN_OR_UNEXPECTED(auto alpha, hex_to_BIGNUM(std::string{rfc5114_g_hex}))
  ASSIGN_OR_UNEXPECTED(auto beta, derive_generator(p, q, rfc5114_beta_seed))

  GroupParameters group{.p = std::move(p),
                        .q = std::move(q),
                        .alpha = std::move(alpha),
                        .beta = std::move(beta)};

  CHECK_OR_UNEXPECTED(validate_group_parameters(group))
  return group;
}

[[nodiscard("Must use group_parameters_by_name return value")]]
auto group_parameters_by_name(std::string_view const name) noexcept
    -> std::expected<GroupParameters, std::string> {
  if (name == toy_group_name) {
    return toy_group_parameters();
  }
  if (name == rfc5114_group_name) {
    return rfc5114_group_parameters();
  }
  return std::unexpected(
      std::format("({}): (unknown group \"{}\", expected \"{}\" or \"{}\")",
                  __FUNCTION__, name, toy_group_name, rfc5114_group_name));
}

}  // namespace chaumauth

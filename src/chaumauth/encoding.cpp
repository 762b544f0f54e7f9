#include "chaumauth/encoding.hpp"

#include <format>  // for format

#include <openssl/bn.h>   // for BN_bin2bn, BN_bn2bin
#include <openssl/evp.h>  // for EVP_EncodeBlock

#include <cstring>      // for strlen
#include <type_traits>  // for invoke_result_t

#include "chaumauth/macro_tools.hpp"  // for OSSL_CHECK_OR_UNEXPECTED

namespace chaumauth {

[[nodiscard("Must use BIGNUM_to_bytes return value")]]
auto BIGNUM_to_bytes(BN_unique_ptr const &bignumber) noexcept
    -> std::expected<std::vector<uint8_t>, std::string> {
  OSSL_CHECK_NULL_OR_UNEXPECTED(bignumber, "bignumber parameter is null")
  UNEXPECTED_IF(BN_is_negative(bignumber.get()) == 1,
                "negative values have no wire encoding")

  if (BN_is_zero(bignumber.get()) == 1) {
    return std::vector<uint8_t>{0x00};
  }

  std::vector<uint8_t> bytes(static_cast<std::size_t>(BN_num_bytes(bignumber.get())));
  UNEXPECTED_IF(
      BN_bn2bin(bignumber.get(), bytes.data()) not_eq
          static_cast<int>(bytes.size()),
      "BN_bn2bin wrote an unexpected number of bytes")
  return bytes;
}

[[nodiscard("Must use bytes_to_BIGNUM return value")]]
auto bytes_to_BIGNUM(std::span<uint8_t const> const bytes,
                     BN_unique_ptr const &bound) noexcept
    -> std::expected<BN_unique_ptr, std::string> {
  OSSL_CHECK_NULL_OR_UNEXPECTED(bound, "bound parameter is null")
  UNEXPECTED_IF(bytes.empty(), "empty integer encoding")
  UNEXPECTED_IF(bytes.size() > 1 and bytes.front() == 0x00,
                "non canonical integer encoding (leading zero byte)")
  UNEXPECTED_IF(bytes.size() > static_cast<std::size_t>(BN_num_bytes(bound.get())),
                std::format("integer encoding too long ({} bytes)",
                            bytes.size()))

  BN_unique_ptr value{
      BN_bin2bn(bytes.data(), static_cast<int>(bytes.size()), nullptr),
      ::BN_free};
  OSSL_CHECK_NULL_OR_UNEXPECTED(value, "BN_bin2bn failed")

  UNEXPECTED_IF(BN_cmp(value.get(), bound.get()) >= 0,
                "integer out of the accepted range")
  return value;
}

[[nodiscard("Must use hex_to_BIGNUM return value")]]
auto hex_to_BIGNUM(std::string const &hex_big_num) noexcept
    -> std::expected<BN_unique_ptr, std::string> {
  UNEXPECTED_IF(hex_big_num.empty(), "empty hexadecimal string")

  BIGNUM *ptr = nullptr;
  auto const parsed = BN_hex2bn(&ptr, hex_big_num.c_str());
  BN_unique_ptr big_number{ptr, ::BN_free};

  UNEXPECTED_IF(parsed == 0 or
                    static_cast<std::size_t>(parsed) not_eq hex_big_num.size(),
                std::format("Cannot convert hexa string to BIG NUMBER ({})",
                            hex_big_num))
  return big_number;
}

[[nodiscard("Must use the hexadecimal string return value")]]
auto BIGNUM_to_hex(BN_unique_ptr const &bignumber) noexcept
    -> std::expected<std::string, std::string> {
  OSSL_CHECK_NULL_OR_UNEXPECTED(bignumber, "bignumber parameter is null")

  CRYPTO_char_unique_ptr const num_hex_str{BN_bn2hex(bignumber.get()),
                                           chaumauth::crypto_char_free};
  OSSL_CHECK_NULL_OR_UNEXPECTED(num_hex_str,
                                "Cannot convert BIG NUMBER to hexa string : ")

  return std::string{num_hex_str.get(), std::strlen(num_hex_str.get())};
}

[[nodiscard("Must use word_to_BIGNUM return value")]]
auto word_to_BIGNUM(BN_ULONG const word) noexcept
    -> std::expected<BN_unique_ptr, std::string> {
  BN_unique_ptr big_number{BN_new(), ::BN_free};
  OSSL_CHECK_NULL_OR_UNEXPECTED(big_number, "Cannot allocate BIGNUM")
  OSSL_CHECK_OR_UNEXPECTED(BN_set_word(big_number.get(), word),
                           "Bad execution of BN_set_word ")
  return big_number;
}

[[nodiscard("Must use base64Encode return value")]]
auto base64Encode(std::span<uint8_t const> const input) noexcept
    -> std::expected<std::string, std::string> {
  std::string outbuffer;

  UNEXPECTED_IF(input.empty(), "base64Encode input: input is empty")

  uint64_t const encoded_size{4UL * ((input.size() + 2UL) / 3UL)};
  // EVP_EncodeBlock writes a trailing NUL
  outbuffer.resize(encoded_size + 1UL, '\0');

  using EVP_EncodeBlock_rt =
      std::invoke_result_t<decltype(&EVP_EncodeBlock), unsigned char *,
                           const unsigned char *, int>;

  UNEXPECTED_IF(
      EVP_EncodeBlock(
          // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
          reinterpret_cast<uint8_t *>(outbuffer.data()), input.data(),
          static_cast<int>(input.size())) not_eq
          static_cast<EVP_EncodeBlock_rt>(encoded_size),
      "EVP_EncodeBlock not correctly encoded")

  outbuffer.resize(encoded_size);
  return outbuffer;
}

}  // namespace chaumauth

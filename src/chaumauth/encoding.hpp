#pragma once

#ifndef CHAUMAUTH_ENCODING_HPP
#define CHAUMAUTH_ENCODING_HPP

#include <cstdint>   // for uint8_t
#include <expected>  // for expected
#include <span>      // for span
#include <string>    // for string
#include <vector>    // for vector

#include "chaumauth/crypto_tools.hpp"  // for BN_unique_ptr

namespace chaumauth {

/*
 * Wire encoding of protocol integers: big-endian, minimal length, zero is the
 * single byte 0x00. Decoding is strict: empty input, leading zero bytes and
 * values >= bound are rejected, so decode(encode(v)) == v and
 * encode(decode(b)) == b for every accepted b.
 */

[[nodiscard("Must use BIGNUM_to_bytes return value")]]
auto BIGNUM_to_bytes(BN_unique_ptr const &bignumber) noexcept
    -> std::expected<std::vector<uint8_t>, std::string>;

[[nodiscard("Must use bytes_to_BIGNUM return value")]]
auto bytes_to_BIGNUM(std::span<uint8_t const> bytes,
                     BN_unique_ptr const &bound) noexcept
    -> std::expected<BN_unique_ptr, std::string>;

[[nodiscard("Must use hex_to_BIGNUM return value")]]
auto hex_to_BIGNUM(std::string const &hex_big_num) noexcept
    -> std::expected<BN_unique_ptr, std::string>;

[[nodiscard("Must use the hexadecimal string return value")]]
auto BIGNUM_to_hex(BN_unique_ptr const &bignumber) noexcept
    -> std::expected<std::string, std::string>;

[[nodiscard("Must use word_to_BIGNUM return value")]]
auto word_to_BIGNUM(BN_ULONG word) noexcept
    -> std::expected<BN_unique_ptr, std::string>;

[[nodiscard("Must use base64Encode return value")]]
auto base64Encode(std::span<uint8_t const> input) noexcept
    -> std::expected<std::string, std::string>;

}  // namespace chaumauth

#endif /* CHAUMAUTH_ENCODING_HPP */

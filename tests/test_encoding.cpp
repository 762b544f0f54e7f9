#include <gtest/gtest.h>

#include <openssl/bn.h>

#include <cstdint>
#include <string>
#include <vector>

#include "chaumauth/crypto_tools.hpp"
#include "chaumauth/encoding.hpp"

namespace chaumauth {
namespace {

auto bound(BN_ULONG const value) -> BN_unique_ptr {
  return word_to_BIGNUM(value).value();
}

// ============================================================================
// Canonical integer encoding
// ============================================================================

TEST(IntegerEncodingTest, ZeroIsOneZeroByte) {
  auto const bytes = BIGNUM_to_bytes(bound(0));
  ASSERT_TRUE(bytes.has_value()) << bytes.error();
  EXPECT_EQ(bytes.value(), std::vector<uint8_t>{0x00});
}

TEST(IntegerEncodingTest, BigEndianMinimalLength) {
  auto const bytes = BIGNUM_to_bytes(bound(0x0102));
  ASSERT_TRUE(bytes.has_value()) << bytes.error();
  EXPECT_EQ(bytes.value(), (std::vector<uint8_t>{0x01, 0x02}));
}

TEST(IntegerEncodingTest, NegativeHasNoEncoding) {
  auto value = bound(5);
  BN_set_negative(value.get(), 1);
  EXPECT_FALSE(BIGNUM_to_bytes(value).has_value());
}

TEST(IntegerDecodingTest, AcceptsCanonicalValues) {
  std::vector<uint8_t> const zero{0x00};
  auto const decoded_zero = bytes_to_BIGNUM(zero, bound(23));
  ASSERT_TRUE(decoded_zero.has_value()) << decoded_zero.error();
  EXPECT_TRUE(BN_is_zero(decoded_zero->get()));

  std::vector<uint8_t> const twenty_two{0x16};
  auto const decoded = bytes_to_BIGNUM(twenty_two, bound(23));
  ASSERT_TRUE(decoded.has_value()) << decoded.error();
  EXPECT_TRUE(BN_is_word(decoded->get(), 22));
}

TEST(IntegerDecodingTest, RejectsEmptyInput) {
  std::vector<uint8_t> const empty;
  EXPECT_FALSE(bytes_to_BIGNUM(empty, bound(23)).has_value());
}

TEST(IntegerDecodingTest, RejectsLeadingZero) {
  std::vector<uint8_t> const padded{0x00, 0x05};
  EXPECT_FALSE(bytes_to_BIGNUM(padded, bound(0x1000)).has_value());
}

TEST(IntegerDecodingTest, RejectsValuesAtOrAboveBound) {
  std::vector<uint8_t> const at_bound{0x17};
  std::vector<uint8_t> const above{0xFF};
  std::vector<uint8_t> const too_long{0x01, 0x00};
  EXPECT_FALSE(bytes_to_BIGNUM(at_bound, bound(23)).has_value());
  EXPECT_FALSE(bytes_to_BIGNUM(above, bound(23)).has_value());
  EXPECT_FALSE(bytes_to_BIGNUM(too_long, bound(23)).has_value());
}

TEST(IntegerDecodingTest, ReencodingGivesTheSameBytes) {
  std::vector<uint8_t> const bytes{0x7F, 0x00, 0x01};
  auto const decoded = bytes_to_BIGNUM(bytes, bound(0x1000000));
  ASSERT_TRUE(decoded.has_value()) << decoded.error();
  auto const encoded = BIGNUM_to_bytes(decoded.value());
  ASSERT_TRUE(encoded.has_value()) << encoded.error();
  EXPECT_EQ(encoded.value(), bytes);
}

// ============================================================================
// Hexadecimal strings
// ============================================================================

TEST(HexEncodingTest, ParsesAndPrints) {
  auto const value = hex_to_BIGNUM("F518AA87");
  ASSERT_TRUE(value.has_value()) << value.error();
  EXPECT_EQ(BIGNUM_to_hex(value.value()).value(), "F518AA87");
}

TEST(HexEncodingTest, RejectsEmptyOrPartialInput) {
  EXPECT_FALSE(hex_to_BIGNUM("").has_value());
  EXPECT_FALSE(hex_to_BIGNUM("12G4").has_value());
  EXPECT_FALSE(hex_to_BIGNUM("xyz").has_value());
}

// ============================================================================
// Base64
// ============================================================================

TEST(Base64Test, KnownVector) {
  std::string const text = "chaum";
  std::vector<uint8_t> const bytes(text.begin(), text.end());
  auto const encoded = base64Encode(bytes);
  ASSERT_TRUE(encoded.has_value()) << encoded.error();
  EXPECT_EQ(encoded.value(), "Y2hhdW0=");
}

TEST(Base64Test, RejectsEmptyInput) {
  EXPECT_FALSE(base64Encode(std::vector<uint8_t>{}).has_value());
}

}  // namespace
}  // namespace chaumauth

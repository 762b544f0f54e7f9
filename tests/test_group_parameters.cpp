#include <gtest/gtest.h>

#include <openssl/bn.h>

#include <string>

#include "chaumauth/encoding.hpp"
#include "chaumauth/group_parameters.hpp"
#include "chaumauth/zkp_engine.hpp"

namespace chaumauth {
namespace {

// ============================================================================
// Built-in groups
// ============================================================================

TEST(GroupParametersTest, ToyGroupValues) {
  auto const group = toy_group_parameters();
  ASSERT_TRUE(group.has_value()) << group.error();
  EXPECT_TRUE(BN_is_word(group->p.get(), 23));
  EXPECT_TRUE(BN_is_word(group->q.get(), 11));
  EXPECT_TRUE(BN_is_word(group->alpha.get(), 4));
  EXPECT_TRUE(BN_is_word(group->beta.get(), 9));
}

TEST(GroupParametersTest, Rfc5114GroupIsValid) {
  auto const group = rfc5114_group_parameters();
  ASSERT_TRUE(group.has_value()) << group.error();
  EXPECT_EQ(BN_num_bits(group->p.get()), 1024);
  EXPECT_EQ(BN_num_bits(group->q.get()), 160);
  EXPECT_TRUE(validate_group_parameters(group.value()).has_value());
}

TEST(GroupParametersTest, Rfc5114BetaIsReproducible) {
  auto const first = rfc5114_group_parameters();
  auto const second = rfc5114_group_parameters();
  ASSERT_TRUE(first.has_value()) << first.error();
  ASSERT_TRUE(second.has_value()) << second.error();
  EXPECT_EQ(BN_cmp(first->beta.get(), second->beta.get()), 0);
  EXPECT_NE(BN_cmp(first->alpha.get(), first->beta.get()), 0);
}

TEST(GroupParametersTest, LookupByName) {
  EXPECT_TRUE(group_parameters_by_name("toy").has_value());
  EXPECT_TRUE(group_parameters_by_name("rfc5114-1024-160").has_value());
  EXPECT_FALSE(group_parameters_by_name("secp256k1").has_value());
  EXPECT_FALSE(group_parameters_by_name("").has_value());
}

// ============================================================================
// Validation
// ============================================================================

TEST(GroupParametersTest, CompositeModulusIsRejected) {
  auto const group = make_group_parameters(
      {.p_hex = "15", .q_hex = "B", .alpha_hex = "4", .beta_hex = "9"});
  EXPECT_FALSE(group.has_value());
}

TEST(GroupParametersTest, OrderNotDividingModulusIsRejected) {
  // 7 does not divide 22
  auto const group = make_group_parameters(
      {.p_hex = "17", .q_hex = "7", .alpha_hex = "4", .beta_hex = "9"});
  EXPECT_FALSE(group.has_value());
}

TEST(GroupParametersTest, GeneratorOutsideSubgroupIsRejected) {
  // 5 has order 22 modulo 23
  auto const group = make_group_parameters(
      {.p_hex = "17", .q_hex = "B", .alpha_hex = "5", .beta_hex = "9"});
  EXPECT_FALSE(group.has_value());
}

TEST(GroupParametersTest, TrivialGeneratorIsRejected) {
  auto const group = make_group_parameters(
      {.p_hex = "17", .q_hex = "B", .alpha_hex = "1", .beta_hex = "9"});
  EXPECT_FALSE(group.has_value());
}

TEST(GroupParametersTest, EqualGeneratorsAreRejected) {
  auto const group = make_group_parameters(
      {.p_hex = "17", .q_hex = "B", .alpha_hex = "4", .beta_hex = "4"});
  EXPECT_FALSE(group.has_value());
}

TEST(GroupParametersTest, MalformedHexIsRejected) {
  auto const group = make_group_parameters(
      {.p_hex = "17zz", .q_hex = "B", .alpha_hex = "4", .beta_hex = "9"});
  EXPECT_FALSE(group.has_value());
}

// ============================================================================
// Derived generators and hashing
// ============================================================================

TEST(DeriveGeneratorTest, ToyGroupGeneratorHasOrderQ) {
  auto const group = toy_group_parameters().value();
  auto const generator = derive_generator(group.p, group.q, "seed");
  ASSERT_TRUE(generator.has_value()) << generator.error();
  EXPECT_FALSE(BN_is_one(generator->get()));

  auto const power =
      ZkpEngine::exponentiate(generator.value(), group.q, group.p);
  ASSERT_TRUE(power.has_value()) << power.error();
  EXPECT_TRUE(BN_is_one(power->get()));
}

TEST(HashToBignumTest, DependsOnEveryPart) {
  auto const first = hash_to_BIGNUM({"salt", "password"}).value();
  auto const second = hash_to_BIGNUM({"salt", "password"}).value();
  auto const other = hash_to_BIGNUM({"salt", "passwore"}).value();
  EXPECT_EQ(BN_cmp(first.get(), second.get()), 0);
  EXPECT_NE(BN_cmp(first.get(), other.get()), 0);
  EXPECT_LE(BN_num_bits(first.get()), 256);
}

}  // namespace
}  // namespace chaumauth

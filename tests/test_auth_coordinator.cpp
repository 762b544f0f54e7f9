#include <gtest/gtest.h>

#include <openssl/bn.h>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <thread>
#include <tuple>
#include <utility>
#include <vector>

#include "chaumauth/auth_coordinator.hpp"
#include "chaumauth/encoding.hpp"
#include "chaumauth/group_parameters.hpp"
#include "chaumauth/zkp_engine.hpp"

namespace chaumauth {
namespace {

using namespace std::chrono_literals;

auto bytes(BN_unique_ptr const &value) -> std::vector<uint8_t> {
  return BIGNUM_to_bytes(value).value();
}

auto word(BN_ULONG const value) -> BN_unique_ptr {
  return word_to_BIGNUM(value).value();
}

// Honest prover holding x, driving the coordinator directly.
struct Prover {
  ZkpEngine const &engine;
  BN_unique_ptr secret;
  BN_unique_ptr nonce{nullptr, ::BN_free};

  auto commitment() const -> std::pair<std::vector<uint8_t>, std::vector<uint8_t>> {
    auto const y = engine.commitment_pair(secret).value();
    return {bytes(y.first), bytes(y.second)};
  }

  auto commit() -> std::pair<std::vector<uint8_t>, std::vector<uint8_t>> {
    nonce = ZkpEngine::generate_random_below(engine.group().q).value();
    auto const r = engine.commitment_pair(nonce).value();
    return {bytes(r.first), bytes(r.second)};
  }

  auto answer(std::vector<uint8_t> const &challenge) const
      -> std::vector<uint8_t> {
    auto const c = bytes_to_BIGNUM(challenge, engine.group().q).value();
    return bytes(engine.solve(nonce, c, secret).value());
  }
};

class AuthCoordinatorTest : public ::testing::Test {
 protected:
  AuthCoordinatorTest()
      : now_(std::make_shared<std::atomic<Clock::time_point>>(
            Clock::time_point{} + 1h)),
        coordinator_(ZkpEngine{toy_group_parameters().value()},
                     CoordinatorConfig{
                         .challenge_ttl = 300s,
                         .session_ttl = 900s,
                         .clock = [now = now_] { return now->load(); }}) {}

  auto prover(BN_ULONG const secret) -> Prover {
    return Prover{.engine = coordinator_.engine(), .secret = word(secret)};
  }

  auto enroll(std::string const &identity, Prover const &who) -> void {
    auto const [y1, y2] = who.commitment();
    ASSERT_TRUE(coordinator_.register_user(identity, y1, y2).has_value());
  }

  auto advance(Clock::duration const by) -> void {
    now_->store(now_->load() + by);
  }

  std::shared_ptr<std::atomic<Clock::time_point>> now_;
  AuthCoordinator coordinator_;
};

// ============================================================================
// Register
// ============================================================================

TEST_F(AuthCoordinatorTest, RegisterAcceptsGroupElements) {
  std::vector<uint8_t> const y1{0x02};
  std::vector<uint8_t> const y2{0x03};
  EXPECT_TRUE(coordinator_.register_user("alice", y1, y2).has_value());
  EXPECT_EQ(coordinator_.registered_users(), 1U);
}

TEST_F(AuthCoordinatorTest, RegisterRejectsMalformedValues) {
  std::vector<uint8_t> const good{0x02};
  std::vector<uint8_t> const empty;
  std::vector<uint8_t> const out_of_range{0x17};
  std::vector<uint8_t> const padded{0x00, 0x02};

  for (auto const &bad : {empty, out_of_range, padded}) {
    auto const result = coordinator_.register_user("alice", good, bad);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().kind, ErrorKind::InvalidArgument);
  }
  EXPECT_EQ(coordinator_.registered_users(), 0U);
}

TEST_F(AuthCoordinatorTest, RegisterRejectsEmptyIdentity) {
  std::vector<uint8_t> const y1{0x02};
  std::vector<uint8_t> const y2{0x03};
  auto const result = coordinator_.register_user("", y1, y2);
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error().kind, ErrorKind::InvalidArgument);
}

// ============================================================================
// CreateChallenge
// ============================================================================

TEST_F(AuthCoordinatorTest, ChallengeForUnknownUserIsNotFound) {
  std::vector<uint8_t> const r{0x08};
  auto const result = coordinator_.create_challenge("mallory", r, r);
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error().kind, ErrorKind::NotFound);
  EXPECT_EQ(coordinator_.live_challenges(), 0U);
}

TEST_F(AuthCoordinatorTest, ChallengeIsInRangeWithLongToken) {
  auto alice = prover(6);
  enroll("alice", alice);
  auto const [r1, r2] = alice.commit();

  auto const issued = coordinator_.create_challenge("alice", r1, r2);
  ASSERT_TRUE(issued.has_value()) << issued.error().message;
  EXPECT_GE(issued->auth_id.size(), min_token_length);
  EXPECT_TRUE(
      bytes_to_BIGNUM(issued->challenge, coordinator_.engine().group().q)
          .has_value());
  EXPECT_EQ(coordinator_.live_challenges(), 1U);
}

TEST_F(AuthCoordinatorTest, ShortTokenLengthsAreRaised) {
  AuthCoordinator coordinator{ZkpEngine{toy_group_parameters().value()},
                              {.token_length = 4, .session_length = 4}};
  std::vector<uint8_t> const y1{0x02};
  std::vector<uint8_t> const y2{0x03};
  ASSERT_TRUE(coordinator.register_user("alice", y1, y2).has_value());
  std::vector<uint8_t> const r1{0x08};
  std::vector<uint8_t> const r2{0x04};
  auto const issued = coordinator.create_challenge("alice", r1, r2);
  ASSERT_TRUE(issued.has_value()) << issued.error().message;
  EXPECT_EQ(issued->auth_id.size(), min_token_length);
}

// ============================================================================
// VerifyAnswer
// ============================================================================

TEST_F(AuthCoordinatorTest, HonestProverIsAuthenticated) {
  auto alice = prover(6);
  enroll("alice", alice);
  auto const [r1, r2] = alice.commit();
  auto const issued = coordinator_.create_challenge("alice", r1, r2).value();

  auto const session =
      coordinator_.verify_answer(issued.auth_id, alice.answer(issued.challenge));
  ASSERT_TRUE(session.has_value()) << session.error().message;
  EXPECT_GE(session->size(), min_token_length);
  EXPECT_EQ(coordinator_.authenticated_identity(session.value()).value(),
            "alice");
  EXPECT_EQ(coordinator_.live_challenges(), 0U);
}

TEST_F(AuthCoordinatorTest, ReplayIsNotFound) {
  auto alice = prover(6);
  enroll("alice", alice);
  auto const [r1, r2] = alice.commit();
  auto const issued = coordinator_.create_challenge("alice", r1, r2).value();
  auto const s = alice.answer(issued.challenge);

  ASSERT_TRUE(coordinator_.verify_answer(issued.auth_id, s).has_value());
  auto const replay = coordinator_.verify_answer(issued.auth_id, s);
  ASSERT_FALSE(replay.has_value());
  EXPECT_EQ(replay.error().kind, ErrorKind::NotFound);
}

TEST_F(AuthCoordinatorTest, UnknownAuthIdIsNotFound) {
  std::vector<uint8_t> const s{0x05};
  auto const result = coordinator_.verify_answer("doesnotexist00", s);
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error().kind, ErrorKind::NotFound);
}

TEST_F(AuthCoordinatorTest, WrongAnswerIsInvalidProofAndConsumesToken) {
  auto alice = prover(6);
  enroll("alice", alice);
  auto const [r1, r2] = alice.commit();
  auto const issued = coordinator_.create_challenge("alice", r1, r2).value();

  // s + 1 mod q never verifies since alpha has order q
  auto const q = coordinator_.engine().group().q.get();
  auto s = bytes_to_BIGNUM(alice.answer(issued.challenge), coordinator_.engine().group().q).value();
  ASSERT_EQ(BN_add_word(s.get(), 1), 1);
  if (BN_cmp(s.get(), q) == 0) {
    BN_zero(s.get());
  }

  auto const rejected = coordinator_.verify_answer(issued.auth_id, bytes(s));
  ASSERT_FALSE(rejected.has_value());
  EXPECT_EQ(rejected.error().kind, ErrorKind::InvalidProof);

  // the correct answer now comes too late
  auto const retry =
      coordinator_.verify_answer(issued.auth_id, alice.answer(issued.challenge));
  ASSERT_FALSE(retry.has_value());
  EXPECT_EQ(retry.error().kind, ErrorKind::NotFound);
}

TEST_F(AuthCoordinatorTest, MalformedAnswerKeepsToken) {
  auto alice = prover(6);
  enroll("alice", alice);
  auto const [r1, r2] = alice.commit();
  auto const issued = coordinator_.create_challenge("alice", r1, r2).value();

  std::vector<uint8_t> const out_of_range{0x0B};
  auto const malformed = coordinator_.verify_answer(issued.auth_id, out_of_range);
  ASSERT_FALSE(malformed.has_value());
  EXPECT_EQ(malformed.error().kind, ErrorKind::InvalidArgument);

  EXPECT_TRUE(coordinator_
                  .verify_answer(issued.auth_id, alice.answer(issued.challenge))
                  .has_value());
}

TEST_F(AuthCoordinatorTest, ExpiredChallengeIsNotFound) {
  auto alice = prover(6);
  enroll("alice", alice);
  auto const [r1, r2] = alice.commit();
  auto const issued = coordinator_.create_challenge("alice", r1, r2).value();

  advance(301s);
  auto const late =
      coordinator_.verify_answer(issued.auth_id, alice.answer(issued.challenge));
  ASSERT_FALSE(late.has_value());
  EXPECT_EQ(late.error().kind, ErrorKind::NotFound);
}

TEST_F(AuthCoordinatorTest, PurgeDropsExpiredChallenges) {
  auto alice = prover(6);
  enroll("alice", alice);
  for (int attempt = 0; attempt < 3; ++attempt) {
    auto const [r1, r2] = alice.commit();
    ASSERT_TRUE(coordinator_.create_challenge("alice", r1, r2).has_value());
  }
  EXPECT_EQ(coordinator_.purge_expired_challenges(), 0U);
  advance(300s);
  EXPECT_EQ(coordinator_.purge_expired_challenges(), 3U);
  EXPECT_EQ(coordinator_.live_challenges(), 0U);
}

TEST(AuthCoordinatorDelayTest, OversizedDelaysAreClamped) {
  // now() + 10^10 s does not fit in steady_clock nanoseconds
  AuthCoordinator coordinator{ZkpEngine{toy_group_parameters().value()},
                              {.challenge_ttl = std::chrono::seconds{10'000'000'000},
                               .session_ttl = std::chrono::seconds{10'000'000'000}}};
  Prover alice{.engine = coordinator.engine(), .secret = word(6)};
  auto const [y1, y2] = alice.commitment();
  ASSERT_TRUE(coordinator.register_user("alice", y1, y2).has_value());

  auto const [r1, r2] = alice.commit();
  auto const issued = coordinator.create_challenge("alice", r1, r2);
  ASSERT_TRUE(issued.has_value()) << issued.error().message;
  auto const session = coordinator.verify_answer(
      issued->auth_id, alice.answer(issued->challenge));
  ASSERT_TRUE(session.has_value()) << session.error().message;
  EXPECT_EQ(coordinator.authenticated_identity(session.value()).value_or(""),
            "alice");
  EXPECT_EQ(coordinator.purge_expired_sessions(), 0U);
}

TEST_F(AuthCoordinatorTest, ReRegistrationAppliesToPendingChallenge) {
  auto const old_secret = prover(6);
  enroll("alice", old_secret);

  auto alice = prover(6);
  auto [r1, r2] = alice.commit();
  auto issued = coordinator_.create_challenge("alice", r1, r2).value();
  // with c = 0 any secret passes
  for (int draw = 0; draw < 16 and issued.challenge == std::vector<uint8_t>{0x00};
       ++draw) {
    std::tie(r1, r2) = alice.commit();
    issued = coordinator_.create_challenge("alice", r1, r2).value();
  }
  ASSERT_NE(issued.challenge, std::vector<uint8_t>{0x00});

  auto const new_secret = prover(7);
  enroll("alice", new_secret);
  EXPECT_EQ(coordinator_.registered_users(), 1U);

  auto const stale =
      coordinator_.verify_answer(issued.auth_id, alice.answer(issued.challenge));
  ASSERT_FALSE(stale.has_value());
  EXPECT_EQ(stale.error().kind, ErrorKind::InvalidProof);

  auto fresh = prover(7);
  auto const [f1, f2] = fresh.commit();
  auto const reissued = coordinator_.create_challenge("alice", f1, f2).value();
  EXPECT_TRUE(coordinator_
                  .verify_answer(reissued.auth_id, fresh.answer(reissued.challenge))
                  .has_value());
}

TEST_F(AuthCoordinatorTest, ConcurrentChallengesOfOneIdentity) {
  auto alice = prover(6);
  enroll("alice", alice);

  auto first = prover(6);
  auto second = prover(6);
  auto const [a1, a2] = first.commit();
  auto const [b1, b2] = second.commit();
  auto const issued_a = coordinator_.create_challenge("alice", a1, a2).value();
  auto const issued_b = coordinator_.create_challenge("alice", b1, b2).value();
  EXPECT_NE(issued_a.auth_id, issued_b.auth_id);

  // answered out of order
  EXPECT_TRUE(coordinator_
                  .verify_answer(issued_b.auth_id, second.answer(issued_b.challenge))
                  .has_value());
  EXPECT_TRUE(coordinator_
                  .verify_answer(issued_a.auth_id, first.answer(issued_a.challenge))
                  .has_value());
}

TEST_F(AuthCoordinatorTest, UnknownSessionIsNotFound) {
  auto const result = coordinator_.authenticated_identity("nope");
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error().kind, ErrorKind::NotFound);
}

TEST_F(AuthCoordinatorTest, SessionExpiresAfterTtl) {
  auto alice = prover(6);
  enroll("alice", alice);
  auto const [r1, r2] = alice.commit();
  auto const issued = coordinator_.create_challenge("alice", r1, r2).value();
  auto const session =
      coordinator_.verify_answer(issued.auth_id, alice.answer(issued.challenge))
          .value();

  advance(899s);
  EXPECT_EQ(coordinator_.authenticated_identity(session).value_or(""), "alice");
  EXPECT_EQ(coordinator_.purge_expired_sessions(), 0U);

  advance(1s);
  auto const expired = coordinator_.authenticated_identity(session);
  ASSERT_FALSE(expired.has_value());
  EXPECT_EQ(expired.error().kind, ErrorKind::NotFound);
}

TEST_F(AuthCoordinatorTest, PurgeReclaimsExpiredSessionsOnly) {
  auto alice = prover(6);
  enroll("alice", alice);
  auto authenticate = [&] {
    auto const [r1, r2] = alice.commit();
    auto const issued = coordinator_.create_challenge("alice", r1, r2).value();
    return coordinator_
        .verify_answer(issued.auth_id, alice.answer(issued.challenge))
        .value();
  };

  auto const early = authenticate();
  advance(600s);
  auto const late = authenticate();
  EXPECT_EQ(coordinator_.live_sessions(), 2U);

  advance(300s);
  EXPECT_EQ(coordinator_.purge_expired_sessions(), 1U);
  EXPECT_EQ(coordinator_.live_sessions(), 1U);
  EXPECT_FALSE(coordinator_.authenticated_identity(early).has_value());
  EXPECT_EQ(coordinator_.authenticated_identity(late).value_or(""), "alice");
}

// ============================================================================
// Concurrency
// ============================================================================

TEST_F(AuthCoordinatorTest, DistinctIdentitiesInParallel) {
  std::atomic<int> authenticated{0};
  {
    std::vector<std::jthread> threads;
    for (int thread = 0; thread < 8; ++thread) {
      threads.emplace_back([this, thread, &authenticated] {
        auto const identity = "user-" + std::to_string(thread);
        auto who = prover(static_cast<BN_ULONG>(thread + 1));
        auto const [y1, y2] = who.commitment();
        if (not coordinator_.register_user(identity, y1, y2).has_value()) {
          return;
        }
        for (int round = 0; round < 20; ++round) {
          auto const [r1, r2] = who.commit();
          auto const issued = coordinator_.create_challenge(identity, r1, r2);
          if (not issued.has_value()) {
            return;
          }
          auto const session = coordinator_.verify_answer(
              issued->auth_id, who.answer(issued->challenge));
          if (session.has_value() and
              coordinator_.authenticated_identity(session.value()).value_or("") ==
                  identity) {
            ++authenticated;
          }
        }
      });
    }
  }
  EXPECT_EQ(authenticated.load(), 8 * 20);
  EXPECT_EQ(coordinator_.live_challenges(), 0U);
}

TEST_F(AuthCoordinatorTest, RacingAnswersSucceedOnce) {
  auto alice = prover(6);
  enroll("alice", alice);

  for (int round = 0; round < 20; ++round) {
    auto const [r1, r2] = alice.commit();
    auto const issued = coordinator_.create_challenge("alice", r1, r2).value();
    auto const s = alice.answer(issued.challenge);

    std::atomic<int> winners{0};
    std::atomic<int> not_found{0};
    {
      std::vector<std::jthread> threads;
      for (int thread = 0; thread < 6; ++thread) {
        threads.emplace_back([&] {
          auto const result = coordinator_.verify_answer(issued.auth_id, s);
          if (result.has_value()) {
            ++winners;
          } else if (result.error().kind == ErrorKind::NotFound) {
            ++not_found;
          }
        });
      }
    }
    EXPECT_EQ(winners.load(), 1);
    EXPECT_EQ(not_found.load(), 5);
  }
}

}  // namespace
}  // namespace chaumauth

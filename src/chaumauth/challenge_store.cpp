#include "chaumauth/challenge_store.hpp"

#include <utility>  // for move

namespace chaumauth {

[[nodiscard]] auto ChallengeStore::insert(std::string const &token,
                                          ChallengeRecord &&record) -> bool {
  return _challenges.try_emplace(token, std::move(record));
}

[[nodiscard]] auto ChallengeStore::take(std::string const &token,
                                        Clock::time_point const now)
    -> std::optional<ChallengeRecord> {
  auto record = _challenges.extract(token);
  if (not record.has_value() or record->expires_at <= now) {
    return std::nullopt;
  }
  return record;
}

auto ChallengeStore::purge_expired(Clock::time_point const now)
    -> std::size_t {
  return _challenges.erase_if([now](ChallengeRecord const &record) -> bool {
    return record.expires_at <= now;
  });
}

[[nodiscard]] auto ChallengeStore::size() const -> std::size_t {
  return _challenges.size();
}

}  // namespace chaumauth

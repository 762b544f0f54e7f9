#include "chaumauth/user_registry.hpp"

#include <utility>  // for move

namespace chaumauth {

auto UserRegistry::register_user(std::string const &identity, BN_unique_ptr y1,
                                 BN_unique_ptr y2) -> void {
  // built before taking the shard lock
  auto record = std::make_shared<UserRecord const>(
      UserRecord{.identity = identity, .y1 = std::move(y1), .y2 = std::move(y2)});
  _users.insert_or_assign(identity, std::move(record));
}

[[nodiscard]] auto UserRegistry::lookup(std::string const &identity) const
    -> std::shared_ptr<UserRecord const> {
  return _users.find(identity).value_or(nullptr);
}

[[nodiscard]] auto UserRegistry::size() const -> std::size_t {
  return _users.size();
}

}  // namespace chaumauth

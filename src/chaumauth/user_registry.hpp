#pragma once

#ifndef CHAUMAUTH_USER_REGISTRY_HPP
#define CHAUMAUTH_USER_REGISTRY_HPP

#include <cstddef>  // for size_t
#include <memory>   // for shared_ptr
#include <string>   // for string

#include "chaumauth/crypto_tools.hpp"  // for BN_unique_ptr
#include "chaumauth/sharded_map.hpp"   // for ShardedMap

namespace chaumauth {

// Public commitment to a secret x: y1 = alpha^x, y2 = beta^x (mod p).
struct UserRecord {
  std::string identity;
  BN_unique_ptr y1;
  BN_unique_ptr y2;
};

/*
 * identity -> UserRecord. Records are immutable once stored: re-registering
 * an identity swaps in a new record (last write wins) and readers holding the
 * previous one keep a consistent snapshot. Records are never removed.
 */
class UserRegistry {
 public:
  auto register_user(std::string const &identity, BN_unique_ptr y1,
                     BN_unique_ptr y2) -> void;

  // nullptr when identity was never registered.
  [[nodiscard]] auto lookup(std::string const &identity) const
      -> std::shared_ptr<UserRecord const>;

  [[nodiscard]] auto size() const -> std::size_t;

 private:
  ShardedMap<std::string, std::shared_ptr<UserRecord const>> _users;
};

}  // namespace chaumauth

#endif /* CHAUMAUTH_USER_REGISTRY_HPP */

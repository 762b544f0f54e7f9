#pragma once

#ifndef CHAUMAUTH_SHARDED_MAP_HPP
#define CHAUMAUTH_SHARDED_MAP_HPP

#include <array>          // for array
#include <concepts>       // for copy_constructible
#include <cstddef>        // for size_t
#include <functional>     // for hash
#include <mutex>          // for mutex, scoped_lock
#include <optional>       // for optional
#include <unordered_map>  // for unordered_map
#include <utility>        // for move

#include "chaumauth/concepts.hpp"  // for HashableKey, ValuePredicate

namespace chaumauth {

/*
 * Hash map split into ShardCount independently locked shards. A key always
 * maps to the same shard, so operations on one key are linearizable while
 * operations on keys of different shards never wait for each other. No lock
 * is held once a method returns, and values are copied or moved out rather
 * than referenced.
 */
template <HashableKey Key, typename Value, std::size_t ShardCount = 16>
class ShardedMap {
  static_assert(ShardCount > 0, "ShardedMap needs at least one shard");

 public:
  ShardedMap() = default;
  ShardedMap(ShardedMap const &) = delete;
  auto operator=(ShardedMap const &) -> ShardedMap & = delete;

  auto insert_or_assign(Key const &key, Value value) -> void {
    auto &shard = shard_for(key);
    std::scoped_lock const lock{shard.mutex};
    shard.entries.insert_or_assign(key, std::move(value));
  }

  // Inserts only if key is absent. On failure value is left untouched.
  [[nodiscard]] auto try_emplace(Key const &key, Value &&value) -> bool {
    auto &shard = shard_for(key);
    std::scoped_lock const lock{shard.mutex};
    return shard.entries.try_emplace(key, std::move(value)).second;
  }

  [[nodiscard]] auto find(Key const &key) const -> std::optional<Value>
    requires std::copy_constructible<Value>
  {
    auto const &shard = shard_for(key);
    std::scoped_lock const lock{shard.mutex};
    auto const found = shard.entries.find(key);
    if (found == shard.entries.end()) {
      return std::nullopt;
    }
    return found->second;
  }

  // Removes key and hands its value to the caller. Two concurrent extracts of
  // one key never both succeed.
  [[nodiscard]] auto extract(Key const &key) -> std::optional<Value> {
    auto &shard = shard_for(key);
    std::scoped_lock const lock{shard.mutex};
    auto node = shard.entries.extract(key);
    if (node.empty()) {
      return std::nullopt;
    }
    return std::move(node.mapped());
  }

  // Erases every value the predicate holds for, one shard at a time.
  template <ValuePredicate<Value> Predicate>
  auto erase_if(Predicate const &predicate) -> std::size_t {
    std::size_t erased{};
    for (auto &shard : _shards) {
      std::scoped_lock const lock{shard.mutex};
      erased += std::erase_if(shard.entries, [&predicate](auto const &entry) {
        return predicate(entry.second);
      });
    }
    return erased;
  }

  [[nodiscard]] auto size() const -> std::size_t {
    std::size_t total{};
    for (auto const &shard : _shards) {
      std::scoped_lock const lock{shard.mutex};
      total += shard.entries.size();
    }
    return total;
  }

 private:
  struct Shard {
    mutable std::mutex mutex;
    std::unordered_map<Key, Value> entries;
  };

  [[nodiscard]] auto shard_for(Key const &key) -> Shard & {
    return _shards[std::hash<Key>{}(key) % ShardCount];
  }
  [[nodiscard]] auto shard_for(Key const &key) const -> Shard const & {
    return _shards[std::hash<Key>{}(key) % ShardCount];
  }

  std::array<Shard, ShardCount> _shards{};
};

}  // namespace chaumauth

#endif /* CHAUMAUTH_SHARDED_MAP_HPP */

#include <gtest/gtest.h>

#include <atomic>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "chaumauth/sharded_map.hpp"

namespace chaumauth {
namespace {

TEST(ShardedMapTest, InsertFindExtract) {
  ShardedMap<std::string, int> map;
  map.insert_or_assign("a", 1);
  map.insert_or_assign("b", 2);
  EXPECT_EQ(map.size(), 2U);
  EXPECT_EQ(map.find("a").value_or(-1), 1);
  EXPECT_FALSE(map.find("c").has_value());

  EXPECT_EQ(map.extract("a").value_or(-1), 1);
  EXPECT_FALSE(map.extract("a").has_value());
  EXPECT_EQ(map.size(), 1U);
}

TEST(ShardedMapTest, InsertOrAssignReplaces) {
  ShardedMap<std::string, int> map;
  map.insert_or_assign("a", 1);
  map.insert_or_assign("a", 3);
  EXPECT_EQ(map.find("a").value_or(-1), 3);
  EXPECT_EQ(map.size(), 1U);
}

TEST(ShardedMapTest, TryEmplaceLeavesValueOnConflict) {
  ShardedMap<std::string, std::unique_ptr<int>> map;
  auto first = std::make_unique<int>(1);
  auto second = std::make_unique<int>(2);
  EXPECT_TRUE(map.try_emplace("a", std::move(first)));
  EXPECT_FALSE(map.try_emplace("a", std::move(second)));
  ASSERT_NE(second, nullptr);
  EXPECT_EQ(*second, 2);

  auto const stored = map.extract("a");
  ASSERT_TRUE(stored.has_value());
  EXPECT_EQ(**stored, 1);
}

TEST(ShardedMapTest, EraseIfSpansShards) {
  ShardedMap<int, int, 4> map;
  for (int key = 0; key < 100; ++key) {
    map.insert_or_assign(key, key);
  }
  auto const erased = map.erase_if([](int value) { return value % 2 == 0; });
  EXPECT_EQ(erased, 50U);
  EXPECT_EQ(map.size(), 50U);
  EXPECT_FALSE(map.find(10).has_value());
  EXPECT_EQ(map.find(11).value_or(-1), 11);
}

TEST(ShardedMapTest, ConcurrentExtractSucceedsOnce) {
  ShardedMap<std::string, int> map;
  for (int round = 0; round < 50; ++round) {
    map.insert_or_assign("token", round);
    std::atomic<int> winners{0};
    {
      std::vector<std::jthread> threads;
      for (int thread = 0; thread < 8; ++thread) {
        threads.emplace_back([&] {
          if (map.extract("token").has_value()) {
            ++winners;
          }
        });
      }
    }
    EXPECT_EQ(winners.load(), 1);
  }
}

TEST(ShardedMapTest, ConcurrentInsertsOfDistinctKeys) {
  ShardedMap<int, int> map;
  {
    std::vector<std::jthread> threads;
    for (int thread = 0; thread < 8; ++thread) {
      threads.emplace_back([&map, thread] {
        for (int key = 0; key < 500; ++key) {
          map.insert_or_assign(thread * 1000 + key, key);
        }
      });
    }
  }
  EXPECT_EQ(map.size(), 4000U);
}

}  // namespace
}  // namespace chaumauth

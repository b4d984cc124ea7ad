/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <gtest/gtest.h>

#include <string>

#include "common/lru_cache.hpp"

using tribune::LruCache;

/**
 * @given full cache where some entries were read recently
 * @when new entries are put
 * @then the least recently used entries are evicted first
 */
TEST(LruCacheTest, LeastRecentlyUsedEvicted) {
  LruCache<int, int> cache{3};

  cache.put(1, 42);
  cache.put(2, 42);
  cache.put(3, 42);
  ASSERT_TRUE(cache.get(1).has_value());
  ASSERT_TRUE(cache.get(2).has_value());

  cache.put(4, 42);
  cache.put(5, 42);

  EXPECT_EQ(cache.size(), 3);
  EXPECT_FALSE(cache.get(3).has_value());
  EXPECT_FALSE(cache.get(1).has_value());
  EXPECT_TRUE(cache.get(2).has_value());
  EXPECT_TRUE(cache.get(4).has_value());
  EXPECT_TRUE(cache.get(5).has_value());
}

/**
 * @given cache with one entry read many times
 * @when the cache is filled up repeatedly
 * @then the entry survives as long as it keeps being read
 */
TEST(LruCacheTest, RepeatedReadsKeepEntry) {
  LruCache<int, int> cache{2};
  cache.put(0, 0);
  for (int i = 1; i < 100; ++i) {
    ASSERT_TRUE(cache.get(0).has_value()) << "round " << i;
    cache.put(i, i);
  }
  EXPECT_FALSE(cache.get(98).has_value());
  EXPECT_TRUE(cache.get(99).has_value());
}

/**
 * @given cache holding a value
 * @when a value is put under the same key and then erased
 * @then put replaces the value without growing, erase drops it
 */
TEST(LruCacheTest, PutReplacesValue) {
  LruCache<int, std::string> cache{2};

  cache.put(1, "one");
  auto stored = cache.put(1, "uno");
  EXPECT_EQ(*stored, "uno");
  EXPECT_EQ(cache.size(), 1);

  auto value = cache.get(1);
  ASSERT_TRUE(value.has_value());
  EXPECT_EQ(**value, "uno");

  cache.erase(1);
  EXPECT_FALSE(cache.get(1).has_value());
  EXPECT_EQ(cache.size(), 0);
}

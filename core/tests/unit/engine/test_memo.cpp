#include <gtest/gtest.h>

#include <string>

#include "typeset_lsp/engine/memo.hpp"

using typeset_lsp::engine::memo::Cache;

TEST(Memo, ComputesOncePerKey)
{
  Cache cache;
  int calls = 0;
  const auto compute = [&] {
    ++calls;
    return std::string("value");
  };

  const auto a = cache.memoize<std::string>("f", 1, compute);
  const auto b = cache.memoize<std::string>("f", 1, compute);
  EXPECT_EQ(calls, 1);
  EXPECT_EQ(a.get(), b.get());
  EXPECT_EQ(*a, "value");

  cache.memoize<std::string>("f", 2, compute);
  cache.memoize<std::string>("g", 1, compute);
  EXPECT_EQ(calls, 3);
  EXPECT_EQ(cache.size(), 3U);
  EXPECT_EQ(cache.stats().hits, 1U);
}

TEST(Memo, EvictsEntriesUnusedForMoreThanMaxAge)
{
  Cache cache;
  cache.memoize<int>("f", 1, [] { return 1; });

  for (int i = 0; i < 3; ++i) {
    cache.evict(3);
  }
  EXPECT_TRUE(cache.contains("f", 1));

  cache.evict(3);
  EXPECT_FALSE(cache.contains("f", 1));
  EXPECT_EQ(cache.stats().evicted, 1U);
}

TEST(Memo, UseResetsAge)
{
  Cache cache;
  const auto compute = [] { return 7; };
  cache.memoize<int>("f", 1, compute);

  for (int i = 0; i < 10; ++i) {
    cache.evict(2);
    cache.memoize<int>("f", 1, compute);
  }
  EXPECT_TRUE(cache.contains("f", 1));
}

TEST(Memo, HandedOutValuesSurviveEviction)
{
  Cache cache;
  const auto value = cache.memoize<std::string>("f", 1, [] { return std::string("kept"); });
  cache.evict(0);
  EXPECT_FALSE(cache.contains("f", 1));
  EXPECT_EQ(*value, "kept");
}

#include <gtest/gtest.h>

#include <cstdint>
#include <thread>
#include <vector>

#include "lsconf/lsp/request_generation.hpp"

using lsconf::lsp::RequestGeneration;

TEST(LspRequestGeneration, NextIsMonotonic)
{
  RequestGeneration gen;
  const auto a = gen.next();
  const auto b = gen.next();
  EXPECT_LT(a, b);
  EXPECT_FALSE(gen.is_current(a));
  EXPECT_TRUE(gen.is_current(b));
}

TEST(LspRequestGeneration, ObserveKeepsMaximum)
{
  RequestGeneration gen;
  gen.observe(5);
  gen.observe(3);
  EXPECT_EQ(gen.latest(), 5U);
  EXPECT_TRUE(gen.is_current(5));
  EXPECT_FALSE(gen.is_current(4));
  EXPECT_TRUE(gen.is_current(6));
}

TEST(LspRequestGeneration, ConcurrentNextIssuesDistinctValues)
{
  RequestGeneration gen;
  constexpr int k_threads = 4;
  constexpr int k_per_thread = 1000;

  std::vector<std::thread> threads;
  threads.reserve(k_threads);
  for (int t = 0; t < k_threads; ++t) {
    threads.emplace_back([&gen] {
      for (int i = 0; i < k_per_thread; ++i) {
        (void)gen.next();
      }
    });
  }
  for (auto & t : threads) {
    t.join();
  }
  EXPECT_EQ(gen.latest(), static_cast<uint64_t>(k_threads * k_per_thread));
}

// =============================================================================
// book_cache_test.cpp
// =============================================================================
// Unit tests for the snapshot cache collaborators (TtlBookCache and
// NullBookCache). Time is driven by SimulationTimeProvider, so expiry is
// deterministic.
// =============================================================================

#include "matchcore/cache/ttl_book_cache.hpp"
#include "matchcore/time/simulation_time_provider.hpp"

#include <gtest/gtest.h>

#include <string>

class TtlBookCacheTest : public ::testing::Test {
 protected:
  matchcore::SimulationTimeProvider clock{1'000};
  matchcore::TtlBookCache cache{clock};
};

// -----------------------------------------------------------------------------
// 1. A value is served until its TTL elapses, then gone.
// -----------------------------------------------------------------------------
TEST_F(TtlBookCacheTest, ExpiresAfterTtl) {
  cache.set("order_book:BTC/USDT", "{}", 1000);

  clock.advance_by(999);
  auto hit = cache.get("order_book:BTC/USDT");
  ASSERT_TRUE(hit.has_value());
  EXPECT_EQ(*hit, "{}");

  clock.advance_by(1);
  EXPECT_FALSE(cache.get("order_book:BTC/USDT").has_value());
  EXPECT_EQ(cache.size(), 0u);
}

// -----------------------------------------------------------------------------
// 2. set overwrites and restarts the TTL; erase removes immediately.
// -----------------------------------------------------------------------------
TEST_F(TtlBookCacheTest, OverwriteAndErase) {
  cache.set("k", "v1", 100);
  clock.advance_by(80);
  cache.set("k", "v2", 100);
  clock.advance_by(80);

  auto hit = cache.get("k");
  ASSERT_TRUE(hit.has_value());
  EXPECT_EQ(*hit, "v2");

  cache.erase("k");
  EXPECT_FALSE(cache.get("k").has_value());
  EXPECT_NO_FATAL_FAILURE(cache.erase("never-set"));
}

// -----------------------------------------------------------------------------
// 3. A non-positive TTL stores nothing.
// -----------------------------------------------------------------------------
TEST_F(TtlBookCacheTest, NonPositiveTtlIsNotStored) {
  cache.set("k", "v", 0);
  cache.set("j", "v", -5);
  EXPECT_EQ(cache.size(), 0u);
  EXPECT_FALSE(cache.get("k").has_value());
}

// -----------------------------------------------------------------------------
// 4. Keys are namespaced per symbol.
// -----------------------------------------------------------------------------
TEST(BookCacheKeyTest, KeyPerSymbol) {
  EXPECT_EQ(matchcore::bookCacheKey("BTC/USDT"), "order_book:BTC/USDT");
  EXPECT_NE(matchcore::bookCacheKey("BTC/USDT"),
            matchcore::bookCacheKey("ETH/USDT"));
}

// -----------------------------------------------------------------------------
// 5. The disabled cache never returns anything.
// -----------------------------------------------------------------------------
TEST(NullBookCacheTest, AlwaysMisses) {
  matchcore::NullBookCache cache;
  cache.set("k", "v", 1000);
  EXPECT_FALSE(cache.get("k").has_value());
}

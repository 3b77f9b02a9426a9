#include "exchange-rate-cache.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <optional>
#include <thread>

#include "cachemetrics.hpp"
#include "conversion-error.hpp"
#include "currencypair.hpp"
#include "exchangerate.hpp"
#include "fxt_exception.hpp"
#include "fxt_format.hpp"
#include "fxt_string.hpp"
#include "fxt_vector.hpp"
#include "timedef.hpp"

namespace fxt {

class ExchangeRateCacheTest : public ::testing::Test {
 protected:
  ExchangeRateCache cache;
};

TEST_F(ExchangeRateCacheTest, GetAbsent) {
  EXPECT_EQ(cache.get("USD", "EUR"), std::nullopt);

  const auto cacheMetrics = cache.metrics();
  EXPECT_EQ(cacheMetrics.hits, 0);
  EXPECT_EQ(cacheMetrics.misses, 1);
  EXPECT_EQ(cacheMetrics.hitRate, 0);
}

TEST_F(ExchangeRateCacheTest, SetThenGet) {
  cache.set("USD", "EUR", 0.9);

  EXPECT_EQ(cache.get("USD", "EUR"), 0.9);
  EXPECT_EQ(cache.get("USD", "EUR", true), 0.9);
  EXPECT_EQ(cache.get("EUR", "USD"), std::nullopt);

  const auto cacheMetrics = cache.metrics();
  EXPECT_EQ(cacheMetrics.hits, 2);
  EXPECT_EQ(cacheMetrics.misses, 1);
  EXPECT_EQ(cacheMetrics.apiCallsSaved, 2);
  EXPECT_EQ(cacheMetrics.nbEntries, 1);
  EXPECT_DOUBLE_EQ(cacheMetrics.hitRate, 2.0 / 3);
  EXPECT_DOUBLE_EQ(cacheMetrics.averageAccessCount, 2);
}

TEST_F(ExchangeRateCacheTest, SetReplacesAndResetsAccessStats) {
  cache.set("USD", "EUR", 0.9);
  EXPECT_EQ(cache.get("USD", "EUR"), 0.9);
  cache.set("USD", "EUR", 0.95);

  EXPECT_EQ(cache.size(), 1);
  EXPECT_EQ(cache.metrics().averageAccessCount, 0);
  EXPECT_EQ(cache.get("USD", "EUR"), 0.95);
}

TEST_F(ExchangeRateCacheTest, InvalidRatesAreNotCached) {
  cache.set("USD", "EUR", 0);
  cache.set("USD", "GBP", -1.5);

  EXPECT_EQ(cache.size(), 0);
}

TEST(ExchangeRateCacheExpiryTest, LiveEntryExpires) {
  ExchangeRateCache cache(std::chrono::milliseconds(20), std::chrono::hours(1));
  cache.set("USD", "EUR", 0.9);

  std::this_thread::sleep_for(std::chrono::milliseconds(40));

  // still valid in historical context
  EXPECT_EQ(cache.get("USD", "EUR", true), 0.9);
  EXPECT_EQ(cache.get("USD", "EUR"), std::nullopt);

  // expired read removed the entry
  EXPECT_EQ(cache.size(), 0);
  EXPECT_EQ(cache.metrics().misses, 1);
}

TEST(ExchangeRateCacheExpiryTest, HistoricalEntryExpires) {
  ExchangeRateCache cache(std::chrono::hours(1), std::chrono::milliseconds(20));
  cache.set("USD", "EUR", 0.9);

  std::this_thread::sleep_for(std::chrono::milliseconds(40));

  EXPECT_EQ(cache.get("USD", "EUR", true), std::nullopt);
  EXPECT_EQ(cache.size(), 0);
}

TEST(ExchangeRateCacheEvictionTest, LeastRecentlyAccessedIsEvicted) {
  ExchangeRateCache cache;
  const auto currency = [](int idx) { return format("C{}", idx); };
  for (int idx = 0; idx < ExchangeRateCache::kDefaultMaxNbEntries; ++idx) {
    cache.set(currency(idx), "EUR", 1.0 + idx);
  }
  // C0 is accessed, so C1 becomes the least recently accessed one
  EXPECT_EQ(cache.get(currency(0), "EUR"), 1.0);

  cache.set("NEW", "EUR", 2.5);

  EXPECT_EQ(cache.size(), ExchangeRateCache::kDefaultMaxNbEntries);
  EXPECT_EQ(cache.get(currency(1), "EUR"), std::nullopt);
  EXPECT_EQ(cache.get(currency(0), "EUR"), 1.0);
  EXPECT_EQ(cache.get("NEW", "EUR"), 2.5);
}

TEST(ExchangeRateCacheEvictionTest, ReplacingDoesNotEvict) {
  ExchangeRateCache cache(ExchangeRateCache::kDefaultLiveTtl, ExchangeRateCache::kDefaultHistoricalTtl, 2);
  cache.set("USD", "EUR", 0.9);
  cache.set("GBP", "EUR", 1.2);
  cache.set("USD", "EUR", 0.95);

  EXPECT_EQ(cache.size(), 2);
  EXPECT_EQ(cache.get("GBP", "EUR"), 1.2);
}

TEST_F(ExchangeRateCacheTest, GetOrFetchCallsFetchOnlyOnMiss) {
  int nbCalls = 0;
  const auto fetch = [&nbCalls] {
    ++nbCalls;
    return 0.9;
  };

  EXPECT_EQ(cache.getOrFetch("USD", "EUR", fetch), 0.9);
  EXPECT_EQ(cache.getOrFetch("USD", "EUR", fetch), 0.9);
  EXPECT_EQ(nbCalls, 1);
}

TEST_F(ExchangeRateCacheTest, GetOrFetchPropagatesFailure) {
  EXPECT_THROW(cache.getOrFetch("USD", "EUR", []() -> double { throw exception("provider down"); }), exception);
  EXPECT_EQ(cache.size(), 0);

  EXPECT_THROW(cache.getOrFetch("USD", "EUR", [] { return 0.0; }), conversion_error);
  EXPECT_EQ(cache.size(), 0);
}

TEST_F(ExchangeRateCacheTest, Invalidate) {
  cache.set("USD", "EUR", 0.9);
  cache.set("EUR", "USD", 1.1);
  cache.set("GBP", "EUR", 1.2);
  cache.set("ZAR", "GBP", 0.04);

  EXPECT_EQ(cache.invalidate("USD"), 2);
  EXPECT_EQ(cache.size(), 2);
  EXPECT_EQ(cache.invalidate("JPY"), 0);
  EXPECT_EQ(cache.get("GBP", "EUR"), 1.2);
}

TEST_F(ExchangeRateCacheTest, HistoricalRatesOfExpenses) {
  cache.set("USD", "EUR", 0.92);
  cache.setHistorical(1, "USD", "EUR", 0.9);
  cache.setHistorical(2, "USD", "EUR", 0.85);
  cache.setHistorical(3, "USD", "EUR", 0);

  EXPECT_EQ(cache.get("USD", "EUR"), 0.92);
  EXPECT_EQ(cache.getHistorical(1, "USD", "EUR"), 0.9);
  EXPECT_EQ(cache.getHistorical(2, "USD", "EUR"), 0.85);
  EXPECT_EQ(cache.getHistorical(1, "EUR", "USD"), std::nullopt);
  EXPECT_EQ(cache.getHistorical(3, "USD", "EUR"), std::nullopt);
  EXPECT_EQ(cache.size(), 3);
}

TEST_F(ExchangeRateCacheTest, InvalidateExpense) {
  cache.set("USD", "EUR", 0.92);
  cache.setHistorical(1, "USD", "EUR", 0.9);
  cache.setHistorical(1, "GBP", "EUR", 1.15);
  cache.setHistorical(2, "USD", "EUR", 0.85);

  EXPECT_EQ(cache.invalidateExpense(1), 2);
  EXPECT_EQ(cache.invalidateExpense(1), 0);
  EXPECT_EQ(cache.getHistorical(1, "USD", "EUR"), std::nullopt);
  EXPECT_EQ(cache.getHistorical(2, "USD", "EUR"), 0.85);

  EXPECT_EQ(cache.invalidateExpenses(), 1);
  EXPECT_EQ(cache.get("USD", "EUR"), 0.92);
  EXPECT_EQ(cache.size(), 1);
}

TEST_F(ExchangeRateCacheTest, BatchOperations) {
  vector<ExchangeRate> exchangeRates;
  exchangeRates.push_back(ExchangeRate{CurrencyPair("USD", "EUR"), 0.9, Clock::now(), RateSource::kApi, 0, {}});
  exchangeRates.push_back(ExchangeRate{CurrencyPair("GBP", "EUR"), 1.2, Clock::now(), RateSource::kDatabase, 0, {}});
  cache.setBatch(exchangeRates);

  vector<CurrencyPair> pairs{CurrencyPair("USD", "EUR"), CurrencyPair("JPY", "EUR"), CurrencyPair("GBP", "EUR")};
  const auto rates = cache.getBatch(pairs);

  ASSERT_EQ(rates.size(), 3U);
  EXPECT_EQ(rates[0], 0.9);
  EXPECT_EQ(rates[1], std::nullopt);
  EXPECT_EQ(rates[2], 1.2);
}

TEST_F(ExchangeRateCacheTest, WarmAndClear) {
  cache.warm({{CurrencyPair("EUR", "USD"), 1.1}, {CurrencyPair("EUR", "ZAR"), 20.1}});
  EXPECT_EQ(cache.get("EUR", "ZAR"), 20.1);

  EXPECT_EQ(cache.clear(), 2);
  EXPECT_EQ(cache.size(), 0);

  const auto cacheMetrics = cache.metrics();
  EXPECT_EQ(cacheMetrics.hits, 0);
  EXPECT_EQ(cacheMetrics.misses, 0);
}

TEST_F(ExchangeRateCacheTest, StatusSummary) {
  cache.set("USD", "EUR", 0.9);
  EXPECT_EQ(cache.get("USD", "EUR"), 0.9);
  EXPECT_EQ(cache.get("USD", "EUR"), 0.9);
  EXPECT_EQ(cache.get("GBP", "EUR"), std::nullopt);

  const auto statusSummary = cache.statusSummary();
  EXPECT_EQ(statusSummary.size, 1);
  EXPECT_DOUBLE_EQ(statusSummary.hitRate, 0.67);
  EXPECT_EQ(statusSummary.apiCallsSaved, 2);
  EXPECT_EQ(statusSummary.oldestAgeMinutes, 0);
}

TEST(ExchangeRateCacheCleanupTest, CleanupRemovesOldEntries) {
  ExchangeRateCache cache(std::chrono::milliseconds(20));
  cache.set("USD", "EUR", 0.9);
  std::this_thread::sleep_for(std::chrono::milliseconds(40));
  cache.set("GBP", "EUR", 1.2);

  EXPECT_EQ(cache.cleanup(), 1);
  EXPECT_EQ(cache.size(), 1);
}

TEST(ExchangeRateCacheCleanupTest, CleanupKeepsHistoricalRatesOfExpenses) {
  ExchangeRateCache cache(std::chrono::milliseconds(20), std::chrono::hours(1));
  cache.set("USD", "EUR", 0.9);
  cache.setHistorical(1, "USD", "EUR", 0.88);
  std::this_thread::sleep_for(std::chrono::milliseconds(40));

  EXPECT_EQ(cache.cleanup(), 1);
  EXPECT_EQ(cache.getHistorical(1, "USD", "EUR"), 0.88);
}

TEST(ExchangeRateCacheExpiryTest, HistoricalRateOfExpenseExpires) {
  ExchangeRateCache cache(std::chrono::hours(1), std::chrono::milliseconds(20));
  cache.setHistorical(1, "USD", "EUR", 0.88);

  std::this_thread::sleep_for(std::chrono::milliseconds(40));

  EXPECT_EQ(cache.getHistorical(1, "USD", "EUR"), std::nullopt);
  EXPECT_EQ(cache.size(), 0);
}

TEST(ExchangeRateCacheCleanupTest, BackgroundCleanup) {
  ExchangeRateCache cache(std::chrono::milliseconds(10), std::chrono::hours(1), 10, std::chrono::milliseconds(10));
  cache.set("USD", "EUR", 0.9);

  cache.startCleanup();
  EXPECT_TRUE(cache.isCleanupRunning());

  for (int attempt = 0; attempt < 100 && cache.size() != 0; ++attempt) {
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }
  EXPECT_EQ(cache.size(), 0);

  cache.stopCleanup();
  EXPECT_FALSE(cache.isCleanupRunning());
}

TEST(ExchangeRateCacheConcurrencyTest, ConcurrentAccesses) {
  ExchangeRateCache cache(ExchangeRateCache::kDefaultLiveTtl, ExchangeRateCache::kDefaultHistoricalTtl, 50);
  {
    vector<std::jthread> threads;
    for (int threadIdx = 0; threadIdx < 4; ++threadIdx) {
      threads.emplace_back([&cache, threadIdx] {
        for (int idx = 0; idx < 200; ++idx) {
          const string from = format("C{}", (idx * (threadIdx + 1)) % 80);
          cache.set(from, "EUR", 1.5);
          [[maybe_unused]] auto rate = cache.get(from, "EUR");
          if (idx % 50 == 0) {
            cache.invalidate(from);
          }
        }
      });
    }
  }
  EXPECT_LE(cache.size(), 50);
}

}  // namespace fxt

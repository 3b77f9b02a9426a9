#pragma once

#include <chrono>
#include <cstddef>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string_view>
#include <thread>
#include <unordered_map>
#include <utility>

#include "cachemetrics.hpp"
#include "currencypair.hpp"
#include "exchangerate.hpp"
#include "expense.hpp"
#include "fxt_hash.hpp"
#include "fxt_vector.hpp"
#include "timedef.hpp"

namespace fxt {

/// Process local, time bounded cache of exchange rates per ordered currency pair.
/// It also holds the historical rates of expenses read from storage, keyed by expense and pair.
///
/// Current rates expire after 'liveTtl', and after 'historicalTtl' when queried in a historical context.
/// Historical rates of expenses expire after 'historicalTtl'.
/// Expiration is checked at read time, an expired entry being removed by the read that detects it.
/// When full, the least recently accessed entry is evicted before insertion of a new one, whatever its kind.
/// A background thread (see startCleanup) periodically removes expired entries, current rates being considered expired
/// after 'liveTtl'.
///
/// All methods are thread safe. No lock is held during the call of a fetch function.
class ExchangeRateCache {
 public:
  static constexpr Duration kDefaultLiveTtl = std::chrono::hours(1);
  static constexpr Duration kDefaultHistoricalTtl = std::chrono::hours(24);
  static constexpr int32_t kDefaultMaxNbEntries = 1000;
  static constexpr Duration kDefaultCleanupInterval = std::chrono::minutes(5);

  using FetchFunc = std::function<double()>;

  explicit ExchangeRateCache(Duration liveTtl = kDefaultLiveTtl, Duration historicalTtl = kDefaultHistoricalTtl,
                             int32_t maxNbEntries = kDefaultMaxNbEntries,
                             Duration cleanupInterval = kDefaultCleanupInterval);

  ExchangeRateCache(const ExchangeRateCache &) = delete;
  ExchangeRateCache(ExchangeRateCache &&) = delete;
  ExchangeRateCache &operator=(const ExchangeRateCache &) = delete;
  ExchangeRateCache &operator=(ExchangeRateCache &&) = delete;

  /// Stops the cleanup thread if running.
  ~ExchangeRateCache();

  /// Returns the cached rate if present and not expired.
  std::optional<double> get(std::string_view from, std::string_view to, bool historical = false);

  /// Inserts or replaces the rate of given pair. Non positive rates are ignored.
  void set(std::string_view from, std::string_view to, double rate, RateSource source = RateSource::kApi);

  /// Returns the cached rate if present, otherwise calls 'fetchFunc' and caches its result.
  /// Any exception thrown by 'fetchFunc' is propagated, and nothing is cached in this case.
  double getOrFetch(std::string_view from, std::string_view to, const FetchFunc &fetchFunc, bool historical = false);

  /// Returns the cached historical rate of given expense and pair, if present and not expired.
  std::optional<double> getHistorical(ExpenseId expenseId, std::string_view from, std::string_view to);

  /// Caches the historical rate of given expense and pair. Invalid rates are ignored.
  void setHistorical(ExpenseId expenseId, std::string_view from, std::string_view to, double rate);

  /// Removes all entries involving 'currency' on either side. Returns the number of removed entries.
  int32_t invalidate(std::string_view currency);

  /// Removes cached historical rates of given expense. Returns the number of removed entries.
  int32_t invalidateExpense(ExpenseId expenseId);

  /// Removes cached historical rates of all expenses. Returns the number of removed entries.
  int32_t invalidateExpenses();

  CacheMetrics metrics() const;

  CacheStatusSummary statusSummary() const;

  vector<std::optional<double>> getBatch(const vector<CurrencyPair> &pairs, bool historical = false);

  void setBatch(const vector<ExchangeRate> &exchangeRates);

  /// Pre-loads given rates, considered as coming from the live provider.
  void warm(const vector<std::pair<CurrencyPair, double>> &rates);

  /// Removes all entries and resets metrics. Returns the number of removed entries.
  int32_t clear();

  /// Removes expired entries. Returns the number of removed entries.
  int32_t cleanup();

  int32_t size() const;

  /// Starts the periodic cleanup thread. No-op if already running.
  void startCleanup();

  /// Stops the periodic cleanup thread and waits for its termination. No-op if not running.
  void stopCleanup();

  bool isCleanupRunning() const { return _cleanupThread.joinable(); }

 private:
  struct Key {
    CurrencyPair pair;
    std::optional<ExpenseId> expenseId;  // only set for historical rates of an expense

    bool operator==(const Key &) const noexcept = default;
  };

  struct KeyHash {
    std::size_t operator()(const Key &key) const {
      return HashCombine(std::hash<CurrencyPair>()(key.pair), std::hash<std::optional<ExpenseId>>()(key.expenseId));
    }
  };

  struct Entry {
    ExchangeRate exchangeRate;
    uint64_t lastAccessSeq;
  };

  using RatesMap = std::unordered_map<Key, Entry, KeyHash>;

  std::optional<double> find(const Key &key, Duration ttl);

  void setUnlocked(Key key, double rate, RateSource source, TimePoint nowTime);

  void evictLeastRecentlyAccessed();

  RatesMap _ratesMap;
  Duration _liveTtl;
  Duration _historicalTtl;
  Duration _cleanupInterval;
  int32_t _maxNbEntries;
  uint64_t _accessSeq{};
  int64_t _nbHits{};
  int64_t _nbMisses{};
  int64_t _nbApiCallsSaved{};
  mutable std::mutex _mutex;

  std::mutex _cleanupMutex;
  std::condition_variable_any _cleanupCondition;
  std::jthread _cleanupThread;
};

}  // namespace fxt

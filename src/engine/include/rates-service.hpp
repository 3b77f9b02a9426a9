#pragma once

#include <cstdint>
#include <future>
#include <optional>
#include <string_view>

#include "backfill-job.hpp"
#include "cachemetrics.hpp"
#include "conversion-engine.hpp"
#include "exchange-rate-cache.hpp"
#include "expense.hpp"
#include "freshness-guard.hpp"
#include "freshnessresult.hpp"
#include "historical-rate-store.hpp"
#include "migration-state-schema.hpp"
#include "migrationresult.hpp"
#include "rates-refresher.hpp"
#include "threadpool.hpp"
#include "timedef.hpp"

namespace fxt {

class AbstractRateProvider;
class AbstractRatesStorage;
class FxTrackInfo;

/// Entry point of the currency conversion core, owning all its components.
/// The cache cleanup thread runs during the whole lifetime of the service.
class RatesService {
 public:
  RatesService(const FxTrackInfo &fxTrackInfo, AbstractRatesStorage &ratesStorage, AbstractRateProvider &rateProvider);

  RatesService(const RatesService &) = delete;
  RatesService(RatesService &&) = delete;
  RatesService &operator=(const RatesService &) = delete;
  RatesService &operator=(RatesService &&) = delete;

  ~RatesService();

  /// Converts given amount, never throwing in lenient mode.
  double convert(double amount, std::string_view from, std::string_view to,
                 std::optional<ExpenseId> optExpenseId = std::nullopt,
                 ConversionEngine::Mode mode = ConversionEngine::Mode::kLenient) const {
    return _conversionEngine.convert(amount, from, to, optExpenseId, mode);
  }

  /// Records the historical rate of a newly created expense. Never throws.
  void saveRatesForExpense(ExpenseId expenseId, TimePoint recordedDate) noexcept {
    _historicalRateStore.saveForExpense(expenseId, recordedDate);
  }

  /// Same as saveRatesForExpense, but in a background task. Caller does not need to wait for the returned future.
  std::future<void> saveRatesForExpenseAsync(ExpenseId expenseId, TimePoint recordedDate);

  MigrationResult migrateExistingExpenses() { return _backfillJob.migrateExistingExpenses(); }

  MigrationResult resumeMigration() { return _backfillJob.resume(); }

  /// Deletes all historical rates, and forgets the cached ones.
  int32_t rollbackMigration();

  schema::MigrationState migrationStatus() const { return _backfillJob.status(); }

  /// Makes sure that rates are fresh, waiting at most 'timeout' (or the configured one if not set).
  /// Never throws: a failed refresh is reported in the 'error' field of the result.
  FreshnessResult ensureFreshRates(std::optional<Duration> timeout = std::nullopt);

  /// Unconditionally refreshes current rates. Returns the number of refreshed rates.
  int32_t refreshRates() { return _ratesRefresher.refresh(); }

  CacheMetrics getCacheMetrics() const { return _exchangeRateCache.metrics(); }

  CacheStatusSummary getCacheStatus() const { return _exchangeRateCache.statusSummary(); }

  /// Removes cached rates involving given currency, or all cached rates if no currency is given.
  /// Returns the number of removed entries.
  int32_t invalidateCache(std::optional<std::string_view> currency = std::nullopt);

  /// Forgets cached historical rates of given expense, to be called when it is deleted.
  int32_t invalidateExpenseCache(ExpenseId expenseId) { return _exchangeRateCache.invalidateExpense(expenseId); }

 private:
  ExchangeRateCache _exchangeRateCache;
  HistoricalRateStore _historicalRateStore;
  ConversionEngine _conversionEngine;
  BackfillJob _backfillJob;
  RatesRefresher _ratesRefresher;
  FreshnessGuard _freshnessGuard;
  Duration _freshnessTimeout;

  // Last member so that pending background saves complete before other members are destroyed.
  ThreadPool _asyncTasksPool;
};

}  // namespace fxt

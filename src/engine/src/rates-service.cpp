#include "rates-service.hpp"

#include <exception>
#include <future>
#include <optional>
#include <string_view>

#include "abstract-rate-provider.hpp"
#include "abstract-rates-storage.hpp"
#include "backfill-job.hpp"
#include "conversion-error.hpp"
#include "freshnessresult.hpp"
#include "fxt_log.hpp"
#include "fxtrackinfo.hpp"
#include "general-config.hpp"

namespace fxt {

namespace {
BackfillJob::Settings CreateBackfillSettings(const FxTrackInfo &fxTrackInfo) {
  const schema::MigrationConfig &migrationConfig = fxTrackInfo.generalConfig().migration;
  return BackfillJob::Settings{fxTrackInfo.baseCurrency(),     fxTrackInfo.supportedCurrencies(),
                               migrationConfig.batchSize,      migrationConfig.maxDaysDifference,
                               migrationConfig.nbMaxRetries,   fxTrackInfo.retryDelay()};
}
}  // namespace

RatesService::RatesService(const FxTrackInfo &fxTrackInfo, AbstractRatesStorage &ratesStorage,
                           AbstractRateProvider &rateProvider)
    : _exchangeRateCache(fxTrackInfo.liveTtl(), fxTrackInfo.historicalTtl(),
                         fxTrackInfo.generalConfig().cache.maxEntries, fxTrackInfo.cleanupInterval()),
      _historicalRateStore(ratesStorage, _exchangeRateCache, fxTrackInfo.baseCurrency(),
                           [this](std::string_view from, std::string_view to) {
                             return _conversionEngine.fetchRate(from, to);
                           }),
      _conversionEngine(_historicalRateStore, _exchangeRateCache, rateProvider),
      _backfillJob(ratesStorage, _conversionEngine, CreateBackfillSettings(fxTrackInfo), fxTrackInfo.dataDir()),
      _ratesRefresher(ratesStorage, _exchangeRateCache, rateProvider, fxTrackInfo.baseCurrency(),
                      fxTrackInfo.supportedCurrencies()),
      _freshnessGuard(ratesStorage, _ratesRefresher),
      _freshnessTimeout(fxTrackInfo.freshnessTimeout()),
      _asyncTasksPool(1) {
  _exchangeRateCache.startCleanup();
}

RatesService::~RatesService() { _exchangeRateCache.stopCleanup(); }

std::future<void> RatesService::saveRatesForExpenseAsync(ExpenseId expenseId, TimePoint recordedDate) {
  return _asyncTasksPool.enqueue(
      [this, expenseId, recordedDate] { _historicalRateStore.saveForExpense(expenseId, recordedDate); });
}

FreshnessResult RatesService::ensureFreshRates(std::optional<Duration> timeout) {
  try {
    return _freshnessGuard.ensureFresh(timeout.value_or(_freshnessTimeout));
  } catch (const conversion_error &e) {
    log::error("Unable to ensure fresh rates ({}): {}", ErrorKindToString(e.kind()), e.what());
    return FreshnessResult{false, false, false, e.what()};
  } catch (const std::exception &e) {
    log::error("Unable to ensure fresh rates: {}", e.what());
    return FreshnessResult{false, false, false, e.what()};
  }
}

int32_t RatesService::rollbackMigration() {
  const int32_t nbDeleted = _backfillJob.rollback();
  _exchangeRateCache.invalidateExpenses();
  return nbDeleted;
}

int32_t RatesService::invalidateCache(std::optional<std::string_view> currency) {
  if (currency) {
    return _exchangeRateCache.invalidate(*currency);
  }
  return _exchangeRateCache.clear();
}

}  // namespace fxt

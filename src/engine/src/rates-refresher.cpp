#include "rates-refresher.hpp"

#include <cstdint>
#include <exception>
#include <utility>

#include "abstract-rate-provider.hpp"
#include "abstract-rates-storage.hpp"
#include "conversion-error.hpp"
#include "exchange-rate-cache.hpp"
#include "fxt_log.hpp"
#include "timedef.hpp"
#include "validrate.hpp"

namespace fxt {

RatesRefresher::RatesRefresher(AbstractRatesStorage &ratesStorage, ExchangeRateCache &exchangeRateCache,
                               AbstractRateProvider &rateProvider, CurrencyCode baseCurrency,
                               vector<CurrencyCode> supportedCurrencies)
    : _ratesStorage(ratesStorage),
      _exchangeRateCache(exchangeRateCache),
      _rateProvider(rateProvider),
      _baseCurrency(std::move(baseCurrency)),
      _supportedCurrencies(std::move(supportedCurrencies)) {}

RatesRefresher::FetchedRates RatesRefresher::fetchRates() const {
  FetchedRates fetchedRates;
  int32_t nbFailures = 0;
  for (const CurrencyCode &currency : _supportedCurrencies) {
    if (currency == _baseCurrency) {
      continue;
    }
    try {
      const double rate = _rateProvider.fetchLiveRate(_baseCurrency, currency);
      if (!IsValidRate(rate)) {
        throw conversion_error(ErrorKind::kApiUnavailable, "Invalid rate {} fetched", rate);
      }
      fetchedRates.emplace_back(CurrencyPair(_baseCurrency, currency), rate);
    } catch (const std::exception &e) {
      log::warn("Unable to refresh rate {}-{}: {}", _baseCurrency, currency, e.what());
      ++nbFailures;
    }
  }
  if (fetchedRates.empty() && nbFailures != 0) {
    throw conversion_error(ErrorKind::kApiUnavailable, "Unable to fetch any rate from {}", _baseCurrency);
  }
  return fetchedRates;
}

int32_t RatesRefresher::commit(const FetchedRates &fetchedRates) {
  const TimePoint nowTime = Clock::now();
  try {
    for (const auto &[pair, rate] : fetchedRates) {
      _ratesStorage.upsertDailyRate(pair, rate, nowTime);
    }
  } catch (const std::exception &e) {
    throw conversion_error(ErrorKind::kDatabaseError, "Unable to store refreshed rates: {}", e.what());
  }
  _exchangeRateCache.warm(fetchedRates);
  log::info("Refreshed {} rate(s) from {}", fetchedRates.size(), _baseCurrency);
  return static_cast<int32_t>(fetchedRates.size());
}

}  // namespace fxt

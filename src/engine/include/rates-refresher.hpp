#pragma once

#include <cstdint>
#include <utility>

#include "currencycode.hpp"
#include "currencypair.hpp"
#include "fxt_vector.hpp"

namespace fxt {

class AbstractRateProvider;
class AbstractRatesStorage;
class ExchangeRateCache;

/// Refreshes the daily rate history with the current rates from the base currency to all supported currencies.
/// A refresh is made of two steps: fetching, without any side effect, then committing the fetched rates to the storage
/// and the cache. This allows a caller to discard a refresh whose result arrives too late.
class RatesRefresher {
 public:
  using FetchedRates = vector<std::pair<CurrencyPair, double>>;

  RatesRefresher(AbstractRatesStorage &ratesStorage, ExchangeRateCache &exchangeRateCache,
                 AbstractRateProvider &rateProvider, CurrencyCode baseCurrency, vector<CurrencyCode> supportedCurrencies);

  /// Fetches and commits all rates. Returns the number of refreshed rates.
  int32_t refresh() { return commit(fetchRates()); }

  /// Fetches the live rates from the base currency to each other supported currency.
  /// Individual failures are logged and skipped. Throws a conversion_error if no rate at all could be fetched.
  FetchedRates fetchRates() const;

  /// Records given rates in the daily rate history at current day and seeds the cache with them.
  /// A storage failure is reported as a conversion_error of kind kDatabaseError, the cache being left untouched.
  int32_t commit(const FetchedRates &fetchedRates);

 private:
  AbstractRatesStorage &_ratesStorage;
  ExchangeRateCache &_exchangeRateCache;
  AbstractRateProvider &_rateProvider;
  CurrencyCode _baseCurrency;
  vector<CurrencyCode> _supportedCurrencies;
};

}  // namespace fxt

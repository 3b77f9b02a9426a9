#pragma once

#include <functional>
#include <optional>
#include <string_view>

#include "currencycode.hpp"
#include "expense.hpp"
#include "timedef.hpp"

namespace fxt {

class AbstractRatesStorage;
class ExchangeRateCache;

/// Append only record of the rate in force for each expense at its creation time.
/// Rates read from storage are kept in the exchange rate cache, as they never change once recorded.
class HistoricalRateStore {
 public:
  /// Returns the current rate from first currency to second one, throwing on failure.
  using LiveRateFetcher = std::function<double(std::string_view, std::string_view)>;

  HistoricalRateStore(AbstractRatesStorage &ratesStorage, ExchangeRateCache &exchangeRateCache, CurrencyCode baseCurrency,
                      LiveRateFetcher liveRateFetcher);

  /// Returns the rate recorded for given expense and pair, if any.
  /// Same currency pairs return 1 without any lookup. A storage failure is logged and reported as absent.
  /// Cached historical rates of an expense should be invalidated when it is deleted.
  std::optional<double> get(ExpenseId expenseId, std::string_view from, std::string_view to) const;

  /// Records the live rate from the expense currency to the base currency for given expense.
  /// Best effort: never throws, any failure is logged. Calling it again for the same expense has no effect.
  void saveForExpense(ExpenseId expenseId, TimePoint recordedDate) noexcept;

  std::string_view baseCurrency() const { return _baseCurrency; }

 private:
  void doSaveForExpense(ExpenseId expenseId, TimePoint recordedDate);

  AbstractRatesStorage &_ratesStorage;
  ExchangeRateCache &_exchangeRateCache;
  CurrencyCode _baseCurrency;
  LiveRateFetcher _liveRateFetcher;
};

}  // namespace fxt

#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

#include "expense.hpp"

namespace fxt {

class AbstractRateProvider;
class ExchangeRateCache;
class HistoricalRateStore;

/// Converts amounts between currencies with the following fallback chain, first success winning:
///  - same currency: amount unchanged
///  - historical rate of the expense, if an expense is given
///  - cached or live rate of the pair
///  - inverse of the cached or live rate of the reversed pair
///  - amount unchanged, with a warning
class ConversionEngine {
 public:
  enum class Mode : int8_t {
    kLenient,  // last fallback returns the amount unchanged
    kStrict    // last fallback throws a conversion_error of kind kApiUnavailable
  };

  ConversionEngine(const HistoricalRateStore &historicalRateStore, ExchangeRateCache &exchangeRateCache,
                   AbstractRateProvider &rateProvider);

  double convert(double amount, std::string_view from, std::string_view to,
                 std::optional<ExpenseId> optExpenseId = std::nullopt, Mode mode = Mode::kLenient) const;

  /// Returns the rate of given pair from the cache, or from the live provider on a cache miss.
  /// In a 'historical' context, cached rates are accepted up to the historical time to live.
  /// Throws if the provider fails or returns an invalid rate.
  double fetchRate(std::string_view from, std::string_view to, bool historical = false) const;

 private:
  std::optional<double> tryFetchRate(std::string_view from, std::string_view to, bool historical) const;

  const HistoricalRateStore &_historicalRateStore;
  ExchangeRateCache &_exchangeRateCache;
  AbstractRateProvider &_rateProvider;
};

}  // namespace fxt

#include "historical-rate-store.hpp"

#include <exception>
#include <optional>
#include <string_view>
#include <utility>

#include "abstract-rates-storage.hpp"
#include "conversion-error.hpp"
#include "currencypair.hpp"
#include "exchange-rate-cache.hpp"
#include "fxt_log.hpp"
#include "fxt_vector.hpp"
#include "historicalrate.hpp"
#include "timestring.hpp"
#include "validrate.hpp"

namespace fxt {

HistoricalRateStore::HistoricalRateStore(AbstractRatesStorage &ratesStorage, ExchangeRateCache &exchangeRateCache,
                                         CurrencyCode baseCurrency, LiveRateFetcher liveRateFetcher)
    : _ratesStorage(ratesStorage),
      _exchangeRateCache(exchangeRateCache),
      _baseCurrency(std::move(baseCurrency)),
      _liveRateFetcher(std::move(liveRateFetcher)) {}

std::optional<double> HistoricalRateStore::get(ExpenseId expenseId, std::string_view from, std::string_view to) const {
  if (from == to) {
    return 1.0;
  }
  auto optRate = _exchangeRateCache.getHistorical(expenseId, from, to);
  if (optRate) {
    return optRate;
  }
  try {
    optRate = _ratesStorage.findHistoricalRate(expenseId, CurrencyPair{CurrencyCode(from), CurrencyCode(to)});
  } catch (const std::exception &e) {
    log::error("{}: unable to read historical rate {}-{} of expense {}: {}",
               ErrorKindToString(ErrorKind::kDatabaseError), from, to, expenseId, e.what());
    return std::nullopt;
  }
  if (!optRate) {
    return std::nullopt;
  }
  if (!IsValidRate(*optRate)) {
    log::warn("Ignoring invalid historical rate {} {}-{} of expense {}", *optRate, from, to, expenseId);
    return std::nullopt;
  }
  _exchangeRateCache.setHistorical(expenseId, from, to, *optRate);
  return optRate;
}

void HistoricalRateStore::saveForExpense(ExpenseId expenseId, TimePoint recordedDate) noexcept {
  try {
    doSaveForExpense(expenseId, recordedDate);
  } catch (const std::exception &e) {
    log::error("Failed to save historical rates of expense {}: {}", expenseId, e.what());
  }
}

void HistoricalRateStore::doSaveForExpense(ExpenseId expenseId, TimePoint recordedDate) {
  const auto optExpense = _ratesStorage.findExpenseById(expenseId);
  if (!optExpense) {
    log::error("Cannot save historical rates of unknown expense {}", expenseId);
    return;
  }
  if (optExpense->currency == _baseCurrency) {
    log::debug("Expense {} is in base currency {}, no rate to save", expenseId, _baseCurrency);
    return;
  }

  CurrencyPair pair(optExpense->currency, _baseCurrency);
  if (_ratesStorage.findHistoricalRate(expenseId, pair)) {
    log::debug("Historical rate {} of expense {} already saved", pair, expenseId);
    return;
  }

  const double rate = _liveRateFetcher(pair.from(), pair.to());
  if (!IsValidRate(rate)) {
    log::warn("Invalid rate {} for {}, historical rate of expense {} not saved", rate, pair, expenseId);
    return;
  }

  vector<HistoricalRate> historicalRates;
  historicalRates.push_back(HistoricalRate{expenseId, pair, rate, recordedDate});
  if (_ratesStorage.createHistoricalRates(historicalRates) == 0) {
    log::debug("Historical rate of expense {} was concurrently saved", expenseId);
    return;
  }
  _exchangeRateCache.setHistorical(expenseId, pair.from(), pair.to(), rate);
  log::info("Saved historical rate {} of expense {} recorded at {}", rate, expenseId, TimeToString(recordedDate));
}

}  // namespace fxt

#include "conversion-engine.hpp"

#include <exception>
#include <optional>
#include <string_view>

#include "abstract-rate-provider.hpp"
#include "conversion-error.hpp"
#include "exchange-rate-cache.hpp"
#include "fxt_log.hpp"
#include "historical-rate-store.hpp"

namespace fxt {

ConversionEngine::ConversionEngine(const HistoricalRateStore &historicalRateStore,
                                   ExchangeRateCache &exchangeRateCache, AbstractRateProvider &rateProvider)
    : _historicalRateStore(historicalRateStore), _exchangeRateCache(exchangeRateCache), _rateProvider(rateProvider) {}

double ConversionEngine::convert(double amount, std::string_view from, std::string_view to,
                                 std::optional<ExpenseId> optExpenseId, Mode mode) const {
  if (from == to) {
    return amount;
  }

  if (optExpenseId) {
    const auto optRate = _historicalRateStore.get(*optExpenseId, from, to);
    if (optRate) {
      log::debug("Convert {} {} to {} with historical rate {} of expense {}", amount, from, to, *optRate,
                 *optExpenseId);
      return amount * *optRate;
    }
    log::debug("No historical rate {}-{} for expense {}, use current rate", from, to, *optExpenseId);
  }

  // an expense being converted is a historical context, current rates are accepted for longer
  const bool historical = optExpenseId.has_value();
  auto optRate = tryFetchRate(from, to, historical);
  if (optRate) {
    log::debug("Convert {} {} to {} with current rate {}", amount, from, to, *optRate);
    return amount * *optRate;
  }

  optRate = tryFetchRate(to, from, historical);
  if (optRate) {
    log::debug("Convert {} {} to {} with inverse of current rate {}", amount, from, to, *optRate);
    return amount / *optRate;
  }

  if (mode == Mode::kStrict) {
    throw conversion_error(ErrorKind::kApiUnavailable, "No rate available to convert {} to {}", from, to);
  }
  log::warn("No rate available for {}-{}, amount {} left unconverted", from, to, amount);
  return amount;
}

double ConversionEngine::fetchRate(std::string_view from, std::string_view to, bool historical) const {
  if (from == to) {
    return 1;
  }
  return _exchangeRateCache.getOrFetch(
      from, to, [this, from, to] { return _rateProvider.fetchLiveRate(from, to); }, historical);
}

std::optional<double> ConversionEngine::tryFetchRate(std::string_view from, std::string_view to,
                                                    bool historical) const {
  try {
    return fetchRate(from, to, historical);
  } catch (const std::exception &e) {
    log::warn("Unable to retrieve rate {}-{}: {}", from, to, e.what());
  }
  return std::nullopt;
}

}  // namespace fxt

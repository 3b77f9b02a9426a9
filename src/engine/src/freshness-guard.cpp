#include "freshness-guard.hpp"

#include <chrono>
#include <future>
#include <memory>
#include <mutex>

#include "abstract-rates-storage.hpp"
#include "durationstring.hpp"
#include "freshnessresult.hpp"
#include "fxt_log.hpp"
#include "rates-refresher.hpp"
#include "timedef.hpp"
#include "timestring.hpp"

namespace fxt {

FreshnessGuard::FreshnessGuard(const AbstractRatesStorage &ratesStorage, RatesRefresher &ratesRefresher)
    : _ratesStorage(ratesStorage), _ratesRefresher(ratesRefresher), _threadPool(1) {}

bool FreshnessGuard::isFresh() const {
  const auto optLastUpdateTime = _ratesStorage.lastRatesUpdateTime();
  if (!optLastUpdateTime) {
    return false;
  }
  const bool isFromToday = *optLastUpdateTime >= StartOfUtcDay(Clock::now());
  log::debug("Last rates update at {} is {}from today", TimeToString(*optLastUpdateTime), isFromToday ? "" : "not ");
  return isFromToday;
}

FreshnessResult FreshnessGuard::ensureFresh(Duration timeout) {
  if (isFresh()) {
    return FreshnessResult{true, false, false, {}};
  }

  std::shared_future<void> refreshFuture;
  auto refreshState = std::make_shared<RefreshState>();
  {
    std::lock_guard<std::mutex> guard(_mutex);
    if (_pendingRefresh.valid() && _pendingRefresh.wait_for(std::chrono::seconds(0)) != std::future_status::ready) {
      log::info("Rates refresh already in progress");
      return FreshnessResult{true, false, false, {}};
    }
    _pendingRefresh = _threadPool.enqueue([this, refreshState] { refreshTask(*refreshState); }).share();
    refreshFuture = _pendingRefresh;
  }

  if (refreshFuture.wait_for(timeout) == std::future_status::timeout) {
    std::lock_guard<std::mutex> guard(refreshState->mutex);
    if (!refreshState->committed) {
      refreshState->abandoned = true;
      log::warn("Rates refresh did not complete within {}, proceeding with current rates", DurationToString(timeout));
      return FreshnessResult{true, false, true, {}};
    }
  }

  // Rethrows the exception of the refresh, if any
  refreshFuture.get();
  return FreshnessResult{true, true, false, {}};
}

void FreshnessGuard::refreshTask(RefreshState &refreshState) {
  const auto fetchedRates = _ratesRefresher.fetchRates();

  std::lock_guard<std::mutex> guard(refreshState.mutex);
  if (refreshState.abandoned) {
    log::info("Discarding {} rate(s) of a timed out refresh", fetchedRates.size());
    return;
  }
  _ratesRefresher.commit(fetchedRates);
  refreshState.committed = true;
}

}  // namespace fxt

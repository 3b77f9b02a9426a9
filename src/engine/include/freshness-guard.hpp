#pragma once

#include <future>
#include <memory>
#include <mutex>

#include "freshnessresult.hpp"
#include "threadpool.hpp"
#include "timedef.hpp"

namespace fxt {

class AbstractRatesStorage;
class RatesRefresher;

/// Makes sure that current rates have been refreshed today before an operation relying on them.
/// Freshness is advisory: a refresh taking longer than the given timeout does not block the caller, and its late
/// result is discarded.
class FreshnessGuard {
 public:
  FreshnessGuard(const AbstractRatesStorage &ratesStorage, RatesRefresher &ratesRefresher);

  FreshnessGuard(const FreshnessGuard &) = delete;
  FreshnessGuard(FreshnessGuard &&) = delete;
  FreshnessGuard &operator=(const FreshnessGuard &) = delete;
  FreshnessGuard &operator=(FreshnessGuard &&) = delete;

  /// Returns immediately with 'updated' false if rates were refreshed today, or if a refresh is already in progress.
  /// Otherwise, launches a refresh and waits at most 'timeout' for it.
  /// Exceptions thrown by the refresh, if it completes in time, are propagated.
  FreshnessResult ensureFresh(Duration timeout);

  /// Tells whether the daily rate history has been updated during current UTC day.
  bool isFresh() const;

 private:
  struct RefreshState {
    std::mutex mutex;
    bool abandoned = false;
    bool committed = false;
  };

  void refreshTask(RefreshState &refreshState);

  const AbstractRatesStorage &_ratesStorage;
  RatesRefresher &_ratesRefresher;
  std::mutex _mutex;
  std::shared_future<void> _pendingRefresh;

  // Last member so that the refresh task in progress, if any, completes before other members are destroyed.
  ThreadPool _threadPool;
};

}  // namespace fxt

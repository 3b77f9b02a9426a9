#include "exchange-rate-cache.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstdint>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string_view>
#include <thread>
#include <utility>

#include "cachemetrics.hpp"
#include "conversion-error.hpp"
#include "currencypair.hpp"
#include "durationstring.hpp"
#include "exchangerate.hpp"
#include "expense.hpp"
#include "fxt_invalid_argument_exception.hpp"
#include "fxt_log.hpp"
#include "fxt_vector.hpp"
#include "timedef.hpp"
#include "validrate.hpp"

namespace fxt {

ExchangeRateCache::ExchangeRateCache(Duration liveTtl, Duration historicalTtl, int32_t maxNbEntries,
                                     Duration cleanupInterval)
    : _liveTtl(liveTtl), _historicalTtl(historicalTtl), _cleanupInterval(cleanupInterval), _maxNbEntries(maxNbEntries) {
  if (_maxNbEntries <= 0) {
    throw invalid_argument("Exchange rate cache capacity should be strictly positive");
  }
  if (_cleanupInterval <= Duration::zero()) {
    throw invalid_argument("Exchange rate cache cleanup interval should be strictly positive");
  }
  _ratesMap.reserve(static_cast<RatesMap::size_type>(_maxNbEntries));
}

ExchangeRateCache::~ExchangeRateCache() { stopCleanup(); }

std::optional<double> ExchangeRateCache::get(std::string_view from, std::string_view to, bool historical) {
  return find(Key{CurrencyPair{CurrencyCode(from), CurrencyCode(to)}, std::nullopt},
              historical ? _historicalTtl : _liveTtl);
}

std::optional<double> ExchangeRateCache::getHistorical(ExpenseId expenseId, std::string_view from,
                                                       std::string_view to) {
  return find(Key{CurrencyPair{CurrencyCode(from), CurrencyCode(to)}, expenseId}, _historicalTtl);
}

std::optional<double> ExchangeRateCache::find(const Key &key, Duration ttl) {
  const TimePoint nowTime = Clock::now();

  std::lock_guard<std::mutex> guard(_mutex);
  const auto it = _ratesMap.find(key);
  if (it == _ratesMap.end()) {
    ++_nbMisses;
    return std::nullopt;
  }
  ExchangeRate &exchangeRate = it->second.exchangeRate;
  if (nowTime - exchangeRate.fetchedAt > ttl) {
    log::debug("Cached rate {} expired", key.pair);
    _ratesMap.erase(it);
    ++_nbMisses;
    return std::nullopt;
  }
  ++exchangeRate.accessCount;
  exchangeRate.lastAccessedAt = nowTime;
  it->second.lastAccessSeq = ++_accessSeq;
  ++_nbHits;
  ++_nbApiCallsSaved;
  return exchangeRate.rate;
}

void ExchangeRateCache::set(std::string_view from, std::string_view to, double rate, RateSource source) {
  const TimePoint nowTime = Clock::now();
  std::lock_guard<std::mutex> guard(_mutex);
  setUnlocked(Key{CurrencyPair{CurrencyCode(from), CurrencyCode(to)}, std::nullopt}, rate, source, nowTime);
}

void ExchangeRateCache::setHistorical(ExpenseId expenseId, std::string_view from, std::string_view to, double rate) {
  const TimePoint nowTime = Clock::now();
  std::lock_guard<std::mutex> guard(_mutex);
  setUnlocked(Key{CurrencyPair{CurrencyCode(from), CurrencyCode(to)}, expenseId}, rate, RateSource::kDatabase,
              nowTime);
}

void ExchangeRateCache::setUnlocked(Key key, double rate, RateSource source, TimePoint nowTime) {
  if (!IsValidRate(rate)) {
    log::warn("Refusing to cache invalid rate {} for {}", rate, key.pair);
    return;
  }
  if (!_ratesMap.contains(key) && static_cast<int32_t>(_ratesMap.size()) >= _maxNbEntries) {
    evictLeastRecentlyAccessed();
  }
  log::trace("Caching {} rate {} for {}", RateSourceToString(source), rate, key.pair);
  ExchangeRate exchangeRate{key.pair, rate, nowTime, source, 0, nowTime};
  _ratesMap.insert_or_assign(std::move(key), Entry{std::move(exchangeRate), ++_accessSeq});
}

void ExchangeRateCache::evictLeastRecentlyAccessed() {
  const auto it = std::ranges::min_element(_ratesMap, {}, [](const auto &entry) { return entry.second.lastAccessSeq; });
  if (it != _ratesMap.end()) {
    log::debug("Evict least recently accessed rate {}", it->first.pair);
    _ratesMap.erase(it);
  }
}

double ExchangeRateCache::getOrFetch(std::string_view from, std::string_view to, const FetchFunc &fetchFunc,
                                     bool historical) {
  const auto optRate = get(from, to, historical);
  if (optRate) {
    return *optRate;
  }
  // Lock is not held here: fetch may be slow
  const double rate = fetchFunc();
  if (!IsValidRate(rate)) {
    throw conversion_error(ErrorKind::kApiUnavailable, "Invalid rate {} fetched for {}-{}", rate, from, to);
  }
  set(from, to, rate, RateSource::kApi);
  return rate;
}

int32_t ExchangeRateCache::invalidate(std::string_view currency) {
  std::lock_guard<std::mutex> guard(_mutex);
  const auto nbRemoved = static_cast<int32_t>(
      std::erase_if(_ratesMap, [currency](const auto &entry) { return entry.first.pair.contains(currency); }));
  log::info("Invalidated {} cache entries for currency {}", nbRemoved, currency);
  return nbRemoved;
}

int32_t ExchangeRateCache::invalidateExpense(ExpenseId expenseId) {
  std::lock_guard<std::mutex> guard(_mutex);
  const auto nbRemoved = static_cast<int32_t>(
      std::erase_if(_ratesMap, [expenseId](const auto &entry) { return entry.first.expenseId == expenseId; }));
  log::debug("Invalidated {} cache entries for expense {}", nbRemoved, expenseId);
  return nbRemoved;
}

int32_t ExchangeRateCache::invalidateExpenses() {
  std::lock_guard<std::mutex> guard(_mutex);
  const auto nbRemoved = static_cast<int32_t>(
      std::erase_if(_ratesMap, [](const auto &entry) { return entry.first.expenseId.has_value(); }));
  log::info("Invalidated {} cache entries of expenses", nbRemoved);
  return nbRemoved;
}

CacheMetrics ExchangeRateCache::metrics() const {
  const TimePoint nowTime = Clock::now();
  CacheMetrics cacheMetrics;

  std::lock_guard<std::mutex> guard(_mutex);
  cacheMetrics.hits = _nbHits;
  cacheMetrics.misses = _nbMisses;
  cacheMetrics.apiCallsSaved = _nbApiCallsSaved;
  cacheMetrics.nbEntries = static_cast<int64_t>(_ratesMap.size());
  const auto nbQueries = _nbHits + _nbMisses;
  cacheMetrics.hitRate = nbQueries == 0 ? 0 : static_cast<double>(_nbHits) / static_cast<double>(nbQueries);
  if (!_ratesMap.empty()) {
    int64_t totalAccessCount = 0;
    TimePoint oldest = TimePoint::max();
    TimePoint newest = TimePoint::min();
    for (const auto &[key, entry] : _ratesMap) {
      totalAccessCount += entry.exchangeRate.accessCount;
      oldest = std::min(oldest, entry.exchangeRate.fetchedAt);
      newest = std::max(newest, entry.exchangeRate.fetchedAt);
    }
    cacheMetrics.averageAccessCount =
        static_cast<double>(totalAccessCount) / static_cast<double>(cacheMetrics.nbEntries);
    cacheMetrics.oldestEntryAge = nowTime - oldest;
    cacheMetrics.newestEntryAge = nowTime - newest;
  }
  return cacheMetrics;
}

CacheStatusSummary ExchangeRateCache::statusSummary() const {
  const CacheMetrics cacheMetrics = metrics();
  return CacheStatusSummary{
      cacheMetrics.nbEntries, std::round(cacheMetrics.hitRate * 100) / 100, cacheMetrics.apiCallsSaved,
      std::chrono::round<std::chrono::minutes>(cacheMetrics.oldestEntryAge).count()};
}

vector<std::optional<double>> ExchangeRateCache::getBatch(const vector<CurrencyPair> &pairs, bool historical) {
  vector<std::optional<double>> rates;
  rates.reserve(pairs.size());
  for (const CurrencyPair &pair : pairs) {
    rates.push_back(get(pair.from(), pair.to(), historical));
  }
  return rates;
}

void ExchangeRateCache::setBatch(const vector<ExchangeRate> &exchangeRates) {
  const TimePoint nowTime = Clock::now();
  std::lock_guard<std::mutex> guard(_mutex);
  for (const ExchangeRate &exchangeRate : exchangeRates) {
    setUnlocked(Key{exchangeRate.pair, std::nullopt}, exchangeRate.rate, exchangeRate.source, nowTime);
  }
}

void ExchangeRateCache::warm(const vector<std::pair<CurrencyPair, double>> &rates) {
  const TimePoint nowTime = Clock::now();
  std::lock_guard<std::mutex> guard(_mutex);
  for (const auto &[pair, rate] : rates) {
    setUnlocked(Key{pair, std::nullopt}, rate, RateSource::kApi, nowTime);
  }
  log::info("Cache warming completed: {} rates cached", rates.size());
}

int32_t ExchangeRateCache::clear() {
  std::lock_guard<std::mutex> guard(_mutex);
  const auto nbRemoved = static_cast<int32_t>(_ratesMap.size());
  _ratesMap.clear();
  _nbHits = 0;
  _nbMisses = 0;
  _nbApiCallsSaved = 0;
  log::info("Cache cleared: {} entries removed", nbRemoved);
  return nbRemoved;
}

int32_t ExchangeRateCache::cleanup() {
  const TimePoint nowTime = Clock::now();
  std::lock_guard<std::mutex> guard(_mutex);
  const auto nbRemoved = static_cast<int32_t>(std::erase_if(_ratesMap, [this, nowTime](const auto &entry) {
    const Duration ttl = entry.first.expenseId ? _historicalTtl : _liveTtl;
    return nowTime - entry.second.exchangeRate.fetchedAt > ttl;
  }));
  if (nbRemoved != 0) {
    log::debug("Cache cleanup: {} expired entries removed", nbRemoved);
  }
  return nbRemoved;
}

int32_t ExchangeRateCache::size() const {
  std::lock_guard<std::mutex> guard(_mutex);
  return static_cast<int32_t>(_ratesMap.size());
}

void ExchangeRateCache::startCleanup() {
  if (_cleanupThread.joinable()) {
    return;
  }
  log::debug("Start exchange rate cache cleanup every {}", DurationToString(_cleanupInterval));
  _cleanupThread = std::jthread([this](std::stop_token stopToken) {
    std::unique_lock<std::mutex> lock(_cleanupMutex);
    while (!stopToken.stop_requested()) {
      _cleanupCondition.wait_for(lock, stopToken, _cleanupInterval, [] { return false; });
      if (stopToken.stop_requested()) {
        break;
      }
      cleanup();
    }
  });
}

void ExchangeRateCache::stopCleanup() {
  if (!_cleanupThread.joinable()) {
    return;
  }
  _cleanupThread.request_stop();
  _cleanupThread.join();
  log::debug("Exchange rate cache cleanup stopped");
}

}  // namespace fxt

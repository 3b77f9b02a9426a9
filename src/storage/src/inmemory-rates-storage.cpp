#include "inmemory-rates-storage.hpp"

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <mutex>
#include <optional>
#include <string_view>
#include <utility>

#include "closesthistoricalrate.hpp"
#include "currencypair.hpp"
#include "expense.hpp"
#include "file.hpp"
#include "fxt_const.hpp"
#include "fxt_log.hpp"
#include "fxt_vector.hpp"
#include "historicalrate.hpp"
#include "rates-storage-schema.hpp"
#include "read-json.hpp"
#include "reader.hpp"
#include "timedef.hpp"
#include "validrate.hpp"
#include "write-json.hpp"
#include "writer.hpp"

namespace fxt {

namespace {
File GetRatesStorageFile(std::string_view dataDir) {
  return {dataDir, File::Type::kCache, kRatesStorageFileName, File::IfError::kNoThrow};
}

int32_t DaysBetween(TimePoint lhs, TimePoint rhs) {
  const auto nbDays = (std::chrono::floor<std::chrono::days>(lhs) - std::chrono::floor<std::chrono::days>(rhs)).count();
  return static_cast<int32_t>(std::abs(nbDays));
}
}  // namespace

InMemoryRatesStorage::InMemoryRatesStorage(std::string_view dataDir) : _dataDir(dataDir) {
  load(GetRatesStorageFile(_dataDir));
}

std::optional<Expense> InMemoryRatesStorage::findExpenseById(ExpenseId expenseId) const {
  std::lock_guard<std::mutex> guard(_mutex);
  const auto it = _expenses.find(expenseId);
  if (it == _expenses.end()) {
    return std::nullopt;
  }
  return it->second;
}

vector<Expense> InMemoryRatesStorage::findAllExpensesForMigration(int32_t batchSize, ExpenseId lastProcessedId) const {
  vector<Expense> expenses;
  std::lock_guard<std::mutex> guard(_mutex);
  for (auto it = _expenses.upper_bound(lastProcessedId);
       it != _expenses.end() && static_cast<int32_t>(expenses.size()) < batchSize; ++it) {
    expenses.push_back(it->second);
  }
  return expenses;
}

int32_t InMemoryRatesStorage::countAllExpenses() const {
  std::lock_guard<std::mutex> guard(_mutex);
  return static_cast<int32_t>(_expenses.size());
}

int32_t InMemoryRatesStorage::countHistoricalRatesForExpense(ExpenseId expenseId) const {
  std::lock_guard<std::mutex> guard(_mutex);
  int32_t count = 0;
  for (auto it = _historicalRates.lower_bound(HistoricalRateKey(expenseId, CurrencyPair()));
       it != _historicalRates.end() && it->first.first == expenseId; ++it) {
    ++count;
  }
  return count;
}

int32_t InMemoryRatesStorage::createHistoricalRates(const vector<HistoricalRate> &historicalRates) {
  int32_t nbInserted = 0;
  std::lock_guard<std::mutex> guard(_mutex);
  for (const HistoricalRate &historicalRate : historicalRates) {
    if (!IsValidRate(historicalRate.rate)) {
      log::warn("Refusing to store invalid rate {} for expense {} and {}", historicalRate.rate,
                historicalRate.expenseId, historicalRate.pair);
      continue;
    }
    // First writer wins, duplicates are silently ignored
    if (_historicalRates.try_emplace(HistoricalRateKey(historicalRate.expenseId, historicalRate.pair), historicalRate)
            .second) {
      ++nbInserted;
    }
  }
  return nbInserted;
}

std::optional<double> InMemoryRatesStorage::findHistoricalRate(ExpenseId expenseId, const CurrencyPair &pair) const {
  std::lock_guard<std::mutex> guard(_mutex);
  const auto it = _historicalRates.find(HistoricalRateKey(expenseId, pair));
  if (it == _historicalRates.end()) {
    return std::nullopt;
  }
  return it->second.rate;
}

std::optional<ClosestHistoricalRate> InMemoryRatesStorage::findClosestHistoricalRateInWindow(const CurrencyPair &pair,
                                                                                             TimePoint date,
                                                                                             int32_t maxDaysDiff) const {
  if (pair.isSameCurrency()) {
    return ClosestHistoricalRate{1, date, 0};
  }
  std::optional<ClosestHistoricalRate> closest;
  std::lock_guard<std::mutex> guard(_mutex);
  for (auto it = _dailyRates.lower_bound(DailyRateKey(pair, TimePoint::min()));
       it != _dailyRates.end() && it->first.first == pair; ++it) {
    const TimePoint rowDay = it->first.second;
    const int32_t daysDifference = DaysBetween(rowDay, date);
    if (daysDifference <= maxDaysDiff && (!closest || daysDifference < closest->daysDifference)) {
      closest = ClosestHistoricalRate{it->second, rowDay, daysDifference};
    }
  }
  return closest;
}

void InMemoryRatesStorage::upsertDailyRate(const CurrencyPair &pair, double rate, TimePoint day) {
  if (!IsValidRate(rate)) {
    log::warn("Refusing to store invalid daily rate {} for {}", rate, pair);
    return;
  }
  std::lock_guard<std::mutex> guard(_mutex);
  _dailyRates.insert_or_assign(DailyRateKey(pair, StartOfUtcDay(day)), rate);
}

std::optional<TimePoint> InMemoryRatesStorage::lastRatesUpdateTime() const {
  std::lock_guard<std::mutex> guard(_mutex);
  const auto it = std::ranges::max_element(_dailyRates, {}, [](const auto &dailyRate) { return dailyRate.first.second; });
  if (it == _dailyRates.end()) {
    return std::nullopt;
  }
  return it->first.second;
}

int32_t InMemoryRatesStorage::deleteAllHistoricalRates() {
  std::lock_guard<std::mutex> guard(_mutex);
  const auto nbDeleted = static_cast<int32_t>(_historicalRates.size());
  _historicalRates.clear();
  return nbDeleted;
}

void InMemoryRatesStorage::addExpense(Expense expense) {
  std::lock_guard<std::mutex> guard(_mutex);
  const ExpenseId expenseId = expense.id;
  _expenses.insert_or_assign(expenseId, std::move(expense));
}

bool InMemoryRatesStorage::removeExpense(ExpenseId expenseId) {
  std::lock_guard<std::mutex> guard(_mutex);
  if (_expenses.erase(expenseId) == 0) {
    return false;
  }
  // Historical rates are owned by their expense
  std::erase_if(_historicalRates,
                [expenseId](const auto &historicalRate) { return historicalRate.first.first == expenseId; });
  return true;
}

void InMemoryRatesStorage::load(const Reader &reader) {
  const auto snapshot = ReadJsonOrThrow<schema::RatesStorage>(reader);

  std::lock_guard<std::mutex> guard(_mutex);
  _expenses.clear();
  _historicalRates.clear();
  _dailyRates.clear();
  int32_t nbInvalidRates = 0;
  for (const schema::ExpenseEntry &expenseEntry : snapshot.expenses) {
    std::optional<double> conversionRate = expenseEntry.conversionRate;
    if (conversionRate && !IsValidRate(*conversionRate)) {
      ++nbInvalidRates;
      conversionRate.reset();
    }
    _expenses.insert_or_assign(expenseEntry.id,
                               Expense{expenseEntry.id, expenseEntry.amount, expenseEntry.currency,
                                       TimePointFromSecondsSinceEpoch(expenseEntry.date), conversionRate});
  }
  for (const schema::HistoricalRateEntry &rateEntry : snapshot.historicalRates) {
    if (!IsValidRate(rateEntry.rate)) {
      ++nbInvalidRates;
      continue;
    }
    CurrencyPair pair(rateEntry.from, rateEntry.to);
    HistoricalRate historicalRate{rateEntry.expenseId, pair, rateEntry.rate,
                                  TimePointFromSecondsSinceEpoch(rateEntry.recordedAt)};
    _historicalRates.try_emplace(HistoricalRateKey(rateEntry.expenseId, std::move(pair)), std::move(historicalRate));
  }
  for (const schema::DailyRateEntry &dailyRateEntry : snapshot.dailyRates) {
    if (!IsValidRate(dailyRateEntry.rate)) {
      ++nbInvalidRates;
      continue;
    }
    _dailyRates.insert_or_assign(DailyRateKey(CurrencyPair(dailyRateEntry.from, dailyRateEntry.to),
                                              StartOfUtcDay(TimePointFromSecondsSinceEpoch(dailyRateEntry.date))),
                                 dailyRateEntry.rate);
  }
  if (nbInvalidRates != 0) {
    log::warn("Ignored {} invalid rate(s) from rates storage snapshot", nbInvalidRates);
  }
  log::debug("Loaded {} expenses, {} historical rates and {} daily rates", _expenses.size(), _historicalRates.size(),
             _dailyRates.size());
}

void InMemoryRatesStorage::save(const Writer &writer) const {
  schema::RatesStorage snapshot;
  snapshot.timeepoch = TimestampToSecondsSinceEpoch(Clock::now());
  {
    std::lock_guard<std::mutex> guard(_mutex);
    snapshot.expenses.reserve(_expenses.size());
    for (const auto &[expenseId, expense] : _expenses) {
      snapshot.expenses.push_back(schema::ExpenseEntry{expenseId, expense.amount, expense.currency,
                                                       TimestampToSecondsSinceEpoch(expense.date),
                                                       expense.conversionRate});
    }
    snapshot.historicalRates.reserve(_historicalRates.size());
    for (const auto &[key, historicalRate] : _historicalRates) {
      snapshot.historicalRates.push_back(schema::HistoricalRateEntry{
          historicalRate.expenseId, historicalRate.pair.from(), historicalRate.pair.to(), historicalRate.rate,
          TimestampToSecondsSinceEpoch(historicalRate.recordedAt)});
    }
    snapshot.dailyRates.reserve(_dailyRates.size());
    for (const auto &[key, rate] : _dailyRates) {
      snapshot.dailyRates.push_back(
          schema::DailyRateEntry{key.first.from(), key.first.to(), rate, TimestampToSecondsSinceEpoch(key.second)});
    }
  }
  WritePrettyJson(snapshot, writer);
}

void InMemoryRatesStorage::updateCacheFile() const {
  if (_dataDir.empty()) {
    return;
  }
  save(GetRatesStorageFile(_dataDir));
}

}  // namespace fxt

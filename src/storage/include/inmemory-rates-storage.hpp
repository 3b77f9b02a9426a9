#pragma once

#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string_view>
#include <utility>

#include "abstract-rates-storage.hpp"
#include "cache-file-updator-interface.hpp"
#include "closesthistoricalrate.hpp"
#include "currencypair.hpp"
#include "expense.hpp"
#include "fxt_string.hpp"
#include "fxt_vector.hpp"
#include "historicalrate.hpp"
#include "timedef.hpp"

namespace fxt {

class Reader;
class Writer;

/// Thread safe storage held in memory, optionally loaded from and saved to a json snapshot file.
class InMemoryRatesStorage : public AbstractRatesStorage, public CacheFileUpdatorInterface {
 public:
  /// Creates an empty storage without persistence.
  InMemoryRatesStorage() = default;

  /// Creates a storage backed by the snapshot file 'ratesstorage.json' of the cache directory of 'dataDir'.
  explicit InMemoryRatesStorage(std::string_view dataDir);

  std::optional<Expense> findExpenseById(ExpenseId expenseId) const override;

  vector<Expense> findAllExpensesForMigration(int32_t batchSize, ExpenseId lastProcessedId = 0) const override;

  int32_t countAllExpenses() const override;

  int32_t countHistoricalRatesForExpense(ExpenseId expenseId) const override;

  int32_t createHistoricalRates(const vector<HistoricalRate> &historicalRates) override;

  std::optional<double> findHistoricalRate(ExpenseId expenseId, const CurrencyPair &pair) const override;

  std::optional<ClosestHistoricalRate> findClosestHistoricalRateInWindow(const CurrencyPair &pair, TimePoint date,
                                                                         int32_t maxDaysDiff) const override;

  void upsertDailyRate(const CurrencyPair &pair, double rate, TimePoint day) override;

  std::optional<TimePoint> lastRatesUpdateTime() const override;

  int32_t deleteAllHistoricalRates() override;

  /// Adds or replaces an expense.
  void addExpense(Expense expense);

  /// Removes an expense and all its historical rates. Returns true if the expense existed.
  bool removeExpense(ExpenseId expenseId);

  /// Loads the content of a snapshot, replacing current content.
  void load(const Reader &reader);

  /// Writes a snapshot of current content.
  void save(const Writer &writer) const;

  void updateCacheFile() const override;

 private:
  using HistoricalRateKey = std::pair<ExpenseId, CurrencyPair>;
  using DailyRateKey = std::pair<CurrencyPair, TimePoint>;

  string _dataDir;
  std::map<ExpenseId, Expense> _expenses;
  std::map<HistoricalRateKey, HistoricalRate> _historicalRates;
  std::map<DailyRateKey, double> _dailyRates;
  mutable std::mutex _mutex;
};

}  // namespace fxt

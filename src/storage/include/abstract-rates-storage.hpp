#pragma once

#include <cstdint>
#include <optional>

#include "closesthistoricalrate.hpp"
#include "currencypair.hpp"
#include "expense.hpp"
#include "fxt_vector.hpp"
#include "historicalrate.hpp"
#include "timedef.hpp"

namespace fxt {

/// Persistence collaborator of the conversion core: expenses (read only), historical rates per expense and the
/// general daily rate history.
/// Implementations must be thread safe and may throw on storage failure.
class AbstractRatesStorage {
 public:
  virtual ~AbstractRatesStorage() = default;

  virtual std::optional<Expense> findExpenseById(ExpenseId expenseId) const = 0;

  /// Returns at most 'batchSize' expenses with an id strictly greater than 'lastProcessedId', by ascending id.
  virtual vector<Expense> findAllExpensesForMigration(int32_t batchSize, ExpenseId lastProcessedId = 0) const = 0;

  virtual int32_t countAllExpenses() const = 0;

  virtual int32_t countHistoricalRatesForExpense(ExpenseId expenseId) const = 0;

  /// Inserts given rows, ignoring those whose (expenseId, pair) key already exists and those with an invalid rate
  /// (see IsValidRate).
  /// Returns the number of inserted rows.
  virtual int32_t createHistoricalRates(const vector<HistoricalRate> &historicalRates) = 0;

  virtual std::optional<double> findHistoricalRate(ExpenseId expenseId, const CurrencyPair &pair) const = 0;

  /// Returns the rate of the daily rate history closest to 'date', if any within 'maxDaysDiff' days.
  virtual std::optional<ClosestHistoricalRate> findClosestHistoricalRateInWindow(const CurrencyPair &pair,
                                                                                 TimePoint date,
                                                                                 int32_t maxDaysDiff) const = 0;

  /// Inserts or replaces the daily rate of 'pair' for the UTC day containing 'day'. An invalid rate is ignored.
  virtual void upsertDailyRate(const CurrencyPair &pair, double rate, TimePoint day) = 0;

  /// Returns the most recent day of the daily rate history, if any.
  virtual std::optional<TimePoint> lastRatesUpdateTime() const = 0;

  /// Deletes all historical rates of all expenses. Returns the number of deleted rows.
  virtual int32_t deleteAllHistoricalRates() = 0;
};

}  // namespace fxt

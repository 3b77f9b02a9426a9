#pragma once

#include <gmock/gmock.h>

#include <cstdint>
#include <optional>

#include "abstract-rates-storage.hpp"

namespace fxt {

class MockRatesStorage : public AbstractRatesStorage {
 public:
  MOCK_METHOD(std::optional<Expense>, findExpenseById, (ExpenseId), (const override));
  MOCK_METHOD(vector<Expense>, findAllExpensesForMigration, (int32_t, ExpenseId), (const override));
  MOCK_METHOD(int32_t, countAllExpenses, (), (const override));
  MOCK_METHOD(int32_t, countHistoricalRatesForExpense, (ExpenseId), (const override));
  MOCK_METHOD(int32_t, createHistoricalRates, (const vector<HistoricalRate> &), (override));
  MOCK_METHOD(std::optional<double>, findHistoricalRate, (ExpenseId, const CurrencyPair &), (const override));
  MOCK_METHOD(std::optional<ClosestHistoricalRate>, findClosestHistoricalRateInWindow,
              (const CurrencyPair &, TimePoint, int32_t), (const override));
  MOCK_METHOD(void, upsertDailyRate, (const CurrencyPair &, double, TimePoint), (override));
  MOCK_METHOD(std::optional<TimePoint>, lastRatesUpdateTime, (), (const override));
  MOCK_METHOD(int32_t, deleteAllHistoricalRates, (), (override));
};

}  // namespace fxt

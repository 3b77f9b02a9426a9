#include "inmemory-rates-storage.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <filesystem>
#include <limits>
#include <optional>
#include <string_view>

#include "currencypair.hpp"
#include "expense.hpp"
#include "file.hpp"
#include "fxt_const.hpp"
#include "fxt_string.hpp"
#include "fxt_vector.hpp"
#include "historicalrate.hpp"
#include "reader_mock.hpp"
#include "timedef.hpp"
#include "writer_mock.hpp"

namespace fxt {

using ::testing::_;
using ::testing::Return;

class InMemoryRatesStorageTest : public ::testing::Test {
 protected:
  InMemoryRatesStorageTest() {
    storage.addExpense(Expense{1, 100, "USD", day1, std::nullopt});
    storage.addExpense(Expense{2, 50, "ZAR", day1, 18.5});
    storage.addExpense(Expense{5, 10, "EUR", day2, std::nullopt});
  }

  TimePoint day1 = TimePointFromSecondsSinceEpoch(1704153600);  // 2024-01-02
  TimePoint day2 = day1 + std::chrono::days(1);
  CurrencyPair usdEur{"USD", "EUR"};
  CurrencyPair eurUsd{"EUR", "USD"};
  InMemoryRatesStorage storage;
};

TEST_F(InMemoryRatesStorageTest, FindExpense) {
  auto expense = storage.findExpenseById(2);
  ASSERT_TRUE(expense.has_value());
  EXPECT_EQ(expense->currency, "ZAR");
  EXPECT_EQ(expense->conversionRate, 18.5);
  EXPECT_FALSE(storage.findExpenseById(3).has_value());
  EXPECT_EQ(storage.countAllExpenses(), 3);
}

TEST_F(InMemoryRatesStorageTest, FindAllExpensesForMigrationPaging) {
  auto firstPage = storage.findAllExpensesForMigration(2);
  ASSERT_EQ(firstPage.size(), 2U);
  EXPECT_EQ(firstPage[0].id, 1);
  EXPECT_EQ(firstPage[1].id, 2);

  auto secondPage = storage.findAllExpensesForMigration(2, firstPage.back().id);
  ASSERT_EQ(secondPage.size(), 1U);
  EXPECT_EQ(secondPage[0].id, 5);

  EXPECT_TRUE(storage.findAllExpensesForMigration(2, 5).empty());
}

TEST_F(InMemoryRatesStorageTest, CreateHistoricalRatesIgnoresDuplicates) {
  vector<HistoricalRate> rates{HistoricalRate{1, usdEur, 0.9, day1}, HistoricalRate{1, eurUsd, 1.1, day1}};
  EXPECT_EQ(storage.createHistoricalRates(rates), 2);

  vector<HistoricalRate> duplicates{HistoricalRate{1, usdEur, 0.95, day2}};
  EXPECT_EQ(storage.createHistoricalRates(duplicates), 0);

  EXPECT_EQ(storage.findHistoricalRate(1, usdEur), 0.9);
  EXPECT_EQ(storage.countHistoricalRatesForExpense(1), 2);
  EXPECT_EQ(storage.countHistoricalRatesForExpense(2), 0);
}

TEST_F(InMemoryRatesStorageTest, CreateHistoricalRatesRejectsInvalidRates) {
  vector<HistoricalRate> rates{HistoricalRate{1, usdEur, 0, day1}, HistoricalRate{1, eurUsd, -1.1, day1},
                               HistoricalRate{2, usdEur, std::numeric_limits<double>::quiet_NaN(), day1},
                               HistoricalRate{2, eurUsd, std::numeric_limits<double>::infinity(), day1}};
  EXPECT_EQ(storage.createHistoricalRates(rates), 0);
  EXPECT_FALSE(storage.findHistoricalRate(1, usdEur).has_value());
  EXPECT_EQ(storage.countHistoricalRatesForExpense(2), 0);
}

TEST_F(InMemoryRatesStorageTest, RemoveExpenseCascades) {
  vector<HistoricalRate> rates{HistoricalRate{1, usdEur, 0.9, day1}, HistoricalRate{2, CurrencyPair("ZAR", "EUR"),
                                                                                    1 / 18.5, day1}};
  storage.createHistoricalRates(rates);

  EXPECT_TRUE(storage.removeExpense(1));
  EXPECT_FALSE(storage.removeExpense(1));
  EXPECT_EQ(storage.countHistoricalRatesForExpense(1), 0);
  EXPECT_EQ(storage.countHistoricalRatesForExpense(2), 1);
}

TEST_F(InMemoryRatesStorageTest, DeleteAllHistoricalRates) {
  vector<HistoricalRate> rates{HistoricalRate{1, usdEur, 0.9, day1}, HistoricalRate{1, eurUsd, 1.1, day1}};
  storage.createHistoricalRates(rates);

  EXPECT_EQ(storage.deleteAllHistoricalRates(), 2);
  EXPECT_EQ(storage.countHistoricalRatesForExpense(1), 0);
}

TEST_F(InMemoryRatesStorageTest, ClosestHistoricalRateInWindow) {
  storage.upsertDailyRate(usdEur, 0.91, day1 - std::chrono::days(10));
  storage.upsertDailyRate(usdEur, 0.92, day1 + std::chrono::days(3) + std::chrono::hours(5));
  storage.upsertDailyRate(eurUsd, 1.2, day1);

  auto closest = storage.findClosestHistoricalRateInWindow(usdEur, day1, 30);
  ASSERT_TRUE(closest.has_value());
  EXPECT_EQ(closest->rate, 0.92);
  EXPECT_EQ(closest->daysDifference, 3);
  EXPECT_EQ(closest->date, day1 + std::chrono::days(3));

  EXPECT_FALSE(storage.findClosestHistoricalRateInWindow(usdEur, day1, 2).has_value());
  EXPECT_FALSE(storage.findClosestHistoricalRateInWindow(CurrencyPair("GBP", "EUR"), day1, 30).has_value());
}

TEST_F(InMemoryRatesStorageTest, ClosestHistoricalRateSameCurrency) {
  auto closest = storage.findClosestHistoricalRateInWindow(CurrencyPair("EUR", "EUR"), day1, 0);
  ASSERT_TRUE(closest.has_value());
  EXPECT_EQ(closest->rate, 1);
  EXPECT_EQ(closest->daysDifference, 0);
}

TEST_F(InMemoryRatesStorageTest, UpsertDailyRateOnePerDay) {
  EXPECT_FALSE(storage.lastRatesUpdateTime().has_value());

  storage.upsertDailyRate(usdEur, 0.9, day1 + std::chrono::hours(2));
  storage.upsertDailyRate(usdEur, 0.95, day1 + std::chrono::hours(20));

  EXPECT_EQ(storage.findClosestHistoricalRateInWindow(usdEur, day1, 0)->rate, 0.95);
  EXPECT_EQ(storage.lastRatesUpdateTime(), day1);

  storage.upsertDailyRate(eurUsd, 1.05, day2);
  EXPECT_EQ(storage.lastRatesUpdateTime(), day2);
}

TEST_F(InMemoryRatesStorageTest, UpsertDailyRateIgnoresInvalidRates) {
  storage.upsertDailyRate(usdEur, 0.9, day1);
  storage.upsertDailyRate(usdEur, std::numeric_limits<double>::quiet_NaN(), day1);
  storage.upsertDailyRate(usdEur, 0, day2);
  storage.upsertDailyRate(eurUsd, -1, day2);

  EXPECT_EQ(storage.findClosestHistoricalRateInWindow(usdEur, day1, 0)->rate, 0.9);
  EXPECT_FALSE(storage.findClosestHistoricalRateInWindow(eurUsd, day2, 0).has_value());
  EXPECT_EQ(storage.lastRatesUpdateTime(), day1);
}

TEST_F(InMemoryRatesStorageTest, LoadSkipsInvalidRates) {
  MockReader reader;
  EXPECT_CALL(reader, readAll())
      .WillOnce(Return(
          R"({"timeepoch":1704153600,"expenses":[{"id":7,"amount":12.5,"currency":"GBP","date":1704153600,"conversionRate":0}],)"
          R"("historicalRates":[{"expenseId":7,"from":"GBP","to":"EUR","rate":-1.16,"recordedAt":1704153600}],)"
          R"("dailyRates":[{"from":"GBP","to":"EUR","rate":0,"date":1704153600}]})"));

  storage.load(reader);

  EXPECT_EQ(storage.countAllExpenses(), 1);
  EXPECT_FALSE(storage.findExpenseById(7)->conversionRate.has_value());
  EXPECT_EQ(storage.countHistoricalRatesForExpense(7), 0);
  EXPECT_FALSE(storage.lastRatesUpdateTime().has_value());
}

TEST_F(InMemoryRatesStorageTest, LoadFromReader) {
  MockReader reader;
  EXPECT_CALL(reader, readAll())
      .WillOnce(Return(
          R"({"timeepoch":1704153600,"expenses":[{"id":7,"amount":12.5,"currency":"GBP","date":1704153600}],)"
          R"("historicalRates":[{"expenseId":7,"from":"GBP","to":"EUR","rate":1.16,"recordedAt":1704153600}],)"
          R"("dailyRates":[{"from":"GBP","to":"EUR","rate":1.15,"date":1704153600}]})"));

  storage.load(reader);

  EXPECT_EQ(storage.countAllExpenses(), 1);
  EXPECT_FALSE(storage.findExpenseById(7)->conversionRate.has_value());
  EXPECT_EQ(storage.findHistoricalRate(7, CurrencyPair("GBP", "EUR")), 1.16);
  EXPECT_EQ(storage.lastRatesUpdateTime(), day1);
}

TEST_F(InMemoryRatesStorageTest, SaveToWriter) {
  MockWriter writer;
  EXPECT_CALL(writer, write(::testing::HasSubstr(R"("currency": "ZAR")"), _)).WillOnce(Return(1));

  storage.save(writer);
}

TEST(InMemoryRatesStorageFileTest, SnapshotRoundTrip) {
  const string dataDir = (std::filesystem::temp_directory_path() / "fxtrack_storage_test").string();
  std::filesystem::remove_all(dataDir);

  const TimePoint day = TimePointFromSecondsSinceEpoch(1704153600);
  {
    InMemoryRatesStorage storage(dataDir);
    storage.addExpense(Expense{3, 42, "CHF", day, std::nullopt});
    storage.createHistoricalRates(vector<HistoricalRate>{HistoricalRate{3, CurrencyPair("CHF", "EUR"), 1.04, day}});
    storage.updateCacheFile();
  }

  EXPECT_TRUE(File(dataDir, File::Type::kCache, kRatesStorageFileName, File::IfError::kThrow).exists());

  InMemoryRatesStorage reloaded(dataDir);
  EXPECT_EQ(reloaded.findExpenseById(3)->amount, 42);
  EXPECT_EQ(reloaded.findExpenseById(3)->date, day);
  EXPECT_EQ(reloaded.findHistoricalRate(3, CurrencyPair("CHF", "EUR")), 1.04);

  std::filesystem::remove_all(dataDir);
}

}  // namespace fxt

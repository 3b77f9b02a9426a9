#pragma once

#include <cstdint>
#include <optional>

#include "fxt_string.hpp"
#include "fxt_vector.hpp"

namespace fxt::schema {

/// Time points are stored as seconds since epoch.

struct ExpenseEntry {
  int64_t id{};
  double amount{};
  string currency;
  int64_t date{};
  std::optional<double> conversionRate;
};

struct HistoricalRateEntry {
  int64_t expenseId{};
  string from;
  string to;
  double rate{};
  int64_t recordedAt{};
};

struct DailyRateEntry {
  string from;
  string to;
  double rate{};
  int64_t date{};
};

struct RatesStorage {
  int64_t timeepoch{};
  vector<ExpenseEntry> expenses;
  vector<HistoricalRateEntry> historicalRates;
  vector<DailyRateEntry> dailyRates;
};

}  // namespace fxt::schema

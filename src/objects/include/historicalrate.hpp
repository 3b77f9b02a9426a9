#pragma once

#include "currencypair.hpp"
#include "expense.hpp"
#include "timedef.hpp"

namespace fxt {

/// Rate in force for an expense at the time it was recorded.
/// Identified by (expenseId, pair), never updated once created.
struct HistoricalRate {
  ExpenseId expenseId{};
  CurrencyPair pair;
  double rate{};
  TimePoint recordedAt;
};

}  // namespace fxt

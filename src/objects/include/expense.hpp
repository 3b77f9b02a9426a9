#pragma once

#include <cstdint>
#include <optional>

#include "currencycode.hpp"
#include "timedef.hpp"

namespace fxt {

using ExpenseId = int64_t;

/// View of an expense as needed by the conversion core.
/// 'conversionRate', when present, is the rate from 'currency' to the base currency recorded inline with the expense
/// before historical rates existed.
struct Expense {
  ExpenseId id{};
  double amount{};
  CurrencyCode currency;
  TimePoint date;
  std::optional<double> conversionRate;
};

}  // namespace fxt

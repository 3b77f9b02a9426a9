#pragma once

#include <cstdint>
#include <optional>

#include "currencycode.hpp"
#include "expense.hpp"
#include "fxt_string.hpp"
#include "fxt_vector.hpp"

namespace fxt::schema::cmdresult {

struct Convert {
  struct In {
    double amount;
    CurrencyCode from;
    CurrencyCode to;
    std::optional<ExpenseId> expenseId;
  } in;
  double out;
};

struct Refresh {
  int32_t nbRefreshedRates;
};

struct Freshness {
  bool success;
  bool updated;
  bool timedOut;
  string error;
};

struct Migration {
  int32_t totalExpenses;
  int32_t migratedExpenses;
  int32_t skippedExpenses;
  vector<string> errors;
  int64_t durationMs;
};

struct Rollback {
  int32_t nbDeletedHistoricalRates;
};

struct CacheMetrics {
  int64_t hits;
  int64_t misses;
  int64_t apiCallsSaved;
  int64_t nbEntries;
  double hitRate;
  double averageAccessCount;
  int64_t oldestEntryAgeMs;
  int64_t newestEntryAgeMs;
};

}  // namespace fxt::schema::cmdresult

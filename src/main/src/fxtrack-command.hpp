#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <string_view>

#include "currencycode.hpp"
#include "expense.hpp"
#include "fxt_const.hpp"
#include "fxt_string.hpp"

namespace fxt {

enum class FxTrackCommandType : int8_t {
  kConvert,
  kSaveRates,
  kRefresh,
  kEnsureFresh,
  kMigrate,
  kRollback,
  kStatus,
  kMetrics,
};

/// Command and options given on the command line.
struct FxTrackCommand {
  FxTrackCommandType type{FxTrackCommandType::kStatus};
  string dataDir{kDefaultDataDir};
  double amount{};
  CurrencyCode from;
  CurrencyCode to;
  std::optional<ExpenseId> expenseId;
  std::optional<int32_t> batchSize;
  std::optional<int32_t> nbMaxRetries;
  bool resume{};
};

/// Parses the command line arguments, excluding the program name.
/// Returns an empty optional if help was requested (usage is then printed on standard output).
/// Throws invalid_argument on incorrect arguments.
std::optional<FxTrackCommand> ParseFxTrackCommand(std::span<const char *const> args);

/// Same as above from 'main' arguments, skipping the program name if any.
std::optional<FxTrackCommand> ParseFxTrackCommand(int argc, const char *const argv[]);

string FxTrackUsage(std::string_view programName);

}  // namespace fxt

#pragma once

#include <chrono>
#include <cstdint>
#include <string_view>
#include <unordered_set>

#include "currencycode.hpp"
#include "currencypair.hpp"
#include "expense.hpp"
#include "fxt_string.hpp"
#include "fxt_vector.hpp"
#include "migration-state-schema.hpp"
#include "migrationresult.hpp"
#include "timedef.hpp"

namespace fxt {

class AbstractRatesStorage;
class ConversionEngine;

/// Populates historical rates of expenses created before historical rates were recorded.
/// Existing historical rates are never overwritten: an expense having at least one historical rate is skipped.
/// Only storage failures are retried. An expense without any available rate fails immediately, and a pair whose live
/// rate could not be fetched is not queried again until the end of the run.
class BackfillJob {
 public:
  struct Settings {
    CurrencyCode baseCurrency;
    vector<CurrencyCode> supportedCurrencies;
    int32_t batchSize = 50;
    int32_t maxDaysDifference = 30;
    int32_t nbMaxRetries = 3;
    Duration retryDelay = std::chrono::seconds(1);
  };

  /// If 'dataDir' is not empty, migration progress is persisted in its cache directory after each batch.
  BackfillJob(AbstractRatesStorage &ratesStorage, const ConversionEngine &conversionEngine, Settings settings,
              std::string_view dataDir = {});

  /// Migrates all expenses, from the first one.
  MigrationResult migrateExistingExpenses();

  /// Continues an interrupted migration after its last processed expense, or starts a new one if the last migration
  /// is not running or failed.
  MigrationResult resume();

  /// Deletes all historical rates and the persisted migration state. Returns the number of deleted historical rates.
  int32_t rollback();

  /// Returns the persisted state of the last migration, or the state of the last run without persistence.
  schema::MigrationState status() const;

 private:
  enum class ExpenseOutcome : int8_t { kMigrated, kAlreadyMigrated, kFailed };

  MigrationResult run(schema::MigrationState state);

  ExpenseOutcome processExpense(const Expense &expense, vector<string> &errors);

  bool migrateExpense(const Expense &expense);

  void persistState(const schema::MigrationState &state);

  using CurrencyPairSet = std::unordered_set<CurrencyPair>;

  AbstractRatesStorage &_ratesStorage;
  const ConversionEngine &_conversionEngine;
  Settings _settings;
  std::string_view _dataDir;
  schema::MigrationState _lastState;
  // pairs whose live rate could not be fetched during current run, not queried again
  CurrencyPairSet _unavailablePairs;
};

}  // namespace fxt

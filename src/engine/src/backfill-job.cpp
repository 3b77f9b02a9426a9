#include "backfill-job.hpp"

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <exception>
#include <string_view>
#include <thread>
#include <utility>

#include "abstract-rates-storage.hpp"
#include "conversion-engine.hpp"
#include "conversion-error.hpp"
#include "currencypair.hpp"
#include "file.hpp"
#include "fxt_const.hpp"
#include "fxt_format.hpp"
#include "fxt_invalid_argument_exception.hpp"
#include "fxt_log.hpp"
#include "historicalrate.hpp"
#include "migration-state-schema.hpp"
#include "migrationresult.hpp"
#include "read-json.hpp"
#include "timedef.hpp"
#include "validrate.hpp"
#include "write-json.hpp"

namespace fxt {

namespace {
File GetMigrationStateFile(std::string_view dataDir) {
  return {dataDir, File::Type::kCache, kMigrationStateFileName, File::IfError::kNoThrow};
}
}  // namespace

BackfillJob::BackfillJob(AbstractRatesStorage &ratesStorage, const ConversionEngine &conversionEngine,
                         Settings settings, std::string_view dataDir)
    : _ratesStorage(ratesStorage),
      _conversionEngine(conversionEngine),
      _settings(std::move(settings)),
      _dataDir(dataDir) {
  if (_settings.batchSize <= 0) {
    throw invalid_argument("Migration batch size should be strictly positive");
  }
  _settings.nbMaxRetries = std::max(_settings.nbMaxRetries, 1);
}

MigrationResult BackfillJob::migrateExistingExpenses() {
  schema::MigrationState state;
  state.startTime = TimestampToMillisecondsSinceEpoch(Clock::now());
  return run(std::move(state));
}

MigrationResult BackfillJob::resume() {
  schema::MigrationState state = status();
  if (state.status != schema::MigrationStatus::running && state.status != schema::MigrationStatus::failed) {
    log::info("No interrupted migration to resume, starting a new one");
    return migrateExistingExpenses();
  }
  log::info("Resuming migration after expense {} ({} already processed)", state.lastProcessedId,
            state.processedExpenses);
  // Errors of the previous run are not carried over, failed expenses before 'lastProcessedId' are not retried
  state.errors.clear();
  return run(std::move(state));
}

int32_t BackfillJob::rollback() {
  log::warn("Rolling back migration: deleting all historical rates");
  const int32_t nbDeleted = _ratesStorage.deleteAllHistoricalRates();
  if (!_dataDir.empty()) {
    GetMigrationStateFile(_dataDir).remove();
  }
  _lastState = schema::MigrationState{};
  log::info("Rollback completed: {} historical rate(s) deleted", nbDeleted);
  return nbDeleted;
}

schema::MigrationState BackfillJob::status() const {
  if (_dataDir.empty()) {
    return _lastState;
  }
  return ReadJsonOrThrow<schema::MigrationState>(GetMigrationStateFile(_dataDir));
}

MigrationResult BackfillJob::run(schema::MigrationState state) {
  const auto startTime = std::chrono::steady_clock::now();
  const auto computeDuration = [startTime] {
    return std::chrono::duration_cast<milliseconds>(std::chrono::steady_clock::now() - startTime);
  };

  state.status = schema::MigrationStatus::running;
  state.batchSize = _settings.batchSize;
  _unavailablePairs.clear();

  int32_t nbProcessedInRun = 0;
  int32_t nbMigratedInRun = 0;
  int32_t nbSkippedInRun = 0;

  try {
    state.totalExpenses = _ratesStorage.countAllExpenses();
    log::info("Starting historical rates migration of {} expense(s)", state.totalExpenses);

    while (true) {
      const auto expenses = _ratesStorage.findAllExpensesForMigration(_settings.batchSize, state.lastProcessedId);
      if (expenses.empty()) {
        break;
      }
      for (const Expense &expense : expenses) {
        switch (processExpense(expense, state.errors)) {
          case ExpenseOutcome::kMigrated:
            ++state.migratedExpenses;
            ++nbMigratedInRun;
            break;
          case ExpenseOutcome::kAlreadyMigrated:
            [[fallthrough]];
          case ExpenseOutcome::kFailed:
            ++state.skippedExpenses;
            ++nbSkippedInRun;
            break;
        }
        ++state.processedExpenses;
        ++nbProcessedInRun;
        state.lastProcessedId = expense.id;
      }
      log::info("Migration progress: {}/{} expense(s) processed", state.processedExpenses, state.totalExpenses);
      persistState(state);
    }
  } catch (const std::exception &e) {
    // only storage accesses may throw here
    log::error("Migration failed: {}", e.what());
    state.errors.push_back(format("Migration failed: {}: {}", ErrorKindToString(ErrorKind::kDatabaseError), e.what()));
    state.status = schema::MigrationStatus::failed;
    persistState(state);
    return MigrationResult{0, nbMigratedInRun, nbSkippedInRun, std::move(state.errors), computeDuration()};
  }

  state.status = schema::MigrationStatus::completed;
  persistState(state);

  MigrationResult migrationResult{nbProcessedInRun, nbMigratedInRun, nbSkippedInRun, state.errors, computeDuration()};
  log::info("Migration completed in {} ms: {} migrated, {} skipped, {} error(s)", migrationResult.duration.count(),
            migrationResult.migratedExpenses, migrationResult.skippedExpenses, migrationResult.errors.size());
  return migrationResult;
}

BackfillJob::ExpenseOutcome BackfillJob::processExpense(const Expense &expense, vector<string> &errors) {
  for (int32_t attemptNb = 1;; ++attemptNb) {
    ErrorKind errorKind = ErrorKind::kDatabaseError;
    string errorMsg;
    try {
      return migrateExpense(expense) ? ExpenseOutcome::kMigrated : ExpenseOutcome::kAlreadyMigrated;
    } catch (const conversion_error &e) {
      errorKind = e.kind();
      errorMsg = e.what();
    } catch (const std::exception &e) {
      // rate failures are handled per pair, remaining ones come from storage
      errorMsg = e.what();
    }
    // a missing rate will not appear by retrying
    if (errorKind == ErrorKind::kRateNotFound || attemptNb >= _settings.nbMaxRetries) {
      log::error("Migration of expense {} failed after {} attempt(s): {}", expense.id, attemptNb, errorMsg);
      errors.push_back(format("Expense {}: {}: {}", expense.id, ErrorKindToString(errorKind), errorMsg));
      return ExpenseOutcome::kFailed;
    }
    log::warn("Migration attempt {} of expense {} failed: {}", attemptNb, expense.id, errorMsg);
    std::this_thread::sleep_for(_settings.retryDelay);
  }
}

bool BackfillJob::migrateExpense(const Expense &expense) {
  const int32_t nbExistingRates = _ratesStorage.countHistoricalRatesForExpense(expense.id);
  if (nbExistingRates > 0) {
    log::debug("Skipping expense {}: {} historical rate(s) already exist", expense.id, nbExistingRates);
    return false;
  }

  vector<HistoricalRate> historicalRates;
  const auto isCovered = [&historicalRates](const CurrencyPair &pair) {
    return std::ranges::any_of(historicalRates,
                               [&pair](const HistoricalRate &historicalRate) { return historicalRate.pair == pair; });
  };

  const CurrencyCode &baseCurrency = _settings.baseCurrency;
  if (expense.currency != baseCurrency && expense.conversionRate && IsValidRate(*expense.conversionRate)) {
    const double rate = *expense.conversionRate;
    log::debug("Using inline conversion rate {} of expense {}", rate, expense.id);
    historicalRates.push_back(
        HistoricalRate{expense.id, CurrencyPair(expense.currency, baseCurrency), rate, expense.date});
    historicalRates.push_back(
        HistoricalRate{expense.id, CurrencyPair(baseCurrency, expense.currency), 1 / rate, expense.date});
  }

  int32_t nbFromHistory = 0;
  int32_t nbFromProvider = 0;
  for (const CurrencyCode &from : _settings.supportedCurrencies) {
    for (const CurrencyCode &to : _settings.supportedCurrencies) {
      if (from == to) {
        continue;
      }
      CurrencyPair pair(from, to);
      if (isCovered(pair)) {
        continue;
      }
      const auto optClosestRate =
          _ratesStorage.findClosestHistoricalRateInWindow(pair, expense.date, _settings.maxDaysDifference);
      if (optClosestRate && IsValidRate(optClosestRate->rate)) {
        log::debug("Closest rate {} for {} of expense {} is {} day(s) away", optClosestRate->rate, pair, expense.id,
                   optClosestRate->daysDifference);
        historicalRates.push_back(HistoricalRate{expense.id, std::move(pair), optClosestRate->rate, expense.date});
        ++nbFromHistory;
        continue;
      }
      if (_unavailablePairs.contains(pair)) {
        log::trace("Rate {} already unavailable in this migration", pair);
        continue;
      }
      try {
        const double rate = _conversionEngine.fetchRate(from, to, true);
        historicalRates.push_back(HistoricalRate{expense.id, std::move(pair), rate, expense.date});
        ++nbFromProvider;
      } catch (const std::exception &e) {
        log::warn("Unable to resolve rate {} for expense {}: {}", pair, expense.id, e.what());
        _unavailablePairs.insert(std::move(pair));
      }
    }
  }

  if (historicalRates.empty()) {
    throw conversion_error(ErrorKind::kRateNotFound, "No rates available for migration");
  }

  const int32_t nbInserted = _ratesStorage.createHistoricalRates(historicalRates);
  log::info("Migrated expense {}: {} rate(s) saved ({} from history, {} from provider)", expense.id, nbInserted,
            nbFromHistory, nbFromProvider);
  return true;
}

void BackfillJob::persistState(const schema::MigrationState &state) {
  _lastState = state;
  if (_dataDir.empty()) {
    return;
  }
  try {
    WritePrettyJson(state, GetMigrationStateFile(_dataDir));
  } catch (const std::exception &e) {
    log::error("Unable to persist migration state: {}", e.what());
  }
}

}  // namespace fxt

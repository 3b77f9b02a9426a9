#include "processcommandsfromcli.hpp"

#include <chrono>
#include <exception>
#include <utility>

#include "command-result-schema.hpp"
#include "curlhandle.hpp"
#include "exchangerate-api-provider.hpp"
#include "fxt_log.hpp"
#include "fxtrack-command.hpp"
#include "fxtrackinfo.hpp"
#include "general-config.hpp"
#include "inmemory-rates-storage.hpp"
#include "logginginfo.hpp"
#include "migrationresult.hpp"
#include "rates-service.hpp"
#include "runmodes.hpp"
#include "timedef.hpp"
#include "write-json.hpp"

namespace fxt {

namespace {

FxTrackInfo CreateFxTrackInfo(const FxTrackCommand &command, settings::RunMode runMode) {
  schema::GeneralConfig generalConfig = ReadGeneralConfig(command.dataDir);
  if (command.batchSize) {
    generalConfig.migration.batchSize = *command.batchSize;
  }
  if (command.nbMaxRetries) {
    generalConfig.migration.nbMaxRetries = *command.nbMaxRetries;
  }
  LoggingInfo loggingInfo(LoggingInfo::WithLoggersCreation::kYes, command.dataDir, generalConfig.log);
  return FxTrackInfo(runMode, command.dataDir, std::move(generalConfig), std::move(loggingInfo));
}

void PrintJson(const auto &obj) {
  log::get(LoggingInfo::kOutputLoggerName)->info("{}", WritePrettyJsonOrThrow(obj));
}

void PrintMigrationResult(const MigrationResult &migrationResult) {
  PrintJson(schema::cmdresult::Migration{migrationResult.totalExpenses, migrationResult.migratedExpenses,
                                         migrationResult.skippedExpenses, migrationResult.errors,
                                         migrationResult.duration.count()});
}

void Process(const FxTrackCommand &command, RatesService &ratesService) {
  switch (command.type) {
    case FxTrackCommandType::kConvert: {
      const double converted = ratesService.convert(command.amount, command.from, command.to, command.expenseId);
      PrintJson(schema::cmdresult::Convert{{command.amount, command.from, command.to, command.expenseId}, converted});
      break;
    }
    case FxTrackCommandType::kSaveRates:
      ratesService.saveRatesForExpense(*command.expenseId, Clock::now());
      break;
    case FxTrackCommandType::kRefresh:
      PrintJson(schema::cmdresult::Refresh{ratesService.refreshRates()});
      break;
    case FxTrackCommandType::kEnsureFresh: {
      const auto freshnessResult = ratesService.ensureFreshRates();
      PrintJson(schema::cmdresult::Freshness{freshnessResult.success, freshnessResult.updated,
                                             freshnessResult.timedOut, freshnessResult.error});
      break;
    }
    case FxTrackCommandType::kMigrate:
      PrintMigrationResult(command.resume ? ratesService.resumeMigration() : ratesService.migrateExistingExpenses());
      break;
    case FxTrackCommandType::kRollback:
      PrintJson(schema::cmdresult::Rollback{ratesService.rollbackMigration()});
      break;
    case FxTrackCommandType::kStatus:
      PrintJson(ratesService.migrationStatus());
      break;
    case FxTrackCommandType::kMetrics: {
      const auto cacheMetrics = ratesService.getCacheMetrics();
      PrintJson(schema::cmdresult::CacheMetrics{
          cacheMetrics.hits, cacheMetrics.misses, cacheMetrics.apiCallsSaved, cacheMetrics.nbEntries,
          cacheMetrics.hitRate, cacheMetrics.averageAccessCount,
          std::chrono::duration_cast<milliseconds>(cacheMetrics.oldestEntryAge).count(),
          std::chrono::duration_cast<milliseconds>(cacheMetrics.newestEntryAge).count()});
      break;
    }
  }
}

}  // namespace

bool ProcessCommandFromCLI(const FxTrackCommand &command, settings::RunMode runMode) {
  // Should be outside the try / catch as it holds the RAII object managing the Logging (LoggingInfo)
  const FxTrackInfo fxTrackInfo = CreateFxTrackInfo(command, runMode);

  CurlInitRAII curlInitRAII;  // Should be before any curl query

  try {
    InMemoryRatesStorage ratesStorage(fxTrackInfo.dataDir());
    ExchangeRateApiProvider rateProvider(fxTrackInfo);
    {
      RatesService ratesService(fxTrackInfo, ratesStorage, rateProvider);

      Process(command, ratesService);
    }

    // Write potentially updated storage on disk at end of program
    ratesStorage.updateCacheFile();

    log::debug("normal termination");
  } catch (const std::exception &e) {
    // Log exception here as LoggingInfo is still configured at this point (will be destroyed immediately afterwards)
    log::critical("{}", e.what());
    return false;
  }
  return true;
}

}  // namespace fxt

#pragma once

#include <string_view>

namespace fxt {

static constexpr std::string_view kDefaultDataDir = FXT_DATA_DIR;

/// General configuration file, created with default values if absent.
static constexpr std::string_view kGeneralConfigFileName = "generalconfig.json";

/// Snapshot of expenses, historical rates and daily rates of the in-memory storage.
static constexpr std::string_view kRatesStorageFileName = "ratesstorage.json";

/// Persisted progress of the historical rates migration, used to resume an interrupted run.
static constexpr std::string_view kMigrationStateFileName = "migrationstate.json";

}  // namespace fxt

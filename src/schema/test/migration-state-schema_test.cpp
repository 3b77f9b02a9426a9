#include "migration-state-schema.hpp"

#include <gtest/gtest.h>

#include "read-json.hpp"
#include "write-json.hpp"

namespace fxt {

TEST(MigrationStateSchema, WriteMinified) {
  schema::MigrationState state;
  state.startTime = 1704153600;
  state.totalExpenses = 3;
  state.processedExpenses = 3;
  state.migratedExpenses = 2;
  state.skippedExpenses = 1;
  state.errors.emplace_back("Expense 3: No rates available for migration");
  state.lastProcessedId = 3;
  state.batchSize = 50;
  state.status = schema::MigrationStatus::completed;

  EXPECT_EQ(
      WriteJsonOrThrow(state),
      R"({"startTime":1704153600,"totalExpenses":3,"processedExpenses":3,"migratedExpenses":2,"skippedExpenses":1,"errors":["Expense 3: No rates available for migration"],"lastProcessedId":3,"batchSize":50,"status":"completed"})");
}

TEST(MigrationStateSchema, Read) {
  auto state = ReadJsonOrThrow<schema::MigrationState>(R"({"lastProcessedId":42,"status":"running"})");

  EXPECT_EQ(state.lastProcessedId, 42);
  EXPECT_EQ(state.status, schema::MigrationStatus::running);
  EXPECT_TRUE(state.errors.empty());
}

}  // namespace fxt

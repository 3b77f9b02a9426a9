#pragma once

#include <cstdint>

#include "fxt_string.hpp"
#include "fxt_vector.hpp"
#include "timedef.hpp"

namespace fxt {

/// Outcome of a historical rates migration run.
/// Skipped expenses are either already migrated ones or failures, the latter having a matching entry in 'errors'.
struct MigrationResult {
  int32_t totalExpenses{};
  int32_t migratedExpenses{};
  int32_t skippedExpenses{};
  vector<string> errors;
  milliseconds duration{};
};

}  // namespace fxt

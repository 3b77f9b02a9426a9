#pragma once

#include <cstdint>

#include "fxt_json.hpp"
#include "fxt_string.hpp"
#include "fxt_vector.hpp"

namespace fxt::schema {

enum class MigrationStatus : int8_t { idle, running, completed, failed };

/// Progress of a historical rates migration, persisted after each batch so that an interrupted run can resume.
struct MigrationState {
  int64_t startTime{};
  int32_t totalExpenses{};
  int32_t processedExpenses{};
  int32_t migratedExpenses{};
  int32_t skippedExpenses{};
  vector<string> errors;
  int64_t lastProcessedId{};
  int32_t batchSize{};
  MigrationStatus status{MigrationStatus::idle};
};

}  // namespace fxt::schema

// To make enum serializable as strings
template <>
struct glz::meta<::fxt::schema::MigrationStatus> {
  using enum ::fxt::schema::MigrationStatus;

  static constexpr auto value = enumerate(idle, running, completed, failed);
};

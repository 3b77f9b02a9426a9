#pragma once

#include <cstdint>

#include "timedef.hpp"

namespace fxt {

struct CacheMetrics {
  int64_t hits{};
  int64_t misses{};
  int64_t apiCallsSaved{};
  int64_t nbEntries{};
  /// hits / (hits + misses), 0 when the cache has never been queried.
  double hitRate{};
  double averageAccessCount{};
  /// Ages of the oldest and newest entries, zero when empty.
  Duration oldestEntryAge{};
  Duration newestEntryAge{};
};

/// Short cache status, for display.
struct CacheStatusSummary {
  int64_t size{};
  /// Hit rate rounded to 2 decimals.
  double hitRate{};
  int64_t apiCallsSaved{};
  int64_t oldestAgeMinutes{};
};

}  // namespace fxt

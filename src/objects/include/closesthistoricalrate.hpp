#pragma once

#include <cstdint>

#include "timedef.hpp"

namespace fxt {

/// Rate of the rate history closest in time to a requested date.
struct ClosestHistoricalRate {
  double rate{};
  TimePoint date;
  int32_t daysDifference{};
};

}  // namespace fxt

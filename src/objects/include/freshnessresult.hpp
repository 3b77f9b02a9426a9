#pragma once

#include "fxt_string.hpp"

namespace fxt {

struct FreshnessResult {
  bool success{};
  bool updated{};
  bool timedOut{};
  string error;
};

}  // namespace fxt

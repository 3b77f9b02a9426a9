#pragma once

#include <cmath>

namespace fxt {

/// A rate is usable only if finite and strictly positive. Other values are never cached nor stored.
inline bool IsValidRate(double rate) { return std::isfinite(rate) && rate > 0; }

}  // namespace fxt

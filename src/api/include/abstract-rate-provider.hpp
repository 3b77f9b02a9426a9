#pragma once

#include <string_view>

namespace fxt {

/// Source of live exchange rates.
class AbstractRateProvider {
 public:
  virtual ~AbstractRateProvider() = default;

  /// Returns the current rate to convert one unit of 'from' into 'to'.
  /// Throws an exception if the rate cannot be retrieved. A returned rate is always strictly positive.
  virtual double fetchLiveRate(std::string_view from, std::string_view to) = 0;
};

}  // namespace fxt

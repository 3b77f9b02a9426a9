#pragma once

#include <cstdint>
#include <string_view>

#include "currencypair.hpp"
#include "timedef.hpp"

namespace fxt {

enum class RateSource : int8_t { kApi, kDatabase, kFallback };

std::string_view RateSourceToString(RateSource rateSource);

/// Cache resident rate, never persisted.
struct ExchangeRate {
  CurrencyPair pair;
  double rate{};
  TimePoint fetchedAt;
  RateSource source{RateSource::kApi};
  int64_t accessCount{};
  TimePoint lastAccessedAt;
};

}  // namespace fxt

#pragma once

#include <cstdint>
#include <unordered_map>

#include "fxt_string.hpp"

namespace fxt::schema {

/// Latest rates of a base currency, as returned by exchangerate-api.com (v4).
/// Other fields of the response are ignored.
struct ExchangeRateApiLatest {
  string base;
  string date;
  int64_t time_last_updated{};
  std::unordered_map<string, double> rates;
};

}  // namespace fxt::schema

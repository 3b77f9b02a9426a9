#include "exchangerate.hpp"

#include <string_view>

#include "fxt_exception.hpp"

namespace fxt {

std::string_view RateSourceToString(RateSource rateSource) {
  switch (rateSource) {
    case RateSource::kApi:
      return "api";
    case RateSource::kDatabase:
      return "database";
    case RateSource::kFallback:
      return "fallback";
    default:
      throw exception("Unknown rate source {}", static_cast<int>(rateSource));
  }
}

}  // namespace fxt

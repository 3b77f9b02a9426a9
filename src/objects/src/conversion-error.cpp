#include "conversion-error.hpp"

#include <string_view>

namespace fxt {

std::string_view ErrorKindToString(ErrorKind errorKind) {
  switch (errorKind) {
    case ErrorKind::kRateNotFound:
      return "RATE_NOT_FOUND";
    case ErrorKind::kApiUnavailable:
      return "API_UNAVAILABLE";
    case ErrorKind::kInvalidCurrency:
      return "INVALID_CURRENCY";
    case ErrorKind::kDatabaseError:
      return "DATABASE_ERROR";
    default:
      throw exception("Unknown error kind {}", static_cast<int>(errorKind));
  }
}

}  // namespace fxt

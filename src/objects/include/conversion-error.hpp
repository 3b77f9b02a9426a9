#pragma once

#include <cstdint>
#include <string_view>
#include <utility>

#include "fxt_exception.hpp"
#include "fxt_format.hpp"

namespace fxt {

enum class ErrorKind : int8_t { kRateNotFound, kApiUnavailable, kInvalidCurrency, kDatabaseError };

std::string_view ErrorKindToString(ErrorKind errorKind);

/// Conversion failure of a given kind.
class conversion_error : public exception {
 public:
  template <typename... Args>
  explicit conversion_error(ErrorKind errorKind, format_string<Args...> fmt, Args &&...args)
      : exception(fmt, std::forward<Args>(args)...), _errorKind(errorKind) {}

  ErrorKind kind() const noexcept { return _errorKind; }

 private:
  ErrorKind _errorKind;
};

}  // namespace fxt

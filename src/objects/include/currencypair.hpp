#pragma once

#include <compare>
#include <functional>
#include <string_view>
#include <utility>

#include "currencycode.hpp"
#include "fxt_format.hpp"
#include "fxt_hash.hpp"
#include "fxt_string.hpp"

namespace fxt {

/// Ordered couple of currencies of a conversion.
/// Important note: USD/EUR != EUR/USD. Use reverse() to reverse it.
class CurrencyPair {
 public:
  CurrencyPair() noexcept = default;

  CurrencyPair(CurrencyCode from, CurrencyCode to) : _from(std::move(from)), _to(std::move(to)) {}

  /// Create a CurrencyPair from its string representation.
  /// The two currency codes must be separated by given char separator.
  explicit CurrencyPair(std::string_view pairStrRep, char currencyCodeSep = '-');

  const CurrencyCode &from() const noexcept { return _from; }

  const CurrencyCode &to() const noexcept { return _to; }

  /// Computes the reverse pair.
  /// Example: return EUR/USD for a pair USD/EUR
  [[nodiscard]] CurrencyPair reverse() const { return {_to, _from}; }

  bool isSameCurrency() const noexcept { return _from == _to; }

  /// Tells whether this pair involves given currency, on either side.
  bool contains(std::string_view cur) const noexcept { return _from == cur || _to == cur; }

  /// Key representation, for instance "USD-EUR"
  string str(char sep = '-') const;

  auto operator<=>(const CurrencyPair &) const = default;

  bool operator==(const CurrencyPair &) const = default;

 private:
  CurrencyCode _from;
  CurrencyCode _to;
};

}  // namespace fxt

template <>
struct fmt::formatter<::fxt::CurrencyPair> {
  constexpr auto parse(format_parse_context &ctx) -> decltype(ctx.begin()) {
    auto it = ctx.begin();
    const auto end = ctx.end();
    if (it != end && *it != '}') {
      throw format_error("invalid format");
    }
    return it;
  }

  template <typename FormatContext>
  auto format(const ::fxt::CurrencyPair &pair, FormatContext &ctx) const -> decltype(ctx.out()) {
    return fmt::format_to(ctx.out(), "{}-{}", pair.from(), pair.to());
  }
};

namespace std {
template <>
struct hash<::fxt::CurrencyPair> {
  auto operator()(const ::fxt::CurrencyPair &pair) const {
    return ::fxt::HashCombine(hash<::fxt::CurrencyCode>()(pair.from()), hash<::fxt::CurrencyCode>()(pair.to()));
  }
};
}  // namespace std

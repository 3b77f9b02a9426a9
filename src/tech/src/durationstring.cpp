#include "durationstring.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <chrono>
#include <cstdint>
#include <string_view>
#include <system_error>
#include <type_traits>
#include <utility>

#include "fxt_format.hpp"
#include "fxt_invalid_argument_exception.hpp"
#include "fxt_string.hpp"
#include "timedef.hpp"

namespace fxt {

namespace {
using UnitDuration = std::pair<std::string_view, Duration>;

constexpr UnitDuration kDurationUnits[] = {
    {"y", std::chrono::years(1)},   {"mon", std::chrono::months(1)},      {"w", std::chrono::weeks(1)},
    {"d", std::chrono::days(1)},    {"h", std::chrono::hours(1)},         {"min", std::chrono::minutes(1)},
    {"s", std::chrono::seconds(1)}, {"ms", std::chrono::milliseconds(1)}, {"us", std::chrono::microseconds(1)},
};

constexpr char kInvalidTimeDurationUnitMsg[] =
    "Cannot parse time duration. Accepted time units are y, mon, w, d, h, min, s, ms and us";

bool IsSpace(char ch) { return std::isspace(static_cast<unsigned char>(ch)) != 0; }
bool IsDigit(char ch) { return std::isdigit(static_cast<unsigned char>(ch)) != 0; }
bool IsLower(char ch) { return std::islower(static_cast<unsigned char>(ch)) != 0; }

}  // namespace

Duration ParseDuration(std::string_view durationStr) {
  while (!durationStr.empty() && IsSpace(durationStr.front())) {
    durationStr.remove_prefix(1);
  }

  if (durationStr.empty()) {
    throw invalid_argument("Empty duration is not allowed");
  }
  if (durationStr.find('.') != std::string_view::npos) {
    throw invalid_argument("Time amount should be an integral value");
  }

  const auto sz = durationStr.size();
  Duration ret{};
  for (std::remove_const_t<decltype(sz)> charPos = 0; charPos < sz;) {
    const auto intFirst = charPos;

    while (charPos < sz && IsDigit(durationStr[charPos])) {
      ++charPos;
    }
    if (intFirst == charPos) {
      throw invalid_argument(kInvalidTimeDurationUnitMsg);
    }
    int64_t timeAmount{};
    const auto [ptr, err] = std::from_chars(durationStr.data() + intFirst, durationStr.data() + charPos, timeAmount);
    if (err != std::errc()) {
      throw invalid_argument("Unable to parse time amount in '{}'", durationStr);
    }

    while (charPos < sz && IsSpace(durationStr[charPos])) {
      ++charPos;
    }
    const auto unitFirst = charPos;
    while (charPos < sz && IsLower(durationStr[charPos])) {
      ++charPos;
    }
    const std::string_view timeUnitStr(durationStr.begin() + unitFirst, durationStr.begin() + charPos);
    const auto it = std::ranges::find_if(kDurationUnits, [timeUnitStr](const auto &durationUnitWithDuration) {
      return durationUnitWithDuration.first == timeUnitStr;
    });
    if (it == std::end(kDurationUnits)) {
      throw invalid_argument(kInvalidTimeDurationUnitMsg);
    }
    ret += timeAmount * it->second;
    while (charPos < sz && IsSpace(durationStr[charPos])) {
      ++charPos;
    }
  }

  return ret;
}

string DurationToString(Duration dur, int nbSignificantUnits) {
  string ret;

  if (dur == kUndefinedDuration) {
    ret.append("<undef>");
    return ret;
  }

  for (const auto &[unitStr, unitDuration] : kDurationUnits) {
    if (dur >= unitDuration) {
      const auto countInThisDurationUnit = dur / unitDuration;
      fxt::format_to(std::back_inserter(ret), "{}{}", countInThisDurationUnit, unitStr);
      dur -= countInThisDurationUnit * unitDuration;
      if (--nbSignificantUnits == 0) {
        break;
      }
    }
  }

  if (ret.empty()) {
    ret.append("0s");
  }

  return ret;
}

}  // namespace fxt

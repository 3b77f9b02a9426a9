#pragma once

#include <string_view>

#include "fxt_string.hpp"
#include "timedef.hpp"

namespace fxt {

inline constexpr const char* const kTimeYearToSecondSpaceSeparatedFormat = "%Y-%m-%d %H:%M:%S";

inline constexpr const char* const kTimeYearToSecondTSeparatedFormatUTC = "%Y-%m-%dT%H:%M:%SZ";

inline constexpr const char* const kTimeYearToDayFormat = "%Y-%m-%d";

/// Get a string representation of a given time point, printed in UTC ISO 8061 format by default.
/// 'format' specifies the string style, with the default argument value given as example:
///    'YYYY-MM-DDTHH:MM:SSZ'
string TimeToString(TimePoint timePoint, const char* format = kTimeYearToSecondTSeparatedFormatUTC);

/// Parse a string representation of a given time point (considered UTC) and return a time_point.
TimePoint StringToTime(std::string_view timeStr, const char* format = kTimeYearToSecondTSeparatedFormatUTC);

}  // namespace fxt

#include "timestring.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>
#include <string>
#include <string_view>

#include "fxt_exception.hpp"
#include "fxt_string.hpp"
#include "timedef.hpp"

namespace fxt {

string TimeToString(TimePoint timePoint, const char* format) {
  const std::time_t time = Clock::to_time_t(timePoint);
  std::tm utc{};
  const std::tm* pUtc = gmtime_r(&time, &utc);
  if (pUtc == nullptr) {
    throw exception("Issue in gmtime_r");
  }
  static constexpr string::size_type kMaxFormatLen = 256;
  string::size_type bufSize = std::string_view(format).size();
  if (bufSize > kMaxFormatLen) {
    throw exception("Format string {} is too long, maximum length is {}", format, kMaxFormatLen);
  }
  string buf(bufSize, '\0');

  std::size_t bytesWritten;
  do {
    bytesWritten = std::strftime(buf.data(), buf.size(), format, pUtc);
    if (bytesWritten == 0) {
      if (buf.size() > 4 * kMaxFormatLen) {
        throw exception("Unable to format time with {}", format);
      }
      buf.resize((3U * buf.size()) / 2U + 1U);
    }
  } while (bytesWritten == 0);

  buf.resize(bytesWritten);
  return buf;
}

TimePoint StringToTime(std::string_view timeStr, const char* format) {
  std::tm utc{};
  std::istringstream ss{std::string(timeStr)};
  ss >> std::get_time(&utc, format);
  if (ss.fail()) {
    throw exception("Failed to parse time string {}", timeStr);
  }
  // Convert timestamp to epoch time assuming UTC
  std::time_t timet = timegm(&utc);
  return Clock::from_time_t(timet);
}

}  // namespace fxt

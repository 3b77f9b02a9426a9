#pragma once

#include <cstdint>
#include <string_view>

namespace fxt {

/// Get the log level position (0 for 'off', 6 for 'trace') from its name or from its digit representation.
int8_t LogPosFromLogStr(std::string_view logStr);

}  // namespace fxt

#pragma once

#include <cstdint>

#include "fxt_string.hpp"

namespace fxt::schema {

struct LogConfig {
  string consoleLevel{"info"};
  string fileLevel{"debug"};
  int64_t maxFileSize{5 * 1024 * 1024};  // 5Mi
  int32_t maxNbFiles{20};
};

}  // namespace fxt::schema

#pragma once

#include <cstdint>

#include <spdlog/common.h>  // IWYU pragma: export
#include <spdlog/spdlog.h>  // IWYU pragma: export

namespace fxt {

namespace log = spdlog;

/// Log level positions are stored from 0 (off) to 6 (trace), which is the reverse order of spdlog levels.
constexpr int8_t PosFromLevel(log::level::level_enum level) {
  return static_cast<int8_t>(log::level::off) - static_cast<int8_t>(level);
}

constexpr log::level::level_enum LevelFromPos(int8_t levelPos) {
  return static_cast<log::level::level_enum>(static_cast<int8_t>(log::level::off) - levelPos);
}

}  // namespace fxt

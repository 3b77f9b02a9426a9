#pragma once

#include <cstddef>
#include <cstdint>

namespace fxt {

constexpr uint64_t HashValue64(uint64_t h1) {
  // Murmur-inspired hashing.
  constexpr uint64_t kMul = 0x9ddfea08eb382d69ULL;
  h1 *= kMul;
  h1 ^= (h1 >> 44);
  h1 *= kMul;
  h1 ^= (h1 >> 41);
  h1 *= kMul;
  return h1;
}

constexpr std::size_t HashCombine(std::size_t h1, std::size_t h2) {
  // Taken from boost::hash_combine
  static_assert(sizeof(std::size_t) == 4 || sizeof(std::size_t) == 8, "HashCombine not defined for this std::size_t");

  if constexpr (sizeof(std::size_t) == 4) {
    h1 ^= h2 + 0x9e3779b9 + (h1 << 6) + (h1 >> 2);
  } else {
    // see https://github.com/HowardHinnant/hash_append/issues/7
    h1 ^= h2 + 0x9e3779b97f4a7c15ULL + (h1 << 12) + (h1 >> 4);
  }

  return h1;
}

}  // namespace fxt

#pragma once

#include <cstdint>
#include <string_view>

namespace fxt {
enum class HttpRequestType : int8_t { kGet, kPost };

constexpr std::string_view HttpRequestTypeToString(HttpRequestType requestType) {
  switch (requestType) {
    case HttpRequestType::kGet:
      return "GET";
    case HttpRequestType::kPost:
      return "POST";
    default:
      return "UNKNOWN";
  }
}

}  // namespace fxt

#pragma once

#include <string_view>
#include <utility>

#include "fxt_string.hpp"
#include "fxt_vector.hpp"
#include "httprequesttype.hpp"

namespace fxt {

class CurlOptions {
 public:
  /// Each header is stored in its final "Key: value" form.
  using HttpHeaders = vector<string>;

  explicit CurlOptions(HttpRequestType requestType) : _requestType(requestType) {}

  void appendHttpHeader(std::string_view key, std::string_view value) {
    string header(key);
    header.append(": ");
    header.append(value);
    _httpHeaders.push_back(std::move(header));
  }

  const HttpHeaders &httpHeaders() const { return _httpHeaders; }

  HttpRequestType requestType() const { return _requestType; }

 private:
  HttpHeaders _httpHeaders;
  HttpRequestType _requestType = HttpRequestType::kGet;
};

}  // namespace fxt

#pragma once

#include <string_view>
#include <utility>

#include "fxt_log.hpp"
#include "fxt_string.hpp"
#include "timedef.hpp"

namespace fxt {

/// Options applied once to a CurlHandle, for all its queries.
class PermanentCurlOptions {
 public:
  static constexpr auto kDefaultNbMaxRetries = 2;

  PermanentCurlOptions() noexcept = default;

  const auto &getAcceptedEncoding() const { return _acceptedEncoding; }

  /// Maximum duration of a single attempt, zero meaning no limit.
  auto requestTimeout() const { return _requestTimeout; }

  auto requestCallLogLevel() const { return _requestCallLogLevel; }
  auto requestAnswerLogLevel() const { return _requestAnswerLogLevel; }

  /// Number of retries after a first failed attempt.
  auto nbMaxRetries() const { return _nbMaxRetries; }

  class Builder {
   public:
    Builder() noexcept = default;

    Builder &setAcceptedEncoding(std::string_view acceptedEncoding) {
      _acceptedEncoding = string(acceptedEncoding);
      return *this;
    }

    Builder &setRequestTimeout(Duration requestTimeout) {
      _requestTimeout = requestTimeout;
      return *this;
    }

    Builder &setRequestCallLogLevel(log::level::level_enum requestCallLogLevel) {
      _requestCallLogLevel = requestCallLogLevel;
      return *this;
    }

    Builder &setRequestAnswerLogLevel(log::level::level_enum requestAnswerLogLevel) {
      _requestAnswerLogLevel = requestAnswerLogLevel;
      return *this;
    }

    Builder &setNbMaxRetries(int nbMaxRetries) {
      _nbMaxRetries = nbMaxRetries;
      return *this;
    }

    PermanentCurlOptions build() {
      return {std::move(_acceptedEncoding), _requestTimeout, _requestCallLogLevel, _requestAnswerLogLevel,
              _nbMaxRetries};
    }

   private:
    string _acceptedEncoding;
    Duration _requestTimeout{};
    log::level::level_enum _requestCallLogLevel = log::level::level_enum::info;
    log::level::level_enum _requestAnswerLogLevel = log::level::level_enum::trace;
    int _nbMaxRetries = kDefaultNbMaxRetries;
  };

 private:
  PermanentCurlOptions(string acceptedEncoding, Duration requestTimeout, log::level::level_enum requestCallLogLevel,
                       log::level::level_enum requestAnswerLogLevel, int nbMaxRetries)
      : _acceptedEncoding(std::move(acceptedEncoding)),
        _requestTimeout(requestTimeout),
        _requestCallLogLevel(requestCallLogLevel),
        _requestAnswerLogLevel(requestAnswerLogLevel),
        _nbMaxRetries(nbMaxRetries) {}

  string _acceptedEncoding;
  Duration _requestTimeout{};
  log::level::level_enum _requestCallLogLevel = log::level::level_enum::info;
  log::level::level_enum _requestAnswerLogLevel = log::level::level_enum::trace;
  int _nbMaxRetries = kDefaultNbMaxRetries;
};

}  // namespace fxt

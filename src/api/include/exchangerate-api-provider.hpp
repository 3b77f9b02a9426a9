#pragma once

#include <mutex>
#include <string_view>

#include "abstract-rate-provider.hpp"
#include "curlhandle.hpp"
#include "fxtrackinfo.hpp"

namespace fxt {

/// Live rates from exchangerate-api.com, queried as GET <baseUrl>/<from>.
class ExchangeRateApiProvider : public AbstractRateProvider {
 public:
  /// Queries are answered by overriden responses (see curlHandle()) when run mode of 'fxTrackInfo' requires it.
  explicit ExchangeRateApiProvider(const FxTrackInfo &fxTrackInfo);

  double fetchLiveRate(std::string_view from, std::string_view to) override;

  /// Test only: see CurlHandle::setOverridenQueryResponses.
  CurlHandle &curlHandle() { return _curlHandle; }

 private:
  CurlHandle _curlHandle;
  std::mutex _curlHandleMutex;
};

}  // namespace fxt

#include "exchangerate-api-provider.hpp"

#include <mutex>
#include <string_view>

#include "conversion-error.hpp"
#include "curlhandle.hpp"
#include "curloptions.hpp"
#include "durationstring.hpp"
#include "fxt_exception.hpp"
#include "fxt_log.hpp"
#include "fxt_string.hpp"
#include "fxtrackinfo.hpp"
#include "general-config.hpp"
#include "httprequesttype.hpp"
#include "permanentcurloptions.hpp"
#include "rates-api-response-schema.hpp"
#include "read-json.hpp"
#include "validrate.hpp"

namespace fxt {

namespace {

PermanentCurlOptions CreatePermanentCurlOptions(const schema::ProviderConfig &providerConfig) {
  return PermanentCurlOptions::Builder()
      .setRequestTimeout(ParseDuration(providerConfig.requestTimeout))
      .setNbMaxRetries(providerConfig.nbMaxRetries)
      .setAcceptedEncoding("gzip,deflate")
      .setRequestCallLogLevel(log::level::debug)
      .build();
}

CurlOptions CreateCurlOptions() {
  CurlOptions opts(HttpRequestType::kGet);
  opts.appendHttpHeader("Accept", "application/json");
  return opts;
}

}  // namespace

ExchangeRateApiProvider::ExchangeRateApiProvider(const FxTrackInfo &fxTrackInfo)
    : _curlHandle(fxTrackInfo.generalConfig().provider.baseUrl,
                  CreatePermanentCurlOptions(fxTrackInfo.generalConfig().provider), fxTrackInfo.getRunMode()) {}

double ExchangeRateApiProvider::fetchLiveRate(std::string_view from, std::string_view to) {
  string endpoint("/");
  endpoint.append(from);

  schema::ExchangeRateApiLatest latest;
  {
    std::lock_guard<std::mutex> guard(_curlHandleMutex);
    static const CurlOptions kOpts = CreateCurlOptions();

    std::string_view dataStr;
    try {
      dataStr = _curlHandle.query(endpoint, kOpts);
    } catch (const exception &e) {
      throw conversion_error(ErrorKind::kApiUnavailable, "exchangerate-api query of {} failed: {}", from, e.what());
    }
    if (ReadPartialJson(dataStr, "exchangerate-api", latest)) {
      throw conversion_error(ErrorKind::kApiUnavailable, "Unable to parse rates of {} from exchangerate-api", from);
    }
  }

  const auto it = latest.rates.find(string(to));
  if (it == latest.rates.end()) {
    throw conversion_error(ErrorKind::kInvalidCurrency, "No rate from {} to {} in exchangerate-api response", from,
                           to);
  }
  const double rate = it->second;
  if (!IsValidRate(rate)) {
    throw conversion_error(ErrorKind::kApiUnavailable, "Invalid rate {} from {} to {} in exchangerate-api response",
                           rate, from, to);
  }
  log::debug("Live rate {}-{} = {} (as of {})", from, to, rate, latest.date);
  return rate;
}

}  // namespace fxt

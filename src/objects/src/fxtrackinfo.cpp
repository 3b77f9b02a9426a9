#include "fxtrackinfo.hpp"

#include <algorithm>
#include <string_view>
#include <utility>

#include "durationstring.hpp"
#include "fxt_invalid_argument_exception.hpp"
#include "general-config.hpp"
#include "logginginfo.hpp"
#include "runmodes.hpp"

namespace fxt {

FxTrackInfo::FxTrackInfo(settings::RunMode runMode, std::string_view dataDir, schema::GeneralConfig &&generalConfig,
                         LoggingInfo &&loggingInfo)
    : _dataDir(dataDir),
      _generalConfig(std::move(generalConfig)),
      _loggingInfo(std::move(loggingInfo)),
      _liveTtl(ParseDuration(_generalConfig.cache.liveTtl)),
      _historicalTtl(ParseDuration(_generalConfig.cache.historicalTtl)),
      _cleanupInterval(ParseDuration(_generalConfig.cache.cleanupInterval)),
      _retryDelay(ParseDuration(_generalConfig.migration.retryDelay)),
      _freshnessTimeout(ParseDuration(_generalConfig.freshness.timeout)),
      _runMode(runMode) {
  const auto &currencies = _generalConfig.currencies;
  if (currencies.base.empty()) {
    throw invalid_argument("Base currency should be set");
  }
  if (std::ranges::find(currencies.supported, currencies.base) == currencies.supported.end()) {
    throw invalid_argument("Base currency {} should be part of supported currencies", currencies.base);
  }
}

}  // namespace fxt

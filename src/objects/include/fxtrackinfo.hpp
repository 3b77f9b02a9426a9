#pragma once

#include <cstdint>
#include <string_view>

#include "currencycode.hpp"
#include "fxt_const.hpp"
#include "fxt_string.hpp"
#include "fxt_vector.hpp"
#include "general-config.hpp"
#include "logginginfo.hpp"
#include "runmodes.hpp"
#include "timedef.hpp"

namespace fxt {

/// Start-up information shared by all components: data directory, parsed configuration and loggers.
/// Durations of the configuration are parsed once at construction, so that an invalid one is reported early.
class FxTrackInfo {
 public:
  explicit FxTrackInfo(settings::RunMode runMode = settings::RunMode::kProd, std::string_view dataDir = kDefaultDataDir,
                       schema::GeneralConfig &&generalConfig = schema::GeneralConfig(),
                       LoggingInfo &&loggingInfo = LoggingInfo());

  settings::RunMode getRunMode() const { return _runMode; }

  std::string_view dataDir() const { return _dataDir; }

  const schema::GeneralConfig &generalConfig() const { return _generalConfig; }

  const LoggingInfo &loggingInfo() const { return _loggingInfo; }

  const CurrencyCode &baseCurrency() const { return _generalConfig.currencies.base; }

  const vector<CurrencyCode> &supportedCurrencies() const { return _generalConfig.currencies.supported; }

  Duration liveTtl() const { return _liveTtl; }
  Duration historicalTtl() const { return _historicalTtl; }
  Duration cleanupInterval() const { return _cleanupInterval; }
  Duration retryDelay() const { return _retryDelay; }
  Duration freshnessTimeout() const { return _freshnessTimeout; }

 private:
  string _dataDir;
  schema::GeneralConfig _generalConfig;
  LoggingInfo _loggingInfo;
  Duration _liveTtl;
  Duration _historicalTtl;
  Duration _cleanupInterval;
  Duration _retryDelay;
  Duration _freshnessTimeout;
  settings::RunMode _runMode;
};

}  // namespace fxt

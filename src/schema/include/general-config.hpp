#pragma once

#include <cstdint>
#include <string_view>

#include "currencycode.hpp"
#include "fxt_string.hpp"
#include "fxt_vector.hpp"
#include "log-config.hpp"

namespace fxt {

namespace schema {

/// Durations are stored as their human readable string representation ("1h30min") and parsed with ParseDuration.

struct CurrenciesConfig {
  CurrencyCode base{"EUR"};
  vector<CurrencyCode> supported{"EUR", "ZAR", "USD", "GBP", "JPY", "CHF", "CAD", "AUD"};
};

struct CacheConfig {
  string liveTtl{"1h"};
  string historicalTtl{"24h"};
  int32_t maxEntries{1000};
  string cleanupInterval{"5min"};
};

struct MigrationConfig {
  int32_t batchSize{50};
  int32_t maxDaysDifference{30};
  int32_t nbMaxRetries{3};
  string retryDelay{"1s"};
};

struct FreshnessConfig {
  string timeout{"5s"};
};

struct ProviderConfig {
  string baseUrl{"https://api.exchangerate-api.com/v4/latest"};
  string requestTimeout{"10s"};
  int32_t nbMaxRetries{2};
};

struct GeneralConfig {
  CurrenciesConfig currencies;
  CacheConfig cache;
  MigrationConfig migration;
  FreshnessConfig freshness;
  ProviderConfig provider;
  LogConfig log;
};

}  // namespace schema

schema::GeneralConfig ReadGeneralConfig(std::string_view dataDir);

}  // namespace fxt

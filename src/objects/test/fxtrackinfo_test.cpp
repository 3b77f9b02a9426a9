#include "fxtrackinfo.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <utility>

#include "fxt_exception.hpp"
#include "general-config.hpp"
#include "runmodes.hpp"

namespace fxt {

TEST(FxTrackInfoTest, DefaultConfiguration) {
  FxTrackInfo fxTrackInfo(settings::RunMode::kQueryResponseOverriden, "/tmp/fxtrack");

  EXPECT_EQ(fxTrackInfo.dataDir(), "/tmp/fxtrack");
  EXPECT_EQ(fxTrackInfo.getRunMode(), settings::RunMode::kQueryResponseOverriden);
  EXPECT_EQ(fxTrackInfo.baseCurrency(), "EUR");
  EXPECT_EQ(fxTrackInfo.supportedCurrencies().size(), 8U);
  EXPECT_EQ(fxTrackInfo.liveTtl(), std::chrono::hours(1));
  EXPECT_EQ(fxTrackInfo.historicalTtl(), std::chrono::hours(24));
  EXPECT_EQ(fxTrackInfo.cleanupInterval(), std::chrono::minutes(5));
  EXPECT_EQ(fxTrackInfo.retryDelay(), std::chrono::seconds(1));
  EXPECT_EQ(fxTrackInfo.freshnessTimeout(), std::chrono::seconds(5));
}

TEST(FxTrackInfoTest, CustomDurations) {
  schema::GeneralConfig generalConfig;
  generalConfig.cache.liveTtl = "1h30min";
  generalConfig.freshness.timeout = "500ms";

  FxTrackInfo fxTrackInfo(settings::RunMode::kProd, "/tmp/fxtrack", std::move(generalConfig));

  EXPECT_EQ(fxTrackInfo.liveTtl(), std::chrono::minutes(90));
  EXPECT_EQ(fxTrackInfo.freshnessTimeout(), std::chrono::milliseconds(500));
}

TEST(FxTrackInfoTest, InvalidDuration) {
  schema::GeneralConfig generalConfig;
  generalConfig.cache.historicalTtl = "24";

  EXPECT_THROW(FxTrackInfo(settings::RunMode::kProd, "/tmp/fxtrack", std::move(generalConfig)), exception);
}

TEST(FxTrackInfoTest, BaseCurrencyShouldBeSupported) {
  schema::GeneralConfig generalConfig;
  generalConfig.currencies.base = "SEK";

  EXPECT_THROW(FxTrackInfo(settings::RunMode::kProd, "/tmp/fxtrack", std::move(generalConfig)), exception);
}

}  // namespace fxt

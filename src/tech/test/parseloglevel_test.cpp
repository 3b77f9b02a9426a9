#include "parseloglevel.hpp"

#include <gtest/gtest.h>

#include "fxt_exception.hpp"
#include "fxt_log.hpp"

namespace fxt {

TEST(ParseLogLevelTest, FromDigit) {
  EXPECT_EQ(LogPosFromLogStr("0"), 0);
  EXPECT_EQ(LogPosFromLogStr("6"), 6);
  EXPECT_THROW(LogPosFromLogStr("7"), exception);
}

TEST(ParseLogLevelTest, FromName) {
  EXPECT_EQ(LogPosFromLogStr("off"), 0);
  EXPECT_EQ(LogPosFromLogStr("warning"), 3);
  EXPECT_EQ(LogPosFromLogStr("trace"), 6);
  EXPECT_THROW(LogPosFromLogStr("verbose"), exception);
}

TEST(ParseLogLevelTest, LevelConversions) {
  EXPECT_EQ(LevelFromPos(LogPosFromLogStr("info")), log::level::info);
  EXPECT_EQ(PosFromLevel(log::level::err), 2);
}

}  // namespace fxt

#include "file.hpp"

#include <gtest/gtest.h>

#include <filesystem>

#include "fxt_exception.hpp"
#include "fxt_string.hpp"

namespace fxt {

class FileTest : public ::testing::Test {
 protected:
  FileTest() : dataDir((std::filesystem::temp_directory_path() / "fxtrack_file_test").string()) {
    std::filesystem::remove_all(dataDir);
  }

  ~FileTest() override { std::filesystem::remove_all(dataDir); }

  string dataDir;
};

TEST_F(FileTest, ReadAbsentFileNoThrow) {
  File file(dataDir, File::Type::kCache, "absent.json", File::IfError::kNoThrow);

  EXPECT_FALSE(file.exists());
  EXPECT_EQ(file.readAll(), "");
}

TEST_F(FileTest, ReadAbsentFileThrow) {
  File file(dataDir, File::Type::kCache, "absent.json", File::IfError::kThrow);

  EXPECT_THROW(file.readAll(), exception);
}

TEST_F(FileTest, WriteCreatesDirectoriesThenRead) {
  File file(dataDir, File::Type::kCache, "data.json", File::IfError::kThrow);

  EXPECT_EQ(file.write(R"({"a":1})"), 8);
  EXPECT_TRUE(file.exists());
  EXPECT_EQ(file.readAll(), "{\"a\":1}\n");

  file.write("{}", Writer::Mode::Append);
  EXPECT_EQ(file.readAll(), "{\"a\":1}\n{}\n");

  EXPECT_TRUE(file.remove());
  EXPECT_FALSE(file.exists());
  EXPECT_FALSE(file.remove());
}

TEST_F(FileTest, EmptyDataIsNotWritten) {
  File file(dataDir, File::Type::kStatic, "empty.json", File::IfError::kThrow);

  EXPECT_EQ(file.write(""), 0);
  EXPECT_FALSE(file.exists());
}

}  // namespace fxt

#include <gtest/gtest.h>
#include <string>
#include "common/errors.hpp"
#include "config/entity_config.hpp"
#include "test_utils.hpp"

using namespace disk;
using namespace disk::config;

class EntityConfigTest : public ::testing::Test {
protected:
  void SetUp() override {
    init_logging();
  }

  static void expect_rejected(const std::string& project, const std::string& sub,
      const std::string& file, const std::string& ext) {
    EXPECT_THROW(EntityConfig::create(Dir::DATA, project, sub, file, ext), ConfigError)
      << "project='" << project << "' sub='" << sub << "' file='" << file << "' ext='" << ext << "'";
  }
};

TEST_F(EntityConfigTest, DerivesFileIdentity) {
  const auto config = EntityConfig::create(Dir::CACHE, "MyApp", "a/b", "state", "bin");

  EXPECT_EQ(config.dir(), Dir::CACHE);
  EXPECT_EQ(config.project(), "MyApp");
  EXPECT_EQ(config.file(), "state");
  EXPECT_EQ(config.extension(), "bin");
  EXPECT_EQ(config.identity().file_name, "state.bin");
  EXPECT_EQ(config.identity().file_name_gzip, "state.bin.gz");
  EXPECT_EQ(config.identity().file_name_tmp, "state.bin.tmp");
  EXPECT_EQ(config.identity().file_name_gzip_tmp, "state.bin.gz.tmp");
}

TEST_F(EntityConfigTest, EmptyExtensionHasNoDot) {
  const auto config = EntityConfig::create(Dir::DATA, "MyApp", "", "signal", "");

  EXPECT_EQ(config.identity().file_name, "signal");
  EXPECT_EQ(config.identity().file_name_gzip, "signal.gz");
  EXPECT_EQ(config.identity().file_name_tmp, "signal.tmp");
  EXPECT_EQ(config.identity().file_name_gzip_tmp, "signal.gz.tmp");
}

TEST_F(EntityConfigTest, SplitsSubDirectories) {
  const auto config = EntityConfig::create(Dir::DATA, "MyApp", "one/two/three", "f", "txt");
  const std::vector<std::string> expected = {"one", "two", "three"};
  EXPECT_EQ(config.sub_segments(), expected);
  EXPECT_EQ(config.sub_directories(), "one/two/three");

  const auto flat = EntityConfig::create(Dir::DATA, "MyApp", "", "f", "txt");
  EXPECT_TRUE(flat.sub_segments().empty());
}

TEST_F(EntityConfigTest, RejectsEmptyAndOversizedNames) {
  expect_rejected("", "", "file", "bin");
  expect_rejected("proj", "", "", "bin");
  expect_rejected(std::string(255, 'p'), "", "file", "bin");
  expect_rejected("proj", "", std::string(255, 'f'), "bin");

}

TEST_F(EntityConfigTest, RejectsSeparatorsOutsideSubDirectories) {
  expect_rejected("my/app", "", "file", "bin");
  expect_rejected("app", "", "dir/file", "bin");
  expect_rejected("app", "", "file", "b/in");
  expect_rejected("my\\app", "", "file", "bin");
}

TEST_F(EntityConfigTest, RejectsForbiddenSymbols) {
  for (char symbol : std::string("<>:\"'|?*^$&()")) {
    expect_rejected(std::string("app") + symbol, "", "file", "bin");
    expect_rejected("app", std::string("sub") + symbol, "file", "bin");
    expect_rejected("app", "", std::string("file") + symbol, "bin");
  }
  expect_rejected("app", "", std::string("fi\0le", 5), "bin");
}

TEST_F(EntityConfigTest, RejectsBadEdges) {
  expect_rejected(" app", "", "file", "bin");
  expect_rejected("app ", "", "file", "bin");
  expect_rejected("app", "/sub", "file", "bin");
  expect_rejected("app", "sub/", "file", "bin");
  expect_rejected("app", "sub/ inner", "file", "bin");
  expect_rejected("app", "", "file ", "bin");
}

TEST_F(EntityConfigTest, RejectsWhitespaceNames) {
  expect_rejected("\t", "", "state", "bin");
  expect_rejected("\n", "", "state", "bin");
  expect_rejected(" \t ", "", "state", "bin");
  expect_rejected("app\t", "", "state", "bin");
  expect_rejected("\vapp", "", "state", "bin");
  expect_rejected("app", "\t", "state", "bin");
  expect_rejected("app", "one/\r", "state", "bin");
  expect_rejected("app", "", "\t", "bin");
  expect_rejected("app", "", "state\n", "bin");
  expect_rejected("app", "", "state", "\t");

  EXPECT_NO_THROW(EntityConfig::create(Dir::DATA, "my app", "a b", "state file", "bin"));
}

TEST_F(EntityConfigTest, RejectsDotNames) {
  expect_rejected(".", "", "state", "bin");
  expect_rejected("..", "", "state", "bin");
  expect_rejected("app", "", ".", "");
  expect_rejected("app", "", "..", "");
  expect_rejected("app", "", "..", "bin");

  EXPECT_NO_THROW(EntityConfig::create(Dir::DATA, ".app", "", ".hidden", ""));
  EXPECT_NO_THROW(EntityConfig::create(Dir::DATA, "app", "", "...", "bin"));
}

TEST_F(EntityConfigTest, RejectsReservedNames) {
  expect_rejected("CON", "", "file", "bin");
  expect_rejected("app", "", "nul", "bin");
  expect_rejected("app", "Com3", "file", "bin");
  expect_rejected("app", "", "file", "lpt9");

  EXPECT_NO_THROW(EntityConfig::create(Dir::DATA, "CONSOLE", "", "COM10", "bin"));
}

TEST_F(EntityConfigTest, RejectsBadSubSegments) {
  expect_rejected("app", "a//b", "file", "bin");
  expect_rejected("app", "a/./b", "file", "bin");
  expect_rejected("app", "a/../b", "file", "bin");
  expect_rejected("app", "..", "file", "bin");
  expect_rejected("app", "1/2/3/4/5/6/7/8/9/10", "file", "bin");
  expect_rejected("app", "a/" + std::string(256, 's'), "file", "bin");

  EXPECT_NO_THROW(EntityConfig::create(Dir::DATA, "app", "1/2/3/4/5/6/7/8/9", "file", "bin"));
}

TEST_F(EntityConfigTest, DirNamesRoundTrip) {
  for (Dir dir : {Dir::PROJECT, Dir::CACHE, Dir::CONFIG, Dir::DATA, Dir::DATA_LOCAL, Dir::PREFERENCE}) {
    EXPECT_EQ(dir_from_string(dir_to_string(dir)), dir);
  }
  EXPECT_STREQ(dir_to_string(Dir::DATA_LOCAL), "data_local");
  EXPECT_THROW(dir_from_string("downloads"), ConfigError);
}

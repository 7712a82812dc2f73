#include <gtest/gtest.h>
#include <set>
#include <sstream>
#include "common/metadata.hpp"

using disk::Metadata;

TEST(MetadataTest, HoldsSizeAndPath) {
  const Metadata metadata(42, "/tmp/file.bin");
  EXPECT_EQ(metadata.size(), 42u);
  EXPECT_EQ(metadata.path(), std::filesystem::path("/tmp/file.bin"));

  const auto [size, path] = metadata.to_parts();
  EXPECT_EQ(size, 42u);
  EXPECT_EQ(path, std::filesystem::path("/tmp/file.bin"));
}

TEST(MetadataTest, ZeroAndFormatting) {
  const Metadata zero = Metadata::zero("/tmp/missing");
  EXPECT_EQ(zero.size(), 0u);
  EXPECT_EQ(zero.to_string(), "0 bytes @ /tmp/missing");

  std::ostringstream out;
  out << Metadata(7, "/a");
  EXPECT_EQ(out.str(), "7 bytes @ /a");
}

TEST(MetadataTest, ComparesBySizeThenPath) {
  EXPECT_EQ(Metadata(1, "/a"), Metadata(1, "/a"));
  EXPECT_NE(Metadata(1, "/a"), Metadata(2, "/a"));
  EXPECT_NE(Metadata(1, "/a"), Metadata(1, "/b"));

  std::set<Metadata> ordered = {Metadata(2, "/a"), Metadata(1, "/b"), Metadata(1, "/a")};
  auto it = ordered.begin();
  EXPECT_EQ(*it++, Metadata(1, "/a"));
  EXPECT_EQ(*it++, Metadata(1, "/b"));
  EXPECT_EQ(*it, Metadata(2, "/a"));
}

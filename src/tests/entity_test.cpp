#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>
#include "codec/binary_codec.hpp"
#include "codec/text_codec.hpp"
#include "common/errors.hpp"
#include "entity/entity.hpp"
#include "io/file_io.hpp"
#include "test_utils.hpp"

using namespace disk;
using namespace disk::entity;

namespace {

struct Greeting {
  std::string text;
  std::uint32_t number{0};

  void encode(codec::ByteWriter& writer) const {
    writer.write_string(text);
    writer.write_u32(number);
  }

  static Greeting decode(codec::ByteReader& reader) {
    Greeting greeting;
    greeting.text = reader.read_string();
    greeting.number = reader.read_u32();
    return greeting;
  }

  bool operator==(const Greeting& other) const {
    return text == other.text && number == other.number;
  }
};

using GreetingEntity = FramedEntity<Greeting, codec::BinaryCodec<Greeting>>;
using NoteEntity = Entity<std::string, codec::TextCodec<std::string>>;

frame::Frame make_frame(std::uint8_t fill, std::uint8_t version) {
  frame::Frame frame;
  frame.header.fill(fill);
  frame.version = version;
  return frame;
}

} // namespace

class EntityTest : public ::testing::Test {
protected:
  std::filesystem::path root;
  std::shared_ptr<path::FixedRootResolver> resolver;

  void SetUp() override {
    init_logging();
    root = make_test_root("entity_test");
    resolver = std::make_shared<path::FixedRootResolver>(root);
  }

  void TearDown() override {
    std::filesystem::remove_all(root);
  }

  GreetingEntity make_greeting_entity(std::uint8_t version) const {
    return GreetingEntity(
      path::Location(GreetingEntity::make_config(config::Dir::DATA, "greeter", "saves", "greeting"), resolver),
      make_frame(1, version));
  }
};

TEST_F(EntityTest, FramedAtomicSaveEndToEnd) {
  GreetingEntity entity = make_greeting_entity(5);
  const Greeting value{"Hello", 123};

  const Metadata saved = entity.save_atomic(value);
  EXPECT_EQ(saved.path(), root / "data" / "greeter" / "saves" / "greeting.bin");

  const std::vector<std::uint8_t> raw = io::read_file(saved.path());
  ASSERT_GT(raw.size(), frame::FULL_HEADER_SIZE);
  EXPECT_EQ(std::vector<std::uint8_t>(raw.begin(), raw.begin() + 24), std::vector<std::uint8_t>(24, 1));
  EXPECT_EQ(raw[24], 5);
  EXPECT_EQ(std::vector<std::uint8_t>(raw.begin() + 25, raw.end()), entity.codec().encode(value));

  EXPECT_EQ(entity.file_version(), 5);
  EXPECT_EQ(entity.from_file(), value);
  EXPECT_EQ(entity.from_file_memmap(), value);
  EXPECT_EQ(entity.file_header_to_string(), std::string(24, '\x01'));
}

TEST_F(EntityTest, FramedGzipWrapsTheWholeFrame) {
  GreetingEntity entity = make_greeting_entity(2);
  const Greeting value{"compressed", 9};

  entity.save_gzip(value);
  const std::vector<std::uint8_t> decompressed = entity.read_to_bytes_gzip();
  EXPECT_EQ(decompressed, entity.to_bytes(value));
  EXPECT_EQ(decompressed[24], 2);
  EXPECT_EQ(entity.from_file_gzip(), value);

  entity.save_atomic_gzip_memmap(Greeting{"again", 10});
  EXPECT_EQ(entity.from_file_gzip_memmap(), (Greeting{"again", 10}));
}

TEST_F(EntityTest, FramedRejectsForeignFiles) {
  GreetingEntity writer = make_greeting_entity(1);
  writer.save(Greeting{"old", 1});

  GreetingEntity newer = make_greeting_entity(2);
  try {
    newer.from_file();
    FAIL() << "Expected FrameError";
  } catch (const FrameError& e) {
    EXPECT_EQ(e.kind(), FrameErrorKind::VERSION_MISMATCH);
  }

  GreetingEntity other_schema(writer.location(), make_frame(9, 1));
  try {
    other_schema.from_file();
    FAIL() << "Expected FrameError";
  } catch (const FrameError& e) {
    EXPECT_EQ(e.kind(), FrameErrorKind::HEADER_MISMATCH);
  }

  EXPECT_THROW(writer.from_bytes(std::vector<std::uint8_t>(10, 1)), FrameError);
}

TEST_F(EntityTest, FromVersionsPicksFirstMatch) {
  make_greeting_entity(1).save(Greeting{"stored", 1});
  GreetingEntity entity = make_greeting_entity(2);

  std::vector<std::string> called;
  auto make = [&](const std::string& name) {
    return [&called, name]() {
      called.push_back(name);
      return Greeting{name, 0};
    };
  };

  const auto [version, value] = entity.from_versions({
    {2, make("A")},
    {1, make("B")},
    {1, make("C")}
  });

  EXPECT_EQ(version, 1);
  EXPECT_EQ(value.text, "B");
  EXPECT_THAT(called, ::testing::ElementsAre("B"));
}

TEST_F(EntityTest, FromVersionsUpgradesOldLayout) {
  GreetingEntity old_entity = make_greeting_entity(1);
  old_entity.save(Greeting{"legacy", 7});

  GreetingEntity current = make_greeting_entity(2);
  const auto [version, value] = current.from_versions({
    {2, [&]() { return current.from_file(); }},
    {1, [&]() {
      Greeting upgraded = old_entity.from_file();
      upgraded.number *= 100;
      return upgraded;
    }}
  });

  EXPECT_EQ(version, 1);
  EXPECT_EQ(value, (Greeting{"legacy", 700}));
}

TEST_F(EntityTest, FromVersionsWithoutMatch) {
  make_greeting_entity(3).save(Greeting{"v3", 3});
  GreetingEntity entity = make_greeting_entity(1);

  try {
    entity.from_versions({{1, [] { return Greeting{}; }}, {2, [] { return Greeting{}; }}});
    FAIL() << "Expected FrameError";
  } catch (const FrameError& e) {
    EXPECT_EQ(e.kind(), FrameErrorKind::NO_VERSION_MATCHED);
  }

  // Constructor failures propagate untouched
  EXPECT_THROW(entity.from_versions({{3, []() -> Greeting { throw CodecError("broken"); }}}), CodecError);
}

TEST_F(EntityTest, TextEntityLifecycle) {
  NoteEntity notes(path::Location(
    NoteEntity::make_config(config::Dir::CONFIG, "notes", "", "todo"), resolver));

  EXPECT_EQ(notes.absolute_path(), root / "config" / "notes" / "todo.txt");
  EXPECT_FALSE(notes.exists());

  notes.save_atomic("buy milk\nwrite tests");
  EXPECT_EQ(notes.read_to_string(), "buy milk\nwrite tests");
  EXPECT_EQ(notes.from_file(), "buy milk\nwrite tests");
  EXPECT_EQ(notes.file_size().size(), 20u);

  notes.save_atomic_gzip("zipped");
  EXPECT_EQ(notes.from_file_gzip(), "zipped");

  EXPECT_EQ(notes.rm_atomic().size(), 20u);
  EXPECT_GT(notes.rm_gzip().size(), 0u);
  EXPECT_NO_THROW(notes.rm_tmp());
  EXPECT_FALSE(notes.exists());
  EXPECT_EQ(notes.rm_project().path(), root / "config" / "notes");
}

TEST_F(EntityTest, TextEntityRejectsBadConfig) {
  EXPECT_THROW(NoteEntity::make_config(config::Dir::DATA, "notes", "../escape", "todo"), ConfigError);
  EXPECT_THROW(NoteEntity::make_config(config::Dir::DATA, "", "", "todo"), ConfigError);
}

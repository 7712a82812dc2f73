#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>
#include "codec/binary_codec.hpp"
#include "codec/byte_buffer.hpp"
#include "codec/text_codec.hpp"
#include "common/errors.hpp"

using namespace disk;
using namespace disk::codec;
using ::testing::ElementsAre;

namespace {

struct Sample {
  std::string text;
  std::uint32_t number{0};
  std::int64_t signed_number{0};
  double ratio{0};
  bool flag{false};
  std::vector<std::uint8_t> blob;

  void encode(ByteWriter& writer) const {
    writer.write_string(text);
    writer.write_u32(number);
    writer.write_i64(signed_number);
    writer.write_f64(ratio);
    writer.write_bool(flag);
    writer.write_bytes(blob);
  }

  static Sample decode(ByteReader& reader) {
    Sample sample;
    sample.text = reader.read_string();
    sample.number = reader.read_u32();
    sample.signed_number = reader.read_i64();
    sample.ratio = reader.read_f64();
    sample.flag = reader.read_bool();
    sample.blob = reader.read_bytes();
    return sample;
  }

  bool operator==(const Sample& other) const {
    return text == other.text && number == other.number && signed_number == other.signed_number &&
      ratio == other.ratio && flag == other.flag && blob == other.blob;
  }
};

// Decoding always fails with a library exception
struct Picky {
  void encode(ByteWriter& writer) const { writer.write_u8(1); }
  static Picky decode(ByteReader&) { throw std::invalid_argument("picky refuses"); }
};

} // namespace

TEST(ByteBufferTest, LittleEndianLayout) {
  ByteWriter writer(BinaryOptions{ByteOrder::LITTLE});
  writer.write_u16(0x0102);
  writer.write_u32(0x03040506);
  writer.write_string("hi");

  EXPECT_THAT(writer.bytes(), ElementsAre(
    0x02, 0x01,
    0x06, 0x05, 0x04, 0x03,
    2, 0, 0, 0, 0, 0, 0, 0, 'h', 'i'));
}

TEST(ByteBufferTest, BigEndianLayout) {
  ByteWriter writer(BinaryOptions{ByteOrder::BIG});
  writer.write_u32(0x03040506);
  writer.write_u64(1);

  EXPECT_THAT(writer.bytes(), ElementsAre(0x03, 0x04, 0x05, 0x06, 0, 0, 0, 0, 0, 0, 0, 1));

  const std::vector<std::uint8_t> bytes = writer.bytes();
  ByteReader reader(bytes.data(), bytes.size(), BinaryOptions{ByteOrder::BIG});
  EXPECT_EQ(reader.read_u32(), 0x03040506u);
  EXPECT_EQ(reader.read_u64(), 1u);
  EXPECT_TRUE(reader.at_end());
}

TEST(ByteBufferTest, ReaderRejectsShortInput) {
  const std::vector<std::uint8_t> bytes = {1, 2, 3};
  ByteReader reader(bytes.data(), bytes.size(), BinaryOptions{});
  EXPECT_THROW(reader.read_u32(), CodecError);

  // Length prefix claims more than is left
  ByteWriter writer(BinaryOptions{});
  writer.write_u64(1000);
  const std::vector<std::uint8_t> prefix = writer.bytes();
  ByteReader string_reader(prefix.data(), prefix.size(), BinaryOptions{});
  EXPECT_THROW(string_reader.read_string(), CodecError);

  const std::vector<std::uint8_t> bad_bool = {2};
  ByteReader bool_reader(bad_bool.data(), bad_bool.size(), BinaryOptions{});
  EXPECT_THROW(bool_reader.read_bool(), CodecError);
}

TEST(BinaryCodecTest, RoundTrip) {
  const Sample sample{"Hello", 123, -77, 0.25, true, {9, 8, 7}};

  for (ByteOrder order : {ByteOrder::LITTLE, ByteOrder::BIG}) {
    BinaryCodec<Sample> codec(BinaryOptions{order});
    const std::vector<std::uint8_t> bytes = codec.encode(sample);
    EXPECT_EQ(codec.decode(bytes.data(), bytes.size()), sample);
  }
  EXPECT_STREQ(BinaryCodec<Sample>::extension(), "bin");
}

TEST(BinaryCodecTest, ByteOrderChangesEncoding) {
  const Sample sample{"", 1, 0, 0, false, {}};
  const auto little = BinaryCodec<Sample>(BinaryOptions{ByteOrder::LITTLE}).encode(sample);
  const auto big = BinaryCodec<Sample>(BinaryOptions{ByteOrder::BIG}).encode(sample);
  EXPECT_NE(little, big);
  EXPECT_EQ(little.size(), big.size());
}

TEST(BinaryCodecTest, RejectsMalformedInput) {
  BinaryCodec<Sample> codec;
  std::vector<std::uint8_t> bytes = codec.encode(Sample{"text", 1, 2, 3.0, false, {1}});

  std::vector<std::uint8_t> trailing = bytes;
  trailing.push_back(0);
  EXPECT_THROW(codec.decode(trailing.data(), trailing.size()), CodecError);

  bytes.pop_back();
  EXPECT_THROW(codec.decode(bytes.data(), bytes.size()), CodecError);
  EXPECT_THROW(codec.decode(nullptr, 0), CodecError);
}

TEST(BinaryCodecTest, NormalizesForeignExceptions) {
  BinaryCodec<Picky> codec;
  const std::vector<std::uint8_t> bytes = codec.encode(Picky{});
  try {
    codec.decode(bytes.data(), bytes.size());
    FAIL() << "Expected CodecError";
  } catch (const CodecError& e) {
    EXPECT_THAT(e.what(), ::testing::HasSubstr("picky refuses"));
  }
}

TEST(TextCodecTest, NumbersAndStrings) {
  TextCodec<int> ints;
  const auto encoded = ints.encode(-42);
  EXPECT_EQ(std::string(encoded.begin(), encoded.end()), "-42");
  EXPECT_EQ(ints.decode(encoded.data(), encoded.size()), -42);

  const std::string padded = "  17\n";
  EXPECT_EQ(ints.decode(reinterpret_cast<const std::uint8_t*>(padded.data()), padded.size()), 17);

  TextCodec<std::string> strings;
  const std::string text = "multiple words\nand lines";
  const auto raw = strings.encode(text);
  EXPECT_EQ(strings.decode(raw.data(), raw.size()), text);
  EXPECT_STREQ(TextCodec<double>::extension(), "txt");
}

TEST(TextCodecTest, RejectsBadText) {
  TextCodec<int> ints;
  const std::string letters = "abc";
  const std::string trailing = "12 monkeys";
  EXPECT_THROW(ints.decode(reinterpret_cast<const std::uint8_t*>(letters.data()), letters.size()), CodecError);
  EXPECT_THROW(ints.decode(reinterpret_cast<const std::uint8_t*>(trailing.data()), trailing.size()), CodecError);
  EXPECT_THROW(ints.decode(nullptr, 0), CodecError);
}

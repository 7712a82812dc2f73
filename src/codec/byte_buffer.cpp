#include "codec/byte_buffer.hpp"
#include "common/errors.hpp"
#include <cstring>
#include <limits>
#include <boost/endian/conversion.hpp>

namespace disk {
namespace codec {

namespace {

template <typename T>
T to_order(T value, ByteOrder order) {
  return order == ByteOrder::BIG
    ? boost::endian::native_to_big(value)
    : boost::endian::native_to_little(value);
}

template <typename T>
T from_order(T value, ByteOrder order) {
  return order == ByteOrder::BIG
    ? boost::endian::big_to_native(value)
    : boost::endian::little_to_native(value);
}

} // namespace

//==============================================
// WRITER
//==============================================

ByteWriter::ByteWriter(const BinaryOptions& options)
  : options_(options) {}

void ByteWriter::write_u8(std::uint8_t value) {
  bytes_.push_back(value);
}

void ByteWriter::write_u16(std::uint16_t value) {
  value = to_order(value, options_.order);
  append(&value, sizeof(value));
}

void ByteWriter::write_u32(std::uint32_t value) {
  value = to_order(value, options_.order);
  append(&value, sizeof(value));
}

void ByteWriter::write_u64(std::uint64_t value) {
  value = to_order(value, options_.order);
  append(&value, sizeof(value));
}

void ByteWriter::write_i32(std::int32_t value) {
  write_u32(static_cast<std::uint32_t>(value));
}

void ByteWriter::write_i64(std::int64_t value) {
  write_u64(static_cast<std::uint64_t>(value));
}

void ByteWriter::write_f64(double value) {
  static_assert(sizeof(double) == sizeof(std::uint64_t), "double must be 64 bits");
  std::uint64_t bits;
  std::memcpy(&bits, &value, sizeof(bits));
  write_u64(bits);
}

void ByteWriter::write_bool(bool value) {
  write_u8(value ? 1 : 0);
}

void ByteWriter::write_string(const std::string& value) {
  write_u64(value.size());
  append(value.data(), value.size());
}

void ByteWriter::write_bytes(const std::vector<std::uint8_t>& value) {
  write_u64(value.size());
  append(value.data(), value.size());
}

void ByteWriter::append(const void* data, std::size_t size) {
  const auto* begin = static_cast<const std::uint8_t*>(data);
  bytes_.insert(bytes_.end(), begin, begin + size);
}


//==============================================
// READER
//==============================================

ByteReader::ByteReader(const std::uint8_t* data, std::size_t size, const BinaryOptions& options)
  : data_(data)
  , size_(size)
  , position_(0)
  , options_(options) {}

std::uint8_t ByteReader::read_u8() {
  std::uint8_t value;
  take(&value, sizeof(value));
  return value;
}

std::uint16_t ByteReader::read_u16() {
  std::uint16_t value;
  take(&value, sizeof(value));
  return from_order(value, options_.order);
}

std::uint32_t ByteReader::read_u32() {
  std::uint32_t value;
  take(&value, sizeof(value));
  return from_order(value, options_.order);
}

std::uint64_t ByteReader::read_u64() {
  std::uint64_t value;
  take(&value, sizeof(value));
  return from_order(value, options_.order);
}

std::int32_t ByteReader::read_i32() {
  return static_cast<std::int32_t>(read_u32());
}

std::int64_t ByteReader::read_i64() {
  return static_cast<std::int64_t>(read_u64());
}

double ByteReader::read_f64() {
  const std::uint64_t bits = read_u64();
  double value;
  std::memcpy(&value, &bits, sizeof(value));
  return value;
}

bool ByteReader::read_bool() {
  const std::uint8_t value = read_u8();
  if (value > 1) {
    throw CodecError("invalid bool byte: " + std::to_string(value));
  }
  return value == 1;
}

std::string ByteReader::read_string() {
  std::string value(read_length(), '\0');
  take(value.data(), value.size());
  return value;
}

std::vector<std::uint8_t> ByteReader::read_bytes() {
  std::vector<std::uint8_t> value(read_length());
  take(value.data(), value.size());
  return value;
}

void ByteReader::take(void* out, std::size_t size) {
  if (size > remaining()) {
    throw CodecError("unexpected end of input: needed " + std::to_string(size) +
      " bytes, " + std::to_string(remaining()) + " left");
  }
  if (size > 0) {
    std::memcpy(out, data_ + position_, size);
  }
  position_ += size;
}

std::size_t ByteReader::read_length() {
  const std::uint64_t length = read_u64();
  // Checked before allocating so a corrupt prefix cannot request gigabytes
  if (length > remaining()) {
    throw CodecError("length prefix " + std::to_string(length) + " exceeds remaining input");
  }
  return static_cast<std::size_t>(length);
}

} // namespace codec
} // namespace disk

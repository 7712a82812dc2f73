#ifndef DISK_CODEC_BYTE_BUFFER_HPP
#define DISK_CODEC_BYTE_BUFFER_HPP

#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace disk {
namespace codec {

enum class ByteOrder : std::uint8_t {
  LITTLE = 0,
  BIG = 1
};

// Encoder settings. Built once and handed to each codec by value.
struct BinaryOptions {
  ByteOrder order = ByteOrder::LITTLE;
};

// Appends fixed-width integers in the configured byte order.
// Strings and blobs are prefixed with their u64 length.
class ByteWriter {
public:
  explicit ByteWriter(const BinaryOptions& options);

  void write_u8(std::uint8_t value);
  void write_u16(std::uint16_t value);
  void write_u32(std::uint32_t value);
  void write_u64(std::uint64_t value);
  void write_i32(std::int32_t value);
  void write_i64(std::int64_t value);
  void write_f64(double value);
  void write_bool(bool value);
  void write_string(const std::string& value);
  void write_bytes(const std::vector<std::uint8_t>& value);

  const std::vector<std::uint8_t>& bytes() const { return bytes_; }
  std::vector<std::uint8_t> release() { return std::move(bytes_); }

private:
  void append(const void* data, std::size_t size);

  BinaryOptions options_;
  std::vector<std::uint8_t> bytes_;
};

// Reads values written by ByteWriter with the same options.
// Running out of input throws CodecError.
class ByteReader {
public:
  ByteReader(const std::uint8_t* data, std::size_t size, const BinaryOptions& options);

  std::uint8_t read_u8();
  std::uint16_t read_u16();
  std::uint32_t read_u32();
  std::uint64_t read_u64();
  std::int32_t read_i32();
  std::int64_t read_i64();
  double read_f64();
  bool read_bool();
  std::string read_string();
  std::vector<std::uint8_t> read_bytes();

  std::size_t remaining() const { return size_ - position_; }
  bool at_end() const { return position_ == size_; }

private:
  void take(void* out, std::size_t size);
  std::size_t read_length();

  const std::uint8_t* data_;
  std::size_t size_;
  std::size_t position_;
  BinaryOptions options_;
};

} // namespace codec
} // namespace disk

#endif // DISK_CODEC_BYTE_BUFFER_HPP

#ifndef DISK_CODEC_BINARY_CODEC_HPP
#define DISK_CODEC_BINARY_CODEC_HPP

#include <cstddef>
#include <cstdint>
#include <exception>
#include <string>
#include <vector>
#include "codec/byte_buffer.hpp"
#include "common/errors.hpp"

namespace disk {
namespace codec {

// Compact binary codec. T describes its own layout:
//
//   void encode(ByteWriter& writer) const;
//   static T decode(ByteReader& reader);
//
// Decoding must consume the whole input, trailing bytes are an error.
template <typename T>
class BinaryCodec {
public:
  explicit BinaryCodec(BinaryOptions options = {})
    : options_(options) {}

  static const char* extension() { return "bin"; }

  const BinaryOptions& options() const { return options_; }

  std::vector<std::uint8_t> encode(const T& value) const {
    ByteWriter writer(options_);
    try {
      value.encode(writer);
    } catch (const CodecError&) {
      throw;
    } catch (const std::exception& e) {
      throw CodecError(std::string("encode failed: ") + e.what());
    }
    return writer.release();
  }

  T decode(const std::uint8_t* data, std::size_t size) const {
    ByteReader reader(data, size, options_);
    try {
      T value = T::decode(reader);
      if (!reader.at_end()) {
        throw CodecError(std::to_string(reader.remaining()) + " trailing bytes after value");
      }
      return value;
    } catch (const CodecError&) {
      throw;
    } catch (const std::exception& e) {
      throw CodecError(std::string("decode failed: ") + e.what());
    }
  }

private:
  BinaryOptions options_;
};

} // namespace codec
} // namespace disk

#endif // DISK_CODEC_BINARY_CODEC_HPP

#ifndef DISK_CODEC_TEXT_CODEC_HPP
#define DISK_CODEC_TEXT_CODEC_HPP

#include <cstddef>
#include <cstdint>
#include <sstream>
#include <string>
#include <type_traits>
#include <vector>
#include "common/errors.hpp"

namespace disk {
namespace codec {

// Plain text through the stream operators of T. std::string is stored
// verbatim rather than read back word by word.
template <typename T>
class TextCodec {
public:
  static const char* extension() { return "txt"; }

  std::vector<std::uint8_t> encode(const T& value) const {
    if constexpr (std::is_same_v<T, std::string>) {
      return std::vector<std::uint8_t>(value.begin(), value.end());
    } else {
      std::ostringstream out;
      out << value;
      if (!out) {
        throw CodecError("failed to format value as text");
      }
      const std::string text = out.str();
      return std::vector<std::uint8_t>(text.begin(), text.end());
    }
  }

  T decode(const std::uint8_t* data, std::size_t size) const {
    const char* begin = reinterpret_cast<const char*>(data);
    std::string text(begin, begin + size);
    if constexpr (std::is_same_v<T, std::string>) {
      return text;
    } else {
      std::istringstream in(text);
      T value{};
      if (!(in >> value)) {
        throw CodecError("failed to parse text: \"" + text + "\"");
      }
      // Only whitespace may follow the value
      in >> std::ws;
      if (!in.eof()) {
        throw CodecError("trailing characters after value in: \"" + text + "\"");
      }
      return value;
    }
  }
};

} // namespace codec
} // namespace disk

#endif // DISK_CODEC_TEXT_CODEC_HPP

#ifndef DISK_FRAME_FRAME_HPP
#define DISK_FRAME_FRAME_HPP

#include <array>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <vector>

namespace disk {
namespace frame {

constexpr std::size_t HEADER_SIZE = 24;
constexpr std::size_t FULL_HEADER_SIZE = HEADER_SIZE + 1;

using Header = std::array<std::uint8_t, HEADER_SIZE>;
using FullHeader = std::array<std::uint8_t, FULL_HEADER_SIZE>;

// On-disk layout of a framed payload:
//   [0, 24)  header (schema magic)
//   24       version
//   [25, n)  codec bytes
// Compression wraps all n bytes.
struct Frame {
  Header header{};
  std::uint8_t version{0};

  // Header followed by the version byte
  FullHeader full_header() const;

  // Checks length, then header, then version. Throws FrameError.
  void validate_header(const std::uint8_t* data, std::size_t size) const;
  void validate_header(const std::vector<std::uint8_t>& bytes) const;

  // full_header() || payload
  std::vector<std::uint8_t> prepend(const std::vector<std::uint8_t>& payload) const;
};

// Reads the first 25 bytes of an uncompressed file and returns byte 24
// when bytes [0, 24) equal the header. Throws IoError if the file cannot
// be opened or holds fewer than 25 bytes, FrameError on a header mismatch.
std::uint8_t read_file_version(const std::filesystem::path& path, const Header& header);

} // namespace frame
} // namespace disk

#endif // DISK_FRAME_FRAME_HPP

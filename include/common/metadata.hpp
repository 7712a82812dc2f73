#ifndef DISK_COMMON_METADATA_HPP
#define DISK_COMMON_METADATA_HPP

#include <cstdint>
#include <filesystem>
#include <ostream>
#include <string>
#include <utility>

namespace disk {

// Byte count paired with the path it describes. Returned by every
// successful save, remove and size query.
class Metadata {
public:
  Metadata(std::uint64_t size, std::filesystem::path path);

  // Metadata with a size of 0 bytes
  static Metadata zero(std::filesystem::path path);

  std::uint64_t size() const { return size_; }
  const std::filesystem::path& path() const { return path_; }
  std::pair<std::uint64_t, std::filesystem::path> to_parts() const;

  // "<size> bytes @ <path>"
  std::string to_string() const;

  bool operator==(const Metadata& other) const;
  bool operator!=(const Metadata& other) const { return !(*this == other); }
  bool operator<(const Metadata& other) const;

private:
  std::uint64_t size_;
  std::filesystem::path path_;
};

std::ostream& operator<<(std::ostream& out, const Metadata& metadata);

} // namespace disk

#endif // DISK_COMMON_METADATA_HPP

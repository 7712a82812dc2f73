#ifndef DISK_IO_MAPPED_FILE_HPP
#define DISK_IO_MAPPED_FILE_HPP

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <vector>

namespace disk {
namespace io {

// Read-only view of a whole file through mmap.
//
// The caller must make sure no other process truncates or rewrites
// the file while the view is alive. Doing so is undefined behaviour
// at the memory access level and cannot be detected here.
class MappedFile {
public:
  explicit MappedFile(const std::filesystem::path& path);
  ~MappedFile();

  MappedFile(const MappedFile&) = delete;
  MappedFile& operator=(const MappedFile&) = delete;

  const std::uint8_t* data() const { return static_cast<const std::uint8_t*>(address_); }
  std::size_t size() const { return size_; }

private:
  void* address_;
  std::size_t size_;
};

enum class FlushMode {
  ASYNC,  // msync(MS_ASYNC)
  SYNC    // msync(MS_SYNC), returns once the pages reached the file
};

// Creates or resizes the file to exactly bytes.size() and copies the
// bytes in through a shared writable mapping. Same caller precondition
// as MappedFile.
void write_file_mmap(const std::filesystem::path& path,
  const std::vector<std::uint8_t>& bytes, FlushMode mode);

} // namespace io
} // namespace disk

#endif // DISK_IO_MAPPED_FILE_HPP

#ifndef DISK_IO_FILE_IO_HPP
#define DISK_IO_FILE_IO_HPP

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <system_error>
#include <vector>

namespace disk {
namespace io {

// ---- BUFFERED I/O ----
// Reads the whole file
std::vector<std::uint8_t> read_file(const std::filesystem::path& path);
// Reads exactly `length` bytes starting at `offset`, IoError if the file is shorter
std::vector<std::uint8_t> read_range(const std::filesystem::path& path,
  std::uint64_t offset, std::size_t length);
// Creates or truncates the file and writes all bytes
void write_file(const std::filesystem::path& path, const std::vector<std::uint8_t>& bytes);


// ---- SIZES ----
// Size of the file or directory entry, 0 on any error
std::uint64_t filesize(const std::filesystem::path& path) noexcept;
// Size of the file or directory entry, IoError if it cannot be stat'ed
std::uint64_t file_size(const std::filesystem::path& path);


// ---- ERRORS ----
// errno as an error_code, or `fallback` when errno is not set
std::error_code last_error(std::errc fallback = std::errc::io_error);

} // namespace io
} // namespace disk

#endif // DISK_IO_FILE_IO_HPP

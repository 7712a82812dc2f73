#ifndef DISK_IO_GZIP_HPP
#define DISK_IO_GZIP_HPP

#include <cstddef>
#include <cstdint>
#include <vector>

namespace disk {
namespace io {

// Single gzip member at the fastest compression level
std::vector<std::uint8_t> compress_gzip(const std::uint8_t* data, std::size_t size);
std::vector<std::uint8_t> compress_gzip(const std::vector<std::uint8_t>& bytes);

// Throws IoError (illegal_byte_sequence) when the input is not valid gzip
std::vector<std::uint8_t> decompress_gzip(const std::uint8_t* data, std::size_t size);
std::vector<std::uint8_t> decompress_gzip(const std::vector<std::uint8_t>& bytes);

} // namespace io
} // namespace disk

#endif // DISK_IO_GZIP_HPP

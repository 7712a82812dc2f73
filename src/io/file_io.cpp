#include "io/file_io.hpp"
#include "common/errors.hpp"
#include <cerrno>
#include <fstream>
#include <sys/stat.h>
#include <boost/log/trivial.hpp>

namespace disk {
namespace io {

//==============================================
// BUFFERED I/O
//==============================================

std::vector<std::uint8_t> read_file(const std::filesystem::path& path) {
  BOOST_LOG_TRIVIAL(debug) << "FileIO: Reading file: " << path.string();

  errno = 0;
  std::ifstream file(path, std::ios::binary);
  if (!file) {
    BOOST_LOG_TRIVIAL(error) << "FileIO: Failed to open file: " << path.string();
    throw IoError("failed to open file", last_error(std::errc::no_such_file_or_directory), path);
  }

  std::vector<std::uint8_t> bytes;
  std::error_code ec;
  const std::uintmax_t size = std::filesystem::file_size(path, ec);
  if (!ec) {
    bytes.reserve(static_cast<std::size_t>(size));
  }

  char buffer[4096];
  while (file.read(buffer, sizeof(buffer))) {
    bytes.insert(bytes.end(), buffer, buffer + file.gcount());
  }
  // Final partial chunk
  if (file.gcount() > 0) {
    bytes.insert(bytes.end(), buffer, buffer + file.gcount());
  }

  if (file.bad()) {
    BOOST_LOG_TRIVIAL(error) << "FileIO: Read failed for: " << path.string();
    throw IoError("read failed", last_error(), path);
  }

  BOOST_LOG_TRIVIAL(debug) << "FileIO: Read " << bytes.size() << " bytes from: " << path.string();
  return bytes;
}

std::vector<std::uint8_t> read_range(const std::filesystem::path& path,
    std::uint64_t offset, std::size_t length) {
  BOOST_LOG_TRIVIAL(debug) << "FileIO: Reading " << length << " bytes at offset " << offset
                           << " from: " << path.string();

  errno = 0;
  std::ifstream file(path, std::ios::binary);
  if (!file) {
    BOOST_LOG_TRIVIAL(error) << "FileIO: Failed to open file: " << path.string();
    throw IoError("failed to open file", last_error(std::errc::no_such_file_or_directory), path);
  }

  // Checked before allocating, so the offset also fits a streamoff below
  const std::uint64_t size = io::file_size(path);
  if (offset > size || length > size - offset) {
    BOOST_LOG_TRIVIAL(error) << "FileIO: Range of " << length << " bytes at offset " << offset
                             << " is past the end of " << path.string() << " (" << size << " bytes)";
    throw IoError("failed to fill whole buffer", std::make_error_code(std::errc::io_error), path);
  }

  std::vector<std::uint8_t> bytes(length);
  file.seekg(static_cast<std::streamoff>(offset), std::ios::beg);
  file.read(reinterpret_cast<char*>(bytes.data()), static_cast<std::streamsize>(length));

  if (!file || static_cast<std::size_t>(file.gcount()) != length) {
    BOOST_LOG_TRIVIAL(error) << "FileIO: Short read from: " << path.string();
    throw IoError("failed to fill whole buffer", std::make_error_code(std::errc::io_error), path);
  }

  return bytes;
}

void write_file(const std::filesystem::path& path, const std::vector<std::uint8_t>& bytes) {
  BOOST_LOG_TRIVIAL(debug) << "FileIO: Writing " << bytes.size() << " bytes to: " << path.string();

  errno = 0;
  std::ofstream file(path, std::ios::binary | std::ios::trunc);
  if (!file) {
    BOOST_LOG_TRIVIAL(error) << "FileIO: Failed to create file: " << path.string();
    throw IoError("failed to create file", last_error(), path);
  }

  file.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
  file.flush();
  if (!file) {
    BOOST_LOG_TRIVIAL(error) << "FileIO: Write failed for: " << path.string();
    throw IoError("write failed", last_error(), path);
  }

  file.close();
  if (file.fail()) {
    throw IoError("close failed", last_error(), path);
  }
}


//==============================================
// SIZES
//==============================================

std::uint64_t filesize(const std::filesystem::path& path) noexcept {
  struct stat info {};
  if (::stat(path.c_str(), &info) != 0) {
    return 0;
  }
  return static_cast<std::uint64_t>(info.st_size);
}

std::uint64_t file_size(const std::filesystem::path& path) {
  struct stat info {};
  if (::stat(path.c_str(), &info) != 0) {
    const std::error_code ec = last_error();
    BOOST_LOG_TRIVIAL(error) << "FileIO: Failed to stat: " << path.string() << ": " << ec.message();
    throw IoError("failed to read size", ec, path);
  }
  return static_cast<std::uint64_t>(info.st_size);
}


//==============================================
// ERRORS
//==============================================

std::error_code last_error(std::errc fallback) {
  if (errno != 0) {
    return std::error_code(errno, std::generic_category());
  }
  return std::make_error_code(fallback);
}

} // namespace io
} // namespace disk

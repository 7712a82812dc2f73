#include "io/mapped_file.hpp"
#include "io/file_io.hpp"
#include "common/errors.hpp"
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/mman.h>
#include <sys/stat.h>
#include <unistd.h>
#include <boost/log/trivial.hpp>

namespace disk {
namespace io {

namespace {

// Closes the descriptor when leaving scope
class FileDescriptor {
public:
  explicit FileDescriptor(int fd) : fd_(fd) {}
  FileDescriptor(const FileDescriptor&) = delete;
  FileDescriptor& operator=(const FileDescriptor&) = delete;
  ~FileDescriptor() {
    if (fd_ >= 0) {
      ::close(fd_);
    }
  }

  int get() const { return fd_; }

private:
  int fd_;
};

[[noreturn]] void throw_errno(const std::string& message, const std::filesystem::path& path) {
  const std::error_code ec = last_error();
  BOOST_LOG_TRIVIAL(error) << "MappedFile: " << message << " for " << path.string() << ": " << ec.message();
  throw IoError(message, ec, path);
}

} // namespace

//==============================================
// READ-ONLY MAPPING
//==============================================

MappedFile::MappedFile(const std::filesystem::path& path)
  : address_(nullptr)
  , size_(0) {
  BOOST_LOG_TRIVIAL(debug) << "MappedFile: Mapping file: " << path.string();

  FileDescriptor fd(::open(path.c_str(), O_RDONLY | O_CLOEXEC));
  if (fd.get() < 0) {
    throw_errno("open failed", path);
  }

  struct stat info {};
  if (::fstat(fd.get(), &info) != 0) {
    throw_errno("fstat failed", path);
  }

  size_ = static_cast<std::size_t>(info.st_size);
  // A zero length mapping is invalid, an empty file maps to an empty view
  if (size_ == 0) {
    return;
  }

  void* address = ::mmap(nullptr, size_, PROT_READ, MAP_PRIVATE, fd.get(), 0);
  if (address == MAP_FAILED) {
    size_ = 0;
    throw_errno("mmap failed", path);
  }
  address_ = address;
}

MappedFile::~MappedFile() {
  if (address_ != nullptr) {
    ::munmap(address_, size_);
  }
}


//==============================================
// WRITABLE MAPPING
//==============================================

void write_file_mmap(const std::filesystem::path& path,
    const std::vector<std::uint8_t>& bytes, FlushMode mode) {
  BOOST_LOG_TRIVIAL(debug) << "MappedFile: Writing " << bytes.size() << " bytes through mmap to: "
                           << path.string();

  errno = 0;
  FileDescriptor fd(::open(path.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0666));
  if (fd.get() < 0) {
    throw_errno("open failed", path);
  }

  if (::ftruncate(fd.get(), static_cast<off_t>(bytes.size())) != 0) {
    throw_errno("ftruncate failed", path);
  }

  if (bytes.empty()) {
    return;
  }

  void* address = ::mmap(nullptr, bytes.size(), PROT_READ | PROT_WRITE, MAP_SHARED, fd.get(), 0);
  if (address == MAP_FAILED) {
    throw_errno("mmap failed", path);
  }

  std::memcpy(address, bytes.data(), bytes.size());

  const int flags = (mode == FlushMode::SYNC) ? MS_SYNC : MS_ASYNC;
  if (::msync(address, bytes.size(), flags) != 0) {
    const std::error_code ec = last_error();
    ::munmap(address, bytes.size());
    BOOST_LOG_TRIVIAL(error) << "MappedFile: msync failed for " << path.string() << ": " << ec.message();
    throw IoError("msync failed", ec, path);
  }

  if (::munmap(address, bytes.size()) != 0) {
    throw_errno("munmap failed", path);
  }
}

} // namespace io
} // namespace disk

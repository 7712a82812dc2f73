#ifndef DISK_COMMON_ERRORS_HPP
#define DISK_COMMON_ERRORS_HPP

#include <filesystem>
#include <stdexcept>
#include <string>
#include <system_error>

namespace disk {

// Reasons a binary frame is rejected
enum class FrameErrorKind {
  TOO_SHORT = 0,
  HEADER_MISMATCH,
  VERSION_MISMATCH,
  NO_VERSION_MATCHED
};

inline const char* frame_error_to_string(FrameErrorKind kind) {
  switch (kind) {
    case FrameErrorKind::TOO_SHORT: return "Too short";
    case FrameErrorKind::HEADER_MISMATCH: return "Header mismatch";
    case FrameErrorKind::VERSION_MISMATCH: return "Version mismatch";
    case FrameErrorKind::NO_VERSION_MATCHED: return "No version matched";
    default: return "Undefined frame error";
  }
}

class DiskError : public std::runtime_error {
public:
  explicit DiskError(const std::string& message)
    : std::runtime_error(message) {}
};

class PathError : public DiskError {
public:
  explicit PathError(const std::string& message)
    : DiskError("Path error: " + message) {}
};

class FrameError : public DiskError {
public:
  FrameError(FrameErrorKind kind, const std::string& message)
    : DiskError(std::string("Frame error (") + frame_error_to_string(kind) + "): " + message)
    , kind_(kind) {}

  FrameErrorKind kind() const { return kind_; }

private:
  FrameErrorKind kind_;
};

class CodecError : public DiskError {
public:
  explicit CodecError(const std::string& message)
    : DiskError("Codec error: " + message) {}
};

class IoError : public DiskError {
public:
  IoError(const std::string& message, std::error_code code,
          const std::filesystem::path& path = {})
    : DiskError("I/O error: " + message + " [" + path.string() + "]: " + code.message())
    , code_(code)
    , path_(path) {}

  const std::error_code& code() const { return code_; }
  const std::filesystem::path& path() const { return path_; }

private:
  std::error_code code_;
  std::filesystem::path path_;
};

class RangeError : public DiskError {
public:
  explicit RangeError(const std::string& message)
    : DiskError("Range error: " + message) {}
};

class ConfigError : public DiskError {
public:
  explicit ConfigError(const std::string& message)
    : DiskError("Config error: " + message) {}
};

} // namespace disk

#endif // DISK_COMMON_ERRORS_HPP

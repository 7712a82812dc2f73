#ifndef DISK_ENGINE_FILE_ENGINE_HPP
#define DISK_ENGINE_FILE_ENGINE_HPP

#include <cstdint>
#include <filesystem>
#include <functional>
#include <string>
#include <utility>
#include <vector>
#include "common/metadata.hpp"
#include "frame/frame.hpp"
#include "path/location.hpp"

namespace disk {
namespace engine {

// Callbacks run inside the atomic save sequence. An exception thrown
// from a hook aborts the save exactly like a failed write.
struct AtomicHooks {
  // Runs after the temp file is complete and before it is renamed over the target
  std::function<void(const std::filesystem::path& tmp, const std::filesystem::path& target)> before_rename;
};

// Moves raw bytes between memory and the paths of one Location.
//
// Every atomic operation writes to the temp sibling and renames it
// into place, so the target path holds either the old or the new
// content. Nothing is fsync'ed before the rename. Concurrent writers
// to the same location race on the same temp name, last rename wins.
class FileEngine {
public:
  explicit FileEngine(path::Location location, AtomicHooks hooks = {});

  const path::Location& location() const { return location_; }
  void set_hooks(AtomicHooks hooks) { hooks_ = std::move(hooks); }


  // ---- SAVE ----
  // Direct writes, no interruption safety
  Metadata save(const std::vector<std::uint8_t>& bytes);
  Metadata save_gzip(const std::vector<std::uint8_t>& bytes);
  // Temp file then rename
  Metadata save_atomic(const std::vector<std::uint8_t>& bytes);
  Metadata save_atomic_gzip(const std::vector<std::uint8_t>& bytes);

  // Same as above through a writable mapping. The atomic variants
  // flush with MS_SYNC before the rename, the others with MS_ASYNC.
  Metadata save_memmap(const std::vector<std::uint8_t>& bytes);
  Metadata save_gzip_memmap(const std::vector<std::uint8_t>& bytes);
  Metadata save_atomic_memmap(const std::vector<std::uint8_t>& bytes);
  Metadata save_atomic_gzip_memmap(const std::vector<std::uint8_t>& bytes);


  // ---- READ ----
  std::vector<std::uint8_t> read_to_bytes() const;
  std::vector<std::uint8_t> read_to_bytes_gzip() const;
  std::vector<std::uint8_t> read_to_bytes_memmap() const;
  std::vector<std::uint8_t> read_to_bytes_gzip_memmap() const;
  std::string read_to_string() const;

  // Bytes [start, end) of the uncompressed file. start == end yields one
  // byte (the byte at `start`). Throws RangeError when start > end and
  // IoError when the file is too short.
  std::vector<std::uint8_t> file_bytes(std::uint64_t start, std::uint64_t end) const;
  // Bytes [start, end) through a mapping. start == end yields nothing.
  // Throws RangeError when start > end or end lies past the file end.
  std::vector<std::uint8_t> file_bytes_memmap(std::uint64_t start, std::uint64_t end) const;

  // Version byte of the uncompressed file if its first 24 bytes equal `header`
  std::uint8_t file_version(const frame::Header& header) const;


  // ---- QUERY ----
  // False when absent, IoError when the check itself fails
  bool exists() const;
  bool exists_gzip() const;
  Metadata file_size() const;
  Metadata file_size_gzip() const;
  // Size of the directory entry itself, not of its contents
  Metadata project_dir_size() const;
  Metadata sub_dir_size() const;


  // ---- REMOVE ----
  // A missing file is not an error and yields a zero sized Metadata
  Metadata rm();
  Metadata rm_gzip();
  // Rename to the temp sibling, then unlink it
  Metadata rm_atomic();
  Metadata rm_atomic_gzip();
  // Removes whichever temp files exist
  void rm_tmp();
  // Recursive removal, symlinks are removed and never followed
  Metadata rm_sub();
  Metadata rm_project();
  Metadata rm_rf();


  // ---- DIRECTORIES ----
  // Creates every directory up to the file, already existing is fine
  void mkdir();
  // Creates or truncates the file to zero bytes
  Metadata touch();

  // Sets the process file mode creation mask and returns the previous one
  static std::uint32_t umask(std::uint32_t mask);

private:
  enum class WriteMode {
    BUFFERED,
    MEMMAP_ASYNC,
    MEMMAP_SYNC
  };

  Metadata write_direct(const std::filesystem::path& target,
    const std::vector<std::uint8_t>& bytes, WriteMode mode);
  Metadata write_atomic(const std::filesystem::path& tmp, const std::filesystem::path& target,
    const std::vector<std::uint8_t>& bytes, WriteMode mode);
  static void write_with(const std::filesystem::path& path,
    const std::vector<std::uint8_t>& bytes, WriteMode mode);
  // Best attempt at removing a temp file after a failure, throws IoError if that fails too
  static void discard_tmp(const std::filesystem::path& tmp);

  static Metadata remove_file(const std::filesystem::path& path);
  static Metadata remove_atomic(const std::filesystem::path& path, const std::filesystem::path& tmp);
  static Metadata remove_tree(const std::filesystem::path& path);
  static bool path_exists(const std::filesystem::path& path);
  static Metadata entry_size(const std::filesystem::path& path);

  path::Location location_;
  AtomicHooks hooks_;
};

} // namespace engine
} // namespace disk

#endif // DISK_ENGINE_FILE_ENGINE_HPP

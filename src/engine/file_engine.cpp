#include "engine/file_engine.hpp"
#include "common/errors.hpp"
#include "io/file_io.hpp"
#include "io/gzip.hpp"
#include "io/mapped_file.hpp"
#include <ios>
#include <system_error>
#include <sys/stat.h>
#include <sys/types.h>
#include <boost/log/trivial.hpp>

namespace disk {
namespace engine {

namespace fs = std::filesystem;

//==============================================
// CONSTRUCTOR
//==============================================

// Binds the engine to one entity location, hooks default to none
FileEngine::FileEngine(path::Location location, AtomicHooks hooks)
  : location_(std::move(location))
  , hooks_(std::move(hooks)) {
  BOOST_LOG_TRIVIAL(debug) << "FileEngine: Created for: " << location_.absolute_path().string();
}


//==============================================
// SAVE
//==============================================

// Writes the bytes straight to the target, no temp file
Metadata FileEngine::save(const std::vector<std::uint8_t>& bytes) {
  BOOST_LOG_TRIVIAL(info) << "FileEngine: Saving " << bytes.size() << " bytes";
  return write_direct(location_.absolute_path(), bytes, WriteMode::BUFFERED);
}

// Compresses, then writes straight to the .gz target
Metadata FileEngine::save_gzip(const std::vector<std::uint8_t>& bytes) {
  BOOST_LOG_TRIVIAL(info) << "FileEngine: Saving " << bytes.size() << " bytes gzip compressed";
  return write_direct(location_.absolute_path_gzip(), io::compress_gzip(bytes), WriteMode::BUFFERED);
}

// Writes the temp file and renames it over the target
Metadata FileEngine::save_atomic(const std::vector<std::uint8_t>& bytes) {
  BOOST_LOG_TRIVIAL(info) << "FileEngine: Atomically saving " << bytes.size() << " bytes";
  return write_atomic(location_.tmp_path(), location_.absolute_path(), bytes, WriteMode::BUFFERED);
}

// Compresses, then publishes through the gzip temp file
Metadata FileEngine::save_atomic_gzip(const std::vector<std::uint8_t>& bytes) {
  BOOST_LOG_TRIVIAL(info) << "FileEngine: Atomically saving " << bytes.size() << " bytes gzip compressed";
  return write_atomic(location_.gzip_tmp_path(), location_.absolute_path_gzip(),
    io::compress_gzip(bytes), WriteMode::BUFFERED);
}

// Direct write through a shared mapping, flushed asynchronously
Metadata FileEngine::save_memmap(const std::vector<std::uint8_t>& bytes) {
  BOOST_LOG_TRIVIAL(info) << "FileEngine: Saving " << bytes.size() << " bytes through mmap";
  return write_direct(location_.absolute_path(), bytes, WriteMode::MEMMAP_ASYNC);
}

// Compressed direct write through a shared mapping
Metadata FileEngine::save_gzip_memmap(const std::vector<std::uint8_t>& bytes) {
  BOOST_LOG_TRIVIAL(info) << "FileEngine: Saving " << bytes.size() << " bytes gzip compressed through mmap";
  return write_direct(location_.absolute_path_gzip(), io::compress_gzip(bytes), WriteMode::MEMMAP_ASYNC);
}

// Mapped temp file synced to disk before the rename
Metadata FileEngine::save_atomic_memmap(const std::vector<std::uint8_t>& bytes) {
  BOOST_LOG_TRIVIAL(info) << "FileEngine: Atomically saving " << bytes.size() << " bytes through mmap";
  return write_atomic(location_.tmp_path(), location_.absolute_path(), bytes, WriteMode::MEMMAP_SYNC);
}

// Compressed mapped temp file synced before the rename
Metadata FileEngine::save_atomic_gzip_memmap(const std::vector<std::uint8_t>& bytes) {
  BOOST_LOG_TRIVIAL(info) << "FileEngine: Atomically saving " << bytes.size()
                          << " bytes gzip compressed through mmap";
  return write_atomic(location_.gzip_tmp_path(), location_.absolute_path_gzip(),
    io::compress_gzip(bytes), WriteMode::MEMMAP_SYNC);
}


//==============================================
// READ
//==============================================

// Whole uncompressed file
std::vector<std::uint8_t> FileEngine::read_to_bytes() const {
  const fs::path path = location_.absolute_path();
  BOOST_LOG_TRIVIAL(info) << "FileEngine: Reading: " << path.string();
  return io::read_file(path);
}

// Whole .gz file, decompressed
std::vector<std::uint8_t> FileEngine::read_to_bytes_gzip() const {
  const fs::path path = location_.absolute_path_gzip();
  BOOST_LOG_TRIVIAL(info) << "FileEngine: Reading gzip: " << path.string();
  return io::decompress_gzip(io::read_file(path));
}

// Copies the uncompressed file out of a read-only mapping
std::vector<std::uint8_t> FileEngine::read_to_bytes_memmap() const {
  const fs::path path = location_.absolute_path();
  BOOST_LOG_TRIVIAL(info) << "FileEngine: Reading through mmap: " << path.string();
  io::MappedFile mapped(path);
  return std::vector<std::uint8_t>(mapped.data(), mapped.data() + mapped.size());
}

// Inflates the .gz file straight from its mapping
std::vector<std::uint8_t> FileEngine::read_to_bytes_gzip_memmap() const {
  const fs::path path = location_.absolute_path_gzip();
  BOOST_LOG_TRIVIAL(info) << "FileEngine: Reading gzip through mmap: " << path.string();
  io::MappedFile mapped(path);
  return io::decompress_gzip(mapped.data(), mapped.size());
}

// File content as raw characters, no encoding check
std::string FileEngine::read_to_string() const {
  const std::vector<std::uint8_t> bytes = read_to_bytes();
  return std::string(bytes.begin(), bytes.end());
}

// Ranged buffered read, see header for the empty range case
std::vector<std::uint8_t> FileEngine::file_bytes(std::uint64_t start, std::uint64_t end) const {
  const fs::path path = location_.absolute_path();
  BOOST_LOG_TRIVIAL(info) << "FileEngine: Reading bytes [" << start << ", " << end << ") of: " << path.string();

  if (start > end) {
    BOOST_LOG_TRIVIAL(error) << "FileEngine: Invalid range, start " << start << " is past end " << end;
    throw RangeError("start " + std::to_string(start) + " is greater than end " + std::to_string(end));
  }

  // An empty range still reads the byte at `start`
  const std::uint64_t length = (start == end) ? 1 : end - start;
  return io::read_range(path, start, static_cast<std::size_t>(length));
}

// Ranged read bounded by the mapped size
std::vector<std::uint8_t> FileEngine::file_bytes_memmap(std::uint64_t start, std::uint64_t end) const {
  const fs::path path = location_.absolute_path();
  BOOST_LOG_TRIVIAL(info) << "FileEngine: Reading bytes [" << start << ", " << end
                          << ") through mmap of: " << path.string();

  if (start > end) {
    BOOST_LOG_TRIVIAL(error) << "FileEngine: Invalid range, start " << start << " is past end " << end;
    throw RangeError("start " + std::to_string(start) + " is greater than end " + std::to_string(end));
  }

  io::MappedFile mapped(path);
  if (end > mapped.size()) {
    BOOST_LOG_TRIVIAL(error) << "FileEngine: Range end " << end << " is past file size " << mapped.size();
    throw RangeError("end " + std::to_string(end) + " is past file size " + std::to_string(mapped.size()));
  }
  return std::vector<std::uint8_t>(mapped.data() + start, mapped.data() + end);
}

// Byte 24 of the uncompressed file once the header matches
std::uint8_t FileEngine::file_version(const frame::Header& header) const {
  const fs::path path = location_.absolute_path();
  BOOST_LOG_TRIVIAL(info) << "FileEngine: Reading file version of: " << path.string();
  return frame::read_file_version(path, header);
}


//==============================================
// QUERY
//==============================================

// Plain file present at the target
bool FileEngine::exists() const {
  return path_exists(location_.absolute_path());
}

// Compressed file present at the target
bool FileEngine::exists_gzip() const {
  return path_exists(location_.absolute_path_gzip());
}

// Size of the uncompressed file, IoError when missing
Metadata FileEngine::file_size() const {
  return entry_size(location_.absolute_path());
}

// Size of the compressed file, IoError when missing
Metadata FileEngine::file_size_gzip() const {
  return entry_size(location_.absolute_path_gzip());
}

// Directory entry size of the project directory
Metadata FileEngine::project_dir_size() const {
  return entry_size(location_.project_dir_path());
}

// Directory entry size of the first sub directory
Metadata FileEngine::sub_dir_size() const {
  return entry_size(location_.sub_dir_parent_path());
}


//==============================================
// REMOVE
//==============================================

// Unlinks the plain file
Metadata FileEngine::rm() {
  BOOST_LOG_TRIVIAL(info) << "FileEngine: Removing file";
  return remove_file(location_.absolute_path());
}

// Unlinks the compressed file
Metadata FileEngine::rm_gzip() {
  BOOST_LOG_TRIVIAL(info) << "FileEngine: Removing gzip file";
  return remove_file(location_.absolute_path_gzip());
}

// Moves the plain file to its temp name before unlinking
Metadata FileEngine::rm_atomic() {
  BOOST_LOG_TRIVIAL(info) << "FileEngine: Atomically removing file";
  return remove_atomic(location_.absolute_path(), location_.tmp_path());
}

// Moves the compressed file to its temp name before unlinking
Metadata FileEngine::rm_atomic_gzip() {
  BOOST_LOG_TRIVIAL(info) << "FileEngine: Atomically removing gzip file";
  return remove_atomic(location_.absolute_path_gzip(), location_.gzip_tmp_path());
}

// Clears temp files left by interrupted saves or removes
void FileEngine::rm_tmp() {
  BOOST_LOG_TRIVIAL(info) << "FileEngine: Removing leftover temp files";

  for (const fs::path& tmp : {location_.tmp_path(), location_.gzip_tmp_path()}) {
    if (!path_exists(tmp)) {
      continue;
    }
    std::error_code ec;
    fs::remove(tmp, ec);
    if (ec) {
      BOOST_LOG_TRIVIAL(error) << "FileEngine: Failed to remove temp file: " << tmp.string();
      throw IoError("failed to remove temp file", ec, tmp);
    }
    BOOST_LOG_TRIVIAL(debug) << "FileEngine: Removed temp file: " << tmp.string();
  }
}

// Deletes the first sub directory and everything below it
Metadata FileEngine::rm_sub() {
  BOOST_LOG_TRIVIAL(info) << "FileEngine: Removing first sub directory";
  return remove_tree(location_.sub_dir_parent_path());
}

// Deletes the whole project directory
Metadata FileEngine::rm_project() {
  BOOST_LOG_TRIVIAL(info) << "FileEngine: Removing project directory";
  return remove_tree(location_.project_dir_path());
}

// Same as rm_project
Metadata FileEngine::rm_rf() {
  return rm_project();
}


//==============================================
// DIRECTORIES
//==============================================

// Creates the base directory and its parents
void FileEngine::mkdir() {
  const fs::path base = location_.base_path();
  BOOST_LOG_TRIVIAL(debug) << "FileEngine: Ensuring directory exists: " << base.string();

  std::error_code ec;
  fs::create_directories(base, ec);
  if (ec) {
    BOOST_LOG_TRIVIAL(error) << "FileEngine: Failed to create directory: " << base.string();
    throw IoError("failed to create directory", ec, base);
  }
}

// Empty file used as a signal
Metadata FileEngine::touch() {
  BOOST_LOG_TRIVIAL(info) << "FileEngine: Touching file";
  return write_direct(location_.absolute_path(), {}, WriteMode::BUFFERED);
}

// Process wide, affects every thread
std::uint32_t FileEngine::umask(std::uint32_t mask) {
#ifdef _WIN32
  (void)mask;
  return 0;
#else
  const mode_t previous = ::umask(static_cast<mode_t>(mask));
  BOOST_LOG_TRIVIAL(debug) << "FileEngine: umask changed from " << std::oct << previous
                           << " to " << mask << std::dec;
  return static_cast<std::uint32_t>(previous);
#endif
}


//==============================================
// WRITE SEQUENCES
//==============================================

// Prepares the directories, then writes in place
Metadata FileEngine::write_direct(const fs::path& target,
    const std::vector<std::uint8_t>& bytes, WriteMode mode) {
  mkdir();
  write_with(target, bytes, mode);
  BOOST_LOG_TRIVIAL(info) << "FileEngine: Wrote " << bytes.size() << " bytes to: " << target.string();
  return Metadata(bytes.size(), target);
}

// Write temp, run the hook, rename. Any failure discards the temp file and rethrows
Metadata FileEngine::write_atomic(const fs::path& tmp, const fs::path& target,
    const std::vector<std::uint8_t>& bytes, WriteMode mode) {
  mkdir();
  BOOST_LOG_TRIVIAL(debug) << "FileEngine: Writing temp file: " << tmp.string();

  try {
    write_with(tmp, bytes, mode);

    if (hooks_.before_rename) {
      hooks_.before_rename(tmp, target);
    }

    std::error_code ec;
    fs::rename(tmp, target, ec);
    if (ec) {
      BOOST_LOG_TRIVIAL(error) << "FileEngine: Failed to rename " << tmp.string() << " to " << target.string();
      throw IoError("failed to rename temp file into place", ec, target);
    }
  } catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(warning) << "FileEngine: Atomic save aborted, discarding temp file: " << e.what();
    discard_tmp(tmp);
    throw;
  }

  BOOST_LOG_TRIVIAL(info) << "FileEngine: Atomically wrote " << bytes.size() << " bytes to: " << target.string();
  return Metadata(bytes.size(), target);
}

// Dispatches to the buffered or mapped writer
void FileEngine::write_with(const fs::path& path,
    const std::vector<std::uint8_t>& bytes, WriteMode mode) {
  switch (mode) {
    case WriteMode::BUFFERED:
      io::write_file(path, bytes);
      break;
    case WriteMode::MEMMAP_ASYNC:
      io::write_file_mmap(path, bytes, io::FlushMode::ASYNC);
      break;
    case WriteMode::MEMMAP_SYNC:
      io::write_file_mmap(path, bytes, io::FlushMode::SYNC);
      break;
  }
}

// A missing temp file is fine, any other failure is reported
void FileEngine::discard_tmp(const fs::path& tmp) {
  std::error_code ec;
  fs::remove(tmp, ec);
  if (ec) {
    BOOST_LOG_TRIVIAL(error) << "FileEngine: Failed to discard temp file: " << tmp.string();
    throw IoError("failed to discard temp file", ec, tmp);
  }
}


//==============================================
// REMOVE SEQUENCES
//==============================================

// Missing files count as removed with a size of 0
Metadata FileEngine::remove_file(const fs::path& path) {
  if (!path_exists(path)) {
    BOOST_LOG_TRIVIAL(debug) << "FileEngine: Nothing to remove at: " << path.string();
    return Metadata::zero(path);
  }

  const std::uint64_t size = io::filesize(path);
  std::error_code ec;
  fs::remove(path, ec);
  if (ec) {
    BOOST_LOG_TRIVIAL(error) << "FileEngine: Failed to remove: " << path.string();
    throw IoError("failed to remove file", ec, path);
  }

  BOOST_LOG_TRIVIAL(info) << "FileEngine: Removed " << size << " bytes at: " << path.string();
  return Metadata(size, path);
}

// Rename then unlink so a crash leaves only a temp file behind
Metadata FileEngine::remove_atomic(const fs::path& path, const fs::path& tmp) {
  if (!path_exists(path)) {
    BOOST_LOG_TRIVIAL(debug) << "FileEngine: Nothing to remove at: " << path.string();
    return Metadata::zero(path);
  }

  const std::uint64_t size = io::filesize(path);
  std::error_code ec;
  fs::rename(path, tmp, ec);
  if (ec) {
    BOOST_LOG_TRIVIAL(error) << "FileEngine: Failed to rename " << path.string() << " to " << tmp.string();
    throw IoError("failed to rename file to temp path", ec, path);
  }

  fs::remove(tmp, ec);
  if (ec) {
    BOOST_LOG_TRIVIAL(error) << "FileEngine: Failed to remove temp file: " << tmp.string();
    throw IoError("failed to remove temp file", ec, tmp);
  }

  BOOST_LOG_TRIVIAL(info) << "FileEngine: Atomically removed " << size << " bytes at: " << path.string();
  return Metadata(size, path);
}

// remove_all deletes symlinks themselves and never follows them
Metadata FileEngine::remove_tree(const fs::path& path) {
  const std::uint64_t size = io::filesize(path);

  std::error_code ec;
  const std::uintmax_t removed = fs::remove_all(path, ec);
  if (ec) {
    BOOST_LOG_TRIVIAL(error) << "FileEngine: Failed to remove directory tree: " << path.string();
    throw IoError("failed to remove directory tree", ec, path);
  }

  BOOST_LOG_TRIVIAL(info) << "FileEngine: Removed " << removed << " entries under: " << path.string();
  return Metadata(size, path);
}

// Absent is false, an undeterminable state throws
bool FileEngine::path_exists(const fs::path& path) {
  std::error_code ec;
  const bool found = fs::exists(fs::symlink_status(path, ec));
  if (ec && ec != std::errc::no_such_file_or_directory) {
    BOOST_LOG_TRIVIAL(error) << "FileEngine: Cannot determine whether path exists: " << path.string();
    throw IoError("failed to check existence", ec, path);
  }
  return found;
}

Metadata FileEngine::entry_size(const fs::path& path) {
  return Metadata(io::file_size(path), path);
}

} // namespace engine
} // namespace disk

#ifndef DISK_ENTITY_ENTITY_HPP
#define DISK_ENTITY_ENTITY_HPP

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <string>
#include <utility>
#include <vector>
#include <boost/log/trivial.hpp>
#include "common/errors.hpp"
#include "common/metadata.hpp"
#include "config/entity_config.hpp"
#include "engine/file_engine.hpp"
#include "frame/frame.hpp"
#include "path/location.hpp"
#include "path/path_resolver.hpp"

namespace disk {
namespace entity {

// A value of type T stored at one location with one codec.
//
// Codec requirements:
//   static const char* extension();
//   std::vector<std::uint8_t> encode(const T&) const;
//   T decode(const std::uint8_t* data, std::size_t size) const;
// Both may throw CodecError.
template <typename T, typename Codec>
class Entity {
public:
  Entity(path::Location location, Codec codec = Codec{}, engine::AtomicHooks hooks = {})
    : engine_(std::move(location), std::move(hooks))
    , codec_(std::move(codec)) {}

  virtual ~Entity() = default;

  // Builds the config with the codec's extension
  static config::EntityConfig make_config(config::Dir dir, const std::string& project,
      const std::string& sub_directories, const std::string& file) {
    return config::EntityConfig::create(dir, project, sub_directories, file, Codec::extension());
  }


  // ---- ENCODING ----
  virtual std::vector<std::uint8_t> to_bytes(const T& value) const {
    return codec_.encode(value);
  }

  virtual T from_bytes(const std::uint8_t* data, std::size_t size) const {
    return codec_.decode(data, size);
  }

  T from_bytes(const std::vector<std::uint8_t>& bytes) const {
    return from_bytes(bytes.data(), bytes.size());
  }


  // ---- SAVE ----
  Metadata save(const T& value) { return engine_.save(to_bytes(value)); }
  Metadata save_gzip(const T& value) { return engine_.save_gzip(to_bytes(value)); }
  Metadata save_atomic(const T& value) { return engine_.save_atomic(to_bytes(value)); }
  Metadata save_atomic_gzip(const T& value) { return engine_.save_atomic_gzip(to_bytes(value)); }
  Metadata save_memmap(const T& value) { return engine_.save_memmap(to_bytes(value)); }
  Metadata save_gzip_memmap(const T& value) { return engine_.save_gzip_memmap(to_bytes(value)); }
  Metadata save_atomic_memmap(const T& value) { return engine_.save_atomic_memmap(to_bytes(value)); }
  Metadata save_atomic_gzip_memmap(const T& value) { return engine_.save_atomic_gzip_memmap(to_bytes(value)); }


  // ---- LOAD ----
  T from_file() const { return from_bytes(engine_.read_to_bytes()); }
  T from_file_gzip() const { return from_bytes(engine_.read_to_bytes_gzip()); }
  T from_file_memmap() const { return from_bytes(engine_.read_to_bytes_memmap()); }
  T from_file_gzip_memmap() const { return from_bytes(engine_.read_to_bytes_gzip_memmap()); }


  // ---- PATHS ----
  const path::Location& location() const { return engine_.location(); }
  std::filesystem::path project_dir_path() const { return location().project_dir_path(); }
  std::filesystem::path sub_dir_parent_path() const { return location().sub_dir_parent_path(); }
  std::filesystem::path base_path() const { return location().base_path(); }
  std::filesystem::path absolute_path() const { return location().absolute_path(); }
  std::filesystem::path absolute_path_gzip() const { return location().absolute_path_gzip(); }
  std::filesystem::path tmp_path() const { return location().tmp_path(); }
  std::filesystem::path gzip_tmp_path() const { return location().gzip_tmp_path(); }


  // ---- RAW I/O ----
  std::vector<std::uint8_t> read_to_bytes() const { return engine_.read_to_bytes(); }
  std::vector<std::uint8_t> read_to_bytes_gzip() const { return engine_.read_to_bytes_gzip(); }
  std::vector<std::uint8_t> read_to_bytes_memmap() const { return engine_.read_to_bytes_memmap(); }
  std::vector<std::uint8_t> read_to_bytes_gzip_memmap() const { return engine_.read_to_bytes_gzip_memmap(); }
  std::string read_to_string() const { return engine_.read_to_string(); }
  std::vector<std::uint8_t> file_bytes(std::uint64_t start, std::uint64_t end) const {
    return engine_.file_bytes(start, end);
  }
  std::vector<std::uint8_t> file_bytes_memmap(std::uint64_t start, std::uint64_t end) const {
    return engine_.file_bytes_memmap(start, end);
  }


  // ---- QUERY ----
  bool exists() const { return engine_.exists(); }
  bool exists_gzip() const { return engine_.exists_gzip(); }
  Metadata file_size() const { return engine_.file_size(); }
  Metadata file_size_gzip() const { return engine_.file_size_gzip(); }
  Metadata project_dir_size() const { return engine_.project_dir_size(); }
  Metadata sub_dir_size() const { return engine_.sub_dir_size(); }


  // ---- LIFECYCLE ----
  Metadata rm() { return engine_.rm(); }
  Metadata rm_gzip() { return engine_.rm_gzip(); }
  Metadata rm_atomic() { return engine_.rm_atomic(); }
  Metadata rm_atomic_gzip() { return engine_.rm_atomic_gzip(); }
  void rm_tmp() { engine_.rm_tmp(); }
  Metadata rm_sub() { return engine_.rm_sub(); }
  Metadata rm_project() { return engine_.rm_project(); }
  Metadata rm_rf() { return engine_.rm_rf(); }
  void mkdir() { engine_.mkdir(); }
  Metadata touch() { return engine_.touch(); }

  engine::FileEngine& engine() { return engine_; }
  const engine::FileEngine& engine() const { return engine_; }
  const Codec& codec() const { return codec_; }

private:
  engine::FileEngine engine_;
  Codec codec_;
};


// Entity whose bytes start with a 24 byte header and a version byte.
// The frame is checked before the codec sees the payload.
template <typename T, typename Codec>
class FramedEntity : public Entity<T, Codec> {
public:
  using Constructor = std::function<T()>;

  FramedEntity(path::Location location, frame::Frame frame,
      Codec codec = Codec{}, engine::AtomicHooks hooks = {})
    : Entity<T, Codec>(std::move(location), std::move(codec), std::move(hooks))
    , frame_(frame) {}

  using Entity<T, Codec>::from_bytes;

  std::vector<std::uint8_t> to_bytes(const T& value) const override {
    return frame_.prepend(this->codec().encode(value));
  }

  T from_bytes(const std::uint8_t* data, std::size_t size) const override {
    frame_.validate_header(data, size);
    return this->codec().decode(data + frame::FULL_HEADER_SIZE, size - frame::FULL_HEADER_SIZE);
  }

  const frame::Frame& frame() const { return frame_; }
  frame::FullHeader full_header() const { return frame_.full_header(); }

  // Version byte of the uncompressed file on disk
  std::uint8_t file_version() const {
    return this->engine().file_version(frame_.header);
  }

  // Loads through the first constructor registered for the version on
  // disk. Each constructor reads its own historical layout and returns
  // the current type. Duplicate versions are allowed, the earliest wins.
  std::pair<std::uint8_t, T> from_versions(
      const std::vector<std::pair<std::uint8_t, Constructor>>& constructors) const {
    const std::uint8_t version = file_version();
    for (const auto& [candidate, construct] : constructors) {
      if (candidate == version) {
        BOOST_LOG_TRIVIAL(info) << "FramedEntity: Loading version " << static_cast<int>(version);
        return {version, construct()};
      }
    }
    BOOST_LOG_TRIVIAL(error) << "FramedEntity: No constructor for version " << static_cast<int>(version);
    throw FrameError(FrameErrorKind::NO_VERSION_MATCHED,
      "no constructor for version " + std::to_string(version) + " of " + this->absolute_path().string());
  }

  // First 24 bytes of the uncompressed file as raw characters
  std::string file_header_to_string() const {
    const std::vector<std::uint8_t> bytes = this->engine().file_bytes(0, frame::HEADER_SIZE);
    return std::string(bytes.begin(), bytes.end());
  }

private:
  frame::Frame frame_;
};

} // namespace entity
} // namespace disk

#endif // DISK_ENTITY_ENTITY_HPP

#include "common/metadata.hpp"
#include <sstream>
#include <tuple>

namespace disk {

Metadata::Metadata(std::uint64_t size, std::filesystem::path path)
  : size_(size)
  , path_(std::move(path)) {}

Metadata Metadata::zero(std::filesystem::path path) {
  return Metadata(0, std::move(path));
}

std::pair<std::uint64_t, std::filesystem::path> Metadata::to_parts() const {
  return {size_, path_};
}

std::string Metadata::to_string() const {
  std::ostringstream ss;
  ss << size_ << " bytes @ " << path_.string();
  return ss.str();
}

bool Metadata::operator==(const Metadata& other) const {
  return size_ == other.size_ && path_ == other.path_;
}

bool Metadata::operator<(const Metadata& other) const {
  return std::tie(size_, path_) < std::tie(other.size_, other.path_);
}

std::ostream& operator<<(std::ostream& out, const Metadata& metadata) {
  return out << metadata.to_string();
}

} // namespace disk

#include "path/location.hpp"
#include "common/errors.hpp"
#include <boost/log/trivial.hpp>

namespace disk {
namespace path {

Location::Location(config::EntityConfig config, std::shared_ptr<const PathResolver> resolver)
  : config_(std::move(config))
  , resolver_(std::move(resolver)) {
  if (!resolver_) {
    throw PathError("DirectoryUnavailable: no path resolver supplied");
  }
}

std::filesystem::path Location::project_dir_path() const {
  std::filesystem::path path = resolver_->project_dir(config_.dir(), config_.project());
  assert_safe_path(path);

  // Recursive removal starts here, it must name a directory below the resolver root
  const std::filesystem::path last = path.filename();
  if (last.empty() || last == "." || last == "..") {
    BOOST_LOG_TRIVIAL(error) << "Location: Project directory has no name of its own: " << path.string();
    throw PathError("aborting, project directory does not name a directory: " + path.string());
  }
  return path;
}

std::filesystem::path Location::sub_dir_parent_path() const {
  std::filesystem::path path = project_dir_path();
  if (!config_.sub_segments().empty()) {
    path /= config_.sub_segments().front();
  }
  return path;
}

std::filesystem::path Location::base_path() const {
  std::filesystem::path path = project_dir_path();
  for (const auto& segment : config_.sub_segments()) {
    path /= segment;
  }
  return path;
}

std::filesystem::path Location::absolute_path() const {
  return in_base(config_.identity().file_name);
}

std::filesystem::path Location::absolute_path_gzip() const {
  return in_base(config_.identity().file_name_gzip);
}

std::filesystem::path Location::tmp_path() const {
  return in_base(config_.identity().file_name_tmp);
}

std::filesystem::path Location::gzip_tmp_path() const {
  return in_base(config_.identity().file_name_gzip_tmp);
}

std::filesystem::path Location::in_base(const std::string& name) const {
  std::filesystem::path path = base_path() / name;
  assert_safe_path(path);
  return path;
}

void Location::assert_safe_path(const std::filesystem::path& path) {
  if (!path.is_absolute()) {
    BOOST_LOG_TRIVIAL(error) << "Location: Dangerous relative path detected: " << path.string();
    throw PathError("aborting, dangerous path detected: " + path.string());
  }
}

} // namespace path
} // namespace disk

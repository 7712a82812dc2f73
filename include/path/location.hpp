#ifndef DISK_PATH_LOCATION_HPP
#define DISK_PATH_LOCATION_HPP

#include <filesystem>
#include <memory>
#include "config/entity_config.hpp"
#include "path/path_resolver.hpp"

namespace disk {
namespace path {

// Every path of one entity. Nothing is cached: each call asks the
// resolver again and checks the result is absolute.
class Location {
public:
  Location(config::EntityConfig config, std::shared_ptr<const PathResolver> resolver);

  const config::EntityConfig& config() const { return config_; }

  // {project}
  std::filesystem::path project_dir_path() const;
  // {project}/{first sub directory}, or {project} without sub directories
  std::filesystem::path sub_dir_parent_path() const;
  // {project}/{all sub directories}
  std::filesystem::path base_path() const;

  std::filesystem::path absolute_path() const;
  std::filesystem::path absolute_path_gzip() const;
  std::filesystem::path tmp_path() const;
  std::filesystem::path gzip_tmp_path() const;

private:
  std::filesystem::path in_base(const std::string& name) const;
  static void assert_safe_path(const std::filesystem::path& path);

  config::EntityConfig config_;
  std::shared_ptr<const PathResolver> resolver_;
};

} // namespace path
} // namespace disk

#endif // DISK_PATH_LOCATION_HPP

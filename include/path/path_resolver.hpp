#ifndef DISK_PATH_PATH_RESOLVER_HPP
#define DISK_PATH_PATH_RESOLVER_HPP

#include <filesystem>
#include <string>
#include "config/entity_config.hpp"

namespace disk {
namespace path {

// Maps a logical directory kind and project name to the absolute
// project directory. Implementations throw PathError when the
// directory cannot be determined.
class PathResolver {
public:
  virtual ~PathResolver() = default;

  virtual std::filesystem::path project_dir(config::Dir dir, const std::string& project) const = 0;
};

// Linux / XDG base directory conventions
class XdgPathResolver : public PathResolver {
public:
  std::filesystem::path project_dir(config::Dir dir, const std::string& project) const override;

  // Project name as used on disk: lower-cased, whitespace removed
  static std::string project_path_name(const std::string& project);

private:
  std::filesystem::path base_dir(config::Dir dir) const;
  // Absolute value of the environment variable, or an empty path
  static std::filesystem::path absolute_env(const char* name);
};

// Resolves everything below a fixed absolute root:
// {root}/{dir}/{project}
class FixedRootResolver : public PathResolver {
public:
  explicit FixedRootResolver(std::filesystem::path root);

  std::filesystem::path project_dir(config::Dir dir, const std::string& project) const override;
  const std::filesystem::path& root() const { return root_; }

private:
  std::filesystem::path root_;
};

} // namespace path
} // namespace disk

#endif // DISK_PATH_PATH_RESOLVER_HPP

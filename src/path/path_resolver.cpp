#include "path/path_resolver.hpp"
#include "common/errors.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <boost/log/trivial.hpp>

namespace disk {
namespace path {

//==============================================
// XDG RESOLVER
//==============================================

std::filesystem::path XdgPathResolver::project_dir(config::Dir dir, const std::string& project) const {
  std::filesystem::path path = base_dir(dir) / project_path_name(project);
  BOOST_LOG_TRIVIAL(debug) << "XdgPathResolver: Resolved " << config::dir_to_string(dir)
                           << " directory for project '" << project << "' to: " << path.string();
  return path;
}

std::string XdgPathResolver::project_path_name(const std::string& project) {
  std::string name;
  name.reserve(project.size());
  for (unsigned char c : project) {
    if (!std::isspace(c)) {
      name.push_back(static_cast<char>(std::tolower(c)));
    }
  }
  return name;
}

std::filesystem::path XdgPathResolver::base_dir(config::Dir dir) const {
  const char* variable = nullptr;
  std::filesystem::path fallback;

  switch (dir) {
    case config::Dir::PROJECT:
    case config::Dir::CACHE:
      variable = "XDG_CACHE_HOME";
      fallback = ".cache";
      break;
    case config::Dir::CONFIG:
    case config::Dir::PREFERENCE:
      variable = "XDG_CONFIG_HOME";
      fallback = ".config";
      break;
    case config::Dir::DATA:
    case config::Dir::DATA_LOCAL:
      variable = "XDG_DATA_HOME";
      fallback = std::filesystem::path(".local") / "share";
      break;
  }

  if (std::filesystem::path xdg = absolute_env(variable); !xdg.empty()) {
    return xdg;
  }

  std::filesystem::path home = absolute_env("HOME");
  if (home.empty()) {
    BOOST_LOG_TRIVIAL(error) << "XdgPathResolver: HOME is unset or not absolute";
    throw PathError("DirectoryUnavailable: user directories could not be found");
  }
  return home / fallback;
}

std::filesystem::path XdgPathResolver::absolute_env(const char* name) {
  const char* value = std::getenv(name);
  if (value == nullptr || *value == '\0') {
    return {};
  }
  std::filesystem::path path(value);
  // XDG ignores relative values
  return path.is_absolute() ? path : std::filesystem::path();
}


//==============================================
// FIXED ROOT RESOLVER
//==============================================

FixedRootResolver::FixedRootResolver(std::filesystem::path root)
  : root_(std::move(root)) {
  if (!root_.is_absolute()) {
    throw PathError("DirectoryUnavailable: root is not absolute: " + root_.string());
  }
}

std::filesystem::path FixedRootResolver::project_dir(config::Dir dir, const std::string& project) const {
  return root_ / config::dir_to_string(dir) / project;
}

} // namespace path
} // namespace disk

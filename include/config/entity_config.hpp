#ifndef DISK_CONFIG_ENTITY_CONFIG_HPP
#define DISK_CONFIG_ENTITY_CONFIG_HPP

#include <string>
#include <vector>

namespace disk {
namespace config {

// OS directory an entity lives under
enum class Dir {
  PROJECT,
  CACHE,
  CONFIG,
  DATA,
  DATA_LOCAL,
  PREFERENCE
};

const char* dir_to_string(Dir dir);
// Accepts the names returned by dir_to_string, throws ConfigError otherwise
Dir dir_from_string(const std::string& name);

// The four on-disk names of one entity. Derived once from the file
// name and extension, never recomputed.
struct FileIdentity {
  std::string file_name;          // {file}.{ext}
  std::string file_name_gzip;     // {file}.{ext}.gz
  std::string file_name_tmp;      // {file}.{ext}.tmp
  std::string file_name_gzip_tmp; // {file}.{ext}.gz.tmp
};

class EntityConfig {
public:
  // ---- CONSTRUCTION ----
  // Validates every component and throws ConfigError on the first violation
  static EntityConfig create(Dir dir, const std::string& project,
    const std::string& sub_directories, const std::string& file,
    const std::string& extension);


  // ---- ACCESSORS ----
  Dir dir() const { return dir_; }
  const std::string& project() const { return project_; }
  const std::string& sub_directories() const { return sub_directories_; }
  // Sub directories split on the platform separators, in order
  const std::vector<std::string>& sub_segments() const { return sub_segments_; }
  const std::string& file() const { return file_; }
  const std::string& extension() const { return extension_; }
  const FileIdentity& identity() const { return identity_; }

private:
  EntityConfig(Dir dir, std::string project, std::string sub_directories,
    std::vector<std::string> sub_segments, std::string file, std::string extension);

  // ---- VALIDATION ----
  static void validate_component(const std::string& what, const std::string& value);
  static std::vector<std::string> split_sub_directories(const std::string& sub_directories);
  static FileIdentity derive_identity(const std::string& file, const std::string& extension);

  // ---- PARAMETERS ----
  Dir dir_;
  std::string project_;
  std::string sub_directories_;
  std::vector<std::string> sub_segments_;
  std::string file_;
  std::string extension_;
  FileIdentity identity_;
};

} // namespace config
} // namespace disk

#endif // DISK_CONFIG_ENTITY_CONFIG_HPP

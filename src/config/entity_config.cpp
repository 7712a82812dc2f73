#include "config/entity_config.hpp"
#include "common/errors.hpp"
#include <algorithm>
#include <array>
#include <cctype>
#include <utility>
#include <boost/log/trivial.hpp>

namespace disk {
namespace config {

namespace {

constexpr std::size_t MAX_COMPONENT_LENGTH = 255;
constexpr std::size_t MAX_TOTAL_LENGTH = 4000;
constexpr std::size_t MAX_SUB_DEPTH = 10;

constexpr std::array<char, 14> FORBIDDEN_SYMBOLS = {
  '<', '>', ':', '"', '\'', '|', '?', '*', '^', '$', '&', '(', ')', '\0'
};

constexpr std::array<const char*, 22> RESERVED_NAMES = {
  "CON", "PRN", "AUX", "NUL",
  "COM1", "COM2", "COM3", "COM4", "COM5", "COM6", "COM7", "COM8", "COM9",
  "LPT1", "LPT2", "LPT3", "LPT4", "LPT5", "LPT6", "LPT7", "LPT8", "LPT9"
};

bool is_separator(char c) {
#ifdef _WIN32
  return c == '/' || c == '\\';
#else
  return c == '/';
#endif
}

bool starts_or_ends_badly(const std::string& value) {
  if (value.empty()) {
    return false;
  }
  auto bad = [](char c) {
    return std::isspace(static_cast<unsigned char>(c)) || c == '/' || c == '\\';
  };
  return bad(value.front()) || bad(value.back());
}

bool is_dot_name(const std::string& value) {
  return value == "." || value == "..";
}

std::string to_upper(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
    [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
  return value;
}

} // namespace

//==============================================
// DIRECTORY NAMES
//==============================================

const char* dir_to_string(Dir dir) {
  switch (dir) {
    case Dir::PROJECT: return "project";
    case Dir::CACHE: return "cache";
    case Dir::CONFIG: return "config";
    case Dir::DATA: return "data";
    case Dir::DATA_LOCAL: return "data_local";
    case Dir::PREFERENCE: return "preference";
    default: return "unknown";
  }
}

Dir dir_from_string(const std::string& name) {
  for (Dir dir : {Dir::PROJECT, Dir::CACHE, Dir::CONFIG, Dir::DATA, Dir::DATA_LOCAL, Dir::PREFERENCE}) {
    if (name == dir_to_string(dir)) {
      return dir;
    }
  }
  throw ConfigError("unknown directory kind: " + name);
}


//==============================================
// CONSTRUCTION
//==============================================

EntityConfig::EntityConfig(Dir dir, std::string project, std::string sub_directories,
    std::vector<std::string> sub_segments, std::string file, std::string extension)
  : dir_(dir)
  , project_(std::move(project))
  , sub_directories_(std::move(sub_directories))
  , sub_segments_(std::move(sub_segments))
  , file_(std::move(file))
  , extension_(std::move(extension))
  , identity_(derive_identity(file_, extension_)) {}

EntityConfig EntityConfig::create(Dir dir, const std::string& project,
    const std::string& sub_directories, const std::string& file,
    const std::string& extension) {
  BOOST_LOG_TRIVIAL(debug) << "EntityConfig: Validating project='" << project
                           << "' sub='" << sub_directories << "' file='" << file
                           << "' ext='" << extension << "'";

  if (project.empty()) {
    throw ConfigError("'Project Directory' must not be an empty string");
  }
  if (file.empty()) {
    throw ConfigError("'File Name' must not be an empty string");
  }
  // Either would resolve to the parent directory, or to the directory itself
  if (is_dot_name(project)) {
    throw ConfigError("'Project Directory' must not be '.' or '..'");
  }
  if (is_dot_name(file)) {
    throw ConfigError("'File Name' must not be '.' or '..'");
  }
  if (project.size() >= MAX_COMPONENT_LENGTH) {
    throw ConfigError("'Project Directory' must be less than 255 bytes long");
  }
  if (file.size() >= MAX_COMPONENT_LENGTH) {
    throw ConfigError("'File Name' must be less than 255 bytes long");
  }
  if (project.size() + sub_directories.size() + file.size() >= MAX_TOTAL_LENGTH) {
    throw ConfigError("Directories combined must be less than 4000 bytes long");
  }

  // Only the sub directories may carry path separators
  const std::array<std::pair<const char*, const std::string*>, 3> plain_components = {{
    {"Project Directory", &project}, {"File Name", &file}, {"File Extension", &extension}
  }};
  for (const auto& [what, value] : plain_components) {
    if (value->find('/') != std::string::npos || value->find('\\') != std::string::npos) {
      throw ConfigError(std::string("'") + what + "' must not contain '/' or '\\'");
    }
  }

  validate_component("Project Directory", project);
  validate_component("File Name", file);
  validate_component("File Extension", extension);

  if (starts_or_ends_badly(sub_directories)) {
    throw ConfigError("'Sub Directories' must not start or end with whitespace, '/' or '\\'");
  }
  std::vector<std::string> segments = split_sub_directories(sub_directories);
  if (segments.size() >= MAX_SUB_DEPTH) {
    throw ConfigError("'Sub Directories' are limited to 10-depth");
  }
  for (const auto& segment : segments) {
    if (segment.size() > MAX_COMPONENT_LENGTH) {
      throw ConfigError("one of the 'Sub Directories' is longer than 255 bytes");
    }
    if (segment.empty() || segment == "." || segment == "..") {
      throw ConfigError("'Sub Directories' must not contain empty, '.' or '..' segments");
    }
    validate_component("Sub Directories", segment);
  }

  return EntityConfig(dir, project, sub_directories, std::move(segments), file, extension);
}


//==============================================
// VALIDATION
//==============================================

void EntityConfig::validate_component(const std::string& what, const std::string& value) {
  for (char symbol : FORBIDDEN_SYMBOLS) {
    if (value.find(symbol) != std::string::npos) {
      BOOST_LOG_TRIVIAL(error) << "EntityConfig: '" << what << "' contains a forbidden symbol: " << value;
      throw ConfigError("'" + what + "' must not contain '" +
        (symbol == '\0' ? std::string("\\0") : std::string(1, symbol)) + "'");
    }
  }

  if (starts_or_ends_badly(value)) {
    throw ConfigError("'" + what + "' must not start or end with whitespace, '/' or '\\'");
  }

  const std::string upper = to_upper(value);
  for (const char* reserved : RESERVED_NAMES) {
    if (upper == reserved) {
      throw ConfigError("'" + what + "' must not be a reserved filename: '" + reserved + "'");
    }
  }
}

std::vector<std::string> EntityConfig::split_sub_directories(const std::string& sub_directories) {
  std::vector<std::string> segments;
  if (sub_directories.empty()) {
    return segments;
  }

  std::string current;
  for (char c : sub_directories) {
    if (is_separator(c)) {
      segments.push_back(current);
      current.clear();
    } else {
      current.push_back(c);
    }
  }
  segments.push_back(current);
  return segments;
}

FileIdentity EntityConfig::derive_identity(const std::string& file, const std::string& extension) {
  FileIdentity identity;
  identity.file_name = extension.empty() ? file : file + "." + extension;
  identity.file_name_gzip = identity.file_name + ".gz";
  identity.file_name_tmp = identity.file_name + ".tmp";
  identity.file_name_gzip_tmp = identity.file_name_gzip + ".tmp";
  return identity;
}

} // namespace config
} // namespace disk

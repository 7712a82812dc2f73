#include "cli/cli.hpp"
#include "common/errors.hpp"
#include "config/entity_config.hpp"
#include "engine/file_engine.hpp"
#include "logger/logger.hpp"
#include "path/location.hpp"
#include "path/path_resolver.hpp"
#include <iostream>
#include <memory>
#include <string>
#include <unordered_map>

struct ProgramOptions {
  std::string dir{"data"};
  std::string project;
  std::string sub;
  std::string file;
  std::string ext;
  std::string root;
  std::string log_file{"disk_shell.log"};
  bool valid{false};
};

void print_usage(const std::string& program_name) {
  std::cerr << "Usage: " << program_name << " -p <project> -f <file> [options]\n"
        << "Required arguments:\n"
        << "  -p, --project   Project name\n"
        << "  -f, --file      File name without extension\n"
        << "Optional arguments:\n"
        << "  -d, --dir       project | cache | config | data | data_local | preference (default: data)\n"
        << "  -s, --sub       Sub directories separated by '/'\n"
        << "  -e, --ext       File extension (default: none)\n"
        << "  -r, --root      Absolute root to resolve under instead of the XDG directories\n"
        << "  -l, --log       Log file (default: disk_shell.log)\n"
        << "Example: " << program_name << " -d cache -p MyApp -s sessions/2024 -f state -e bin\n";
}

ProgramOptions parse_command_line(int argc, char* argv[]) {
  ProgramOptions options;
  const std::unordered_map<std::string, std::string*> flag_map = {
    {"-d", &options.dir},
    {"--dir", &options.dir},
    {"-p", &options.project},
    {"--project", &options.project},
    {"-s", &options.sub},
    {"--sub", &options.sub},
    {"-f", &options.file},
    {"--file", &options.file},
    {"-e", &options.ext},
    {"--ext", &options.ext},
    {"-r", &options.root},
    {"--root", &options.root},
    {"-l", &options.log_file},
    {"--log", &options.log_file}
  };

  if (argc % 2 == 0) {
    std::cerr << "Error: Every flag needs a value\n";
    print_usage(argv[0]);
    return options;
  }

  for (int i = 1; i < argc - 1; i += 2) {
    const std::string flag(argv[i]);
    const auto it = flag_map.find(flag);
    if (it == flag_map.end()) {
      std::cerr << "Error: Unknown argument: " << flag << '\n';
      print_usage(argv[0]);
      return options;
    }
    *it->second = argv[i + 1];
  }

  if (options.project.empty() || options.file.empty()) {
    std::cerr << "Error: Both project and file are required\n";
    print_usage(argv[0]);
    return options;
  }

  options.valid = true;
  return options;
}

bool run_shell(const ProgramOptions& options) {
  try {
    disk::logging::init_logging(options.log_file);

    const auto config = disk::config::EntityConfig::create(
      disk::config::dir_from_string(options.dir), options.project, options.sub, options.file, options.ext);

    std::shared_ptr<const disk::path::PathResolver> resolver;
    if (options.root.empty()) {
      resolver = std::make_shared<disk::path::XdgPathResolver>();
    } else {
      resolver = std::make_shared<disk::path::FixedRootResolver>(options.root);
    }

    disk::engine::FileEngine engine(disk::path::Location(config, resolver));
    disk::cli::CLI cli(engine);
    cli.run();
    return true;
  } catch (const disk::DiskError& e) {
    std::cerr << "Error: " << e.what() << '\n';
    return false;
  } catch (const std::exception& e) {
    std::cerr << "Error: Failed to start shell: " << e.what() << '\n';
    return false;
  }
}

int main(int argc, char* argv[]) {
  if (const auto options = parse_command_line(argc, argv); !options.valid) {
    return 1;
  } else if (!run_shell(options)) {
    return 1;
  }
  return 0;
}

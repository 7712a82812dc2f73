#ifndef DISK_CLI_CLI_HPP
#define DISK_CLI_CLI_HPP

#include <cstdint>
#include <iostream>
#include <string>
#include <vector>
#include "engine/file_engine.hpp"

namespace disk {
namespace cli {

// Interactive inspection of one entity location
class CLI {
public:
  // ---- CONSTRUCTOR ----
  explicit CLI(engine::FileEngine& engine, std::istream& in = std::cin, std::ostream& out = std::cout);


  // ---- STARTUP ----
  void run();

private:
  // ---- PARAMETERS ----
  bool running_;
  engine::FileEngine& engine_;
  std::istream& in_;
  std::ostream& out_;


  // ---- COMMAND PROCESSING ----
  void process_command(const std::string& command, const std::vector<std::string>& args);
  void handle_path_command();
  void handle_exists_command();
  void handle_size_command();
  void handle_bytes_command(const std::vector<std::string>& args);
  void handle_header_command();
  void handle_version_command(const std::vector<std::string>& args);
  void handle_help_command();
  void log_and_display_error(const std::string& message, const std::string& error);


  // ---- FORMATTING ----
  static std::string to_hex(const std::vector<std::uint8_t>& bytes);
  static std::string to_printable(const std::vector<std::uint8_t>& bytes);
};

} // namespace cli
} // namespace disk

#endif // DISK_CLI_CLI_HPP

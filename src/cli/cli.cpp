#include "cli/cli.hpp"
#include "common/errors.hpp"
#include "frame/frame.hpp"
#include <cctype>
#include <iomanip>
#include <sstream>
#include <boost/log/trivial.hpp>

namespace disk {
namespace cli {

//==============================================
// CONSTRUCTOR
//==============================================

CLI::CLI(engine::FileEngine& engine, std::istream& in, std::ostream& out)
  : running_(false)
  , engine_(engine)
  , in_(in)
  , out_(out) {
  BOOST_LOG_TRIVIAL(info) << "CLI: Initialized for: " << engine_.location().absolute_path().string();
}


//==============================================
// STARTUP
//==============================================

void CLI::run() {
  running_ = true;
  std::string line;

  BOOST_LOG_TRIVIAL(info) << "CLI: Starting loop";
  out_ << "disk> " << std::flush;

  while (running_ && std::getline(in_, line)) {
    std::istringstream iss(line);
    std::string command;
    std::vector<std::string> args;

    iss >> command;
    for (std::string arg; iss >> arg;) {
      args.push_back(arg);
    }

    if (command == "quit") {
      running_ = false;
      continue;
    }
    if (!command.empty()) {
      process_command(command, args);
    }

    if (running_) {
      out_ << "disk> " << std::flush;
    }
  }

  BOOST_LOG_TRIVIAL(info) << "CLI: Loop ended";
}


//==============================================
// COMMAND PROCESSING
//==============================================

void CLI::process_command(const std::string& command, const std::vector<std::string>& args) {
  BOOST_LOG_TRIVIAL(debug) << "CLI: Processing command: " << command << " with " << args.size() << " arguments";

  try {
    if (command == "help") {
      handle_help_command();
    }
    else if (command == "path") {
      handle_path_command();
    }
    else if (command == "exists") {
      handle_exists_command();
    }
    else if (command == "size") {
      handle_size_command();
    }
    else if (command == "cat") {
      out_ << engine_.read_to_string() << std::endl;
    }
    else if (command == "gunzip") {
      const std::vector<std::uint8_t> bytes = engine_.read_to_bytes_gzip();
      out_ << std::string(bytes.begin(), bytes.end()) << std::endl;
    }
    else if (command == "bytes") {
      handle_bytes_command(args);
    }
    else if (command == "header") {
      handle_header_command();
    }
    else if (command == "version") {
      handle_version_command(args);
    }
    else if (command == "mkdir") {
      engine_.mkdir();
      out_ << "Created " << engine_.location().base_path().string() << std::endl;
    }
    else if (command == "touch") {
      out_ << "Touched " << engine_.touch() << std::endl;
    }
    else if (command == "rm") {
      out_ << "Removed " << engine_.rm() << std::endl;
    }
    else if (command == "rm_atomic") {
      out_ << "Removed " << engine_.rm_atomic() << std::endl;
    }
    else if (command == "rm_tmp") {
      engine_.rm_tmp();
      out_ << "Temp files removed" << std::endl;
    }
    else if (command == "rm_sub") {
      out_ << "Removed " << engine_.rm_sub() << std::endl;
    }
    else if (command == "rm_project") {
      out_ << "Removed " << engine_.rm_project() << std::endl;
    }
    else {
      out_ << "Unknown command: " << command << " (type 'help')" << std::endl;
    }
  } catch (const DiskError& e) {
    log_and_display_error("Error running '" + command + "'", e.what());
  } catch (const std::exception& e) {
    log_and_display_error("Unexpected failure running '" + command + "'", e.what());
  }
}

void CLI::handle_path_command() {
  const path::Location& location = engine_.location();
  out_ << "project  " << location.project_dir_path().string() << std::endl;
  out_ << "base     " << location.base_path().string() << std::endl;
  out_ << "file     " << location.absolute_path().string() << std::endl;
  out_ << "gzip     " << location.absolute_path_gzip().string() << std::endl;
  out_ << "tmp      " << location.tmp_path().string() << std::endl;
  out_ << "gzip tmp " << location.gzip_tmp_path().string() << std::endl;
}

void CLI::handle_exists_command() {
  out_ << "file: " << (engine_.exists() ? "yes" : "no") << std::endl;
  out_ << "gzip: " << (engine_.exists_gzip() ? "yes" : "no") << std::endl;
}

void CLI::handle_size_command() {
  if (engine_.exists()) {
    out_ << engine_.file_size() << std::endl;
  }
  if (engine_.exists_gzip()) {
    out_ << engine_.file_size_gzip() << std::endl;
  }
}

void CLI::handle_bytes_command(const std::vector<std::string>& args) {
  if (args.size() != 2) {
    out_ << "Usage: bytes <start> <end>" << std::endl;
    return;
  }

  std::uint64_t start = 0;
  std::uint64_t end = 0;
  try {
    start = std::stoull(args[0]);
    end = std::stoull(args[1]);
  } catch (const std::exception&) {
    out_ << "Invalid range: " << args[0] << " " << args[1] << std::endl;
    return;
  }

  out_ << to_hex(engine_.file_bytes(start, end)) << std::endl;
}

void CLI::handle_header_command() {
  const std::vector<std::uint8_t> bytes = engine_.file_bytes(0, frame::FULL_HEADER_SIZE);
  const std::vector<std::uint8_t> header(bytes.begin(), bytes.begin() + frame::HEADER_SIZE);
  out_ << "header  " << to_hex(header) << std::endl;
  out_ << "text    " << to_printable(header) << std::endl;
  out_ << "version " << static_cast<int>(bytes[frame::HEADER_SIZE]) << std::endl;
}

// version            prints byte 24 as stored
// version <48 hex>   checks the header first
void CLI::handle_version_command(const std::vector<std::string>& args) {
  if (args.empty()) {
    const std::vector<std::uint8_t> bytes = engine_.file_bytes(frame::HEADER_SIZE, frame::FULL_HEADER_SIZE);
    out_ << static_cast<int>(bytes[0]) << std::endl;
    return;
  }

  const std::string& hex = args[0];
  if (hex.size() != frame::HEADER_SIZE * 2) {
    out_ << "Header must be " << frame::HEADER_SIZE * 2 << " hex digits" << std::endl;
    return;
  }

  frame::Header header{};
  try {
    for (std::size_t i = 0; i < header.size(); ++i) {
      header[i] = static_cast<std::uint8_t>(std::stoul(hex.substr(i * 2, 2), nullptr, 16));
    }
  } catch (const std::exception&) {
    out_ << "Invalid hex header: " << hex << std::endl;
    return;
  }

  out_ << static_cast<int>(engine_.file_version(header)) << std::endl;
}

void CLI::handle_help_command() {
  out_ << "Available commands:" << std::endl;
  out_ << "  help                Display this help message" << std::endl;
  out_ << "  path                Print every path of the entity" << std::endl;
  out_ << "  exists              Check the plain and gzip files" << std::endl;
  out_ << "  size                Print the size of the existing files" << std::endl;
  out_ << "  cat                 Print the file as text" << std::endl;
  out_ << "  gunzip              Print the decompressed gzip file as text" << std::endl;
  out_ << "  bytes <start> <end> Hex dump of bytes [start, end)" << std::endl;
  out_ << "  header              Show the 24 byte header and the version byte" << std::endl;
  out_ << "  version [hex]       Print the version, checking the header if given" << std::endl;
  out_ << "  mkdir               Create the directories of the entity" << std::endl;
  out_ << "  touch               Create an empty file" << std::endl;
  out_ << "  rm                  Remove the file" << std::endl;
  out_ << "  rm_atomic           Remove the file through its temp path" << std::endl;
  out_ << "  rm_tmp              Remove leftover temp files" << std::endl;
  out_ << "  rm_sub              Remove the first sub directory" << std::endl;
  out_ << "  rm_project          Remove the project directory" << std::endl;
  out_ << "  quit                Exit the shell" << std::endl << std::endl;
}

void CLI::log_and_display_error(const std::string& message, const std::string& error) {
  BOOST_LOG_TRIVIAL(error) << "CLI: " << message << ": " << error;
  out_ << message << ": " << error << std::endl;
}


//==============================================
// FORMATTING
//==============================================

std::string CLI::to_hex(const std::vector<std::uint8_t>& bytes) {
  std::ostringstream oss;
  oss << std::hex << std::setfill('0');
  for (std::size_t i = 0; i < bytes.size(); ++i) {
    if (i > 0) {
      oss << (i % 16 == 0 ? '\n' : ' ');
    }
    oss << std::setw(2) << static_cast<int>(bytes[i]);
  }
  return oss.str();
}

std::string CLI::to_printable(const std::vector<std::uint8_t>& bytes) {
  std::string text;
  text.reserve(bytes.size());
  for (std::uint8_t byte : bytes) {
    text.push_back(std::isprint(byte) ? static_cast<char>(byte) : '.');
  }
  return text;
}

} // namespace cli
} // namespace disk

#include "frame/frame.hpp"
#include "common/errors.hpp"
#include "io/file_io.hpp"
#include <algorithm>
#include <sstream>
#include <boost/log/trivial.hpp>

namespace disk {
namespace frame {

namespace {

template <typename Iterator>
std::string bytes_to_string(Iterator begin, Iterator end) {
  std::ostringstream ss;
  ss << '[';
  for (auto it = begin; it != end; ++it) {
    if (it != begin) {
      ss << ", ";
    }
    ss << static_cast<int>(*it);
  }
  ss << ']';
  return ss.str();
}

} // namespace

FullHeader Frame::full_header() const {
  FullHeader full{};
  std::copy(header.begin(), header.end(), full.begin());
  full[HEADER_SIZE] = version;
  return full;
}

void Frame::validate_header(const std::uint8_t* data, std::size_t size) const {
  // Length first so the comparisons below never read past the buffer
  if (size < FULL_HEADER_SIZE) {
    BOOST_LOG_TRIVIAL(error) << "Frame: Payload too short for header: " << size << " bytes";
    throw FrameError(FrameErrorKind::TOO_SHORT,
      "total byte length less than 25: " + std::to_string(size));
  }

  if (!std::equal(header.begin(), header.end(), data)) {
    BOOST_LOG_TRIVIAL(error) << "Frame: Header bytes do not match";
    throw FrameError(FrameErrorKind::HEADER_MISMATCH,
      "expected " + bytes_to_string(header.begin(), header.end()) +
      ", found " + bytes_to_string(data, data + HEADER_SIZE));
  }

  if (data[HEADER_SIZE] != version) {
    BOOST_LOG_TRIVIAL(error) << "Frame: Version byte " << static_cast<int>(data[HEADER_SIZE])
                             << " does not match " << static_cast<int>(version);
    throw FrameError(FrameErrorKind::VERSION_MISMATCH,
      "expected " + std::to_string(version) + ", found " + std::to_string(data[HEADER_SIZE]));
  }
}

void Frame::validate_header(const std::vector<std::uint8_t>& bytes) const {
  validate_header(bytes.data(), bytes.size());
}

std::vector<std::uint8_t> Frame::prepend(const std::vector<std::uint8_t>& payload) const {
  const FullHeader full = full_header();
  std::vector<std::uint8_t> bytes;
  bytes.reserve(FULL_HEADER_SIZE + payload.size());
  bytes.insert(bytes.end(), full.begin(), full.end());
  bytes.insert(bytes.end(), payload.begin(), payload.end());
  return bytes;
}

std::uint8_t read_file_version(const std::filesystem::path& path, const Header& header) {
  BOOST_LOG_TRIVIAL(debug) << "Frame: Reading version byte of: " << path.string();

  const std::vector<std::uint8_t> bytes = io::read_range(path, 0, FULL_HEADER_SIZE);

  if (!std::equal(header.begin(), header.end(), bytes.begin())) {
    BOOST_LOG_TRIVIAL(error) << "Frame: Header of " << path.string() << " does not match";
    throw FrameError(FrameErrorKind::HEADER_MISMATCH,
      "header failed to match, expected " + bytes_to_string(header.begin(), header.end()) +
      ", found " + bytes_to_string(bytes.begin(), bytes.begin() + HEADER_SIZE));
  }

  return bytes[HEADER_SIZE];
}

} // namespace frame
} // namespace disk

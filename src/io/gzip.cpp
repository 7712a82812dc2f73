#include "io/gzip.hpp"
#include "common/errors.hpp"
#include <limits>
#include <string>
#include <zlib.h>
#include <boost/log/trivial.hpp>

namespace disk {
namespace io {

namespace {

// windowBits 15 plus 16 selects the gzip wrapper
constexpr int GZIP_WINDOW_BITS = 15 + 16;
constexpr int MEMORY_LEVEL = 8;
constexpr std::size_t CHUNK_SIZE = 16 * 1024;

std::string zlib_error_message(int code) {
  switch (code) {
    case Z_ERRNO: return "File operation error";
    case Z_STREAM_ERROR: return "Stream state inconsistent";
    case Z_DATA_ERROR: return "Input data corrupted";
    case Z_MEM_ERROR: return "Out of memory";
    case Z_BUF_ERROR: return "Buffer error";
    case Z_VERSION_ERROR: return "zlib version incompatible";
    default: return "Unknown zlib error " + std::to_string(code);
  }
}

// Owns one initialised z_stream
class ZStream {
public:
  explicit ZStream(bool inflating) : inflating_(inflating) {
    stream_.zalloc = Z_NULL;
    stream_.zfree = Z_NULL;
    stream_.opaque = Z_NULL;
    stream_.next_in = Z_NULL;
    stream_.avail_in = 0;

    const int ret = inflating_
      ? inflateInit2(&stream_, GZIP_WINDOW_BITS)
      : deflateInit2(&stream_, Z_BEST_SPEED, Z_DEFLATED, GZIP_WINDOW_BITS, MEMORY_LEVEL, Z_DEFAULT_STRATEGY);
    if (ret != Z_OK) {
      throw IoError("zlib initialisation failed: " + zlib_error_message(ret),
        std::make_error_code(std::errc::not_enough_memory));
    }
  }

  ZStream(const ZStream&) = delete;
  ZStream& operator=(const ZStream&) = delete;

  ~ZStream() {
    if (inflating_) {
      inflateEnd(&stream_);
    } else {
      deflateEnd(&stream_);
    }
  }

  z_stream* get() { return &stream_; }

private:
  z_stream stream_{};
  bool inflating_;
};

void check_input_size(std::size_t size) {
  if (size > std::numeric_limits<uInt>::max()) {
    throw IoError("buffer too large for zlib", std::make_error_code(std::errc::value_too_large));
  }
}

} // namespace

std::vector<std::uint8_t> compress_gzip(const std::uint8_t* data, std::size_t size) {
  check_input_size(size);
  ZStream zs(false);
  z_stream* stream = zs.get();

  std::vector<std::uint8_t> out(deflateBound(stream, static_cast<uLong>(size)) + 32);
  stream->next_in = const_cast<Bytef*>(reinterpret_cast<const Bytef*>(data));
  stream->avail_in = static_cast<uInt>(size);
  stream->next_out = reinterpret_cast<Bytef*>(out.data());
  stream->avail_out = static_cast<uInt>(out.size());

  // Output buffer is sized by deflateBound so one call finishes
  const int ret = deflate(stream, Z_FINISH);
  if (ret != Z_STREAM_END) {
    BOOST_LOG_TRIVIAL(error) << "Gzip: Compression failed: " << zlib_error_message(ret);
    throw IoError("gzip compression failed: " + zlib_error_message(ret),
      std::make_error_code(std::errc::io_error));
  }

  out.resize(stream->total_out);
  BOOST_LOG_TRIVIAL(debug) << "Gzip: Compressed " << size << " bytes to " << out.size() << " bytes";
  return out;
}

std::vector<std::uint8_t> compress_gzip(const std::vector<std::uint8_t>& bytes) {
  return compress_gzip(bytes.data(), bytes.size());
}

std::vector<std::uint8_t> decompress_gzip(const std::uint8_t* data, std::size_t size) {
  check_input_size(size);
  ZStream zs(true);
  z_stream* stream = zs.get();

  stream->next_in = const_cast<Bytef*>(reinterpret_cast<const Bytef*>(data));
  stream->avail_in = static_cast<uInt>(size);

  std::vector<std::uint8_t> out;
  std::uint8_t chunk[CHUNK_SIZE];
  int ret = Z_OK;

  do {
    stream->next_out = reinterpret_cast<Bytef*>(chunk);
    stream->avail_out = static_cast<uInt>(CHUNK_SIZE);

    ret = inflate(stream, Z_NO_FLUSH);
    if (ret != Z_OK && ret != Z_STREAM_END) {
      // Z_BUF_ERROR here means the input ended before the stream did
      BOOST_LOG_TRIVIAL(error) << "Gzip: Decompression failed: " << zlib_error_message(ret);
      throw IoError("invalid gzip data: " + zlib_error_message(ret),
        std::make_error_code(std::errc::illegal_byte_sequence));
    }

    out.insert(out.end(), chunk, chunk + (CHUNK_SIZE - stream->avail_out));
  } while (ret != Z_STREAM_END);

  out.shrink_to_fit();
  BOOST_LOG_TRIVIAL(debug) << "Gzip: Decompressed " << size << " bytes to " << out.size() << " bytes";
  return out;
}

std::vector<std::uint8_t> decompress_gzip(const std::vector<std::uint8_t>& bytes) {
  return decompress_gzip(bytes.data(), bytes.size());
}

} // namespace io
} // namespace disk

#include "seb/codec/gzip.h"

#include <array>
#include <limits>
#include <string>
#include <string_view>

#include <zlib.h>

#include "seb/error.h"
#include "seb/errors.h"

namespace {

constexpr int kGzipWindowBits = 15 + 16;  // 32K window, gzip wrapper
constexpr int kMemLevel = 8;
constexpr size_t kChunkSize = 16 * 1024;

std::string ZlibMessage(std::string_view base, const z_stream& stream, int rc) {
  std::string message(base);
  message += " (zlib rc=" + std::to_string(rc);
  if (stream.msg != nullptr) {
    message += ", ";
    message += stream.msg;
  }
  message += ")";
  return message;
}

struct DeflateGuard {
  z_stream* stream;
  ~DeflateGuard() { deflateEnd(stream); }
};

struct InflateGuard {
  z_stream* stream;
  ~InflateGuard() { inflateEnd(stream); }
};

}  // namespace

namespace seb::codec {

std::vector<uint8_t> GzipCompress(std::span<const uint8_t> data) {
  if (data.size() > std::numeric_limits<uInt>::max()) {
    throw Error(ErrorDomain::Internal, errors::internal::kCompressorFailure,
                std::string(errors::msg::kGzipInputTooLarge));
  }
  z_stream stream{};
  int rc = deflateInit2(&stream, Z_DEFAULT_COMPRESSION, Z_DEFLATED, kGzipWindowBits, kMemLevel,
                        Z_DEFAULT_STRATEGY);
  if (rc != Z_OK) {
    throw Error(ErrorDomain::Internal, errors::internal::kCompressorFailure,
                ZlibMessage(errors::msg::kGzipInitFailed, stream, rc), rc);
  }
  DeflateGuard guard{&stream};

  std::vector<uint8_t> out(deflateBound(&stream, static_cast<uLong>(data.size())));
  stream.next_in = const_cast<Bytef*>(reinterpret_cast<const Bytef*>(data.data()));
  stream.avail_in = static_cast<uInt>(data.size());
  stream.next_out = reinterpret_cast<Bytef*>(out.data());
  stream.avail_out = static_cast<uInt>(out.size());

  rc = deflate(&stream, Z_FINISH);
  if (rc != Z_STREAM_END) {
    throw Error(ErrorDomain::Internal, errors::internal::kCompressorFailure,
                ZlibMessage(errors::msg::kGzipDeflateFailed, stream, rc), rc);
  }
  out.resize(stream.total_out);
  return out;
}

std::vector<uint8_t> GzipDecompress(std::span<const uint8_t> data, size_t max_output) {
  if (data.size() > std::numeric_limits<uInt>::max()) {
    throw Error(ErrorDomain::Internal, errors::internal::kCompressorFailure,
                std::string(errors::msg::kGzipInputTooLarge));
  }
  z_stream stream{};
  int rc = inflateInit2(&stream, kGzipWindowBits);
  if (rc != Z_OK) {
    throw Error(ErrorDomain::Internal, errors::internal::kCompressorFailure,
                ZlibMessage(errors::msg::kGzipInitFailed, stream, rc), rc);
  }
  InflateGuard guard{&stream};

  stream.next_in = const_cast<Bytef*>(reinterpret_cast<const Bytef*>(data.data()));
  stream.avail_in = static_cast<uInt>(data.size());

  std::vector<uint8_t> out;
  std::array<uint8_t, kChunkSize> chunk{};
  do {
    stream.next_out = reinterpret_cast<Bytef*>(chunk.data());
    stream.avail_out = static_cast<uInt>(chunk.size());
    rc = inflate(&stream, Z_NO_FLUSH);
    if (rc != Z_OK && rc != Z_STREAM_END) {
      // Z_BUF_ERROR here means the input ran out before the member ended.
      throw FormatError(ZlibMessage(errors::msg::kGzipCorrupt, stream, rc),
                        errors::format::kCompressedDataCorrupt, rc);
    }
    const size_t produced = chunk.size() - stream.avail_out;
    if (produced > max_output - out.size()) {
      throw FormatError(std::string(errors::msg::kGzipOutputTooLarge),
                        errors::format::kDecompressedTooLarge);
    }
    out.insert(out.end(), chunk.begin(), chunk.begin() + produced);
  } while (rc != Z_STREAM_END);
  return out;
}

}  // namespace seb::codec

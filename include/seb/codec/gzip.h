#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace seb::codec {

// Upper bound on the inflated size of one member. SEB documents are a few
// hundred KiB; anything near this limit is hostile input.
inline constexpr size_t kMaxDecompressedSize = 64u * 1024u * 1024u;

// Single-member gzip (RFC 1952) around a raw DEFLATE stream, default
// compression level.
std::vector<uint8_t> GzipCompress(std::span<const uint8_t> data);

// Inflates one gzip member. Throws FormatError
// (errors::format::kCompressedDataCorrupt) when the stream is truncated, has a
// bad header or fails its CRC, and FormatError
// (errors::format::kDecompressedTooLarge) once the output would exceed
// |max_output| bytes. Trailing bytes after the member are ignored.
std::vector<uint8_t> GzipDecompress(std::span<const uint8_t> data,
                                    size_t max_output = kMaxDecompressedSize);

}  // namespace seb::codec

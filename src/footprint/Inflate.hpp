#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace footprint {

// Dependency-free DEFLATE (RFC 1951) decoder with a zlib (RFC 1950) wrapper.
//
// Supports all three block types (stored, fixed Huffman, dynamic Huffman). This is what
// PNG IDAT streams produced by ordinary encoders require.
//
// Output growth is capped by `maxOutput` so corrupt or hostile streams cannot exhaust
// memory; exceeding the cap is reported as an error.

constexpr std::size_t kDefaultInflateLimit = 512u * 1024u * 1024u;

// Decode a raw DEFLATE stream starting at data[0].
// On success, *outConsumed (if provided) receives the number of input bytes used
// (the final partial byte counts as consumed).
bool InflateRaw(const std::uint8_t* data, std::size_t size, std::vector<std::uint8_t>& out,
                std::string& outError, std::size_t* outConsumed = nullptr,
                std::size_t maxOutput = kDefaultInflateLimit);

// Decode a zlib stream (2-byte header, DEFLATE payload, big-endian Adler32 trailer).
bool InflateZlib(const std::vector<std::uint8_t>& in, std::vector<std::uint8_t>& out, std::string& outError,
                 std::size_t maxOutput = kDefaultInflateLimit);

// Wrap bytes into a valid zlib stream made of stored (uncompressed) DEFLATE blocks.
std::vector<std::uint8_t> CompressZlibStored(const std::uint8_t* data, std::size_t size);

} // namespace footprint

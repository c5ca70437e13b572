#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

namespace footprint {

// Checksums required by the PNG container and the zlib wrapper.
//
//  - CRC32 (IEEE, reflected 0xEDB88320): PNG chunk integrity.
//  - Adler32 (RFC 1950): zlib stream trailer.

// Running CRC32. Start from 0xFFFFFFFF and XOR the final value with 0xFFFFFFFF.
std::uint32_t Crc32Update(std::uint32_t crc, const std::uint8_t* data, std::size_t size);

inline std::uint32_t Crc32(const std::uint8_t* data, std::size_t size)
{
  return Crc32Update(0xFFFFFFFFu, data, size) ^ 0xFFFFFFFFu;
}

// Running Adler32. Start from 1.
std::uint32_t Adler32Update(std::uint32_t adler, const std::uint8_t* data, std::size_t size);

inline std::uint32_t Adler32(const std::vector<std::uint8_t>& bytes)
{
  return Adler32Update(1u, bytes.data(), bytes.size());
}

} // namespace footprint

#include "footprint/Checksum.hpp"

#include <array>

namespace footprint {

namespace {

constexpr std::array<std::uint32_t, 256> MakeCrcTable()
{
  std::array<std::uint32_t, 256> t{};
  for (std::uint32_t n = 0; n < 256u; ++n) {
    std::uint32_t c = n;
    for (int k = 0; k < 8; ++k) c = (c & 1u) ? 0xEDB88320u ^ (c >> 1) : c >> 1;
    t[n] = c;
  }
  return t;
}

constexpr std::array<std::uint32_t, 256> kCrcTable = MakeCrcTable();

// Largest n such that 255*n*(n+1)/2 + (n+1)*(65521-1) fits in 32 bits.
constexpr std::size_t kAdlerBlock = 5552;
constexpr std::uint32_t kAdlerMod = 65521u;

} // namespace

std::uint32_t Crc32Update(std::uint32_t crc, const std::uint8_t* data, std::size_t size)
{
  if (!data) return crc;
  for (std::size_t i = 0; i < size; ++i) {
    crc = kCrcTable[(crc ^ data[i]) & 0xFFu] ^ (crc >> 8);
  }
  return crc;
}

std::uint32_t Adler32Update(std::uint32_t adler, const std::uint8_t* data, std::size_t size)
{
  std::uint32_t s1 = adler & 0xFFFFu;
  std::uint32_t s2 = adler >> 16;
  if (!data) return adler;

  std::size_t off = 0;
  while (off < size) {
    const std::size_t end = (size - off > kAdlerBlock) ? off + kAdlerBlock : size;
    for (; off < end; ++off) {
      s1 += data[off];
      s2 += s1;
    }
    s1 %= kAdlerMod;
    s2 %= kAdlerMod;
  }
  return (s2 << 16) | s1;
}

} // namespace footprint

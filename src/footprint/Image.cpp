#include "footprint/Image.hpp"

#include "footprint/Checksum.hpp"
#include "footprint/Inflate.hpp"

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <iterator>
#include <sstream>

namespace footprint {

namespace {

constexpr std::uint8_t kPngSig[8] = {0x89u, 'P', 'N', 'G', 0x0Du, 0x0Au, 0x1Au, 0x0Au};
constexpr std::uint32_t kMaxChunk = 256u * 1024u * 1024u;
constexpr std::uint64_t kMaxPixels = 200ull * 1000ull * 1000ull;

std::string LowerExt(const std::string& path)
{
  const std::size_t slash = path.find_last_of("/\\");
  const std::size_t dot = path.find_last_of('.');
  if (dot == std::string::npos) return {};
  if (slash != std::string::npos && dot < slash) return {};
  std::string ext = path.substr(dot);
  for (char& c : ext) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  return ext;
}

bool ReadFileBytes(const std::string& path, std::vector<std::uint8_t>& out)
{
  std::ifstream f(path, std::ios::binary);
  if (!f) return false;
  out.assign(std::istreambuf_iterator<char>(f), std::istreambuf_iterator<char>());
  return !f.bad();
}

bool HasPngSignature(const std::uint8_t* b, std::size_t n)
{
  if (!b || n < 8) return false;
  return std::equal(std::begin(kPngSig), std::end(kPngSig), b);
}

std::uint32_t LoadU32BE(const std::uint8_t* p)
{
  return (static_cast<std::uint32_t>(p[0]) << 24) | (static_cast<std::uint32_t>(p[1]) << 16) |
         (static_cast<std::uint32_t>(p[2]) << 8) | static_cast<std::uint32_t>(p[3]);
}

void AppendU32BE(std::vector<std::uint8_t>& out, std::uint32_t v)
{
  out.push_back(static_cast<std::uint8_t>((v >> 24) & 0xFFu));
  out.push_back(static_cast<std::uint8_t>((v >> 16) & 0xFFu));
  out.push_back(static_cast<std::uint8_t>((v >> 8) & 0xFFu));
  out.push_back(static_cast<std::uint8_t>(v & 0xFFu));
}

void AppendPngChunk(std::vector<std::uint8_t>& out, const char* type, const std::vector<std::uint8_t>& data)
{
  AppendU32BE(out, static_cast<std::uint32_t>(data.size()));
  const std::size_t typeAt = out.size();
  out.insert(out.end(), type, type + 4);
  out.insert(out.end(), data.begin(), data.end());
  // CRC covers type + data, which are contiguous in `out`.
  AppendU32BE(out, Crc32(out.data() + typeAt, 4 + data.size()));
}

bool ValidateRgb(const RgbImage& img, std::string& outError)
{
  if (img.width <= 0 || img.height <= 0) {
    outError = "invalid image dimensions";
    return false;
  }
  const std::size_t expected = static_cast<std::size_t>(img.width) * static_cast<std::size_t>(img.height) * 3u;
  if (img.rgb.size() != expected) {
    std::ostringstream oss;
    oss << "invalid image buffer size (expected " << expected << ", got " << img.rgb.size() << ")";
    outError = oss.str();
    return false;
  }
  return true;
}

// ------------------------------------------------------------------------------------------
// PPM
// ------------------------------------------------------------------------------------------

bool ReadPpmToken(std::istream& in, std::string& out)
{
  out.clear();

  char c = 0;
  while (in.get(c)) {
    if (std::isspace(static_cast<unsigned char>(c))) continue;
    if (c == '#') {
      std::string dummy;
      std::getline(in, dummy);
      continue;
    }
    out.push_back(c);
    break;
  }
  if (out.empty()) return false;

  // Exactly one whitespace character terminates the token (and, after maxval, the header).
  while (in.get(c)) {
    if (std::isspace(static_cast<unsigned char>(c))) break;
    out.push_back(c);
  }
  return true;
}

bool ParsePositiveToken(const std::string& tok, int& out)
{
  if (tok.empty()) return false;
  char* end = nullptr;
  const long v = std::strtol(tok.c_str(), &end, 10);
  if (!end || *end != '\0' || v <= 0 || v > 1000000) return false;
  out = static_cast<int>(v);
  return true;
}

// ------------------------------------------------------------------------------------------
// PNG decoding
// ------------------------------------------------------------------------------------------

struct PngHeader {
  int width = 0;
  int height = 0;
  int bitDepth = 0;
  int colorType = 0;
  int channels = 0;
};

bool ValidDepthForColorType(int colorType, int depth)
{
  switch (colorType) {
  case 0: return depth == 1 || depth == 2 || depth == 4 || depth == 8 || depth == 16;
  case 3: return depth == 1 || depth == 2 || depth == 4 || depth == 8;
  case 2:
  case 4:
  case 6: return depth == 8 || depth == 16;
  default: return false;
  }
}

int ChannelsForColorType(int colorType)
{
  switch (colorType) {
  case 0: return 1;
  case 2: return 3;
  case 3: return 1;
  case 4: return 2;
  case 6: return 4;
  default: return 0;
  }
}

std::uint8_t Paeth(std::uint8_t a, std::uint8_t b, std::uint8_t c)
{
  const int p = static_cast<int>(a) + static_cast<int>(b) - static_cast<int>(c);
  const int pa = std::abs(p - static_cast<int>(a));
  const int pb = std::abs(p - static_cast<int>(b));
  const int pc = std::abs(p - static_cast<int>(c));
  if (pa <= pb && pa <= pc) return a;
  if (pb <= pc) return b;
  return c;
}

// Reverse the per-scanline filters in place. `raw` holds (1 + stride) bytes per row.
bool Unfilter(std::vector<std::uint8_t>& raw, int height, std::size_t stride, std::size_t bpp, std::string& outError)
{
  const std::vector<std::uint8_t> zeros(stride, 0);
  const std::uint8_t* prev = zeros.data();

  for (int y = 0; y < height; ++y) {
    std::uint8_t* row = raw.data() + static_cast<std::size_t>(y) * (stride + 1u);
    const std::uint8_t filter = row[0];
    std::uint8_t* cur = row + 1;

    switch (filter) {
    case 0: break;
    case 1:
      for (std::size_t i = bpp; i < stride; ++i) cur[i] = static_cast<std::uint8_t>(cur[i] + cur[i - bpp]);
      break;
    case 2:
      for (std::size_t i = 0; i < stride; ++i) cur[i] = static_cast<std::uint8_t>(cur[i] + prev[i]);
      break;
    case 3:
      for (std::size_t i = 0; i < stride; ++i) {
        const unsigned a = (i >= bpp) ? cur[i - bpp] : 0u;
        cur[i] = static_cast<std::uint8_t>(cur[i] + ((a + prev[i]) >> 1));
      }
      break;
    case 4:
      for (std::size_t i = 0; i < stride; ++i) {
        const std::uint8_t a = (i >= bpp) ? cur[i - bpp] : 0u;
        const std::uint8_t c = (i >= bpp) ? prev[i - bpp] : 0u;
        cur[i] = static_cast<std::uint8_t>(cur[i] + Paeth(a, prev[i], c));
      }
      break;
    default: {
      std::ostringstream oss;
      oss << "invalid PNG filter type " << static_cast<int>(filter) << " on row " << y;
      outError = oss.str();
      return false;
    }
    }
    prev = cur;
  }
  return true;
}

std::uint8_t OverWhite(std::uint8_t c, std::uint8_t a)
{
  const unsigned v = static_cast<unsigned>(c) * a + 255u * (255u - a) + 127u;
  return static_cast<std::uint8_t>(v / 255u);
}

} // namespace

bool ReadPpm(const std::string& path, RgbImage& outImg, std::string& outError)
{
  outError.clear();
  outImg = RgbImage{};

  std::ifstream f(path, std::ios::binary);
  if (!f) {
    outError = "failed to open file for reading";
    return false;
  }

  std::string tok;
  if (!ReadPpmToken(f, tok) || (tok != "P6" && tok != "P5")) {
    outError = "invalid PPM magic (expected P6 or P5)";
    return false;
  }
  const int channels = (tok == "P6") ? 3 : 1;

  int w = 0;
  int h = 0;
  int maxv = 0;
  if (!ReadPpmToken(f, tok) || !ParsePositiveToken(tok, w)) {
    outError = "invalid PPM width";
    return false;
  }
  if (!ReadPpmToken(f, tok) || !ParsePositiveToken(tok, h)) {
    outError = "invalid PPM height";
    return false;
  }
  if (!ReadPpmToken(f, tok) || !ParsePositiveToken(tok, maxv) || maxv > 65535) {
    outError = "invalid PPM maxval";
    return false;
  }

  const std::size_t bytesPerSample = (maxv > 255) ? 2u : 1u;
  const std::size_t count = static_cast<std::size_t>(w) * static_cast<std::size_t>(h) * static_cast<std::size_t>(channels);
  std::vector<std::uint8_t> buf(count * bytesPerSample);
  f.read(reinterpret_cast<char*>(buf.data()), static_cast<std::streamsize>(buf.size()));
  if (static_cast<std::size_t>(f.gcount()) != buf.size()) {
    outError = "truncated PPM pixel data";
    return false;
  }

  RgbImage img;
  img.width = w;
  img.height = h;
  img.rgb.resize(static_cast<std::size_t>(w) * static_cast<std::size_t>(h) * 3u);

  for (std::size_t i = 0; i < count; ++i) {
    unsigned v = (bytesPerSample == 2u) ? (static_cast<unsigned>(buf[i * 2]) << 8) | buf[i * 2 + 1] : buf[i];
    v = (v * 255u + static_cast<unsigned>(maxv) / 2u) / static_cast<unsigned>(maxv);
    const std::uint8_t b = static_cast<std::uint8_t>(std::min(v, 255u));
    if (channels == 3) {
      img.rgb[i] = b;
    } else {
      img.rgb[i * 3 + 0] = b;
      img.rgb[i * 3 + 1] = b;
      img.rgb[i * 3 + 2] = b;
    }
  }

  outImg = std::move(img);
  return true;
}

bool WritePpm(const std::string& path, const RgbImage& img, std::string& outError)
{
  outError.clear();
  if (!ValidateRgb(img, outError)) return false;

  std::ofstream f(path, std::ios::binary);
  if (!f) {
    outError = "failed to open file for writing";
    return false;
  }

  f << "P6\n" << img.width << " " << img.height << "\n255\n";
  f.write(reinterpret_cast<const char*>(img.rgb.data()), static_cast<std::streamsize>(img.rgb.size()));
  if (!f) {
    outError = "failed while writing file";
    return false;
  }
  return true;
}

bool DecodePng(const std::vector<std::uint8_t>& bytes, RgbImage& outImg, std::string& outError)
{
  outError.clear();
  outImg = RgbImage{};

  if (!HasPngSignature(bytes.data(), bytes.size())) {
    outError = "invalid PNG signature";
    return false;
  }

  PngHeader hdr;
  bool haveHeader = false;
  bool sawEnd = false;
  std::vector<std::uint8_t> idat;
  std::vector<std::uint8_t> palette;
  std::vector<std::uint8_t> paletteAlpha;

  std::size_t pos = 8;
  while (pos + 12u <= bytes.size()) {
    const std::uint32_t len = LoadU32BE(&bytes[pos]);
    if (len > kMaxChunk || pos + 12u + len > bytes.size()) {
      outError = "truncated PNG chunk";
      return false;
    }

    const std::uint8_t* typePtr = &bytes[pos + 4];
    const std::uint8_t* data = &bytes[pos + 8];
    const std::uint32_t crcFile = LoadU32BE(&bytes[pos + 8 + len]);
    const std::string type(reinterpret_cast<const char*>(typePtr), 4);
    if (Crc32(typePtr, 4u + len) != crcFile) {
      outError = "PNG CRC mismatch for chunk '" + type + "'";
      return false;
    }
    pos += 12u + len;

    if (type == "IHDR") {
      if (len != 13u) {
        outError = "invalid IHDR length";
        return false;
      }
      const std::uint32_t w = LoadU32BE(data);
      const std::uint32_t h = LoadU32BE(data + 4);
      if (w == 0 || h == 0 || static_cast<std::uint64_t>(w) * h > kMaxPixels) {
        outError = "invalid or oversized IHDR dimensions";
        return false;
      }
      hdr.width = static_cast<int>(w);
      hdr.height = static_cast<int>(h);
      hdr.bitDepth = data[8];
      hdr.colorType = data[9];
      if (!ValidDepthForColorType(hdr.colorType, hdr.bitDepth)) {
        outError = "unsupported PNG bit depth / color type combination";
        return false;
      }
      if (data[10] != 0u || data[11] != 0u) {
        outError = "unsupported PNG compression or filter method";
        return false;
      }
      if (data[12] != 0u) {
        outError = "interlaced PNG is not supported";
        return false;
      }
      hdr.channels = ChannelsForColorType(hdr.colorType);
      haveHeader = true;
    } else if (type == "PLTE") {
      if (len % 3u != 0u || len > 256u * 3u) {
        outError = "invalid PLTE chunk";
        return false;
      }
      palette.assign(data, data + len);
    } else if (type == "tRNS") {
      if (hdr.colorType == 3) paletteAlpha.assign(data, data + len);
    } else if (type == "IDAT") {
      idat.insert(idat.end(), data, data + len);
    } else if (type == "IEND") {
      sawEnd = true;
      break;
    }
  }

  if (!haveHeader) {
    outError = "missing IHDR";
    return false;
  }
  if (!sawEnd) {
    outError = "missing IEND";
    return false;
  }
  if (idat.empty()) {
    outError = "missing IDAT";
    return false;
  }
  if (hdr.colorType == 3 && palette.empty()) {
    outError = "palette image without PLTE";
    return false;
  }

  const std::size_t bitsPerPixel = static_cast<std::size_t>(hdr.channels) * static_cast<std::size_t>(hdr.bitDepth);
  const std::size_t stride = (static_cast<std::size_t>(hdr.width) * bitsPerPixel + 7u) / 8u;
  const std::size_t bpp = std::max<std::size_t>(1u, bitsPerPixel / 8u);
  const std::size_t expected = (stride + 1u) * static_cast<std::size_t>(hdr.height);

  std::vector<std::uint8_t> raw;
  std::string err;
  if (!InflateZlib(idat, raw, err, expected)) {
    outError = "failed to decompress IDAT: " + err;
    return false;
  }
  if (raw.size() != expected) {
    std::ostringstream oss;
    oss << "unexpected decompressed size (expected " << expected << ", got " << raw.size() << ")";
    outError = oss.str();
    return false;
  }

  if (!Unfilter(raw, hdr.height, stride, bpp, outError)) return false;

  RgbImage img;
  img.width = hdr.width;
  img.height = hdr.height;
  img.rgb.resize(static_cast<std::size_t>(hdr.width) * static_cast<std::size_t>(hdr.height) * 3u);

  const int depth = hdr.bitDepth;
  const unsigned subMask = (depth < 8) ? ((1u << depth) - 1u) : 0xFFu;
  const std::size_t paletteEntries = palette.size() / 3u;

  for (int y = 0; y < hdr.height; ++y) {
    const std::uint8_t* row = raw.data() + static_cast<std::size_t>(y) * (stride + 1u) + 1u;

    // Sample accessor returning 8-bit values (16-bit samples keep their high byte).
    auto sample = [&](int x, int ch) -> unsigned {
      const std::size_t idx = static_cast<std::size_t>(x) * static_cast<std::size_t>(hdr.channels) + static_cast<std::size_t>(ch);
      if (depth == 8) return row[idx];
      if (depth == 16) return row[idx * 2u];
      const std::size_t bit = static_cast<std::size_t>(x) * static_cast<std::size_t>(depth);
      const unsigned shift = 8u - static_cast<unsigned>(depth) - static_cast<unsigned>(bit % 8u);
      return (row[bit / 8u] >> shift) & subMask;
    };

    for (int x = 0; x < hdr.width; ++x) {
      std::uint8_t r = 0;
      std::uint8_t g = 0;
      std::uint8_t b = 0;
      std::uint8_t a = 255;

      switch (hdr.colorType) {
      case 0: {
        unsigned v = sample(x, 0);
        if (depth < 8) v = v * 255u / subMask;
        r = g = b = static_cast<std::uint8_t>(v);
        break;
      }
      case 2:
        r = static_cast<std::uint8_t>(sample(x, 0));
        g = static_cast<std::uint8_t>(sample(x, 1));
        b = static_cast<std::uint8_t>(sample(x, 2));
        break;
      case 3: {
        const unsigned index = sample(x, 0);
        if (index >= paletteEntries) {
          outError = "palette index out of range";
          return false;
        }
        r = palette[index * 3u + 0u];
        g = palette[index * 3u + 1u];
        b = palette[index * 3u + 2u];
        if (index < paletteAlpha.size()) a = paletteAlpha[index];
        break;
      }
      case 4:
        r = g = b = static_cast<std::uint8_t>(sample(x, 0));
        a = static_cast<std::uint8_t>(sample(x, 1));
        break;
      case 6:
        r = static_cast<std::uint8_t>(sample(x, 0));
        g = static_cast<std::uint8_t>(sample(x, 1));
        b = static_cast<std::uint8_t>(sample(x, 2));
        a = static_cast<std::uint8_t>(sample(x, 3));
        break;
      default: break;
      }

      if (a != 255u) {
        r = OverWhite(r, a);
        g = OverWhite(g, a);
        b = OverWhite(b, a);
      }

      const std::size_t o = (static_cast<std::size_t>(y) * static_cast<std::size_t>(hdr.width) + static_cast<std::size_t>(x)) * 3u;
      img.rgb[o + 0] = r;
      img.rgb[o + 1] = g;
      img.rgb[o + 2] = b;
    }
  }

  outImg = std::move(img);
  return true;
}

bool ReadPng(const std::string& path, RgbImage& outImg, std::string& outError)
{
  std::vector<std::uint8_t> bytes;
  if (!ReadFileBytes(path, bytes)) {
    outError = "failed to open file for reading";
    return false;
  }
  return DecodePng(bytes, outImg, outError);
}

bool WritePng(const std::string& path, const RgbImage& img, std::string& outError)
{
  outError.clear();
  if (!ValidateRgb(img, outError)) return false;

  const std::size_t rowBytes = static_cast<std::size_t>(img.width) * 3u;
  std::vector<std::uint8_t> raw;
  raw.reserve((rowBytes + 1u) * static_cast<std::size_t>(img.height));
  for (int y = 0; y < img.height; ++y) {
    raw.push_back(0u);
    const auto rowBegin = img.rgb.begin() + static_cast<std::ptrdiff_t>(static_cast<std::size_t>(y) * rowBytes);
    raw.insert(raw.end(), rowBegin, rowBegin + static_cast<std::ptrdiff_t>(rowBytes));
  }

  std::vector<std::uint8_t> ihdr;
  AppendU32BE(ihdr, static_cast<std::uint32_t>(img.width));
  AppendU32BE(ihdr, static_cast<std::uint32_t>(img.height));
  ihdr.push_back(8u); // bit depth
  ihdr.push_back(2u); // truecolor
  ihdr.push_back(0u);
  ihdr.push_back(0u);
  ihdr.push_back(0u);

  std::vector<std::uint8_t> file(std::begin(kPngSig), std::end(kPngSig));
  AppendPngChunk(file, "IHDR", ihdr);
  AppendPngChunk(file, "IDAT", CompressZlibStored(raw.data(), raw.size()));
  AppendPngChunk(file, "IEND", {});

  std::ofstream f(path, std::ios::binary);
  if (!f) {
    outError = "failed to open file for writing";
    return false;
  }
  f.write(reinterpret_cast<const char*>(file.data()), static_cast<std::streamsize>(file.size()));
  if (!f) {
    outError = "failed while writing file";
    return false;
  }
  return true;
}

bool ReadImageAuto(const std::string& path, RgbImage& outImg, std::string& outError)
{
  const std::string ext = LowerExt(path);
  if (ext == ".png") return ReadPng(path, outImg, outError);
  if (ext == ".ppm" || ext == ".pgm" || ext == ".pnm") return ReadPpm(path, outImg, outError);

  std::ifstream f(path, std::ios::binary);
  if (!f) {
    outError = "failed to open file for reading";
    return false;
  }

  std::uint8_t head[8] = {};
  f.read(reinterpret_cast<char*>(head), static_cast<std::streamsize>(sizeof(head)));
  const std::size_t got = static_cast<std::size_t>(f.gcount());
  f.close();

  if (HasPngSignature(head, got)) return ReadPng(path, outImg, outError);
  if (got >= 2 && head[0] == 'P' && (head[1] == '6' || head[1] == '5')) return ReadPpm(path, outImg, outError);

  outError = "unknown image format (expected PNG or PPM/PGM)";
  return false;
}

bool WriteImageAuto(const std::string& path, const RgbImage& img, std::string& outError)
{
  if (LowerExt(path) == ".png") return WritePng(path, img, outError);
  return WritePpm(path, img, outError);
}

GrayImage ToGray(const RgbImage& img)
{
  GrayImage out;
  out.width = img.width;
  out.height = img.height;
  const std::size_t n = static_cast<std::size_t>(std::max(0, img.width)) * static_cast<std::size_t>(std::max(0, img.height));
  out.pixels.resize(n);
  for (std::size_t i = 0; i < n && i * 3u + 2u < img.rgb.size(); ++i) {
    const unsigned r = img.rgb[i * 3u + 0u];
    const unsigned g = img.rgb[i * 3u + 1u];
    const unsigned b = img.rgb[i * 3u + 2u];
    out.pixels[i] = static_cast<std::uint8_t>((77u * r + 150u * g + 29u * b + 128u) >> 8);
  }
  return out;
}

RgbImage GrayToRgb(const GrayImage& img)
{
  RgbImage out;
  out.width = img.width;
  out.height = img.height;
  out.rgb.resize(img.pixels.size() * 3u);
  for (std::size_t i = 0; i < img.pixels.size(); ++i) {
    out.rgb[i * 3u + 0u] = img.pixels[i];
    out.rgb[i * 3u + 1u] = img.pixels[i];
    out.rgb[i * 3u + 2u] = img.pixels[i];
  }
  return out;
}

GrayImage ResizeGrayArea(const GrayImage& src, int dstW, int dstH)
{
  GrayImage out;
  if (src.width <= 0 || src.height <= 0 || dstW <= 0 || dstH <= 0) return out;

  out.width = dstW;
  out.height = dstH;
  out.pixels.resize(static_cast<std::size_t>(dstW) * static_cast<std::size_t>(dstH));

  const std::int64_t sw = src.width;
  const std::int64_t sh = src.height;

  for (int y = 0; y < dstH; ++y) {
    std::int64_t y0 = static_cast<std::int64_t>(y) * sh / dstH;
    std::int64_t y1 = (static_cast<std::int64_t>(y + 1) * sh + dstH - 1) / dstH;
    y0 = std::min(y0, sh - 1);
    y1 = std::clamp(y1, y0 + 1, sh);

    for (int x = 0; x < dstW; ++x) {
      std::int64_t x0 = static_cast<std::int64_t>(x) * sw / dstW;
      std::int64_t x1 = (static_cast<std::int64_t>(x + 1) * sw + dstW - 1) / dstW;
      x0 = std::min(x0, sw - 1);
      x1 = std::clamp(x1, x0 + 1, sw);

      std::uint64_t sum = 0;
      for (std::int64_t sy = y0; sy < y1; ++sy) {
        for (std::int64_t sx = x0; sx < x1; ++sx) {
          sum += src.at(static_cast<int>(sx), static_cast<int>(sy));
        }
      }
      const std::uint64_t count = static_cast<std::uint64_t>((y1 - y0) * (x1 - x0));
      out.pixels[static_cast<std::size_t>(y) * static_cast<std::size_t>(dstW) + static_cast<std::size_t>(x)] =
          static_cast<std::uint8_t>((sum + count / 2u) / count);
    }
  }
  return out;
}

} // namespace footprint

#include "footprint/Inflate.hpp"

#include "footprint/Checksum.hpp"

#include <algorithm>
#include <array>
#include <sstream>
#include <utility>

namespace footprint {

namespace {

constexpr int kMaxBits = 15;
constexpr int kMaxLitLenCodes = 286;
constexpr int kMaxDistCodes = 30;
constexpr int kFixedLitLenCodes = 288;

constexpr std::array<std::uint16_t, 29> kLenBase = {3,  4,  5,  6,  7,  8,  9,  10, 11,  13,  15,  17,  19,  23, 27,
                                                    31, 35, 43, 51, 59, 67, 83, 99, 115, 131, 163, 195, 227, 258};
constexpr std::array<std::uint8_t, 29> kLenExtra = {0, 0, 0, 0, 0, 0, 0, 0, 1, 1, 1, 1, 2, 2, 2,
                                                    2, 3, 3, 3, 3, 4, 4, 4, 4, 5, 5, 5, 5, 0};
constexpr std::array<std::uint16_t, 30> kDistBase = {1,    2,    3,    4,    5,    7,     9,     13,    17,  25,
                                                     33,   49,   65,   97,   129,  193,   257,   385,   513, 769,
                                                     1025, 1537, 2049, 3073, 4097, 6145,  8193,  12289, 16385, 24577};
constexpr std::array<std::uint8_t, 30> kDistExtra = {0, 0, 0, 0, 1, 1, 2, 2,  3,  3,  4,  4,  5,  5,  6,
                                                     6, 7, 7, 8, 8, 9, 9, 10, 10, 11, 11, 12, 12, 13, 13};

// Order in which code-length code lengths are transmitted.
constexpr std::array<std::uint8_t, 19> kCodeLengthOrder = {16, 17, 18, 0, 8, 7, 9, 6, 10, 5, 11, 4, 12, 3, 13, 2, 14, 1, 15};

class BitReader {
public:
  BitReader(const std::uint8_t* data, std::size_t size) : m_data(data), m_size(size) {}

  // Read `need` bits (LSB first). Sets overrun() and returns 0 past the end of input.
  int bits(int need)
  {
    std::uint32_t val = m_bitBuf;
    while (m_bitCount < need) {
      if (m_pos >= m_size) {
        m_overrun = true;
        return 0;
      }
      val |= static_cast<std::uint32_t>(m_data[m_pos++]) << m_bitCount;
      m_bitCount += 8;
    }
    m_bitBuf = val >> need;
    m_bitCount -= need;
    return static_cast<int>(val & ((1u << need) - 1u));
  }

  void alignToByte()
  {
    m_bitBuf = 0;
    m_bitCount = 0;
  }

  bool overrun() const { return m_overrun; }
  std::size_t pos() const { return m_pos; }
  void advance(std::size_t n) { m_pos += n; }
  const std::uint8_t* cursor() const { return m_data + m_pos; }
  std::size_t remaining() const { return m_pos < m_size ? m_size - m_pos : 0; }

private:
  const std::uint8_t* m_data = nullptr;
  std::size_t m_size = 0;
  std::size_t m_pos = 0;
  std::uint32_t m_bitBuf = 0;
  int m_bitCount = 0;
  bool m_overrun = false;
};

// Canonical Huffman decoding table (count of codes per length + symbols ordered by code).
struct Huffman {
  std::array<std::uint16_t, kMaxBits + 1> count{};
  std::vector<std::uint16_t> symbol;
};

// Returns 0 for a complete code, >0 for an incomplete code, <0 for an over-subscribed set.
int BuildHuffman(Huffman& h, const std::uint8_t* lengths, int n)
{
  h.count.fill(0);
  h.symbol.assign(static_cast<std::size_t>(n), 0);

  for (int s = 0; s < n; ++s) h.count[lengths[s]]++;
  if (h.count[0] == n) return 0;

  int left = 1;
  for (int len = 1; len <= kMaxBits; ++len) {
    left <<= 1;
    left -= h.count[static_cast<std::size_t>(len)];
    if (left < 0) return left;
  }

  std::array<std::uint16_t, kMaxBits + 1> offs{};
  for (int len = 1; len < kMaxBits; ++len) {
    offs[static_cast<std::size_t>(len + 1)] =
        static_cast<std::uint16_t>(offs[static_cast<std::size_t>(len)] + h.count[static_cast<std::size_t>(len)]);
  }
  for (int s = 0; s < n; ++s) {
    if (lengths[s] != 0) h.symbol[offs[lengths[s]]++] = static_cast<std::uint16_t>(s);
  }
  return left;
}

// Decode one symbol; -1 when the bit pattern matches no code.
int DecodeSymbol(BitReader& br, const Huffman& h)
{
  int code = 0;
  int first = 0;
  int index = 0;
  for (int len = 1; len <= kMaxBits; ++len) {
    code |= br.bits(1);
    const int count = h.count[static_cast<std::size_t>(len)];
    if (code - count < first) return h.symbol[static_cast<std::size_t>(index + (code - first))];
    index += count;
    first += count;
    first <<= 1;
    code <<= 1;
  }
  return -1;
}

struct Inflater {
  BitReader br;
  std::vector<std::uint8_t>& out;
  std::size_t maxOutput;
  std::string err;

  bool fail(const std::string& msg)
  {
    err = msg;
    return false;
  }

  bool stored()
  {
    br.alignToByte();
    if (br.remaining() < 4) return fail("truncated stored block header");

    const std::uint8_t* p = br.cursor();
    const unsigned len = static_cast<unsigned>(p[0]) | (static_cast<unsigned>(p[1]) << 8);
    const unsigned nlen = static_cast<unsigned>(p[2]) | (static_cast<unsigned>(p[3]) << 8);
    br.advance(4);
    if (len != (~nlen & 0xFFFFu)) return fail("stored block LEN/NLEN mismatch");
    if (br.remaining() < len) return fail("truncated stored block payload");
    if (out.size() + len > maxOutput) return fail("inflated data exceeds size limit");

    out.insert(out.end(), br.cursor(), br.cursor() + len);
    br.advance(len);
    return true;
  }

  bool codes(const Huffman& lencode, const Huffman& distcode)
  {
    for (;;) {
      int symbol = DecodeSymbol(br, lencode);
      if (br.overrun()) return fail("truncated compressed block");
      if (symbol < 0) return fail("invalid literal/length code");

      if (symbol < 256) {
        if (out.size() >= maxOutput) return fail("inflated data exceeds size limit");
        out.push_back(static_cast<std::uint8_t>(symbol));
        continue;
      }
      if (symbol == 256) return true;

      symbol -= 257;
      if (symbol >= static_cast<int>(kLenBase.size())) return fail("invalid length symbol");
      const std::size_t len = kLenBase[static_cast<std::size_t>(symbol)] +
                              static_cast<std::size_t>(br.bits(kLenExtra[static_cast<std::size_t>(symbol)]));

      const int dsym = DecodeSymbol(br, distcode);
      if (br.overrun()) return fail("truncated compressed block");
      if (dsym < 0 || dsym >= static_cast<int>(kDistBase.size())) return fail("invalid distance symbol");
      const std::size_t dist = kDistBase[static_cast<std::size_t>(dsym)] +
                               static_cast<std::size_t>(br.bits(kDistExtra[static_cast<std::size_t>(dsym)]));
      if (br.overrun()) return fail("truncated compressed block");
      if (dist > out.size()) return fail("distance too far back");
      if (out.size() + len > maxOutput) return fail("inflated data exceeds size limit");

      // Byte-by-byte copy: source and destination may overlap.
      const std::size_t from = out.size() - dist;
      for (std::size_t k = 0; k < len; ++k) {
        const std::uint8_t b = out[from + k];
        out.push_back(b);
      }
    }
  }

  bool fixed()
  {
    static const std::pair<Huffman, Huffman> tables = [] {
      std::array<std::uint8_t, kFixedLitLenCodes> lengths{};
      int s = 0;
      for (; s < 144; ++s) lengths[static_cast<std::size_t>(s)] = 8;
      for (; s < 256; ++s) lengths[static_cast<std::size_t>(s)] = 9;
      for (; s < 280; ++s) lengths[static_cast<std::size_t>(s)] = 7;
      for (; s < kFixedLitLenCodes; ++s) lengths[static_cast<std::size_t>(s)] = 8;

      std::pair<Huffman, Huffman> t;
      (void)BuildHuffman(t.first, lengths.data(), kFixedLitLenCodes);

      std::array<std::uint8_t, kMaxDistCodes> dl{};
      dl.fill(5);
      (void)BuildHuffman(t.second, dl.data(), kMaxDistCodes);
      return t;
    }();
    return codes(tables.first, tables.second);
  }

  bool dynamic()
  {
    const int nlen = br.bits(5) + 257;
    const int ndist = br.bits(5) + 1;
    const int ncode = br.bits(4) + 4;
    if (br.overrun()) return fail("truncated dynamic block header");
    if (nlen > kMaxLitLenCodes || ndist > kMaxDistCodes) return fail("bad dynamic block code counts");

    std::array<std::uint8_t, kMaxLitLenCodes + kMaxDistCodes> lengths{};
    for (int i = 0; i < ncode; ++i) {
      lengths[kCodeLengthOrder[static_cast<std::size_t>(i)]] = static_cast<std::uint8_t>(br.bits(3));
    }
    if (br.overrun()) return fail("truncated code length codes");

    Huffman lencode;
    if (BuildHuffman(lencode, lengths.data(), 19) != 0) return fail("incomplete code length code");

    int index = 0;
    while (index < nlen + ndist) {
      int symbol = DecodeSymbol(br, lencode);
      if (br.overrun()) return fail("truncated code lengths");
      if (symbol < 0) return fail("invalid code length symbol");

      if (symbol < 16) {
        lengths[static_cast<std::size_t>(index++)] = static_cast<std::uint8_t>(symbol);
        continue;
      }

      std::uint8_t len = 0;
      int repeat = 0;
      if (symbol == 16) {
        if (index == 0) return fail("repeat with no previous length");
        len = lengths[static_cast<std::size_t>(index - 1)];
        repeat = 3 + br.bits(2);
      } else if (symbol == 17) {
        repeat = 3 + br.bits(3);
      } else {
        repeat = 11 + br.bits(7);
      }
      if (br.overrun()) return fail("truncated code lengths");
      if (index + repeat > nlen + ndist) return fail("too many code lengths");
      while (repeat-- > 0) lengths[static_cast<std::size_t>(index++)] = len;
    }

    if (lengths[256] == 0) return fail("missing end-of-block code");

    Huffman litcode;
    int rc = BuildHuffman(litcode, lengths.data(), nlen);
    if (rc < 0 || (rc > 0 && nlen - litcode.count[0] != 1)) return fail("invalid literal/length code lengths");

    Huffman distcode;
    rc = BuildHuffman(distcode, lengths.data() + nlen, ndist);
    if (rc < 0 || (rc > 0 && ndist - distcode.count[0] != 1)) return fail("invalid distance code lengths");

    return codes(litcode, distcode);
  }

  bool run()
  {
    bool last = false;
    while (!last) {
      last = br.bits(1) != 0;
      const int type = br.bits(2);
      if (br.overrun()) return fail("truncated block header");

      bool ok = false;
      switch (type) {
      case 0: ok = stored(); break;
      case 1: ok = fixed(); break;
      case 2: ok = dynamic(); break;
      default: return fail("invalid block type");
      }
      if (!ok) return false;
    }
    return true;
  }
};

} // namespace

bool InflateRaw(const std::uint8_t* data, std::size_t size, std::vector<std::uint8_t>& out, std::string& outError,
                std::size_t* outConsumed, std::size_t maxOutput)
{
  out.clear();
  outError.clear();
  if (!data || size == 0) {
    outError = "empty DEFLATE stream";
    return false;
  }

  Inflater inf{BitReader(data, size), out, maxOutput, {}};
  if (!inf.run()) {
    outError = inf.err;
    return false;
  }
  if (outConsumed) *outConsumed = inf.br.pos();
  return true;
}

bool InflateZlib(const std::vector<std::uint8_t>& in, std::vector<std::uint8_t>& out, std::string& outError,
                 std::size_t maxOutput)
{
  out.clear();
  outError.clear();

  if (in.size() < 2 + 4) {
    outError = "zlib stream too small";
    return false;
  }

  const unsigned cmf = in[0];
  const unsigned flg = in[1];
  if (((cmf << 8) | flg) % 31u != 0u) {
    outError = "invalid zlib header (FCHECK)";
    return false;
  }
  if ((cmf & 0x0Fu) != 8u || (cmf >> 4) > 7u) {
    outError = "unsupported zlib compression method (expected DEFLATE)";
    return false;
  }
  if ((flg & 0x20u) != 0u) {
    outError = "unsupported zlib preset dictionary";
    return false;
  }

  std::size_t consumed = 0;
  std::string err;
  if (!InflateRaw(in.data() + 2, in.size() - 2, out, err, &consumed, maxOutput)) {
    outError = err;
    return false;
  }

  const std::size_t pos = 2 + consumed;
  if (pos + 4 > in.size()) {
    outError = "missing Adler32";
    return false;
  }

  const std::uint32_t expected = (static_cast<std::uint32_t>(in[pos + 0]) << 24) |
                                 (static_cast<std::uint32_t>(in[pos + 1]) << 16) |
                                 (static_cast<std::uint32_t>(in[pos + 2]) << 8) | static_cast<std::uint32_t>(in[pos + 3]);
  const std::uint32_t got = Adler32(out);
  if (got != expected) {
    std::ostringstream oss;
    oss << "Adler32 mismatch (expected 0x" << std::hex << expected << ", got 0x" << got << ")";
    outError = oss.str();
    return false;
  }
  return true;
}

std::vector<std::uint8_t> CompressZlibStored(const std::uint8_t* data, std::size_t size)
{
  std::vector<std::uint8_t> out;
  out.reserve(size + size / 65535u * 5u + 16u);

  // CMF=0x78 (deflate, 32K window), FLG=0x01 (fastest, FCHECK ok).
  out.push_back(0x78u);
  out.push_back(0x01u);

  std::size_t off = 0;
  do {
    const std::size_t chunk = std::min<std::size_t>(size - off, 65535u);
    const bool final = (off + chunk == size);
    out.push_back(final ? 0x01u : 0x00u);
    out.push_back(static_cast<std::uint8_t>(chunk & 0xFFu));
    out.push_back(static_cast<std::uint8_t>((chunk >> 8) & 0xFFu));
    out.push_back(static_cast<std::uint8_t>(~chunk & 0xFFu));
    out.push_back(static_cast<std::uint8_t>((~chunk >> 8) & 0xFFu));
    if (chunk > 0) out.insert(out.end(), data + off, data + off + chunk);
    off += chunk;
  } while (off < size);

  const std::uint32_t adler = Adler32Update(1u, data, size);
  out.push_back(static_cast<std::uint8_t>((adler >> 24) & 0xFFu));
  out.push_back(static_cast<std::uint8_t>((adler >> 16) & 0xFFu));
  out.push_back(static_cast<std::uint8_t>((adler >> 8) & 0xFFu));
  out.push_back(static_cast<std::uint8_t>(adler & 0xFFu));
  return out;
}

} // namespace footprint

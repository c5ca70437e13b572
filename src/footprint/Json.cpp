#include "footprint/Json.hpp"

#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <iterator>
#include <ostream>
#include <sstream>

namespace footprint {

JsonValue JsonValue::MakeNull()
{
  return JsonValue{};
}

JsonValue JsonValue::MakeBool(bool b)
{
  JsonValue v;
  v.type = Type::Bool;
  v.boolValue = b;
  return v;
}

JsonValue JsonValue::MakeNumber(double n)
{
  JsonValue v;
  v.type = Type::Number;
  v.numberValue = n;
  return v;
}

JsonValue JsonValue::MakeString(std::string s)
{
  JsonValue v;
  v.type = Type::String;
  v.stringValue = std::move(s);
  return v;
}

JsonValue JsonValue::MakeArray()
{
  JsonValue v;
  v.type = Type::Array;
  return v;
}

JsonValue JsonValue::MakeObject()
{
  JsonValue v;
  v.type = Type::Object;
  return v;
}

const JsonValue* FindJsonMember(const JsonValue& obj, const std::string& key)
{
  if (!obj.isObject()) return nullptr;
  for (const auto& kv : obj.objectValue) {
    if (kv.first == key) return &kv.second;
  }
  return nullptr;
}

JsonValue* FindJsonMember(JsonValue& obj, const std::string& key)
{
  if (!obj.isObject()) return nullptr;
  for (auto& kv : obj.objectValue) {
    if (kv.first == key) return &kv.second;
  }
  return nullptr;
}

std::string JsonEscape(const std::string& s)
{
  static const char* hex = "0123456789abcdef";

  std::string out;
  out.reserve(s.size() + 8);
  for (unsigned char ch : s) {
    switch (ch) {
    case '\\': out += "\\\\"; break;
    case '"': out += "\\\""; break;
    case '\b': out += "\\b"; break;
    case '\f': out += "\\f"; break;
    case '\n': out += "\\n"; break;
    case '\r': out += "\\r"; break;
    case '\t': out += "\\t"; break;
    default:
      if (ch < 0x20) {
        out += "\\u00";
        out.push_back(hex[(ch >> 4) & 0xF]);
        out.push_back(hex[ch & 0xF]);
      } else {
        out.push_back(static_cast<char>(ch));
      }
      break;
    }
  }
  return out;
}

namespace {

void AppendUtf8(std::string& out, std::uint32_t cp)
{
  if (cp <= 0x7Fu) {
    out.push_back(static_cast<char>(cp));
  } else if (cp <= 0x7FFu) {
    out.push_back(static_cast<char>(0xC0u | (cp >> 6)));
    out.push_back(static_cast<char>(0x80u | (cp & 0x3Fu)));
  } else if (cp <= 0xFFFFu) {
    out.push_back(static_cast<char>(0xE0u | (cp >> 12)));
    out.push_back(static_cast<char>(0x80u | ((cp >> 6) & 0x3Fu)));
    out.push_back(static_cast<char>(0x80u | (cp & 0x3Fu)));
  } else {
    out.push_back(static_cast<char>(0xF0u | (cp >> 18)));
    out.push_back(static_cast<char>(0x80u | ((cp >> 12) & 0x3Fu)));
    out.push_back(static_cast<char>(0x80u | ((cp >> 6) & 0x3Fu)));
    out.push_back(static_cast<char>(0x80u | (cp & 0x3Fu)));
  }
}

struct Parser {
  const std::string& s;
  std::size_t i = 0;
  int depth = 0;
  std::string err;

  explicit Parser(const std::string& str) : s(str) {}

  void skipWs()
  {
    while (i < s.size() && std::isspace(static_cast<unsigned char>(s[i])) != 0) ++i;
  }

  char peek() const { return i < s.size() ? s[i] : '\0'; }

  bool consume(char c)
  {
    if (peek() != c) return false;
    ++i;
    return true;
  }

  bool fail(const std::string& msg)
  {
    std::ostringstream oss;
    oss << "JSON parse error @" << i << ": " << msg;
    err = oss.str();
    return false;
  }

  bool parseValue(JsonValue& out)
  {
    skipWs();
    const char c = peek();
    if (c == '\0') return fail("unexpected end of input");

    if (c == 'n') return parseLiteral("null", JsonValue::MakeNull(), out);
    if (c == 't') return parseLiteral("true", JsonValue::MakeBool(true), out);
    if (c == 'f') return parseLiteral("false", JsonValue::MakeBool(false), out);
    if (c == '"') {
      std::string tmp;
      if (!parseString(tmp)) return false;
      out = JsonValue::MakeString(std::move(tmp));
      return true;
    }
    if (c == '[' || c == '{') {
      if (depth >= kMaxJsonDepth) return fail("nesting too deep");
      ++depth;
      const bool ok = (c == '[') ? parseArray(out) : parseObject(out);
      --depth;
      return ok;
    }
    if (c == '-' || std::isdigit(static_cast<unsigned char>(c)) != 0) return parseNumber(out);

    return fail(std::string("unexpected character '") + c + "'");
  }

  bool parseLiteral(const char* word, JsonValue v, JsonValue& out)
  {
    const std::string w(word);
    if (s.compare(i, w.size(), w) != 0) return fail("expected '" + w + "'");
    i += w.size();
    out = std::move(v);
    return true;
  }

  bool parseDigits()
  {
    if (std::isdigit(static_cast<unsigned char>(peek())) == 0) return false;
    while (std::isdigit(static_cast<unsigned char>(peek())) != 0) ++i;
    return true;
  }

  bool parseNumber(JsonValue& out)
  {
    const std::size_t start = i;

    if (peek() == '-') ++i;
    if (peek() == '0') {
      ++i;
    } else if (!parseDigits()) {
      return fail("expected digit");
    }

    if (consume('.') && !parseDigits()) return fail("expected digit after '.'");

    if (peek() == 'e' || peek() == 'E') {
      ++i;
      if (peek() == '+' || peek() == '-') ++i;
      if (!parseDigits()) return fail("expected exponent digits");
    }

    const std::string numStr = s.substr(start, i - start);
    errno = 0;
    char* end = nullptr;
    const double v = std::strtod(numStr.c_str(), &end);
    if (errno == ERANGE || end == numStr.c_str() || (end && *end != '\0')) return fail("invalid number");

    out = JsonValue::MakeNumber(v);
    return true;
  }

  bool parseHex4(std::uint32_t& code)
  {
    if (i + 4 > s.size()) return fail("invalid \\u escape");
    code = 0;
    for (int k = 0; k < 4; ++k) {
      const char h = s[i++];
      code <<= 4;
      if (h >= '0' && h <= '9') code |= static_cast<std::uint32_t>(h - '0');
      else if (h >= 'a' && h <= 'f') code |= static_cast<std::uint32_t>(h - 'a' + 10);
      else if (h >= 'A' && h <= 'F') code |= static_cast<std::uint32_t>(h - 'A' + 10);
      else return fail("invalid hex digit in \\u escape");
    }
    return true;
  }

  bool parseString(std::string& out)
  {
    if (!consume('"')) return fail("expected string");

    std::string result;
    while (i < s.size()) {
      const char c = s[i++];
      if (c == '"') {
        out = std::move(result);
        return true;
      }
      if (static_cast<unsigned char>(c) < 0x20u) return fail("control character in string");
      if (c != '\\') {
        result.push_back(c);
        continue;
      }

      if (i >= s.size()) return fail("unterminated escape sequence");
      const char e = s[i++];
      switch (e) {
      case '"': result.push_back('"'); break;
      case '\\': result.push_back('\\'); break;
      case '/': result.push_back('/'); break;
      case 'b': result.push_back('\b'); break;
      case 'f': result.push_back('\f'); break;
      case 'n': result.push_back('\n'); break;
      case 'r': result.push_back('\r'); break;
      case 't': result.push_back('\t'); break;
      case 'u': {
        std::uint32_t code = 0;
        if (!parseHex4(code)) return false;
        if (code >= 0xD800u && code <= 0xDBFFu) {
          if (s.compare(i, 2, "\\u") != 0) return fail("unpaired high surrogate");
          i += 2;
          std::uint32_t low = 0;
          if (!parseHex4(low)) return false;
          if (low < 0xDC00u || low > 0xDFFFu) return fail("invalid low surrogate");
          code = 0x10000u + ((code - 0xD800u) << 10) + (low - 0xDC00u);
        } else if (code >= 0xDC00u && code <= 0xDFFFu) {
          return fail("unpaired low surrogate");
        }
        AppendUtf8(result, code);
        break;
      }
      default: return fail("unknown escape sequence");
      }
    }

    return fail("unterminated string");
  }

  bool parseArray(JsonValue& out)
  {
    if (!consume('[')) return fail("expected '['");

    JsonValue arr = JsonValue::MakeArray();
    skipWs();
    if (consume(']')) {
      out = std::move(arr);
      return true;
    }

    while (true) {
      JsonValue v;
      if (!parseValue(v)) return false;
      arr.arrayValue.push_back(std::move(v));

      skipWs();
      if (consume(']')) break;
      if (!consume(',')) return fail("expected ',' or ']'");
    }

    out = std::move(arr);
    return true;
  }

  bool parseObject(JsonValue& out)
  {
    if (!consume('{')) return fail("expected '{'");

    JsonValue obj = JsonValue::MakeObject();
    skipWs();
    if (consume('}')) {
      out = std::move(obj);
      return true;
    }

    while (true) {
      skipWs();
      std::string key;
      if (!parseString(key)) return false;

      skipWs();
      if (!consume(':')) return fail("expected ':'");

      JsonValue val;
      if (!parseValue(val)) return false;
      obj.objectValue.emplace_back(std::move(key), std::move(val));

      skipWs();
      if (consume('}')) break;
      if (!consume(',')) return fail("expected ',' or '}'");
    }

    out = std::move(obj);
    return true;
  }
};

std::string FormatNumber(double n)
{
  // Integers print without a fraction; everything else keeps round-trip precision.
  if (std::fabs(n) < 9.0e15 && n == std::floor(n)) {
    std::ostringstream oss;
    oss << static_cast<long long>(n);
    return oss.str();
  }
  // Prefer the short form (0.1 rather than 0.10000000000000001) when it reads back exactly.
  std::ostringstream shortOss;
  shortOss.precision(15);
  shortOss << n;
  if (std::strtod(shortOss.str().c_str(), nullptr) == n) return shortOss.str();

  std::ostringstream oss;
  oss.precision(17);
  oss << n;
  return oss.str();
}

} // namespace

bool ParseJson(const std::string& text, JsonValue& outValue, std::string& outError)
{
  Parser p(text);
  JsonValue v;
  if (!p.parseValue(v)) {
    outError = p.err;
    return false;
  }
  p.skipWs();
  if (p.i != text.size()) {
    outError = std::string("JSON parse error @") + std::to_string(p.i) + ": trailing characters";
    return false;
  }

  outValue = std::move(v);
  outError.clear();
  return true;
}

bool LoadJsonFile(const std::string& path, JsonValue& outValue, std::string& outError)
{
  std::ifstream f(path, std::ios::binary);
  if (!f) {
    outError = "failed to open " + path;
    return false;
  }
  const std::string text((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
  if (f.bad()) {
    outError = "failed while reading " + path;
    return false;
  }
  return ParseJson(text, outValue, outError);
}

std::string JsonStringify(const JsonValue& value, const JsonWriteOptions& opt)
{
  std::ostringstream oss;
  JsonWriter w(oss, opt);
  if (!w.value(value)) return {};
  return oss.str();
}

// -----------------------------------------------------------------------------------------------
// JsonWriter
// -----------------------------------------------------------------------------------------------

JsonWriter::JsonWriter(std::ostream& os, JsonWriteOptions opt) : m_os(&os), m_opt(opt) {}

bool JsonWriter::setError(std::string msg)
{
  if (m_error.empty()) m_error = std::move(msg);
  return false;
}

void JsonWriter::newline(std::size_t depth)
{
  if (!m_opt.pretty) return;
  *m_os << '\n';
  const std::size_t n = depth * static_cast<std::size_t>(m_opt.indent > 0 ? m_opt.indent : 0);
  for (std::size_t k = 0; k < n; ++k) *m_os << ' ';
}

bool JsonWriter::prepareValue()
{
  if (!ok()) return false;
  if (m_stack.empty()) {
    if (m_finished) return setError("JsonWriter: multiple top-level values");
    return true;
  }

  Frame& f = m_stack.back();
  if (f.kind == Frame::Kind::Object) {
    if (f.expectingKey) return setError("JsonWriter: value written without a key");
    return true;
  }

  if (!f.first) *m_os << ',';
  newline(m_stack.size());
  f.first = false;
  return true;
}

void JsonWriter::finishValue()
{
  if (m_stack.empty()) {
    m_finished = true;
    return;
  }
  Frame& f = m_stack.back();
  if (f.kind == Frame::Kind::Object) f.expectingKey = true;
}

bool JsonWriter::beginContainer(Frame::Kind kind, char openChar)
{
  if (!prepareValue()) return false;
  *m_os << openChar;
  Frame f;
  f.kind = kind;
  m_stack.push_back(f);
  return static_cast<bool>(*m_os) || setError("JsonWriter: stream failure");
}

bool JsonWriter::endContainer(Frame::Kind kind, char closeChar)
{
  if (!ok()) return false;
  if (m_stack.empty() || m_stack.back().kind != kind) return setError("JsonWriter: unbalanced container");
  const Frame f = m_stack.back();
  if (f.kind == Frame::Kind::Object && !f.expectingKey) return setError("JsonWriter: key without value");

  m_stack.pop_back();
  if (!f.first) newline(m_stack.size());
  *m_os << closeChar;
  finishValue();
  return static_cast<bool>(*m_os) || setError("JsonWriter: stream failure");
}

bool JsonWriter::beginObject() { return beginContainer(Frame::Kind::Object, '{'); }
bool JsonWriter::endObject() { return endContainer(Frame::Kind::Object, '}'); }
bool JsonWriter::beginArray() { return beginContainer(Frame::Kind::Array, '['); }
bool JsonWriter::endArray() { return endContainer(Frame::Kind::Array, ']'); }

bool JsonWriter::key(const std::string& k)
{
  if (!ok()) return false;
  if (m_stack.empty() || m_stack.back().kind != Frame::Kind::Object) {
    return setError("JsonWriter: key outside of an object");
  }
  Frame& f = m_stack.back();
  if (!f.expectingKey) return setError("JsonWriter: two keys in a row");

  if (!f.first) *m_os << ',';
  newline(m_stack.size());
  f.first = false;
  f.expectingKey = false;

  *m_os << '"' << JsonEscape(k) << '"' << ':';
  if (m_opt.pretty) *m_os << ' ';
  return true;
}

bool JsonWriter::nullValue()
{
  if (!prepareValue()) return false;
  *m_os << "null";
  finishValue();
  return true;
}

bool JsonWriter::boolValue(bool b)
{
  if (!prepareValue()) return false;
  *m_os << (b ? "true" : "false");
  finishValue();
  return true;
}

bool JsonWriter::numberValue(double n)
{
  if (!std::isfinite(n)) return setError("JsonWriter: non-finite number");
  if (!prepareValue()) return false;
  *m_os << FormatNumber(n);
  finishValue();
  return true;
}

bool JsonWriter::intValue(std::int64_t n)
{
  if (!prepareValue()) return false;
  *m_os << n;
  finishValue();
  return true;
}

bool JsonWriter::stringValue(const std::string& s)
{
  if (!prepareValue()) return false;
  *m_os << '"' << JsonEscape(s) << '"';
  finishValue();
  return true;
}

bool JsonWriter::value(const JsonValue& v)
{
  switch (v.type) {
  case JsonValue::Type::Null: return nullValue();
  case JsonValue::Type::Bool: return boolValue(v.boolValue);
  case JsonValue::Type::Number: return numberValue(v.numberValue);
  case JsonValue::Type::String: return stringValue(v.stringValue);
  case JsonValue::Type::Array:
    if (!beginArray()) return false;
    for (const JsonValue& e : v.arrayValue) {
      if (!value(e)) return false;
    }
    return endArray();
  case JsonValue::Type::Object:
    if (!beginObject()) return false;
    for (const auto& kv : v.objectValue) {
      if (!key(kv.first) || !value(kv.second)) return false;
    }
    return endObject();
  }
  return setError("JsonWriter: unknown value type");
}

} // namespace footprint

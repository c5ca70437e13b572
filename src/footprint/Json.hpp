#pragma once

#include <cstdint>
#include <iosfwd>
#include <string>
#include <utility>
#include <vector>

namespace footprint {

// JSON document tree for drawing files, config overrides and result reports.
//
// The parser accepts RFC 8259 only (a comment or trailing comma is an error). Every
// number becomes a double, object members keep file order, and \uXXXX escapes
// (surrogate pairs too) come out as UTF-8 so non-ASCII dimension labels survive.
struct JsonValue {
  enum class Type : std::uint8_t {
    Null,
    Bool,
    Number,
    String,
    Array,
    Object,
  };

  Type type = Type::Null;

  bool boolValue = false;
  double numberValue = 0.0;
  std::string stringValue;
  std::vector<JsonValue> arrayValue;
  std::vector<std::pair<std::string, JsonValue>> objectValue;

  static JsonValue MakeNull();
  static JsonValue MakeBool(bool b);
  static JsonValue MakeNumber(double n);
  static JsonValue MakeString(std::string s);
  static JsonValue MakeArray();
  static JsonValue MakeObject();

  bool isNull() const { return type == Type::Null; }
  bool isBool() const { return type == Type::Bool; }
  bool isNumber() const { return type == Type::Number; }
  bool isString() const { return type == Type::String; }
  bool isArray() const { return type == Type::Array; }
  bool isObject() const { return type == Type::Object; }
};

const JsonValue* FindJsonMember(const JsonValue& obj, const std::string& key);
JsonValue* FindJsonMember(JsonValue& obj, const std::string& key);

// Nesting deeper than this is rejected instead of recursing further.
constexpr int kMaxJsonDepth = 256;

bool ParseJson(const std::string& text, JsonValue& outValue, std::string& outError);

// Read a whole file and parse it.
bool LoadJsonFile(const std::string& path, JsonValue& outValue, std::string& outError);

// Body of a string literal: quotes, backslashes and control bytes escaped, no enclosing quotes.
std::string JsonEscape(const std::string& s);

struct JsonWriteOptions {
  bool pretty = true; // one member per line
  int indent = 2;
};

// Whole tree as text; empty when the tree holds a NaN or Inf.
std::string JsonStringify(const JsonValue& value, const JsonWriteOptions& opt = {});

// Writes reports straight to a stream, members in call order. The first misuse
// (a value where a key is due, a close that does not match, NaN or Inf) latches
// error() and every later call returns false.
class JsonWriter {
public:
  explicit JsonWriter(std::ostream& os, JsonWriteOptions opt = {});

  bool ok() const { return m_error.empty(); }
  const std::string& error() const { return m_error; }

  bool beginObject();
  bool endObject();
  bool beginArray();
  bool endArray();

  // Only valid directly inside an object.
  bool key(const std::string& k);

  bool nullValue();
  bool boolValue(bool b);
  bool numberValue(double n);
  bool intValue(std::int64_t n);
  bool stringValue(const std::string& s);

  // Emit a parsed tree as the next value.
  bool value(const JsonValue& v);

  bool member(const std::string& k, double n) { return key(k) && numberValue(n); }
  bool member(const std::string& k, int n) { return key(k) && intValue(n); }
  bool member(const std::string& k, bool b) { return key(k) && boolValue(b); }
  bool member(const std::string& k, const std::string& s) { return key(k) && stringValue(s); }
  bool member(const std::string& k, const char* s) { return key(k) && stringValue(s ? s : ""); }

  // The root value has been closed.
  bool finished() const { return m_finished; }

private:
  struct Frame {
    enum class Kind : std::uint8_t {
      Object,
      Array,
    };

    Kind kind = Kind::Object;
    bool first = true;

    // Objects alternate key/value; set while a key is due.
    bool expectingKey = true;
  };

  bool setError(std::string msg);
  void newline(std::size_t depth);

  // Separator and indentation for the next value; fails when a key is due.
  bool prepareValue();
  void finishValue();

  bool beginContainer(Frame::Kind kind, char openChar);
  bool endContainer(Frame::Kind kind, char closeChar);

  std::ostream* m_os = nullptr;
  JsonWriteOptions m_opt{};
  std::vector<Frame> m_stack;
  bool m_finished = false;
  std::string m_error;
};

} // namespace footprint

#include "urbanres/Json.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstddef>
#include <cstdlib>
#include <fstream>
#include <iomanip>
#include <sstream>

namespace urbanres {

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

const char* JsonTypeName(JsonValue::Type t)
{
  switch (t) {
  case JsonValue::Type::Null: return "null";
  case JsonValue::Type::Bool: return "bool";
  case JsonValue::Type::Number: return "number";
  case JsonValue::Type::String: return "string";
  case JsonValue::Type::Array: return "array";
  case JsonValue::Type::Object: return "object";
  }
  return "null";
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
  static const char* kHex = "0123456789abcdef";

  std::string out;
  out.reserve(s.size() + 8);
  for (const unsigned char ch : s) {
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
        out.push_back(kHex[(ch >> 4) & 0xF]);
        out.push_back(kHex[ch & 0xF]);
      } else {
        out.push_back(static_cast<char>(ch));
      }
      break;
    }
  }
  return out;
}

namespace {

constexpr int kMaxDepth = 256;

void AppendUtf8(std::string& out, std::uint32_t cp)
{
  if (cp < 0x80) {
    out.push_back(static_cast<char>(cp));
  } else if (cp < 0x800) {
    out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  } else if (cp < 0x10000) {
    out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  } else {
    out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  }
}

class Reader {
public:
  explicit Reader(const std::string& text) : m_s(text) {}

  bool document(JsonValue& out)
  {
    if (!value(out, 0)) return false;
    skipWs();
    if (m_i != m_s.size()) return fail("trailing characters after document");
    return true;
  }

  const std::string& error() const { return m_err; }

private:
  bool fail(const std::string& msg)
  {
    if (!m_err.empty()) return false;
    int line = 1;
    int col = 1;
    for (std::size_t k = 0; k < m_i && k < m_s.size(); ++k) {
      if (m_s[k] == '\n') {
        ++line;
        col = 1;
      } else {
        ++col;
      }
    }
    std::ostringstream oss;
    oss << "JSON parse error at line " << line << ", column " << col << ": " << msg;
    m_err = oss.str();
    return false;
  }

  void skipWs()
  {
    while (m_i < m_s.size()) {
      const char c = m_s[m_i];
      if (c != ' ' && c != '\t' && c != '\n' && c != '\r') break;
      ++m_i;
    }
  }

  char peek() const { return (m_i < m_s.size()) ? m_s[m_i] : '\0'; }

  bool eat(char c)
  {
    if (peek() != c) return false;
    ++m_i;
    return true;
  }

  bool literal(const char* word, JsonValue v, JsonValue& out)
  {
    const std::string w(word);
    if (m_s.compare(m_i, w.size(), w) != 0) return fail("expected '" + w + "'");
    m_i += w.size();
    out = std::move(v);
    return true;
  }

  bool value(JsonValue& out, int depth)
  {
    if (depth > kMaxDepth) return fail("nesting too deep");
    skipWs();

    const char c = peek();
    switch (c) {
    case '\0': return fail("unexpected end of input");
    case 'n': return literal("null", JsonValue::MakeNull(), out);
    case 't': return literal("true", JsonValue::MakeBool(true), out);
    case 'f': return literal("false", JsonValue::MakeBool(false), out);
    case '"': {
      std::string s;
      if (!string(s)) return false;
      out = JsonValue::MakeString(std::move(s));
      return true;
    }
    case '[': return array(out, depth);
    case '{': return object(out, depth);
    default: break;
    }

    if (c == '-' || std::isdigit(static_cast<unsigned char>(c)) != 0) return number(out);
    return fail(std::string("unexpected character '") + c + "'");
  }

  bool digits()
  {
    if (std::isdigit(static_cast<unsigned char>(peek())) == 0) return false;
    while (std::isdigit(static_cast<unsigned char>(peek())) != 0) ++m_i;
    return true;
  }

  bool number(JsonValue& out)
  {
    const std::size_t start = m_i;
    eat('-');
    if (!eat('0') && !digits()) return fail("expected digit");
    if (eat('.') && !digits()) return fail("expected digit after '.'");
    if (peek() == 'e' || peek() == 'E') {
      ++m_i;
      if (!eat('+')) eat('-');
      if (!digits()) return fail("expected exponent digits");
    }

    const std::string text = m_s.substr(start, m_i - start);
    errno = 0;
    char* end = nullptr;
    const double v = std::strtod(text.c_str(), &end);
    if (errno == ERANGE || end != text.c_str() + text.size()) return fail("number out of range: " + text);

    out = JsonValue::MakeNumber(v);
    return true;
  }

  bool hex4(std::uint32_t& out)
  {
    if (m_i + 4 > m_s.size()) return fail("truncated \\u escape");
    out = 0;
    for (int k = 0; k < 4; ++k) {
      const char h = m_s[m_i++];
      out <<= 4;
      if (h >= '0' && h <= '9') out |= static_cast<std::uint32_t>(h - '0');
      else if (h >= 'a' && h <= 'f') out |= static_cast<std::uint32_t>(h - 'a' + 10);
      else if (h >= 'A' && h <= 'F') out |= static_cast<std::uint32_t>(h - 'A' + 10);
      else return fail("invalid hex digit in \\u escape");
    }
    return true;
  }

  bool string(std::string& out)
  {
    if (!eat('"')) return fail("expected string");

    out.clear();
    while (m_i < m_s.size()) {
      const char c = m_s[m_i++];
      if (c == '"') return true;
      if (static_cast<unsigned char>(c) < 0x20) return fail("control character in string");
      if (c != '\\') {
        out.push_back(c);
        continue;
      }

      if (m_i >= m_s.size()) break;
      const char e = m_s[m_i++];
      switch (e) {
      case '"': out.push_back('"'); break;
      case '\\': out.push_back('\\'); break;
      case '/': out.push_back('/'); break;
      case 'b': out.push_back('\b'); break;
      case 'f': out.push_back('\f'); break;
      case 'n': out.push_back('\n'); break;
      case 'r': out.push_back('\r'); break;
      case 't': out.push_back('\t'); break;
      case 'u': {
        std::uint32_t cp = 0;
        if (!hex4(cp)) return false;
        if (cp >= 0xD800 && cp <= 0xDBFF) {
          std::uint32_t lo = 0;
          if (!eat('\\') || !eat('u') || !hex4(lo) || lo < 0xDC00 || lo > 0xDFFF) {
            return fail("unpaired surrogate in \\u escape");
          }
          cp = 0x10000 + ((cp - 0xD800) << 10) + (lo - 0xDC00);
        }
        AppendUtf8(out, cp);
        break;
      }
      default: return fail(std::string("unknown escape '\\") + e + "'");
      }
    }
    return fail("unterminated string");
  }

  bool array(JsonValue& out, int depth)
  {
    eat('[');
    JsonValue arr = JsonValue::MakeArray();

    skipWs();
    if (!eat(']')) {
      while (true) {
        JsonValue v;
        if (!value(v, depth + 1)) return false;
        arr.arrayValue.push_back(std::move(v));

        skipWs();
        if (eat(']')) break;
        if (!eat(',')) return fail("expected ',' or ']'");
      }
    }

    out = std::move(arr);
    return true;
  }

  bool object(JsonValue& out, int depth)
  {
    eat('{');
    JsonValue obj = JsonValue::MakeObject();

    skipWs();
    if (!eat('}')) {
      while (true) {
        skipWs();
        std::string k;
        if (!string(k)) return false;

        skipWs();
        if (!eat(':')) return fail("expected ':'");

        JsonValue v;
        if (!value(v, depth + 1)) return false;
        obj.objectValue.emplace_back(std::move(k), std::move(v));

        skipWs();
        if (eat('}')) break;
        if (!eat(',')) return fail("expected ',' or '}'");
      }
    }

    out = std::move(obj);
    return true;
  }

  const std::string& m_s;
  std::size_t m_i = 0;
  std::string m_err;
};

} // namespace

bool ParseJson(const std::string& text, JsonValue& outValue, std::string& outError)
{
  Reader r(text);
  JsonValue v;
  if (!r.document(v)) {
    outError = r.error();
    return false;
  }
  outValue = std::move(v);
  outError.clear();
  return true;
}

bool ParseJsonFile(const std::string& path, JsonValue& outValue, std::string& outError)
{
  std::ifstream f(path, std::ios::binary);
  if (!f) {
    outError = "failed to open file: " + path;
    return false;
  }
  std::ostringstream oss;
  oss << f.rdbuf();
  if (!ParseJson(oss.str(), outValue, outError)) {
    outError = path + ": " + outError;
    return false;
  }
  return true;
}

// -----------------------------------------------------------------------------------------------
// JsonWriter
// -----------------------------------------------------------------------------------------------

JsonWriter::JsonWriter(std::ostream& os, JsonWriteOptions opt)
    : m_os(os)
    , m_opt(opt)
{
}

bool JsonWriter::setError(std::string msg)
{
  if (m_error.empty()) m_error = std::move(msg);
  return false;
}

void JsonWriter::newline(std::size_t depth)
{
  if (!m_opt.pretty) return;
  m_os << '\n';
  for (std::size_t i = 0; i < depth * static_cast<std::size_t>(std::max(0, m_opt.indent)); ++i) m_os << ' ';
}

bool JsonWriter::prepareValue()
{
  if (!ok()) return false;
  if (m_finished) return setError("JsonWriter: value after the document was complete");
  if (m_stack.empty()) return true;

  Frame& f = m_stack.back();
  if (f.object) {
    if (f.expectingKey) return setError("JsonWriter: value written where an object key was expected");
    return true;
  }

  if (!f.first) m_os << ',';
  newline(m_stack.size());
  f.first = false;
  return true;
}

bool JsonWriter::finishValue()
{
  if (m_stack.empty()) {
    m_finished = true;
  } else if (m_stack.back().object) {
    m_stack.back().expectingKey = true;
  }
  if (!m_os) return setError("JsonWriter: stream write failed");
  return true;
}

bool JsonWriter::beginContainer(bool object)
{
  if (!prepareValue()) return false;
  m_os << (object ? '{' : '[');
  m_stack.push_back(Frame{object, true, true});
  return true;
}

bool JsonWriter::endContainer(bool object)
{
  if (!ok()) return false;
  if (m_stack.empty() || m_stack.back().object != object) {
    return setError(object ? "JsonWriter: endObject without matching beginObject"
                           : "JsonWriter: endArray without matching beginArray");
  }
  const Frame f = m_stack.back();
  if (object && !f.expectingKey) return setError("JsonWriter: object key without a value");

  m_stack.pop_back();
  if (!f.first) newline(m_stack.size());
  m_os << (object ? '}' : ']');
  return finishValue();
}

bool JsonWriter::beginObject()
{
  return beginContainer(true);
}

bool JsonWriter::endObject()
{
  return endContainer(true);
}

bool JsonWriter::beginArray()
{
  return beginContainer(false);
}

bool JsonWriter::endArray()
{
  return endContainer(false);
}

bool JsonWriter::key(const std::string& k)
{
  if (!ok()) return false;
  if (m_stack.empty() || !m_stack.back().object || !m_stack.back().expectingKey) {
    return setError("JsonWriter: key '" + k + "' outside of an object member position");
  }

  Frame& f = m_stack.back();
  if (!f.first) m_os << ',';
  newline(m_stack.size());
  f.first = false;
  f.expectingKey = false;

  m_os << '"' << JsonEscape(k) << '"' << (m_opt.pretty ? ": " : ":");
  return true;
}

bool JsonWriter::nullValue()
{
  if (!prepareValue()) return false;
  m_os << "null";
  return finishValue();
}

bool JsonWriter::boolValue(bool b)
{
  if (!prepareValue()) return false;
  m_os << (b ? "true" : "false");
  return finishValue();
}

bool JsonWriter::numberValue(double n)
{
  if (!std::isfinite(n)) return setError("JsonWriter: non-finite number");
  if (!prepareValue()) return false;

  if (n == std::floor(n) && std::fabs(n) < 1e15) {
    m_os << static_cast<std::int64_t>(n);
  } else {
    std::ostringstream oss;
    oss << std::setprecision(m_opt.precision) << n;
    m_os << oss.str();
  }
  return finishValue();
}

bool JsonWriter::intValue(std::int64_t n)
{
  if (!prepareValue()) return false;
  m_os << n;
  return finishValue();
}

bool JsonWriter::uintValue(std::uint64_t n)
{
  if (!prepareValue()) return false;
  m_os << n;
  return finishValue();
}

bool JsonWriter::stringValue(const std::string& s)
{
  if (!prepareValue()) return false;
  m_os << '"' << JsonEscape(s) << '"';
  return finishValue();
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
    for (const JsonValue& item : v.arrayValue) {
      if (!value(item)) return false;
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

bool WriteJson(std::ostream& os, const JsonValue& value, std::string& outError, const JsonWriteOptions& opt)
{
  JsonWriter w(os, opt);
  if (!w.value(value)) {
    outError = w.error();
    return false;
  }
  if (opt.pretty) os << '\n';
  if (!os) {
    outError = "stream write failed";
    return false;
  }
  outError.clear();
  return true;
}

std::string JsonStringify(const JsonValue& value, const JsonWriteOptions& opt)
{
  std::ostringstream oss;
  std::string err;
  if (!WriteJson(oss, value, err, opt)) return std::string();
  return oss.str();
}

bool WriteJsonFile(const std::string& path, const JsonValue& value, std::string& outError, const JsonWriteOptions& opt)
{
  std::ofstream f(path, std::ios::binary);
  if (!f) {
    outError = "failed to open for writing: " + path;
    return false;
  }
  if (!WriteJson(f, value, outError, opt)) return false;
  f.close();
  if (!f) {
    outError = "failed to write: " + path;
    return false;
  }
  return true;
}

} // namespace urbanres

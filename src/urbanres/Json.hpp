#pragma once

#include <cstdint>
#include <iosfwd>
#include <string>
#include <utility>
#include <vector>

namespace urbanres {

// Minimal JSON document model, parser and streaming writer.
//
// Configs, tree inputs, obstruction sets and every exported result go through this file,
// so the headless tools stay free of third-party JSON libraries.
//
// Notes:
//  - Strict JSON: no comments, no trailing commas.
//  - Numbers are parsed as double.
//  - Objects keep their members in document order.
//  - \u escapes (including surrogate pairs) decode to UTF-8.
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

const char* JsonTypeName(JsonValue::Type t);

const JsonValue* FindJsonMember(const JsonValue& obj, const std::string& key);
JsonValue* FindJsonMember(JsonValue& obj, const std::string& key);

// Errors carry the 1-based line and column of the offending character.
bool ParseJson(const std::string& text, JsonValue& outValue, std::string& outError);

bool ParseJsonFile(const std::string& path, JsonValue& outValue, std::string& outError);

// Escape a string to be used inside a JSON string literal (without surrounding quotes).
std::string JsonEscape(const std::string& s);

struct JsonWriteOptions {
  bool pretty = true;
  int indent = 2;

  // Significant digits for non-integral numbers.
  int precision = 10;
};

// Streaming writer. Callers control member order; misuse (a value where a key is
// expected, unbalanced containers, non-finite numbers) records an error and every later
// call returns false.
class JsonWriter {
public:
  explicit JsonWriter(std::ostream& os, JsonWriteOptions opt = {});

  bool ok() const { return m_error.empty(); }
  const std::string& error() const { return m_error; }

  // True once the top-level value is complete.
  bool finished() const { return m_finished; }

  bool beginObject();
  bool endObject();
  bool beginArray();
  bool endArray();

  bool key(const std::string& k);

  bool nullValue();
  bool boolValue(bool b);
  bool numberValue(double n);
  bool intValue(std::int64_t n);
  bool uintValue(std::uint64_t n);
  bool stringValue(const std::string& s);

  // Emit a whole document subtree in the current context.
  bool value(const JsonValue& v);

  // key(k) followed by a primitive.
  bool member(const std::string& k, double n) { return key(k) && numberValue(n); }
  bool member(const std::string& k, int n) { return key(k) && intValue(n); }
  bool member(const std::string& k, bool b) { return key(k) && boolValue(b); }
  bool member(const std::string& k, const std::string& s) { return key(k) && stringValue(s); }
  bool member(const std::string& k, const char* s) { return key(k) && stringValue(s); }

private:
  struct Frame {
    bool object = true;
    bool first = true;
    bool expectingKey = true; // objects only
  };

  bool setError(std::string msg);
  bool prepareValue();
  bool finishValue();
  bool beginContainer(bool object);
  bool endContainer(bool object);
  void newline(std::size_t depth);

  std::ostream& m_os;
  JsonWriteOptions m_opt;
  std::vector<Frame> m_stack;
  bool m_finished = false;
  std::string m_error;
};

bool WriteJson(std::ostream& os, const JsonValue& value, std::string& outError, const JsonWriteOptions& opt = {});

std::string JsonStringify(const JsonValue& value, const JsonWriteOptions& opt = {});

bool WriteJsonFile(const std::string& path, const JsonValue& value, std::string& outError,
                   const JsonWriteOptions& opt = {});

} // namespace urbanres

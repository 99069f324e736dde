// Implementation of minimal flat-object JSON parser.

#include "core/json_parser.h"

#include <cctype>
#include <cmath>
#include <cstdlib>

namespace engrave {

int JsonValue::asInt(int default_val) const {
  if (type == Number) return static_cast<int>(number_val);
  return default_val;
}

double JsonValue::asDouble(double default_val) const {
  if (type == Number) return number_val;
  return default_val;
}

bool JsonValue::asBool(bool default_val) const {
  if (type == Bool) return bool_val;
  return default_val;
}

std::string JsonValue::asString(const std::string& default_val) const {
  if (type == String) return string_val;
  return default_val;
}

bool JsonValue::isInteger() const {
  return type == Number && std::floor(number_val) == number_val;
}

namespace {

/// @brief Cursor over the input; every scan step reports failure by returning false.
class FlatJsonReader {
 public:
  explicit FlatJsonReader(std::string_view json) : json_(json) {}

  size_t pos() const { return pos_; }

  void skipWhitespace() {
    while (pos_ < json_.size() && std::isspace(static_cast<unsigned char>(json_[pos_]))) {
      ++pos_;
    }
  }

  bool atEnd() const { return pos_ >= json_.size(); }
  char peek() const { return atEnd() ? '\0' : json_[pos_]; }

  bool expect(char chr) {
    if (peek() != chr) return false;
    ++pos_;
    return true;
  }

  /// Parse a string literal (pos at opening quote).
  bool parseString(std::string& out) {
    if (!expect('"')) return false;
    out.clear();
    while (!atEnd() && json_[pos_] != '"') {
      if (json_[pos_] == '\\') {
        ++pos_;
        if (atEnd()) return false;
        switch (json_[pos_]) {
          case '"':  out += '"'; break;
          case '\\': out += '\\'; break;
          case '/':  out += '/'; break;
          case 'n':  out += '\n'; break;
          case 't':  out += '\t'; break;
          case 'r':  out += '\r'; break;
          case 'b':  out += '\b'; break;
          case 'f':  out += '\f'; break;
          default:   return false;
        }
      } else {
        out += json_[pos_];
      }
      ++pos_;
    }
    return expect('"');
  }

  bool parseNumber(double& out) {
    size_t start = pos_;
    if (peek() == '-') ++pos_;
    if (!std::isdigit(static_cast<unsigned char>(peek()))) return false;
    while (std::isdigit(static_cast<unsigned char>(peek()))) ++pos_;
    if (peek() == '.') {
      ++pos_;
      if (!std::isdigit(static_cast<unsigned char>(peek()))) return false;
      while (std::isdigit(static_cast<unsigned char>(peek()))) ++pos_;
    }
    if (peek() == 'e' || peek() == 'E') {
      ++pos_;
      if (peek() == '+' || peek() == '-') ++pos_;
      if (!std::isdigit(static_cast<unsigned char>(peek()))) return false;
      while (std::isdigit(static_cast<unsigned char>(peek()))) ++pos_;
    }
    std::string num_str(json_.substr(start, pos_ - start));
    out = std::strtod(num_str.c_str(), nullptr);
    return true;
  }

  bool parseLiteral(std::string_view word) {
    if (json_.substr(pos_, word.size()) != word) return false;
    pos_ += word.size();
    return true;
  }

  /// Skip a nested object or array, honoring strings inside it.
  bool skipContainer() {
    char open = peek();
    char close = (open == '{') ? '}' : ']';
    int depth = 0;
    std::string ignored;
    while (!atEnd()) {
      char chr = json_[pos_];
      if (chr == '"') {
        if (!parseString(ignored)) return false;
        continue;
      }
      if (chr == open) ++depth;
      if (chr == close && --depth == 0) {
        ++pos_;
        return true;
      }
      ++pos_;
    }
    return false;
  }

 private:
  std::string_view json_;
  size_t pos_ = 0;
};

}  // namespace

JsonParseResult parseJsonObject(std::string_view json) {
  JsonParseResult result;
  FlatJsonReader reader(json);

  auto fail = [&]() {
    result.success = false;
    result.values.clear();
    result.error_offset = reader.pos();
    return result;
  };

  reader.skipWhitespace();
  if (!reader.expect('{')) return fail();
  reader.skipWhitespace();

  if (!reader.expect('}')) {
    while (true) {
      reader.skipWhitespace();
      std::string key;
      if (!reader.parseString(key)) return fail();

      reader.skipWhitespace();
      if (!reader.expect(':')) return fail();
      reader.skipWhitespace();

      JsonValue val;
      char chr = reader.peek();
      if (chr == '"') {
        val.type = JsonValue::String;
        if (!reader.parseString(val.string_val)) return fail();
        result.values[key] = val;
      } else if (chr == 't' || chr == 'f') {
        val.type = JsonValue::Bool;
        val.bool_val = (chr == 't');
        if (!reader.parseLiteral(val.bool_val ? "true" : "false")) return fail();
        result.values[key] = val;
      } else if (chr == 'n') {
        if (!reader.parseLiteral("null")) return fail();
        result.values[key] = val;
      } else if (chr == '{' || chr == '[') {
        // Nested structure - skip it
        if (!reader.skipContainer()) return fail();
      } else {
        val.type = JsonValue::Number;
        if (!reader.parseNumber(val.number_val)) return fail();
        result.values[key] = val;
      }

      reader.skipWhitespace();
      if (reader.expect(',')) continue;
      if (reader.expect('}')) break;
      return fail();
    }
  }

  reader.skipWhitespace();
  if (!reader.atEnd()) return fail();
  result.success = true;
  return result;
}

const JsonValue* findJsonValue(const JsonObject& object, const std::string& key,
                               JsonValue::Type type) {
  auto iter = object.find(key);
  if (iter == object.end() || iter->second.type != type) return nullptr;
  return &iter->second;
}

}  // namespace engrave

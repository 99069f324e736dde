/// @file
/// @brief Implementation of the minimal JSON writer for structured output.

#include "core/json_helpers.h"

#include <cmath>
#include <cstdio>
#include <sstream>

namespace engrave {

void JsonWriter::beginObject() {
  maybeComma();
  buffer_ += '{';
  needs_comma_.push_back(false);
}

void JsonWriter::endObject() { closeContainer('}'); }

void JsonWriter::beginArray() {
  maybeComma();
  buffer_ += '[';
  needs_comma_.push_back(false);
}

void JsonWriter::endArray() { closeContainer(']'); }

void JsonWriter::closeContainer(char closer) {
  buffer_ += closer;
  if (!needs_comma_.empty()) needs_comma_.pop_back();
  if (!needs_comma_.empty()) needs_comma_.back() = true;
}

void JsonWriter::key(std::string_view name) {
  maybeComma();
  buffer_ += '"';
  buffer_ += escapeString(name);
  buffer_ += "\":";
  // The value for this key follows without a comma.
  if (!needs_comma_.empty()) needs_comma_.back() = false;
}

void JsonWriter::value(std::string_view val) {
  writeScalar("\"" + escapeString(val) + "\"");
}

void JsonWriter::value(int val) { writeScalar(std::to_string(val)); }
void JsonWriter::value(uint32_t val) { writeScalar(std::to_string(val)); }
void JsonWriter::value(int64_t val) { writeScalar(std::to_string(val)); }
void JsonWriter::value(uint64_t val) { writeScalar(std::to_string(val)); }

void JsonWriter::value(double val) {
  if (std::isnan(val) || std::isinf(val)) {
    writeScalar("null");
    return;
  }
  std::ostringstream oss;
  oss.precision(double_precision_);
  oss << val;
  writeScalar(oss.str());
}

void JsonWriter::value(bool val) { writeScalar(val ? "true" : "false"); }

void JsonWriter::valueNull() { writeScalar("null"); }

void JsonWriter::writeScalar(std::string_view text) {
  maybeComma();
  buffer_ += text;
  if (!needs_comma_.empty()) needs_comma_.back() = true;
}

std::string JsonWriter::toPrettyString(int indent_size) const {
  std::string result;
  result.reserve(buffer_.size() * 2);

  int depth = 0;
  bool in_string = false;
  bool escaped = false;

  auto indent = [&]() {
    result += '\n';
    result.append(static_cast<size_t>(depth * indent_size), ' ');
  };

  for (size_t pos = 0; pos < buffer_.size(); ++pos) {
    char chr = buffer_[pos];

    if (in_string) {
      result += chr;
      if (escaped) {
        escaped = false;
      } else if (chr == '\\') {
        escaped = true;
      } else if (chr == '"') {
        in_string = false;
      }
      continue;
    }

    switch (chr) {
      case '"':
        in_string = true;
        result += chr;
        break;

      case '{':
      case '[':
        result += chr;
        ++depth;
        // Empty containers stay compact: {} or [].
        if (pos + 1 < buffer_.size() &&
            (buffer_[pos + 1] == '}' || buffer_[pos + 1] == ']')) {
          break;
        }
        indent();
        break;

      case '}':
      case ']':
        if (!result.empty() && (result.back() == '{' || result.back() == '[')) {
          --depth;
          result += chr;
        } else {
          --depth;
          indent();
          result += chr;
        }
        break;

      case ',':
        result += chr;
        indent();
        break;

      case ':':
        result += ": ";
        break;

      default:
        result += chr;
        break;
    }
  }

  return result;
}

void JsonWriter::maybeComma() {
  if (!needs_comma_.empty() && needs_comma_.back()) {
    buffer_ += ',';
    needs_comma_.back() = false;
  }
}

std::string JsonWriter::escapeString(std::string_view input) {
  std::string result;
  result.reserve(input.size());

  for (char chr : input) {
    switch (chr) {
      case '"':  result += "\\\""; break;
      case '\\': result += "\\\\"; break;
      case '\b': result += "\\b";  break;
      case '\f': result += "\\f";  break;
      case '\n': result += "\\n";  break;
      case '\r': result += "\\r";  break;
      case '\t': result += "\\t";  break;
      default:
        // Control characters (0x00-0x1F) as \u00XX.
        if (static_cast<unsigned char>(chr) < 0x20) {
          char hex_buf[8];
          std::snprintf(hex_buf, sizeof(hex_buf), "\\u%04x",
                        static_cast<unsigned>(static_cast<unsigned char>(chr)));
          result += hex_buf;
        } else {
          result += chr;
        }
        break;
    }
  }

  return result;
}

}  // namespace engrave

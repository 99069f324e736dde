// Minimal JSON serialization writer (no external dependencies).
//
// Builds JSON output via a string-builder approach. Used for score
// diagnostics reports and layout geometry. Does not parse JSON.

#ifndef ENGRAVE_CORE_JSON_HELPERS_H
#define ENGRAVE_CORE_JSON_HELPERS_H

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace engrave {

/// @brief Simple JSON writer that builds a JSON string incrementally.
///
/// Usage:
/// @code
///   JsonWriter writer;
///   writer.beginObject();
///   writer.key("bar");
///   writer.value(3);
///   writer.key("x");
///   writer.value(120.5);
///   writer.endObject();
///   std::string json = writer.toString();
///   // -> {"bar":3,"x":120.5}
/// @endcode
///
/// Tracks comma insertion automatically. Does not validate structure
/// (caller must match begin/end pairs).
class JsonWriter {
 public:
  /// @param double_precision Significant digits written for doubles.
  explicit JsonWriter(int double_precision = 10) : double_precision_(double_precision) {}

  void beginObject();
  void endObject();
  void beginArray();
  void endArray();

  /// @brief Write an object key (must be followed by a value call).
  void key(std::string_view name);

  /// @brief Write a string value (JSON-escaped).
  void value(std::string_view val);
  void value(const char* val) { value(std::string_view(val)); }

  void value(int val);
  void value(uint32_t val);
  void value(int64_t val);
  void value(uint64_t val);

  /// @brief Write a floating-point value; NaN and infinity are written as null.
  void value(double val);

  void value(bool val);
  void valueNull();

  /// @brief Get the accumulated JSON string.
  std::string toString() const { return buffer_; }

  /// @brief Get the accumulated JSON string with pretty-print indentation.
  /// @param indent_size Number of spaces per indent level (default: 2).
  std::string toPrettyString(int indent_size = 2) const;

 private:
  /// Write a comma if needed before the next value/key.
  void maybeComma();

  /// Append a scalar token and mark the enclosing container non-empty.
  void writeScalar(std::string_view text);

  void closeContainer(char closer);

  static std::string escapeString(std::string_view input);

  std::string buffer_;
  int double_precision_;

  // One entry per open container: whether the next element needs a comma.
  std::vector<bool> needs_comma_;
};

}  // namespace engrave

#endif  // ENGRAVE_CORE_JSON_HELPERS_H

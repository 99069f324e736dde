// Minimal flat-object JSON parser for configuration input (no external dependencies).
//
// Handles only the subset needed for signature records, layout settings and
// glyph-metric tables: a flat object with string, number, boolean and null
// values. Nested objects and arrays are skipped.

#ifndef ENGRAVE_CORE_JSON_PARSER_H
#define ENGRAVE_CORE_JSON_PARSER_H

#include <cstddef>
#include <cstdint>
#include <map>
#include <string>
#include <string_view>

namespace engrave {

/// @brief A single JSON value (string, number, or boolean).
struct JsonValue {
  enum Type { String, Number, Bool, Null };
  Type type = Null;
  std::string string_val;
  double number_val = 0.0;
  bool bool_val = false;

  /// @brief Get value as integer, with default.
  int asInt(int default_val = 0) const;

  /// @brief Get value as double, with default.
  double asDouble(double default_val = 0.0) const;

  /// @brief Get value as boolean, with default.
  bool asBool(bool default_val = false) const;

  /// @brief Get value as string, with default.
  std::string asString(const std::string& default_val = "") const;

  /// @brief True when the number has no fractional part.
  bool isInteger() const;
};

/// Parsed key-value pairs of one object.
using JsonObject = std::map<std::string, JsonValue>;

/// @brief Outcome of parsing a flat JSON object.
struct JsonParseResult {
  bool success = false;
  JsonObject values;
  size_t error_offset = 0;  ///< Byte offset of the first malformed character.
};

/// @brief Parse a flat JSON object into a key-value map.
///
/// Only top-level keys with scalar values are kept; nested objects and arrays
/// are skipped. A later duplicate key overwrites the earlier one.
///
/// @param json JSON text.
/// @return Values on success, otherwise the offset where parsing stopped.
JsonParseResult parseJsonObject(std::string_view json);

/// @brief Look up a key and require a given type.
/// @return Pointer into the object, or nullptr when missing or of another type.
const JsonValue* findJsonValue(const JsonObject& object, const std::string& key,
                               JsonValue::Type type);

}  // namespace engrave

#endif  // ENGRAVE_CORE_JSON_PARSER_H

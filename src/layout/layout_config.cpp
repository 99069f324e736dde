// Implementation of layout settings loading.

#include "layout/layout_config.h"

#include "core/json_parser.h"

namespace engrave {

bool LayoutConfig::isValid() const {
  return page_width > 0.0 && max_bars_per_line > 0 && max_tokens_per_line > 0 &&
         shrink_tolerance >= 0.0 && stretch_tolerance >= 0.0;
}

LayoutConfigParseResult layoutConfigFromJson(std::string_view json) {
  LayoutConfigParseResult result;
  JsonParseResult parsed = parseJsonObject(json);
  if (!parsed.success) {
    result.error = "malformed JSON at offset " + std::to_string(parsed.error_offset);
    return result;
  }
  const JsonObject& values = parsed.values;
  LayoutConfig& config = result.config;

  struct DoubleField {
    const char* name;
    double* target;
  };
  const DoubleField doubles[] = {
      {"page_width", &config.page_width},
      {"shrink_tolerance", &config.shrink_tolerance},
      {"stretch_tolerance", &config.stretch_tolerance},
  };
  for (const auto& field : doubles) {
    auto iter = values.find(field.name);
    if (iter == values.end()) continue;
    if (iter->second.type != JsonValue::Number) {
      result.error = field.name;
      return result;
    }
    *field.target = iter->second.number_val;
  }

  struct CountField {
    const char* name;
    size_t* target;
  };
  const CountField counts[] = {
      {"max_bars_per_line", &config.max_bars_per_line},
      {"max_tokens_per_line", &config.max_tokens_per_line},
  };
  for (const auto& field : counts) {
    auto iter = values.find(field.name);
    if (iter == values.end()) continue;
    if (!iter->second.isInteger() || iter->second.number_val < 1.0) {
      result.error = field.name;
      return result;
    }
    *field.target = static_cast<size_t>(iter->second.number_val);
  }

  struct BoolField {
    const char* name;
    bool* target;
  };
  const BoolField flags[] = {
      {"ragged_last_line", &config.ragged_last_line},
      {"verbose", &config.verbose},
  };
  for (const auto& field : flags) {
    auto iter = values.find(field.name);
    if (iter == values.end()) continue;
    if (iter->second.type != JsonValue::Bool) {
      result.error = field.name;
      return result;
    }
    *field.target = iter->second.bool_val;
  }

  if (!config.isValid()) {
    result.error = "invalid layout settings";
    return result;
  }
  result.success = true;
  return result;
}

}  // namespace engrave

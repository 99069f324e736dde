// Implementation of glyph metric tables.

#include "layout/glyph_metrics.h"

#include "core/json_parser.h"

namespace engrave {

const char* glyphCategoryToString(GlyphCategory category) {
  switch (category) {
    case GlyphCategory::Notehead:   return "notehead";
    case GlyphCategory::Accidental: return "accidental";
    case GlyphCategory::FlagUnit:   return "flag_unit";
    case GlyphCategory::Dynamic:    return "dynamic";
    case GlyphCategory::Barline:    return "barline";
    case GlyphCategory::Marking:    return "marking";
    case GlyphCategory::Measure:    return "measure";
    case GlyphCategory::GraceScale: return "grace_scale";
  }
  return "unknown";
}

std::optional<GlyphCategory> glyphCategoryFromString(std::string_view name) {
  for (int idx = 0; idx < kGlyphCategoryCount; ++idx) {
    auto category = static_cast<GlyphCategory>(idx);
    if (name == glyphCategoryToString(category)) return category;
  }
  return std::nullopt;
}

TableGlyphMetrics::TableGlyphMetrics()
    : widths_{{
          266.0,   // Notehead
          250.0,   // Accidental
          100.0,   // FlagUnit
          400.0,   // Dynamic
          36.0,    // Barline
          200.0,   // Marking
          3200.0,  // Measure
          0.6,     // GraceScale
      }} {}

double TableGlyphMetrics::width(GlyphCategory category) const {
  return widths_[static_cast<size_t>(category)];
}

void TableGlyphMetrics::setWidth(GlyphCategory category, double value) {
  widths_[static_cast<size_t>(category)] = value;
}

GlyphMetricsParseResult glyphMetricsFromJson(std::string_view json) {
  GlyphMetricsParseResult result;
  JsonParseResult parsed = parseJsonObject(json);
  if (!parsed.success) {
    result.error = "malformed JSON at offset " + std::to_string(parsed.error_offset);
    return result;
  }

  for (const auto& [name, val] : parsed.values) {
    auto category = glyphCategoryFromString(name);
    if (!category) {
      result.error = "unknown glyph category: " + name;
      return result;
    }
    if (val.type != JsonValue::Number || val.number_val <= 0.0) {
      result.error = "invalid width for " + name;
      return result;
    }
    result.metrics.setWidth(*category, val.number_val);
  }
  result.success = true;
  return result;
}

}  // namespace engrave

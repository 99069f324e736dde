// Table-backed glyph metrics with a Bravura-like default table.

#ifndef ENGRAVE_LAYOUT_GLYPH_METRICS_H
#define ENGRAVE_LAYOUT_GLYPH_METRICS_H

#include <array>
#include <string>
#include <string_view>

#include "layout/i_glyph_metrics.h"

namespace engrave {

/// @brief Glyph metrics stored in a fixed table.
class TableGlyphMetrics : public IGlyphMetrics {
 public:
  /// @brief Default table (font units of a 1000-unit em).
  TableGlyphMetrics();

  double width(GlyphCategory category) const override;

  /// @brief Override one entry.
  void setWidth(GlyphCategory category, double value);

 private:
  std::array<double, kGlyphCategoryCount> widths_;
};

/// @brief Outcome of loading a metric table.
struct GlyphMetricsParseResult {
  bool success = false;
  TableGlyphMetrics metrics;
  std::string error;
};

/// @brief Load metrics from a flat JSON object keyed by category name.
///
/// Missing keys keep their defaults. Unknown keys, non-numeric values and
/// non-positive widths are errors.
GlyphMetricsParseResult glyphMetricsFromJson(std::string_view json);

}  // namespace engrave

#endif  // ENGRAVE_LAYOUT_GLYPH_METRICS_H

// Pure abstract interface for glyph width lookup.
// Concrete implementation: TableGlyphMetrics.

#ifndef ENGRAVE_LAYOUT_I_GLYPH_METRICS_H
#define ENGRAVE_LAYOUT_I_GLYPH_METRICS_H

#include <cstdint>
#include <optional>
#include <string_view>

namespace engrave {

/// Glyph classes the width estimator asks about.
enum class GlyphCategory : uint8_t {
  Notehead,    ///< Black notehead.
  Accidental,  ///< Widest accidental glyph.
  FlagUnit,    ///< One flag/beam level.
  Dynamic,     ///< Dynamic marking.
  Barline,     ///< Single barline.
  Marking,     ///< Breath mark, caesura, hairpin start or technique text.
  Measure,     ///< Nominal width of a whole-note bar.
  GraceScale   ///< Grace notehead size relative to Notehead (a ratio).
};

/// Number of GlyphCategory values.
constexpr int kGlyphCategoryCount = 8;

/// @brief Convert GlyphCategory to its table key ("notehead", "grace_scale", ...).
const char* glyphCategoryToString(GlyphCategory category);

/// @brief Parse a table key back to a category.
std::optional<GlyphCategory> glyphCategoryFromString(std::string_view name);

/// @brief Abstract glyph metric source.
///
/// Widths are in font units; layout only depends on their ratios.
class IGlyphMetrics {
 public:
  virtual ~IGlyphMetrics() = default;

  /// @brief Width of a glyph class (a ratio for GraceScale).
  virtual double width(GlyphCategory category) const = 0;
};

}  // namespace engrave

#endif  // ENGRAVE_LAYOUT_I_GLYPH_METRICS_H

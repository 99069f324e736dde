// Line breaking and horizontal justification of bars.

#ifndef ENGRAVE_LAYOUT_LINE_LAYOUT_H
#define ENGRAVE_LAYOUT_LINE_LAYOUT_H

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "layout/i_glyph_metrics.h"
#include "layout/layout_config.h"
#include "layout/measure_width.h"
#include "score/score.h"

namespace engrave {

/// @brief Position of one bar on its line.
struct BarPlacement {
  size_t bar_index = 0;
  double x_offset = 0.0;  ///< From the start of the line.
  double width = 0.0;     ///< Allocated width.
};

/// @brief One printed line.
struct LineLayout {
  std::vector<BarPlacement> bars;
  double width = 0.0;            ///< Allocated line width.
  double intrinsic_width = 0.0;  ///< Sum of the bars' intrinsic widths.

  /// @brief Allocated over intrinsic width (> 1 stretched, < 1 shrunk).
  double scaleFactor() const { return intrinsic_width > 0.0 ? width / intrinsic_width : 1.0; }
};

/// Why a layout could not be produced.
enum class LayoutErrorKind : uint8_t {
  None,
  Unsatisfiable,  ///< A single bar is wider than the page.
  InvalidConfig   ///< Bad settings or a non-positive bar width.
};

/// @brief Convert LayoutErrorKind to human-readable string.
const char* layoutErrorKindToString(LayoutErrorKind kind);

struct LayoutError {
  LayoutErrorKind kind = LayoutErrorKind::None;
  size_t bar_index = 0;  ///< Offending bar (Unsatisfiable, bad width).
};

/// @brief Outcome of a layout call; failures are fatal for the whole call.
struct LayoutResult {
  bool success = false;
  std::vector<LineLayout> lines;
  LayoutError error;
};

/// Largest allowed ratio between the widest and narrowest bar on a line.
constexpr double kMaxBarWidthRatio = 2.0;

/// Bar counts of adjacent lines may differ by at most this much.
constexpr size_t kMaxLineCountDifference = 2;

/// @brief Split line_width among bars in proportion to weights, with any bar
///        that would exceed twice the narrowest clamped to exactly twice it.
///
/// Equivalent to iterative water-filling: the clamped bars are fixed at
/// 2x the narrowest and the rest share the remainder proportionally.
std::vector<double> distributeLineWidth(const std::vector<double>& weights, double line_width);

/// @brief Break bars into lines and allocate widths.
///
/// Steps: greedy fill under the bar, token and width limits (a line never
/// grows more than 2 bars past the previous one); a repair pass moving bars
/// between neighbours until adjacent counts differ by at most 2, breaking
/// again with a lower bar cap when a move would overfill a line;
/// proportional widths with the 2x clamp; barline alignment between
/// consecutive lines with equal bar counts (within a fifth of the line
/// width), blending toward the previous line's widths where needed.
/// Deterministic for identical input.
LayoutResult layoutLines(const std::vector<BarExtent>& extents, const LayoutConfig& config);

/// @brief Measure every bar of a score and lay it out.
LayoutResult layoutScore(const Score& score, const IGlyphMetrics& metrics,
                         const LayoutConfig& config);

/// @brief Serialize line geometry as compact JSON.
std::string layoutToJson(const std::vector<LineLayout>& lines);

}  // namespace engrave

#endif  // ENGRAVE_LAYOUT_LINE_LAYOUT_H

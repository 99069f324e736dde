// Intrinsic bar width estimation from decoded content and glyph metrics.

#ifndef ENGRAVE_LAYOUT_MEASURE_WIDTH_H
#define ENGRAVE_LAYOUT_MEASURE_WIDTH_H

#include <cstddef>
#include <vector>

#include "core/fraction.h"
#include "layout/i_glyph_metrics.h"
#include "notation/notation_token.h"
#include "score/score.h"

namespace engrave {

/// @brief Space requirement of one bar, as consumed by line layout.
struct BarExtent {
  double width = 0.0;      ///< Intrinsic width (relative units).
  size_t token_count = 0;  ///< Note/Rest count of the busiest channel.
};

/// @brief Fraction of the measure width given to each rhythmic slot when
///        the bar's shortest notation class is duration_class.
///
/// Whole or longer 1, half 1/2, quarter 1/4, eighth 1/5, 16th 1/8,
/// 32nd 1/12, 64th 1/16, 128th 1/20.
double slotFraction(const Fraction& duration_class);

/// @brief Flag/beam levels drawn for a duration (0 for quarter and longer).
int flagCount(const Fraction& value);

/// @brief Shortest notation class among the Notes and Rests of several channels.
/// @return A whole note when there are none.
Fraction smallestDurationClass(const std::vector<const std::vector<NotationToken>*>& channels);

/// @brief Width of one channel's content (without the barline).
/// @param bar_class Shortest notation class of the whole bar.
double estimateChannelWidth(const std::vector<NotationToken>& tokens,
                            const Fraction& bar_class, const IGlyphMetrics& metrics);

/// @brief Intrinsic width of a bar: barline plus its widest channel.
///
/// '%' channels are measured with the content of the bar they repeat.
double estimateBarWidth(const Score& score, size_t bar_index, const IGlyphMetrics& metrics);

/// @brief Largest Note/Rest count among the bar's resolved channels.
size_t barTokenCount(const Score& score, size_t bar_index);

/// @brief Width and token count of every bar, in order.
std::vector<BarExtent> measureScore(const Score& score, const IGlyphMetrics& metrics);

}  // namespace engrave

#endif  // ENGRAVE_LAYOUT_MEASURE_WIDTH_H

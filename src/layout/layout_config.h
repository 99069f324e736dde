// Line layout settings.

#ifndef ENGRAVE_LAYOUT_LAYOUT_CONFIG_H
#define ENGRAVE_LAYOUT_LAYOUT_CONFIG_H

#include <cstddef>
#include <string>
#include <string_view>

namespace engrave {

/// @brief Settings for packing bars into lines.
struct LayoutConfig {
  double page_width = 0.0;          ///< Printed line width (same units as bar widths).
  size_t max_bars_per_line = 9;
  size_t max_tokens_per_line = 32;  ///< Sum of bar token counts on a line.
  double shrink_tolerance = 0.10;   ///< A line may hold up to page_width * (1 + this).
  double stretch_tolerance = 0.25;  ///< Ragged last line grows by at most this.
  bool ragged_last_line = false;    ///< Keep the last line at its natural width.
  bool verbose = false;             ///< Log repair and alignment steps to stderr.

  /// @brief True when widths are positive, limits non-zero and tolerances >= 0.
  bool isValid() const;
};

/// @brief Outcome of loading layout settings.
struct LayoutConfigParseResult {
  bool success = false;
  LayoutConfig config;
  std::string error;  ///< Offending field or parse failure description.
};

/// @brief Load settings from a flat JSON object keyed by field name.
///
/// Missing keys keep their defaults; the result is checked with isValid().
LayoutConfigParseResult layoutConfigFromJson(std::string_view json);

}  // namespace engrave

#endif  // ENGRAVE_LAYOUT_LAYOUT_CONFIG_H

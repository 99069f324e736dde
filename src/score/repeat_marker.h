// Repeat and navigation markers attached to bars.

#ifndef ENGRAVE_SCORE_REPEAT_MARKER_H
#define ENGRAVE_SCORE_REPEAT_MARKER_H

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace engrave {

/// Kind of repeat or navigation marker.
enum class RepeatKind : uint8_t {
  Open,    ///< Start of a repeated section.
  Close,   ///< End of a repeated section.
  Segno,   ///< Jump target for DS.
  DC,      ///< Da capo.
  DS,      ///< Dal segno.
  Coda,    ///< Jump target for ToCoda.
  ToCoda,  ///< Jump to the coda.
  Fine,    ///< End after a DC/DS.
  Ending   ///< Numbered ending (volta).
};

/// @brief Convert RepeatKind to its record name ("open", "tocoda", ...).
const char* repeatKindToString(RepeatKind kind);

/// @brief A marker on a bar; ending_number is meaningful only for Ending.
struct RepeatMarker {
  RepeatKind kind = RepeatKind::Open;
  int ending_number = 0;

  bool operator==(const RepeatMarker& other) const {
    return kind == other.kind && ending_number == other.ending_number;
  }
  bool operator!=(const RepeatMarker& other) const { return !(*this == other); }
};

/// @brief Parse a record name ("open", "close", "segno", "dc", "ds", "coda",
///        "tocoda", "fine", "ending:N").
///
/// The ending number is parsed but not range checked; score assembly
/// reports endings below 1.
std::optional<RepeatMarker> parseRepeatMarker(std::string_view text);

/// @brief Format a marker as its record name.
std::string repeatMarkerToString(const RepeatMarker& marker);

}  // namespace engrave

#endif  // ENGRAVE_SCORE_REPEAT_MARKER_H

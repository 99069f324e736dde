// Key, time and tempo signatures shared by runs of bars.

#ifndef ENGRAVE_SCORE_SIGNATURE_H
#define ENGRAVE_SCORE_SIGNATURE_H

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "core/fraction.h"
#include "core/json_parser.h"

namespace engrave {

/// Widest key index on either side of C (quarter steps).
constexpr int kMaxKeyIndex = 23;

/// Largest beat unit accepted in a time signature.
constexpr int kMaxBeatUnit = 128;

/// @brief A time signature such as 6/8, kept as written (never reduced).
struct TimeSignature {
  int beats = 4;
  int beat_unit = 4;

  /// @brief Exact bar duration in whole notes (beats / beat_unit).
  Fraction duration() const { return Fraction(beats, beat_unit); }

  /// @brief True when beats > 0 and beat_unit is a power of two up to 128.
  bool isValid() const;

  /// @brief Format as "n/d".
  std::string toString() const;

  bool operator==(const TimeSignature& other) const {
    return beats == other.beats && beat_unit == other.beat_unit;
  }
  bool operator!=(const TimeSignature& other) const { return !(*this == other); }
};

/// @brief Parse "n/d" (decimal digits only). Does not check isValid().
std::optional<TimeSignature> parseTimeSignature(std::string_view text);

/// @brief Key signature with tempo and swing.
///
/// The key index counts quarter steps from C natural: positive values are
/// spelled on the sharp side, negative values on the flat side. Odd indices
/// are quarter-tone keys and always decode in microtonal mode.
struct KeySignature {
  int key = 0;
  bool microtonal = false;
  int tempo = 120;  ///< Beats per minute.
  int swing = 50;   ///< Percent; 50 is straight.

  /// @brief Microtonal mode actually in effect (forced on for odd keys).
  bool effectiveMicrotonal() const { return microtonal || (key % 2 != 0); }

  bool isValid() const;

  bool operator==(const KeySignature& other) const {
    return key == other.key && microtonal == other.microtonal && tempo == other.tempo &&
           swing == other.swing;
  }
  bool operator!=(const KeySignature& other) const { return !(*this == other); }
};

/// @brief Tonic name for a key index in the encoding's spelling
///        (e.g. 0 -> "C", 4 -> "D", 2 -> "C#", -4 -> "Bb", -1 -> "Cd").
/// @return Empty string when the index is out of range.
std::string keyName(int key);

/// @brief Combined key and time signature referenced by bars.
struct Signature {
  KeySignature key;
  TimeSignature time;

  bool isValid() const { return key.isValid() && time.isValid(); }

  bool operator==(const Signature& other) const {
    return key == other.key && time == other.time;
  }
  bool operator!=(const Signature& other) const { return !(*this == other); }
};

/// @brief Outcome of loading a signature record.
struct SignatureParseResult {
  bool success = false;
  Signature signature;
  std::string error;  ///< Field name or parse failure description.
};

/// @brief Build a signature from a flat record {key, time, tempo, swing, microtonal}.
///
/// "time" is required; the other fields fall back to the defaults.
SignatureParseResult signatureFromJson(const JsonObject& object);

/// @brief Parse a signature record from JSON text.
SignatureParseResult signatureFromJson(std::string_view json);

}  // namespace engrave

#endif  // ENGRAVE_SCORE_SIGNATURE_H

// Decoder for the compact per-channel notation encoding.
//
// A channel is a run of tokens with no separators:
//   [dynamic] [duration letter + dots] pitch-letter [accidental] octave [suffixes]
// plus rests (R), grace groups ({...}), markings (, / // < ~ $x) and the
// measure-repeat sign (%), which must be the only content of the channel.

#ifndef ENGRAVE_NOTATION_NOTATION_DECODER_H
#define ENGRAVE_NOTATION_NOTATION_DECODER_H

#include <cstddef>
#include <cstdint>
#include <string_view>
#include <vector>

#include "notation/notation_token.h"

namespace engrave {

/// Decoder settings taken from the active key signature.
struct DecodeOptions {
  bool microtonal = false;  ///< Allow quarter-tone accidentals (d, db, t, t#).
};

/// Category of a decode failure.
enum class DecodeErrorKind : uint8_t {
  None,
  UnrecognizedToken,  ///< Unknown, malformed or misplaced token.
  InvalidAccidental,  ///< Quarter-tone accidental without microtonal mode.
  DanglingModifier    ///< Dynamic with no following Note.
};

/// @brief Convert DecodeErrorKind to human-readable string.
const char* decodeErrorKindToString(DecodeErrorKind kind);

/// @brief Position-addressable decode failure.
struct DecodeError {
  DecodeErrorKind kind = DecodeErrorKind::None;
  size_t position = 0;  ///< Byte offset of the offending token in the input.
};

/// @brief Outcome of decoding one channel.
struct DecodeResult {
  bool success = false;
  bool measure_repeat = false;  ///< Channel is '%' (repeat previous bar).
  std::vector<NotationToken> tokens;
  DecodeError error;
};

/// @brief Decode one channel's notation text.
///
/// Single pass. Notes, suffixes and markings need at most two characters of
/// lookahead; a dynamic is matched against the whole dynamic table, up to
/// five characters ("ppppp"). Where a longer and a shorter token both match,
/// the longer one wins ("_." before "_", "//" before "/", "sfz" before "sf"). A malformed token is reported at
/// the offset where the token starts.
///
/// @param raw Notation text (ASCII).
/// @param options Microtonal mode of the active key signature.
/// @return Tokens on success, otherwise the first error.
DecodeResult decodeNotation(std::string_view raw, const DecodeOptions& options = {});

}  // namespace engrave

#endif  // ENGRAVE_NOTATION_NOTATION_DECODER_H

// Canonical text encoding of decoded notation tokens.

#ifndef ENGRAVE_NOTATION_NOTATION_ENCODER_H
#define ENGRAVE_NOTATION_NOTATION_ENCODER_H

#include <optional>
#include <string>
#include <vector>

#include "notation/notation_token.h"

namespace engrave {

/// @brief Encode tokens in canonical form.
///
/// Canonical form writes a duration prefix only when the value changes
/// (starting from a quarter note), groups consecutive grace notes in one
/// brace pair, and writes articulations using the two-character forms
/// ("_.", "^.", "^_", ">.", ">_") before the remaining single characters in
/// Articulation order. Several texts decode to the same tokens ("._" and "_."),
/// so encode(decode(text)) need not equal text, but
/// decodeNotation(encode(tokens)) always yields tokens again.
///
/// @param tokens Decoded tokens.
/// @return Encoded text, or nullopt if a duration is not a dotted
///         power-of-two value the encoding can express.
std::optional<std::string> encodeNotation(const std::vector<NotationToken>& tokens);

/// @brief Encode the articulation set of one Note in canonical order.
std::string encodeArticulations(ArticulationSet set);

}  // namespace engrave

#endif  // ENGRAVE_NOTATION_NOTATION_ENCODER_H

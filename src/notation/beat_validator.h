// Beat accounting: a channel must fill its bar exactly.

#ifndef ENGRAVE_NOTATION_BEAT_VALIDATOR_H
#define ENGRAVE_NOTATION_BEAT_VALIDATOR_H

#include <vector>

#include "core/fraction.h"
#include "notation/notation_token.h"
#include "score/channel.h"
#include "score/signature.h"

namespace engrave {

/// @brief Outcome of a beat check; a failure is a beat mismatch.
struct ValidationResult {
  bool success = false;
  Fraction expected;  ///< Bar duration from the time signature.
  Fraction actual;    ///< Sum of Note and Rest durations.
};

/// @brief Exact sum of Note and Rest durations.
///
/// Grace notes and markings contribute zero.
Fraction totalDuration(const std::vector<NotationToken>& tokens);

/// @brief Check that the tokens sum exactly to time.duration().
ValidationResult validateBeats(const std::vector<NotationToken>& tokens,
                               const TimeSignature& time);

/// @brief Check one channel; RepeatsPrevious channels always pass.
ValidationResult validateChannel(const Channel& channel, const TimeSignature& time);

}  // namespace engrave

#endif  // ENGRAVE_NOTATION_BEAT_VALIDATOR_H

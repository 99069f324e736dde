// Implementation of beat accounting.

#include "notation/beat_validator.h"

namespace engrave {

Fraction totalDuration(const std::vector<NotationToken>& tokens) {
  Fraction sum;
  for (const auto& token : tokens) {
    sum += token.beatDuration();
  }
  return sum;
}

ValidationResult validateBeats(const std::vector<NotationToken>& tokens,
                               const TimeSignature& time) {
  ValidationResult result;
  result.expected = time.duration();
  result.actual = totalDuration(tokens);
  result.success = (result.actual == result.expected);
  return result;
}

ValidationResult validateChannel(const Channel& channel, const TimeSignature& time) {
  if (channel.kind == ChannelKind::RepeatsPrevious) {
    ValidationResult result;
    result.success = true;
    result.expected = time.duration();
    result.actual = result.expected;
    return result;
  }
  return validateBeats(channel.tokens, time);
}

}  // namespace engrave

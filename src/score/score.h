// Score document model: signatures plus validated bars.

#ifndef ENGRAVE_SCORE_SCORE_H
#define ENGRAVE_SCORE_SCORE_H

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "score/channel.h"
#include "score/repeat_marker.h"
#include "score/score_diagnostics.h"
#include "score/signature.h"

namespace engrave {

/// @brief One measure: a channel per instrument plus repeat markers.
struct Bar {
  std::vector<Channel> channels;
  std::optional<size_t> signature_override;  ///< Signature index starting here.
  size_t effective_signature = 0;            ///< Resolved once at assembly.
  std::vector<RepeatMarker> repeats;
};

/// @brief Unparsed channel input.
struct ChannelSource {
  std::string notation;
  std::optional<std::string> lyric;
};

/// @brief Unparsed bar input.
struct BarSource {
  std::vector<ChannelSource> channels;
  std::optional<size_t> signature;  ///< Switch to this signature index.
  std::vector<RepeatMarker> repeats;
};

/// @brief An assembled, fully validated score.
///
/// Scores are only produced by assembleScore() and replaceChannelNotation(),
/// so every Notes channel fills its bar and every '%' channel has a previous
/// bar to refer to. A default-constructed Score is empty.
class Score {
 public:
  Score() = default;

  const std::vector<Signature>& signatures() const { return signatures_; }
  const std::vector<Bar>& bars() const { return bars_; }
  size_t barCount() const { return bars_.size(); }
  const Bar& bar(size_t index) const { return bars_.at(index); }

  /// @brief Signature in effect for a bar (override or carried forward).
  const Signature& effectiveSignature(size_t bar_index) const;

  /// @brief Follow '%' back-references to the bar holding the content.
  /// @return Index of that bar, or nullopt if bar/channel is out of range.
  std::optional<size_t> resolveChannel(size_t bar_index, size_t channel_index) const;

  /// @brief Channel whose tokens a bar actually shows (after resolveChannel).
  /// @return Nullptr if bar/channel is out of range.
  const Channel* resolvedChannel(size_t bar_index, size_t channel_index) const;

 private:
  friend struct ScoreAssembler;

  std::vector<Signature> signatures_;
  std::vector<Bar> bars_;
};

/// @brief Outcome of assembling or editing a score.
struct AssembleResult {
  bool success = false;
  Score score;         ///< Valid only when success.
  ScoreReport report;  ///< Every problem found, in bar order.
};

/// @brief Decode and validate every bar into a Score.
///
/// All checks run even after a failure, so the report lists every problem.
AssembleResult assembleScore(const std::vector<Signature>& signatures,
                             const std::vector<BarSource>& bars);

/// @brief Replace one channel's notation, re-checking only that bar.
///
/// The original score is left untouched.
AssembleResult replaceChannelNotation(const Score& score, size_t bar_index,
                                      size_t channel_index, std::string_view notation);

}  // namespace engrave

#endif  // ENGRAVE_SCORE_SCORE_H

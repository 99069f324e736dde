// Batch diagnostics collected while assembling a score.

#ifndef ENGRAVE_SCORE_SCORE_DIAGNOSTICS_H
#define ENGRAVE_SCORE_SCORE_DIAGNOSTICS_H

#include <cstdint>
#include <string>
#include <vector>

#include "core/fraction.h"
#include "notation/notation_decoder.h"

namespace engrave {

/// Kind of problem found in a score.
enum class ScoreIssueKind : uint8_t {
  MissingSignature,     ///< No signatures at all.
  InvalidSignature,     ///< Malformed key, time, tempo or swing.
  SignatureOutOfRange,  ///< Bar override index past the signature list.
  UnrecognizedToken,    ///< Decode failure (see DecodeErrorKind).
  InvalidAccidental,    ///< Decode failure (see DecodeErrorKind).
  DanglingModifier,     ///< Decode failure (see DecodeErrorKind).
  BeatMismatch,         ///< Channel durations do not fill the bar.
  NoPreviousMeasure,    ///< '%' with no earlier bar holding that channel.
  UnmatchedRepeat,      ///< "open" without a later "close".
  MissingJumpTarget,    ///< DS without segno, ToCoda without coda.
  DuplicateJumpTarget,  ///< More than one segno or coda.
  InvalidEnding,        ///< Ending number below 1.
  ChannelOutOfRange     ///< Edit addressed a bar or channel that does not exist.
};

/// @brief Convert ScoreIssueKind to its report name ("beat_mismatch", ...).
const char* scoreIssueKindToString(ScoreIssueKind kind);

/// @brief Map a decode failure to the issue kind reported for it.
ScoreIssueKind issueKindForDecodeError(DecodeErrorKind kind);

/// Marker for a location field that does not apply.
constexpr int kNoLocation = -1;

/// A single problem with its location.
struct ScoreIssue {
  ScoreIssueKind kind = ScoreIssueKind::BeatMismatch;
  int signature = kNoLocation;  ///< Signature index, for signature issues.
  int bar = kNoLocation;
  int channel = kNoLocation;
  int position = kNoLocation;   ///< Byte offset in the channel text.
  Fraction expected;            ///< BeatMismatch only.
  Fraction actual;              ///< BeatMismatch only.
  std::string description;      ///< Human-readable explanation.
};

/// @brief Ordered collection of score issues.
struct ScoreReport {
  std::vector<ScoreIssue> issues;

  void addIssue(const ScoreIssue& issue);

  /// @brief True if any issue was recorded.
  bool hasErrors() const { return !issues.empty(); }

  /// @brief Issues located in one bar, in report order.
  std::vector<ScoreIssue> issuesForBar(int bar) const;

  /// @brief Issues of one kind, in report order.
  std::vector<ScoreIssue> issuesByKind(ScoreIssueKind kind) const;

  /// @brief Serialize the report (issue count plus issues) to pretty JSON.
  std::string toJson() const;
};

}  // namespace engrave

#endif  // ENGRAVE_SCORE_SCORE_DIAGNOSTICS_H

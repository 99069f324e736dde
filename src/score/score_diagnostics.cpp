// Score diagnostics implementation.

#include "score/score_diagnostics.h"

#include <utility>

#include "core/json_helpers.h"

namespace engrave {

// ---------------------------------------------------------------------------
// ScoreIssueKind to string
// ---------------------------------------------------------------------------

const char* scoreIssueKindToString(ScoreIssueKind kind) {
  switch (kind) {
    case ScoreIssueKind::MissingSignature:    return "missing_signature";
    case ScoreIssueKind::InvalidSignature:    return "invalid_signature";
    case ScoreIssueKind::SignatureOutOfRange: return "signature_out_of_range";
    case ScoreIssueKind::UnrecognizedToken:   return "unrecognized_token";
    case ScoreIssueKind::InvalidAccidental:   return "invalid_accidental";
    case ScoreIssueKind::DanglingModifier:    return "dangling_modifier";
    case ScoreIssueKind::BeatMismatch:        return "beat_mismatch";
    case ScoreIssueKind::NoPreviousMeasure:   return "no_previous_measure";
    case ScoreIssueKind::UnmatchedRepeat:     return "unmatched_repeat";
    case ScoreIssueKind::MissingJumpTarget:   return "missing_jump_target";
    case ScoreIssueKind::DuplicateJumpTarget: return "duplicate_jump_target";
    case ScoreIssueKind::InvalidEnding:       return "invalid_ending";
    case ScoreIssueKind::ChannelOutOfRange:   return "channel_out_of_range";
  }
  return "unknown";
}

ScoreIssueKind issueKindForDecodeError(DecodeErrorKind kind) {
  switch (kind) {
    case DecodeErrorKind::InvalidAccidental: return ScoreIssueKind::InvalidAccidental;
    case DecodeErrorKind::DanglingModifier:  return ScoreIssueKind::DanglingModifier;
    case DecodeErrorKind::None:
    case DecodeErrorKind::UnrecognizedToken:
      break;
  }
  return ScoreIssueKind::UnrecognizedToken;
}

// ---------------------------------------------------------------------------
// ScoreReport methods
// ---------------------------------------------------------------------------

void ScoreReport::addIssue(const ScoreIssue& issue) {
  issues.push_back(issue);
}

std::vector<ScoreIssue> ScoreReport::issuesForBar(int bar) const {
  std::vector<ScoreIssue> result;
  for (const auto& issue : issues) {
    if (issue.bar == bar) result.push_back(issue);
  }
  return result;
}

std::vector<ScoreIssue> ScoreReport::issuesByKind(ScoreIssueKind kind) const {
  std::vector<ScoreIssue> result;
  for (const auto& issue : issues) {
    if (issue.kind == kind) result.push_back(issue);
  }
  return result;
}

std::string ScoreReport::toJson() const {
  JsonWriter writer;
  writer.beginObject();
  writer.key("issue_count");
  writer.value(static_cast<uint64_t>(issues.size()));

  writer.key("issues");
  writer.beginArray();
  for (const auto& issue : issues) {
    writer.beginObject();
    writer.key("kind");
    writer.value(scoreIssueKindToString(issue.kind));

    // Location fields are written only when they apply.
    const std::pair<const char*, int> locations[] = {
        {"signature", issue.signature},
        {"bar", issue.bar},
        {"channel", issue.channel},
        {"position", issue.position},
    };
    for (const auto& loc : locations) {
      if (loc.second == kNoLocation) continue;
      writer.key(loc.first);
      writer.value(loc.second);
    }

    if (issue.kind == ScoreIssueKind::BeatMismatch) {
      writer.key("expected");
      writer.value(issue.expected.toString());
      writer.key("actual");
      writer.value(issue.actual.toString());
    }
    writer.key("description");
    writer.value(issue.description);
    writer.endObject();
  }
  writer.endArray();

  writer.endObject();
  return writer.toPrettyString();
}

}  // namespace engrave

// Score assembly and editing.

#include "score/score.h"

#include <utility>

#include "notation/beat_validator.h"
#include "notation/notation_decoder.h"

namespace engrave {

// ---------------------------------------------------------------------------
// Score queries
// ---------------------------------------------------------------------------

const Signature& Score::effectiveSignature(size_t bar_index) const {
  return signatures_.at(bars_.at(bar_index).effective_signature);
}

std::optional<size_t> Score::resolveChannel(size_t bar_index, size_t channel_index) const {
  size_t current = bar_index;
  while (true) {
    if (current >= bars_.size()) return std::nullopt;
    const auto& channels = bars_[current].channels;
    if (channel_index >= channels.size()) return std::nullopt;
    if (channels[channel_index].kind != ChannelKind::RepeatsPrevious) return current;
    if (current == 0) return std::nullopt;
    --current;
  }
}

const Channel* Score::resolvedChannel(size_t bar_index, size_t channel_index) const {
  auto source = resolveChannel(bar_index, channel_index);
  if (!source) return nullptr;
  return &bars_[*source].channels[channel_index];
}

// ---------------------------------------------------------------------------
// Assembly
// ---------------------------------------------------------------------------

/// Shared checks for full assembly and single-channel edits.
struct ScoreAssembler {
  /// Decode one channel and validate it against its bar.
  ///
  /// previous_channels is the channel count of the bar before, or nullopt for
  /// the first bar. time is nullptr when no valid signature is in effect, in
  /// which case the beat check is skipped.
  static Channel buildChannel(const ChannelSource& source, size_t bar_index,
                              size_t channel_index, std::optional<size_t> previous_channels,
                              const Signature* signature, ScoreReport& report) {
    Channel channel;
    channel.source = source.notation;
    channel.lyric = source.lyric;

    DecodeOptions options;
    options.microtonal = signature != nullptr && signature->key.effectiveMicrotonal();
    DecodeResult decoded = decodeNotation(source.notation, options);

    ScoreIssue issue;
    issue.bar = static_cast<int>(bar_index);
    issue.channel = static_cast<int>(channel_index);

    if (!decoded.success) {
      issue.kind = issueKindForDecodeError(decoded.error.kind);
      issue.position = static_cast<int>(decoded.error.position);
      issue.description = std::string(decodeErrorKindToString(decoded.error.kind)) +
                          " at offset " + std::to_string(decoded.error.position);
      report.addIssue(issue);
      return channel;
    }

    if (decoded.measure_repeat) {
      channel.kind = ChannelKind::RepeatsPrevious;
      if (!previous_channels || *previous_channels <= channel_index) {
        issue.kind = ScoreIssueKind::NoPreviousMeasure;
        issue.description = "measure repeat with no previous bar for this channel";
        report.addIssue(issue);
      }
      return channel;
    }

    channel.tokens = std::move(decoded.tokens);
    if (signature == nullptr) return channel;

    ValidationResult beats = validateChannel(channel, signature->time);
    if (!beats.success) {
      issue.kind = ScoreIssueKind::BeatMismatch;
      issue.expected = beats.expected;
      issue.actual = beats.actual;
      issue.description = "expected " + beats.expected.toString() + ", found " +
                          beats.actual.toString();
      report.addIssue(issue);
    }
    return channel;
  }

  static void checkSignatures(const std::vector<Signature>& signatures, ScoreReport& report) {
    if (signatures.empty()) {
      ScoreIssue issue;
      issue.kind = ScoreIssueKind::MissingSignature;
      issue.description = "score has no signatures";
      report.addIssue(issue);
      return;
    }
    for (size_t idx = 0; idx < signatures.size(); ++idx) {
      if (signatures[idx].isValid()) continue;
      ScoreIssue issue;
      issue.kind = ScoreIssueKind::InvalidSignature;
      issue.signature = static_cast<int>(idx);
      issue.description = "invalid signature (time " + signatures[idx].time.toString() +
                          ", key " + std::to_string(signatures[idx].key.key) + ")";
      report.addIssue(issue);
    }
  }

  /// Check repeat structure across all bars.
  static void checkRepeats(const std::vector<Bar>& bars, ScoreReport& report) {
    std::vector<size_t> open_bars;
    std::vector<size_t> segno_bars;
    std::vector<size_t> coda_bars;
    std::vector<size_t> ds_bars;
    std::vector<size_t> to_coda_bars;

    auto addIssue = [&report](ScoreIssueKind kind, size_t bar, std::string description) {
      ScoreIssue issue;
      issue.kind = kind;
      issue.bar = static_cast<int>(bar);
      issue.description = std::move(description);
      report.addIssue(issue);
    };

    for (size_t bar_idx = 0; bar_idx < bars.size(); ++bar_idx) {
      for (const auto& marker : bars[bar_idx].repeats) {
        switch (marker.kind) {
          case RepeatKind::Open:
            open_bars.push_back(bar_idx);
            break;
          case RepeatKind::Close:
            // A close with nothing open repeats from the beginning.
            if (!open_bars.empty()) open_bars.pop_back();
            break;
          case RepeatKind::Segno:
            segno_bars.push_back(bar_idx);
            break;
          case RepeatKind::Coda:
            coda_bars.push_back(bar_idx);
            break;
          case RepeatKind::DS:
            ds_bars.push_back(bar_idx);
            break;
          case RepeatKind::ToCoda:
            to_coda_bars.push_back(bar_idx);
            break;
          case RepeatKind::Ending:
            if (marker.ending_number < 1) {
              addIssue(ScoreIssueKind::InvalidEnding, bar_idx,
                       "ending number " + std::to_string(marker.ending_number));
            }
            break;
          case RepeatKind::DC:
          case RepeatKind::Fine:
            break;
        }
      }
    }

    for (size_t bar_idx : open_bars) {
      addIssue(ScoreIssueKind::UnmatchedRepeat, bar_idx, "repeat open without close");
    }

    struct JumpCheck {
      const std::vector<size_t>* jumps;
      const std::vector<size_t>* targets;
      const char* target_name;
    };
    const JumpCheck checks[] = {
        {&ds_bars, &segno_bars, "segno"},
        {&to_coda_bars, &coda_bars, "coda"},
    };
    for (const auto& check : checks) {
      if (check.jumps->empty()) continue;
      if (check.targets->empty()) {
        for (size_t bar_idx : *check.jumps) {
          addIssue(ScoreIssueKind::MissingJumpTarget, bar_idx,
                   std::string("no ") + check.target_name + " to jump to");
        }
      } else if (check.targets->size() > 1) {
        for (size_t idx = 1; idx < check.targets->size(); ++idx) {
          addIssue(ScoreIssueKind::DuplicateJumpTarget, (*check.targets)[idx],
                   std::string("more than one ") + check.target_name);
        }
      }
    }
  }

  static Score makeScore(std::vector<Signature> signatures, std::vector<Bar> bars) {
    Score score;
    score.signatures_ = std::move(signatures);
    score.bars_ = std::move(bars);
    return score;
  }

  static std::vector<Bar>& mutableBars(Score& score) { return score.bars_; }
};

AssembleResult assembleScore(const std::vector<Signature>& signatures,
                             const std::vector<BarSource>& bars) {
  AssembleResult result;
  ScoreAssembler::checkSignatures(signatures, result.report);

  std::vector<Bar> assembled;
  assembled.reserve(bars.size());
  size_t current_signature = 0;

  for (size_t bar_idx = 0; bar_idx < bars.size(); ++bar_idx) {
    const BarSource& source = bars[bar_idx];
    Bar bar;
    bar.signature_override = source.signature;
    bar.repeats = source.repeats;

    if (source.signature) {
      if (*source.signature < signatures.size()) {
        current_signature = *source.signature;
      } else {
        ScoreIssue issue;
        issue.kind = ScoreIssueKind::SignatureOutOfRange;
        issue.bar = static_cast<int>(bar_idx);
        issue.signature = static_cast<int>(*source.signature);
        issue.description = "signature index " + std::to_string(*source.signature) +
                            " out of range";
        result.report.addIssue(issue);
      }
    }
    bar.effective_signature = current_signature;

    const Signature* signature = nullptr;
    if (current_signature < signatures.size() && signatures[current_signature].isValid()) {
      signature = &signatures[current_signature];
    }

    std::optional<size_t> previous_channels;
    if (bar_idx > 0) previous_channels = assembled.back().channels.size();

    for (size_t ch_idx = 0; ch_idx < source.channels.size(); ++ch_idx) {
      bar.channels.push_back(ScoreAssembler::buildChannel(
          source.channels[ch_idx], bar_idx, ch_idx, previous_channels, signature,
          result.report));
    }
    assembled.push_back(std::move(bar));
  }

  ScoreAssembler::checkRepeats(assembled, result.report);

  result.success = !result.report.hasErrors();
  if (result.success) {
    result.score = ScoreAssembler::makeScore(signatures, std::move(assembled));
  }
  return result;
}

AssembleResult replaceChannelNotation(const Score& score, size_t bar_index,
                                      size_t channel_index, std::string_view notation) {
  AssembleResult result;
  if (bar_index >= score.barCount() ||
      channel_index >= score.bar(bar_index).channels.size()) {
    ScoreIssue issue;
    issue.kind = ScoreIssueKind::ChannelOutOfRange;
    issue.bar = static_cast<int>(bar_index);
    issue.channel = static_cast<int>(channel_index);
    issue.description = "no such bar or channel";
    result.report.addIssue(issue);
    return result;
  }

  const Bar& old_bar = score.bar(bar_index);
  ChannelSource source;
  source.notation = std::string(notation);
  source.lyric = old_bar.channels[channel_index].lyric;

  std::optional<size_t> previous_channels;
  if (bar_index > 0) previous_channels = score.bar(bar_index - 1).channels.size();

  Channel channel = ScoreAssembler::buildChannel(
      source, bar_index, channel_index, previous_channels,
      &score.effectiveSignature(bar_index), result.report);
  if (result.report.hasErrors()) return result;

  result.score = score;
  ScoreAssembler::mutableBars(result.score)[bar_index].channels[channel_index] =
      std::move(channel);
  result.success = true;
  return result;
}

}  // namespace engrave

// Implementation of bar width estimation.

#include "layout/measure_width.h"

#include <algorithm>
#include <cstdlib>
#include <iterator>

namespace engrave {

namespace {

/// Slot fraction per notation class, longest first.
struct SlotClass {
  int64_t den;  ///< Class is 1/den of a whole note.
  double fraction;
};

constexpr SlotClass kSlotClasses[] = {
    {1, 1.0},         // whole (and longer)
    {2, 1.0 / 2.0},   // half
    {4, 1.0 / 4.0},   // quarter
    {8, 1.0 / 5.0},   // eighth
    {16, 1.0 / 8.0},  // 16th
    {32, 1.0 / 12.0}, // 32nd
    {64, 1.0 / 16.0}, // 64th
    {128, 1.0 / 20.0} // 128th
};

/// Accidental cost multipliers.
constexpr double kLeadingAccidentalScale = 0.5;
constexpr double kClearAccidentalScale = 0.25;

/// Staff steps beyond which two accidentals no longer collide.
constexpr int kAccidentalClearance = 6;

/// Accidental cost of the pitch at position idx; nothing to collide with
/// before the first accidental of the channel.
double accidentalCost(const Pitch& pitch, size_t idx, const IGlyphMetrics& metrics,
                      bool& has_prev_accidental, int& prev_accidental_steps) {
  if (pitch.accidental == Accidental::None) return 0.0;
  double cost = metrics.width(GlyphCategory::Accidental);
  int steps = pitch.staffSteps();
  if (idx == 0) {
    cost *= kLeadingAccidentalScale;
  } else if (!has_prev_accidental ||
             std::abs(steps - prev_accidental_steps) > kAccidentalClearance) {
    cost *= kClearAccidentalScale;
  }
  has_prev_accidental = true;
  prev_accidental_steps = steps;
  return cost;
}

std::vector<const std::vector<NotationToken>*> resolvedChannels(const Score& score,
                                                                 size_t bar_index) {
  std::vector<const std::vector<NotationToken>*> result;
  const Bar& bar = score.bar(bar_index);
  for (size_t ch_idx = 0; ch_idx < bar.channels.size(); ++ch_idx) {
    const Channel* channel = score.resolvedChannel(bar_index, ch_idx);
    if (channel != nullptr) result.push_back(&channel->tokens);
  }
  return result;
}

}  // namespace

double slotFraction(const Fraction& duration_class) {
  for (const auto& slot : kSlotClasses) {
    if (duration_class >= Fraction(1, slot.den)) return slot.fraction;
  }
  return kSlotClasses[std::size(kSlotClasses) - 1].fraction;
}

int flagCount(const Fraction& value) {
  Fraction cls = durationClass(value);
  int flags = 0;
  for (Fraction level = duration::eighth(); cls <= level && flags < 5;
       level = level * Fraction(1, 2)) {
    ++flags;
  }
  return flags;
}

Fraction smallestDurationClass(const std::vector<const std::vector<NotationToken>*>& channels) {
  Fraction smallest = duration::whole();
  for (const auto* tokens : channels) {
    for (const auto& token : *tokens) {
      if (!token.isRhythmic()) continue;
      Fraction cls = durationClass(token.duration);
      if (cls < smallest) smallest = cls;
    }
  }
  return smallest;
}

double estimateChannelWidth(const std::vector<NotationToken>& tokens,
                            const Fraction& bar_class, const IGlyphMetrics& metrics) {
  const double notehead = metrics.width(GlyphCategory::Notehead);
  const double slot_width = slotFraction(bar_class) * metrics.width(GlyphCategory::Measure);

  double width = 0.0;
  bool has_prev_accidental = false;
  int prev_accidental_steps = 0;

  for (size_t idx = 0; idx < tokens.size(); ++idx) {
    const NotationToken& token = tokens[idx];
    switch (token.kind) {
      case TokenKind::Marking:
        width += metrics.width(GlyphCategory::Marking);
        break;

      case TokenKind::GraceNote:
        width += metrics.width(GlyphCategory::GraceScale) *
                 (notehead + accidentalCost(token.pitch, idx, metrics, has_prev_accidental,
                                            prev_accidental_steps));
        break;

      case TokenKind::Rest:
        width += std::max(notehead, slot_width);
        break;

      case TokenKind::Note: {
        double glyph =
            notehead + flagCount(token.duration) * metrics.width(GlyphCategory::FlagUnit);
        width += std::max(glyph, slot_width);
        if (token.dynamic) width += metrics.width(GlyphCategory::Dynamic);

        width += accidentalCost(token.pitch, idx, metrics, has_prev_accidental,
                                prev_accidental_steps);
        break;
      }
    }
  }
  return width;
}

double estimateBarWidth(const Score& score, size_t bar_index, const IGlyphMetrics& metrics) {
  auto channels = resolvedChannels(score, bar_index);
  Fraction bar_class = smallestDurationClass(channels);

  double widest = 0.0;
  for (const auto* tokens : channels) {
    widest = std::max(widest, estimateChannelWidth(*tokens, bar_class, metrics));
  }
  return metrics.width(GlyphCategory::Barline) + widest;
}

size_t barTokenCount(const Score& score, size_t bar_index) {
  size_t busiest = 0;
  for (const auto* tokens : resolvedChannels(score, bar_index)) {
    busiest = std::max(busiest, rhythmicTokenCount(*tokens));
  }
  return busiest;
}

std::vector<BarExtent> measureScore(const Score& score, const IGlyphMetrics& metrics) {
  std::vector<BarExtent> extents;
  extents.reserve(score.barCount());
  for (size_t idx = 0; idx < score.barCount(); ++idx) {
    BarExtent extent;
    extent.width = estimateBarWidth(score, idx, metrics);
    extent.token_count = barTokenCount(score, idx);
    extents.push_back(extent);
  }
  return extents;
}

}  // namespace engrave

// Line breaking, balance repair, proportional widths and barline alignment.

#include "layout/line_layout.h"

#include <algorithm>
#include <cmath>
#include <cstdio>

#include "core/json_helpers.h"

namespace engrave {

namespace {

/// Blend weights tried, in order, when aligning a line with its predecessor.
constexpr double kAlignmentSteps[] = {0.25, 0.5, 0.75, 1.0};

/// Barlines of equal-count neighbours may drift by at most this share of the line.
constexpr double kAlignmentTolerance = 0.2;

/// Half-open range [begin, end) of bar indices on one line.
struct LineRange {
  size_t begin = 0;
  size_t end = 0;

  size_t count() const { return end - begin; }
};

/// Bars, tokens and width of a candidate line.
struct LineLoad {
  size_t bars = 0;
  size_t tokens = 0;
  double width = 0.0;
};

LineLoad loadOf(const std::vector<BarExtent>& extents, size_t begin, size_t end) {
  LineLoad load;
  for (size_t idx = begin; idx < end; ++idx) {
    ++load.bars;
    load.tokens += extents[idx].token_count;
    load.width += extents[idx].width;
  }
  return load;
}

/// A line is feasible under the limits; a single bar is always feasible.
bool fitsLimits(const LineLoad& load, const LayoutConfig& config) {
  if (load.bars <= 1) return true;
  return load.bars <= config.max_bars_per_line && load.tokens <= config.max_tokens_per_line &&
         load.width <= config.page_width * (1.0 + config.shrink_tolerance);
}

size_t countDifference(size_t lhs, size_t rhs) {
  return lhs > rhs ? lhs - rhs : rhs - lhs;
}

// ---------------------------------------------------------------------------
// Step 1: greedy accumulation
// ---------------------------------------------------------------------------

std::vector<LineRange> breakGreedy(const std::vector<BarExtent>& extents,
                                   const LayoutConfig& config) {
  std::vector<LineRange> lines;
  LineRange current;
  LineLoad load;

  for (size_t idx = 0; idx < extents.size(); ++idx) {
    LineLoad candidate = load;
    ++candidate.bars;
    candidate.tokens += extents[idx].token_count;
    candidate.width += extents[idx].width;

    bool within_balance = lines.empty() ||
                          candidate.bars <= lines.back().count() + kMaxLineCountDifference;
    if (load.bars > 0 && !(fitsLimits(candidate, config) && within_balance)) {
      lines.push_back(current);
      current.begin = idx;
      load = LineLoad();
      candidate = loadOf(extents, idx, idx + 1);
    }
    current.end = idx + 1;
    load = candidate;
  }
  if (load.bars > 0) lines.push_back(current);
  return lines;
}

// ---------------------------------------------------------------------------
// Step 2: balance repair
// ---------------------------------------------------------------------------

/// Moves bars between neighbours until adjacent counts differ by at most 2.
///
/// Each move goes from the fuller line to the emptier one of a pair whose
/// counts differ by more than 2, which strictly lowers the sum of squared
/// line counts, so the loop terminates. Returns false, with the bar that
/// would not fit, when a move breaks the receiving line's limits.
bool repairBalance(const std::vector<BarExtent>& extents, const LayoutConfig& config,
                   std::vector<LineRange>& lines, size_t& failed_bar) {
  bool changed = true;
  while (changed) {
    changed = false;
    for (size_t idx = 0; idx + 1 < lines.size(); ++idx) {
      LineRange& left = lines[idx];
      LineRange& right = lines[idx + 1];
      if (countDifference(left.count(), right.count()) <= kMaxLineCountDifference) continue;

      if (left.count() > right.count()) {
        // Last bar of the left line moves to the front of the right line.
        if (!fitsLimits(loadOf(extents, right.begin - 1, right.end), config)) {
          failed_bar = right.begin - 1;
          return false;
        }
        --left.end;
        --right.begin;
        if (config.verbose) {
          std::fprintf(stderr, "[LineLayout] balance: bar %zu moved to line %zu\n",
                       right.begin, idx + 1);
        }
      } else {
        // First bar of the right line moves to the end of the left line.
        if (!fitsLimits(loadOf(extents, left.begin, left.end + 1), config)) {
          failed_bar = left.end;
          return false;
        }
        ++left.end;
        ++right.begin;
        if (config.verbose) {
          std::fprintf(stderr, "[LineLayout] balance: bar %zu moved to line %zu\n",
                       left.end - 1, idx);
        }
      }
      changed = true;
      break;
    }
  }
  return true;
}

// ---------------------------------------------------------------------------
// Step 4: barline alignment
// ---------------------------------------------------------------------------

double maxBarlineDrift(const std::vector<double>& prev, const std::vector<double>& cur) {
  double prev_x = 0.0;
  double cur_x = 0.0;
  double drift = 0.0;
  for (size_t idx = 0; idx < cur.size(); ++idx) {
    prev_x += prev[idx];
    cur_x += cur[idx];
    drift = std::max(drift, std::fabs(cur_x - prev_x));
  }
  return drift;
}

std::vector<double> alignWidths(const std::vector<double>& prev, const std::vector<double>& cur,
                                double line_width, size_t line_idx, bool verbose) {
  double tolerance = line_width * kAlignmentTolerance;
  if (maxBarlineDrift(prev, cur) <= tolerance) return cur;

  std::vector<double> blended(cur.size());
  for (double alpha : kAlignmentSteps) {
    for (size_t idx = 0; idx < cur.size(); ++idx) {
      blended[idx] = (1.0 - alpha) * cur[idx] + alpha * prev[idx];
    }
    std::vector<double> candidate = distributeLineWidth(blended, line_width);
    if (maxBarlineDrift(prev, candidate) <= tolerance || alpha >= 1.0) {
      if (verbose) {
        std::fprintf(stderr, "[LineLayout] align: line %zu blended toward line %zu (%.2f)\n",
                     line_idx, line_idx - 1, alpha);
      }
      return candidate;
    }
  }
  return cur;
}

}  // namespace

const char* layoutErrorKindToString(LayoutErrorKind kind) {
  switch (kind) {
    case LayoutErrorKind::None:          return "none";
    case LayoutErrorKind::Unsatisfiable: return "unsatisfiable";
    case LayoutErrorKind::InvalidConfig: return "invalid_config";
  }
  return "unknown";
}

// ---------------------------------------------------------------------------
// Step 3: proportional widths
// ---------------------------------------------------------------------------

std::vector<double> distributeLineWidth(const std::vector<double>& weights, double line_width) {
  std::vector<double> widths(weights.size(), 0.0);
  if (weights.empty()) return widths;

  double narrowest = *std::min_element(weights.begin(), weights.end());
  double ceiling = narrowest * kMaxBarWidthRatio;

  // Clamped bars take exactly 2x the narrowest share; the narrowest bar is
  // never clamped, so the ratio holds after scaling.
  double total = 0.0;
  for (size_t idx = 0; idx < weights.size(); ++idx) {
    widths[idx] = std::min(weights[idx], ceiling);
    total += widths[idx];
  }
  double scale = line_width / total;
  for (double& width : widths) {
    width *= scale;
  }
  return widths;
}

LayoutResult layoutLines(const std::vector<BarExtent>& extents, const LayoutConfig& config) {
  LayoutResult result;
  if (!config.isValid()) {
    result.error.kind = LayoutErrorKind::InvalidConfig;
    return result;
  }

  for (size_t idx = 0; idx < extents.size(); ++idx) {
    double width = extents[idx].width;
    if (!(width > 0.0) || std::isinf(width)) {
      result.error = {LayoutErrorKind::InvalidConfig, idx};
      return result;
    }
    if (width > config.page_width) {
      result.error = {LayoutErrorKind::Unsatisfiable, idx};
      return result;
    }
  }

  // Lines of one to three bars are always balanced, so lowering the bar cap
  // ends by three at the latest.
  LayoutConfig attempt = config;
  std::vector<LineRange> ranges = breakGreedy(extents, attempt);
  size_t failed_bar = 0;
  while (!repairBalance(extents, attempt, ranges, failed_bar)) {
    --attempt.max_bars_per_line;
    if (config.verbose) {
      std::fprintf(stderr,
                   "[LineLayout] balance: bar %zu does not fit, retrying with %zu bars per line\n",
                   failed_bar, attempt.max_bars_per_line);
    }
    ranges = breakGreedy(extents, attempt);
  }

  std::vector<double> prev_widths;
  double prev_line_width = 0.0;

  for (size_t line_idx = 0; line_idx < ranges.size(); ++line_idx) {
    const LineRange& range = ranges[line_idx];
    LineLayout line;

    std::vector<double> weights;
    for (size_t idx = range.begin; idx < range.end; ++idx) {
      weights.push_back(extents[idx].width);
      line.intrinsic_width += extents[idx].width;
    }

    line.width = config.page_width;
    bool is_last = (line_idx + 1 == ranges.size());
    if (is_last && config.ragged_last_line) {
      line.width = std::min(config.page_width,
                            line.intrinsic_width * (1.0 + config.stretch_tolerance));
    }

    std::vector<double> widths = distributeLineWidth(weights, line.width);
    // Lines of different width (a ragged last line) are not aligned.
    if (!prev_widths.empty() && prev_widths.size() == widths.size() &&
        prev_line_width == line.width) {
      widths = alignWidths(prev_widths, widths, line.width, line_idx, config.verbose);
    }

    double x_offset = 0.0;
    for (size_t idx = 0; idx < widths.size(); ++idx) {
      BarPlacement placement;
      placement.bar_index = range.begin + idx;
      placement.x_offset = x_offset;
      placement.width = widths[idx];
      line.bars.push_back(placement);
      x_offset += widths[idx];
    }

    prev_widths = widths;
    prev_line_width = line.width;
    result.lines.push_back(std::move(line));
  }

  result.success = true;
  return result;
}

LayoutResult layoutScore(const Score& score, const IGlyphMetrics& metrics,
                         const LayoutConfig& config) {
  return layoutLines(measureScore(score, metrics), config);
}

std::string layoutToJson(const std::vector<LineLayout>& lines) {
  JsonWriter writer;
  writer.beginObject();
  writer.key("lines");
  writer.beginArray();
  for (const auto& line : lines) {
    writer.beginObject();
    writer.key("width");
    writer.value(line.width);
    writer.key("scale");
    writer.value(line.scaleFactor());
    writer.key("bars");
    writer.beginArray();
    for (const auto& bar : line.bars) {
      writer.beginObject();
      writer.key("bar");
      writer.value(static_cast<uint64_t>(bar.bar_index));
      writer.key("x");
      writer.value(bar.x_offset);
      writer.key("width");
      writer.value(bar.width);
      writer.endObject();
    }
    writer.endArray();
    writer.endObject();
  }
  writer.endArray();
  writer.endObject();
  return writer.toString();
}

}  // namespace engrave

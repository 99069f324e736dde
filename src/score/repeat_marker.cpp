// Implementation of repeat marker names.

#include "score/repeat_marker.h"

#include <cctype>

namespace engrave {

const char* repeatKindToString(RepeatKind kind) {
  switch (kind) {
    case RepeatKind::Open:   return "open";
    case RepeatKind::Close:  return "close";
    case RepeatKind::Segno:  return "segno";
    case RepeatKind::DC:     return "dc";
    case RepeatKind::DS:     return "ds";
    case RepeatKind::Coda:   return "coda";
    case RepeatKind::ToCoda: return "tocoda";
    case RepeatKind::Fine:   return "fine";
    case RepeatKind::Ending: return "ending";
  }
  return "unknown";
}

std::optional<RepeatMarker> parseRepeatMarker(std::string_view text) {
  constexpr RepeatKind kPlain[] = {
      RepeatKind::Open, RepeatKind::Close,  RepeatKind::Segno,
      RepeatKind::DC,   RepeatKind::DS,     RepeatKind::Coda,
      RepeatKind::ToCoda, RepeatKind::Fine,
  };
  for (RepeatKind kind : kPlain) {
    if (text == repeatKindToString(kind)) return RepeatMarker{kind, 0};
  }

  constexpr std::string_view kEndingPrefix = "ending:";
  if (text.substr(0, kEndingPrefix.size()) != kEndingPrefix) return std::nullopt;
  std::string_view digits = text.substr(kEndingPrefix.size());
  if (digits.empty() || digits.size() > 4) return std::nullopt;

  int number = 0;
  for (char chr : digits) {
    if (!std::isdigit(static_cast<unsigned char>(chr))) return std::nullopt;
    number = number * 10 + (chr - '0');
  }
  return RepeatMarker{RepeatKind::Ending, number};
}

std::string repeatMarkerToString(const RepeatMarker& marker) {
  if (marker.kind == RepeatKind::Ending) {
    return "ending:" + std::to_string(marker.ending_number);
  }
  return repeatKindToString(marker.kind);
}

}  // namespace engrave

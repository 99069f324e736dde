// Implementation of canonical notation encoding.

#include "notation/notation_encoder.h"

namespace engrave {

namespace {

/// Two-character articulation forms, tried in this order.
struct CombinedArticulation {
  Articulation lead;
  Articulation tail;
};

constexpr CombinedArticulation kCombined[] = {
    {Articulation::Tenuto, Articulation::Staccato},
    {Articulation::Marcato, Articulation::Staccato},
    {Articulation::Marcato, Articulation::Tenuto},
    {Articulation::Accent, Articulation::Staccato},
    {Articulation::Accent, Articulation::Tenuto},
};

bool appendDuration(const Fraction& value, Fraction& running, std::string& out) {
  if (value == running) return true;
  char letter = '\0';
  int dots = 0;
  if (!durationToLetter(value, letter, dots)) return false;
  out += letter;
  out.append(static_cast<size_t>(dots), '.');
  running = value;
  return true;
}

}  // namespace

std::string encodeArticulations(ArticulationSet set) {
  std::string out;
  ArticulationSet remaining = set;
  for (const auto& combo : kCombined) {
    ArticulationSet pair = articulationBit(combo.lead) | articulationBit(combo.tail);
    if ((remaining & pair) == pair) {
      out += articulationToChar(combo.lead);
      out += articulationToChar(combo.tail);
      remaining = static_cast<ArticulationSet>(remaining & ~pair);
    }
  }
  for (int idx = 0; idx < kArticulationCount; ++idx) {
    auto articulation = static_cast<Articulation>(idx);
    if (hasArticulation(remaining, articulation)) out += articulationToChar(articulation);
  }
  return out;
}

std::optional<std::string> encodeNotation(const std::vector<NotationToken>& tokens) {
  std::string out;
  Fraction running = duration::quarter();
  bool in_grace = false;

  for (const auto& token : tokens) {
    if (token.kind != TokenKind::GraceNote && in_grace) {
      out += '}';
      in_grace = false;
    }

    switch (token.kind) {
      case TokenKind::GraceNote:
        if (!in_grace) {
          out += '{';
          in_grace = true;
        }
        out += pitchToString(token.pitch);
        break;

      case TokenKind::Rest:
        if (!appendDuration(token.duration, running, out)) return std::nullopt;
        out += 'R';
        break;

      case TokenKind::Marking: {
        const char* text = markingKindToString(token.marking);
        // "/" then "/" would read back as "//".
        if (!out.empty() && out.back() == '/' && text[0] == '/') out += ' ';
        out += text;
        break;
      }

      case TokenKind::Note:
        if (token.dynamic) out += dynamicToString(*token.dynamic);
        if (!appendDuration(token.duration, running, out)) return std::nullopt;
        out += pitchToString(token.pitch);
        out += encodeArticulations(token.articulations);
        if (token.ornament != Ornament::None) {
          out += '&';
          out += ornamentToChar(token.ornament);
        }
        if (token.bend != PitchBend::None) {
          out += '?';
          out += pitchBendToChar(token.bend);
        }
        if (token.role != NoteRole::None) out += noteRoleToChar(token.role);
        break;
    }
  }
  if (in_grace) out += '}';
  return out;
}

}  // namespace engrave

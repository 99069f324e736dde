// Implementation of notation token helpers.

#include "notation/notation_token.h"

namespace engrave {

const char* tokenKindToString(TokenKind kind) {
  switch (kind) {
    case TokenKind::Note:      return "note";
    case TokenKind::Rest:      return "rest";
    case TokenKind::GraceNote: return "grace";
    case TokenKind::Marking:   return "marking";
  }
  return "unknown";
}

Fraction NotationToken::beatDuration() const {
  return isRhythmic() ? duration : Fraction();
}

bool NotationToken::operator==(const NotationToken& other) const {
  return kind == other.kind && pitch == other.pitch && duration == other.duration &&
         dynamic == other.dynamic && articulations == other.articulations &&
         ornament == other.ornament && bend == other.bend && role == other.role &&
         marking == other.marking;
}

// ---------------------------------------------------------------------------
// NoteBuilder
// ---------------------------------------------------------------------------

bool NoteBuilder::setDynamic(Dynamic dynamic) {
  if (dynamic_) return false;
  dynamic_ = dynamic;
  return true;
}

bool NoteBuilder::setOrnament(Ornament ornament) {
  if (ornament_ != Ornament::None) return false;
  ornament_ = ornament;
  return true;
}

bool NoteBuilder::setBend(PitchBend bend) {
  if (bend_ != PitchBend::None) return false;
  bend_ = bend;
  return true;
}

bool NoteBuilder::setRole(NoteRole role) {
  if (role_ != NoteRole::None) return false;
  role_ = role;
  return true;
}

NotationToken NoteBuilder::build(const Pitch& pitch, const Fraction& value) {
  NotationToken token = makeNote(pitch, value);
  token.dynamic = dynamic_;
  token.articulations = articulations_;
  token.ornament = ornament_;
  token.bend = bend_;
  token.role = role_;
  *this = NoteBuilder();
  return token;
}

// ---------------------------------------------------------------------------
// Factories
// ---------------------------------------------------------------------------

NotationToken makeNote(const Pitch& pitch, const Fraction& value) {
  NotationToken token;
  token.kind = TokenKind::Note;
  token.pitch = pitch;
  token.duration = value;
  return token;
}

NotationToken makeRest(const Fraction& value) {
  NotationToken token;
  token.kind = TokenKind::Rest;
  token.duration = value;
  return token;
}

NotationToken makeGraceNote(const Pitch& pitch) {
  NotationToken token;
  token.kind = TokenKind::GraceNote;
  token.pitch = pitch;
  return token;
}

NotationToken makeMarking(MarkingKind kind) {
  NotationToken token;
  token.kind = TokenKind::Marking;
  token.marking = kind;
  return token;
}

std::string tokenToDebugString(const NotationToken& token) {
  switch (token.kind) {
    case TokenKind::Note:
      return "Note(" + pitchToString(token.pitch) + " " + token.duration.toString() + ")";
    case TokenKind::Rest:
      return "Rest(" + token.duration.toString() + ")";
    case TokenKind::GraceNote:
      return "Grace(" + pitchToString(token.pitch) + ")";
    case TokenKind::Marking:
      return std::string("Marking(") + markingKindToString(token.marking) + ")";
  }
  return "?";
}

size_t rhythmicTokenCount(const std::vector<NotationToken>& tokens) {
  size_t count = 0;
  for (const auto& token : tokens) {
    if (token.isRhythmic()) ++count;
  }
  return count;
}

}  // namespace engrave

// Implementation of notation vocabulary conversions.

#include "core/basic_types.h"

namespace engrave {

namespace {

/// Semitone offset of each natural letter above C, in quarter steps.
constexpr int kLetterQuarterSteps[7] = {0, 4, 8, 10, 14, 18, 22};

struct DurationLetter {
  char letter;
  int64_t num;
  int64_t den;
};

/// Prefix letters from longest to shortest.
constexpr DurationLetter kDurationLetters[] = {
    {'L', 4, 1},  {'V', 2, 1},  {'W', 1, 1},  {'H', 1, 2},  {'Q', 1, 4},
    {'T', 1, 8},  {'S', 1, 16}, {'Y', 1, 32}, {'X', 1, 64}, {'O', 1, 128},
};

}  // namespace

const char* pitchLetterToString(PitchLetter letter) {
  switch (letter) {
    case PitchLetter::C: return "C";
    case PitchLetter::D: return "D";
    case PitchLetter::E: return "E";
    case PitchLetter::F: return "F";
    case PitchLetter::G: return "G";
    case PitchLetter::A: return "A";
    case PitchLetter::B: return "B";
  }
  return "?";
}

const char* accidentalToString(Accidental accidental) {
  switch (accidental) {
    case Accidental::None:              return "";
    case Accidental::DoubleFlat:        return "bb";
    case Accidental::ThreeQuarterFlat:  return "db";
    case Accidental::Flat:              return "b";
    case Accidental::QuarterFlat:       return "d";
    case Accidental::Natural:           return "n";
    case Accidental::QuarterSharp:      return "t";
    case Accidental::Sharp:             return "#";
    case Accidental::ThreeQuarterSharp: return "t#";
    case Accidental::DoubleSharp:       return "x";
  }
  return "";
}

bool isMicrotonal(Accidental accidental) {
  return accidental == Accidental::ThreeQuarterFlat ||
         accidental == Accidental::QuarterFlat ||
         accidental == Accidental::QuarterSharp ||
         accidental == Accidental::ThreeQuarterSharp;
}

int accidentalQuarterSteps(Accidental accidental) {
  switch (accidental) {
    case Accidental::None:              return 0;
    case Accidental::DoubleFlat:        return -4;
    case Accidental::ThreeQuarterFlat:  return -3;
    case Accidental::Flat:              return -2;
    case Accidental::QuarterFlat:       return -1;
    case Accidental::Natural:           return 0;
    case Accidental::QuarterSharp:      return 1;
    case Accidental::Sharp:             return 2;
    case Accidental::ThreeQuarterSharp: return 3;
    case Accidental::DoubleSharp:       return 4;
  }
  return 0;
}

int Pitch::quarterStepClass() const {
  int steps = kLetterQuarterSteps[static_cast<int>(letter)] +
              accidentalQuarterSteps(accidental);
  return ((steps % 24) + 24) % 24;
}

std::string pitchToString(const Pitch& pitch) {
  std::string result = pitchLetterToString(pitch.letter);
  result += accidentalToString(pitch.accidental);
  if (pitch.octave < 0) {
    result += '-';
  } else {
    result += static_cast<char>('0' + pitch.octave);
  }
  return result;
}

const char* dynamicToString(Dynamic dynamic) {
  switch (dynamic) {
    case Dynamic::PPPPP: return "ppppp";
    case Dynamic::PPPP:  return "pppp";
    case Dynamic::PPP:   return "ppp";
    case Dynamic::PP:    return "pp";
    case Dynamic::P:     return "p";
    case Dynamic::MP:    return "mp";
    case Dynamic::MF:    return "mf";
    case Dynamic::F:     return "f";
    case Dynamic::FF:    return "ff";
    case Dynamic::FFF:   return "fff";
    case Dynamic::FFFF:  return "ffff";
    case Dynamic::FFFFF: return "fffff";
    case Dynamic::SF:    return "sf";
    case Dynamic::SFZ:   return "sfz";
    case Dynamic::FP:    return "fp";
    case Dynamic::SFP:   return "sfp";
    case Dynamic::N:     return "n";
  }
  return "";
}

char articulationToChar(Articulation articulation) {
  switch (articulation) {
    case Articulation::Staccatissimo: return '\'';
    case Articulation::Staccato:      return '.';
    case Articulation::Tenuto:        return '_';
    case Articulation::Marcato:       return '^';
    case Articulation::Accent:        return '>';
    case Articulation::ClosedMute:    return '+';
    case Articulation::OpenMute:      return 'o';
    case Articulation::Harmonic:      return '@';
    case Articulation::Pedal:         return '|';
    case Articulation::Fermata:       return '!';
  }
  return '\0';
}

const char* articulationToString(Articulation articulation) {
  switch (articulation) {
    case Articulation::Staccatissimo: return "staccatissimo";
    case Articulation::Staccato:      return "staccato";
    case Articulation::Tenuto:        return "tenuto";
    case Articulation::Marcato:       return "marcato";
    case Articulation::Accent:        return "accent";
    case Articulation::ClosedMute:    return "closed_mute";
    case Articulation::OpenMute:      return "open_mute";
    case Articulation::Harmonic:      return "harmonic";
    case Articulation::Pedal:         return "pedal";
    case Articulation::Fermata:       return "fermata";
  }
  return "unknown";
}

char ornamentToChar(Ornament ornament) {
  switch (ornament) {
    case Ornament::None:         return '\0';
    case Ornament::Trill:        return 't';
    case Ornament::Turn:         return 's';
    case Ornament::InvertedTurn: return 'S';
    case Ornament::Glissando:    return 'g';
    case Ornament::StrumUp:      return 'u';
    case Ornament::StrumDown:    return 'd';
  }
  return '\0';
}

const char* ornamentToString(Ornament ornament) {
  switch (ornament) {
    case Ornament::None:         return "none";
    case Ornament::Trill:        return "trill";
    case Ornament::Turn:         return "turn";
    case Ornament::InvertedTurn: return "inverted_turn";
    case Ornament::Glissando:    return "glissando";
    case Ornament::StrumUp:      return "strum_up";
    case Ornament::StrumDown:    return "strum_down";
  }
  return "unknown";
}

char pitchBendToChar(PitchBend bend) {
  switch (bend) {
    case PitchBend::None:      return '\0';
    case PitchBend::UpInto:    return 'u';
    case PitchBend::DownInto:  return 'd';
    case PitchBend::UpOutOf:   return 'U';
    case PitchBend::DownOutOf: return 'D';
  }
  return '\0';
}

const char* pitchBendToString(PitchBend bend) {
  switch (bend) {
    case PitchBend::None:      return "none";
    case PitchBend::UpInto:    return "bend_up_into";
    case PitchBend::DownInto:  return "bend_down_into";
    case PitchBend::UpOutOf:   return "bend_up_out_of";
    case PitchBend::DownOutOf: return "fall";
  }
  return "unknown";
}

char noteRoleToChar(NoteRole role) {
  switch (role) {
    case NoteRole::None:      return '\0';
    case NoteRole::TieStart:  return '-';
    case NoteRole::SlurStart: return '(';
    case NoteRole::SlurEnd:   return ')';
    case NoteRole::Tremolo:   return ':';
  }
  return '\0';
}

const char* noteRoleToString(NoteRole role) {
  switch (role) {
    case NoteRole::None:      return "none";
    case NoteRole::TieStart:  return "tie";
    case NoteRole::SlurStart: return "slur_start";
    case NoteRole::SlurEnd:   return "slur_end";
    case NoteRole::Tremolo:   return "tremolo";
  }
  return "unknown";
}

const char* markingKindToString(MarkingKind kind) {
  switch (kind) {
    case MarkingKind::Breath:       return ",";
    case MarkingKind::CaesuraShort: return "/";
    case MarkingKind::CaesuraLong:  return "//";
    case MarkingKind::Crescendo:    return "<";
    case MarkingKind::Decrescendo:  return "~";
    case MarkingKind::Pizzicato:    return "$p";
    case MarkingKind::Arco:         return "$a";
    case MarkingKind::Mute:         return "$m";
    case MarkingKind::Open:         return "$o";
  }
  return "";
}

bool durationFromLetter(char letter, Fraction& out) {
  for (const auto& entry : kDurationLetters) {
    if (entry.letter == letter) {
      out = Fraction(entry.num, entry.den);
      return true;
    }
  }
  return false;
}

bool durationToLetter(const Fraction& value, char& letter, int& dots) {
  for (const auto& entry : kDurationLetters) {
    Fraction base(entry.num, entry.den);
    Fraction total = base;
    Fraction addition = base;
    for (int dot_count = 0; dot_count <= kMaxAugmentationDots; ++dot_count) {
      if (total == value) {
        letter = entry.letter;
        dots = dot_count;
        return true;
      }
      addition = addition * Fraction(1, 2);
      total += addition;
    }
  }
  return false;
}

Fraction durationClass(const Fraction& value) {
  for (const auto& entry : kDurationLetters) {
    Fraction base(entry.num, entry.den);
    if (base <= value) return base;
  }
  return duration::hundredTwentyEighth();
}

}  // namespace engrave

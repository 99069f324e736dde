// Implementation of the notation decoder.

#include "notation/notation_decoder.h"

#include <cctype>
#include <cstring>

namespace engrave {

const char* decodeErrorKindToString(DecodeErrorKind kind) {
  switch (kind) {
    case DecodeErrorKind::None:              return "none";
    case DecodeErrorKind::UnrecognizedToken: return "unrecognized_token";
    case DecodeErrorKind::InvalidAccidental: return "invalid_accidental";
    case DecodeErrorKind::DanglingModifier:  return "dangling_modifier";
  }
  return "unknown";
}

namespace {

struct DynamicEntry {
  const char* text;
  Dynamic dynamic;
};

constexpr DynamicEntry kDynamicTable[] = {
    {"ppppp", Dynamic::PPPPP}, {"pppp", Dynamic::PPPP}, {"ppp", Dynamic::PPP},
    {"pp", Dynamic::PP},       {"p", Dynamic::P},       {"mp", Dynamic::MP},
    {"mf", Dynamic::MF},       {"fffff", Dynamic::FFFFF}, {"ffff", Dynamic::FFFF},
    {"fff", Dynamic::FFF},     {"ff", Dynamic::FF},     {"fp", Dynamic::FP},
    {"f", Dynamic::F},         {"sfz", Dynamic::SFZ},   {"sfp", Dynamic::SFP},
    {"sf", Dynamic::SF},       {"n", Dynamic::N},
};

bool isPitchLetter(char chr) { return chr >= 'A' && chr <= 'G'; }

PitchLetter letterFromChar(char chr) {
  switch (chr) {
    case 'C': return PitchLetter::C;
    case 'D': return PitchLetter::D;
    case 'E': return PitchLetter::E;
    case 'F': return PitchLetter::F;
    case 'G': return PitchLetter::G;
    case 'A': return PitchLetter::A;
    default:  return PitchLetter::B;
  }
}

bool isDynamicStart(char chr) {
  return chr == 'p' || chr == 'm' || chr == 'f' || chr == 's' || chr == 'n';
}

bool articulationFromChar(char chr, Articulation& out) {
  switch (chr) {
    case '\'': out = Articulation::Staccatissimo; return true;
    case '.':  out = Articulation::Staccato;      return true;
    case '_':  out = Articulation::Tenuto;        return true;
    case '^':  out = Articulation::Marcato;       return true;
    case '>':  out = Articulation::Accent;        return true;
    case '+':  out = Articulation::ClosedMute;    return true;
    case 'o':  out = Articulation::OpenMute;      return true;
    case '@':  out = Articulation::Harmonic;      return true;
    case '|':  out = Articulation::Pedal;         return true;
    case '!':  out = Articulation::Fermata;       return true;
    default:   return false;
  }
}

bool ornamentFromChar(char chr, Ornament& out) {
  switch (chr) {
    case 't': out = Ornament::Trill;        return true;
    case 's': out = Ornament::Turn;         return true;
    case 'S': out = Ornament::InvertedTurn; return true;
    case 'g': out = Ornament::Glissando;    return true;
    case 'u': out = Ornament::StrumUp;      return true;
    case 'd': out = Ornament::StrumDown;    return true;
    default:  return false;
  }
}

bool bendFromChar(char chr, PitchBend& out) {
  switch (chr) {
    case 'u': out = PitchBend::UpInto;    return true;
    case 'd': out = PitchBend::DownInto;  return true;
    case 'U': out = PitchBend::UpOutOf;   return true;
    case 'D': out = PitchBend::DownOutOf; return true;
    default:  return false;
  }
}

bool roleFromChar(char chr, NoteRole& out) {
  switch (chr) {
    case '-': out = NoteRole::TieStart;  return true;
    case '(': out = NoteRole::SlurStart; return true;
    case ')': out = NoteRole::SlurEnd;   return true;
    case ':': out = NoteRole::Tremolo;   return true;
    default:  return false;
  }
}

/// @brief Single-pass scanner over one channel.
class NotationScanner {
 public:
  NotationScanner(std::string_view text, const DecodeOptions& options)
      : text_(text), options_(options) {}

  DecodeResult run() {
    DecodeResult result;
    while (true) {
      skipWhitespace();
      if (atEnd()) break;
      if (!scanToken(result)) {
        result.success = false;
        result.tokens.clear();
        result.measure_repeat = false;
        result.error = error_;
        return result;
      }
      if (result.measure_repeat) break;
    }

    if (in_grace_) return fail(result, DecodeErrorKind::UnrecognizedToken, grace_open_pos_);
    if (builder_.hasDynamic()) {
      return fail(result, DecodeErrorKind::DanglingModifier, dynamic_pos_);
    }
    result.tokens = std::move(tokens_);
    result.success = true;
    return result;
  }

 private:
  bool atEnd() const { return pos_ >= text_.size(); }
  char peek(size_t ahead = 0) const {
    return pos_ + ahead < text_.size() ? text_[pos_ + ahead] : '\0';
  }

  void skipWhitespace() {
    while (!atEnd() && std::isspace(static_cast<unsigned char>(text_[pos_]))) ++pos_;
  }

  bool error(DecodeErrorKind kind, size_t position) {
    error_.kind = kind;
    error_.position = position;
    return false;
  }

  DecodeResult fail(DecodeResult& result, DecodeErrorKind kind, size_t position) {
    result.success = false;
    result.tokens.clear();
    result.error.kind = kind;
    result.error.position = position;
    return result;
  }

  /// Dispatch on the first character of a token.
  bool scanToken(DecodeResult& result) {
    size_t start = pos_;
    char chr = peek();

    if (chr == '%') return scanMeasureRepeat(result);
    if (chr == '{') {
      if (in_grace_) return error(DecodeErrorKind::UnrecognizedToken, start);
      in_grace_ = true;
      grace_open_pos_ = start;
      grace_count_ = 0;
      ++pos_;
      return true;
    }
    if (chr == '}') {
      if (!in_grace_ || grace_count_ == 0) {
        return error(DecodeErrorKind::UnrecognizedToken, in_grace_ ? grace_open_pos_ : start);
      }
      in_grace_ = false;
      ++pos_;
      return true;
    }
    if (in_grace_) {
      // Only bare pitches are allowed inside a grace group.
      if (!isPitchLetter(chr)) return error(DecodeErrorKind::UnrecognizedToken, start);
      Pitch pitch;
      if (!scanPitch(start, pitch)) return false;
      tokens_.push_back(makeGraceNote(pitch));
      ++grace_count_;
      return true;
    }

    Fraction unused;
    if (isPitchLetter(chr) || chr == 'R' || durationFromLetter(chr, unused)) {
      return scanRhythmic(start);
    }
    if (isDynamicStart(chr)) return scanDynamic(start);
    return scanMarking(start);
  }

  bool scanMeasureRepeat(DecodeResult& result) {
    size_t start = pos_;
    // Must be the sole content: nothing scanned before, only whitespace after.
    if (!tokens_.empty() || builder_.hasDynamic() || saw_content_ || in_grace_) {
      return error(DecodeErrorKind::UnrecognizedToken, start);
    }
    ++pos_;
    skipWhitespace();
    if (!atEnd()) return error(DecodeErrorKind::UnrecognizedToken, pos_);
    result.measure_repeat = true;
    return true;
  }

  /// Note or rest, with an optional duration prefix.
  bool scanRhythmic(size_t start) {
    saw_content_ = true;
    Fraction value = current_duration_;
    Fraction base;
    if (durationFromLetter(peek(), base)) {
      ++pos_;
      value = base;
      Fraction addition = base;
      int dots = 0;
      while (peek() == '.' && dots < kMaxAugmentationDots) {
        addition = addition * Fraction(1, 2);
        value += addition;
        ++dots;
        ++pos_;
      }
      if (!isPitchLetter(peek()) && peek() != 'R') {
        return error(DecodeErrorKind::UnrecognizedToken, start);
      }
    }

    if (peek() == 'R') {
      ++pos_;
      tokens_.push_back(makeRest(value));
      current_duration_ = value;
      return true;
    }

    Pitch pitch;
    if (!scanPitch(start, pitch)) return false;
    if (!scanSuffixes()) return false;
    tokens_.push_back(builder_.build(pitch, value));
    current_duration_ = value;
    return true;
  }

  /// Letter, optional accidental, required octave.
  bool scanPitch(size_t start, Pitch& out) {
    out.letter = letterFromChar(peek());
    ++pos_;

    size_t accidental_pos = pos_;
    char first = peek();
    char second = peek(1);
    out.accidental = Accidental::None;
    if (first == 'b' && second == 'b') {
      out.accidental = Accidental::DoubleFlat;
      pos_ += 2;
    } else if (first == 'd' && second == 'b') {
      out.accidental = Accidental::ThreeQuarterFlat;
      pos_ += 2;
    } else if (first == 't' && second == '#') {
      out.accidental = Accidental::ThreeQuarterSharp;
      pos_ += 2;
    } else if (first == 'b') {
      out.accidental = Accidental::Flat;
      ++pos_;
    } else if (first == 'd') {
      out.accidental = Accidental::QuarterFlat;
      ++pos_;
    } else if (first == 'n') {
      out.accidental = Accidental::Natural;
      ++pos_;
    } else if (first == 't') {
      out.accidental = Accidental::QuarterSharp;
      ++pos_;
    } else if (first == '#') {
      out.accidental = Accidental::Sharp;
      ++pos_;
    } else if (first == 'x') {
      out.accidental = Accidental::DoubleSharp;
      ++pos_;
    }
    if (isMicrotonal(out.accidental) && !options_.microtonal) {
      return error(DecodeErrorKind::InvalidAccidental, accidental_pos);
    }

    char octave = peek();
    if (octave == '-') {
      out.octave = static_cast<int8_t>(kMinOctave);
    } else if (octave >= '0' && octave <= '9') {
      out.octave = static_cast<int8_t>(octave - '0');
    } else {
      return error(DecodeErrorKind::UnrecognizedToken, start);
    }
    ++pos_;
    return true;
  }

  /// Articulations, ornament, bend and role following a note's octave.
  bool scanSuffixes() {
    while (!atEnd()) {
      size_t here = pos_;
      char chr = peek();
      char next = peek(1);

      // Combined articulations take precedence over their first character.
      if ((chr == '_' && next == '.') ||
          ((chr == '^' || chr == '>') && (next == '.' || next == '_'))) {
        Articulation lead = Articulation::Tenuto;
        Articulation tail = Articulation::Tenuto;
        articulationFromChar(chr, lead);
        articulationFromChar(next, tail);
        builder_.addArticulation(lead);
        builder_.addArticulation(tail);
        pos_ += 2;
        continue;
      }

      Articulation articulation;
      if (articulationFromChar(chr, articulation)) {
        builder_.addArticulation(articulation);
        ++pos_;
        continue;
      }

      if (chr == '&') {
        Ornament ornament;
        if (!ornamentFromChar(next, ornament) || !builder_.setOrnament(ornament)) {
          return error(DecodeErrorKind::UnrecognizedToken, here);
        }
        pos_ += 2;
        continue;
      }

      if (chr == '?') {
        PitchBend bend;
        if (!bendFromChar(next, bend) || !builder_.setBend(bend)) {
          return error(DecodeErrorKind::UnrecognizedToken, here);
        }
        pos_ += 2;
        continue;
      }

      NoteRole role;
      if (roleFromChar(chr, role)) {
        if (!builder_.setRole(role)) return error(DecodeErrorKind::UnrecognizedToken, here);
        ++pos_;
        continue;
      }
      break;
    }
    return true;
  }

  bool scanDynamic(size_t start) {
    saw_content_ = true;
    const DynamicEntry* best = nullptr;
    size_t best_len = 0;
    std::string_view rest = text_.substr(pos_);
    for (const auto& entry : kDynamicTable) {
      size_t len = std::strlen(entry.text);
      if (len > best_len && rest.substr(0, len) == entry.text) {
        best = &entry;
        best_len = len;
      }
    }
    if (best == nullptr || !builder_.setDynamic(best->dynamic)) {
      return error(DecodeErrorKind::UnrecognizedToken, start);
    }
    dynamic_pos_ = start;
    pos_ += best_len;
    return true;
  }

  bool scanMarking(size_t start) {
    char chr = peek();
    char next = peek(1);
    MarkingKind kind = MarkingKind::Breath;
    size_t len = 1;
    switch (chr) {
      case ',': kind = MarkingKind::Breath; break;
      case '/':
        if (next == '/') {
          kind = MarkingKind::CaesuraLong;
          len = 2;
        } else {
          kind = MarkingKind::CaesuraShort;
        }
        break;
      case '<': kind = MarkingKind::Crescendo; break;
      case '~': kind = MarkingKind::Decrescendo; break;
      case '$':
        len = 2;
        if (next == 'p') {
          kind = MarkingKind::Pizzicato;
        } else if (next == 'a') {
          kind = MarkingKind::Arco;
        } else if (next == 'm') {
          kind = MarkingKind::Mute;
        } else if (next == 'o') {
          kind = MarkingKind::Open;
        } else {
          return error(DecodeErrorKind::UnrecognizedToken, start);
        }
        break;
      default:
        return error(DecodeErrorKind::UnrecognizedToken, start);
    }
    saw_content_ = true;
    tokens_.push_back(makeMarking(kind));
    pos_ += len;
    return true;
  }

  std::string_view text_;
  DecodeOptions options_;
  size_t pos_ = 0;

  NoteBuilder builder_;
  std::vector<NotationToken> tokens_;
  Fraction current_duration_ = duration::quarter();
  size_t dynamic_pos_ = 0;
  bool saw_content_ = false;

  bool in_grace_ = false;
  size_t grace_open_pos_ = 0;
  size_t grace_count_ = 0;

  DecodeError error_;
};

}  // namespace

DecodeResult decodeNotation(std::string_view raw, const DecodeOptions& options) {
  NotationScanner scanner(raw, options);
  return scanner.run();
}

}  // namespace engrave

// Basic types for notation encoding and engraving.

#ifndef ENGRAVE_CORE_BASIC_TYPES_H
#define ENGRAVE_CORE_BASIC_TYPES_H

#include <cstdint>
#include <string>

#include "core/fraction.h"

namespace engrave {

// ---------------------------------------------------------------------------
// Duration constants (fractions of a whole note)
// ---------------------------------------------------------------------------

namespace duration {

inline Fraction longa() { return Fraction(4, 1); }
inline Fraction breve() { return Fraction(2, 1); }
inline Fraction whole() { return Fraction(1, 1); }
inline Fraction half() { return Fraction(1, 2); }
inline Fraction quarter() { return Fraction(1, 4); }
inline Fraction eighth() { return Fraction(1, 8); }
inline Fraction sixteenth() { return Fraction(1, 16); }
inline Fraction thirtySecond() { return Fraction(1, 32); }
inline Fraction sixtyFourth() { return Fraction(1, 64); }
inline Fraction hundredTwentyEighth() { return Fraction(1, 128); }

}  // namespace duration

/// Maximum number of augmentation dots accepted on a duration.
constexpr int kMaxAugmentationDots = 4;

/// Octave of middle C in scientific numbering.
constexpr int kMiddleOctave = 4;

/// Lowest and highest octave the encoding can express ('-' and '9').
constexpr int kMinOctave = -1;
constexpr int kMaxOctave = 9;

// ---------------------------------------------------------------------------
// Pitch
// ---------------------------------------------------------------------------

/// Pitch letter, in staff order starting at C.
enum class PitchLetter : uint8_t { C = 0, D, E, F, G, A, B };

/// @brief Convert PitchLetter to its upper-case letter ("C".."B").
const char* pitchLetterToString(PitchLetter letter);

/// Accidentals, ordered from lowest to highest alteration.
enum class Accidental : uint8_t {
  None,               ///< Taken from the key signature.
  DoubleFlat,         ///< bb
  ThreeQuarterFlat,   ///< db
  Flat,               ///< b
  QuarterFlat,        ///< d
  Natural,            ///< n
  QuarterSharp,       ///< t
  Sharp,              ///< #
  ThreeQuarterSharp,  ///< t#
  DoubleSharp         ///< x
};

/// @brief Encoded form of an accidental ("" for None).
const char* accidentalToString(Accidental accidental);

/// @brief True for quarter-tone accidentals (d, db, t, t#).
bool isMicrotonal(Accidental accidental);

/// @brief Alteration in quarter steps (DoubleFlat = -4 .. DoubleSharp = +4).
int accidentalQuarterSteps(Accidental accidental);

/// @brief A written pitch: letter, optional accidental and octave.
struct Pitch {
  PitchLetter letter = PitchLetter::C;
  Accidental accidental = Accidental::None;
  int8_t octave = kMiddleOctave;  ///< Scientific octave as written (4 = middle C).

  /// @brief Octave relative to middle C's octave (middle = 0).
  int relativeOctave() const { return octave - kMiddleOctave; }

  /// @brief Diatonic staff steps above middle C (C4 = 0, D4 = 1, B3 = -1).
  int staffSteps() const {
    return relativeOctave() * 7 + static_cast<int>(letter);
  }

  /// @brief Pitch class in quarter steps above C (0-23).
  int quarterStepClass() const;

  bool operator==(const Pitch& other) const {
    return letter == other.letter && accidental == other.accidental &&
           octave == other.octave;
  }
  bool operator!=(const Pitch& other) const { return !(*this == other); }
};

/// @brief Format a pitch in the encoding (e.g. "C#4", "Bb-").
std::string pitchToString(const Pitch& pitch);

// ---------------------------------------------------------------------------
// Modifiers
// ---------------------------------------------------------------------------

/// Dynamic levels, soft to loud, followed by the accented forms.
enum class Dynamic : uint8_t {
  PPPPP, PPPP, PPP, PP, P, MP, MF, F, FF, FFF, FFFF, FFFFF,
  SF, SFZ, FP, SFP,
  N  ///< Niente (silent).
};

/// @brief Encoded form of a dynamic ("pp", "sfz", ...).
const char* dynamicToString(Dynamic dynamic);

/// Articulations; a Note carries any subset (stored as bit flags).
enum class Articulation : uint8_t {
  Staccatissimo,  ///< '
  Staccato,       ///< .
  Tenuto,         ///< _
  Marcato,        ///< ^
  Accent,         ///< >
  ClosedMute,     ///< +
  OpenMute,       ///< o
  Harmonic,       ///< @
  Pedal,          ///< |
  Fermata         ///< !
};

/// Number of Articulation values.
constexpr int kArticulationCount = 10;

/// @brief Encoded character of a single articulation.
char articulationToChar(Articulation articulation);

/// @brief Human-readable articulation name.
const char* articulationToString(Articulation articulation);

/// Bit set over Articulation.
using ArticulationSet = uint16_t;

/// @brief Bit flag for one articulation.
inline constexpr ArticulationSet articulationBit(Articulation articulation) {
  return static_cast<ArticulationSet>(1u << static_cast<unsigned>(articulation));
}

/// @brief Check membership in an articulation set.
inline constexpr bool hasArticulation(ArticulationSet set, Articulation articulation) {
  return (set & articulationBit(articulation)) != 0;
}

/// Ornaments (at most one per Note), encoded as '&' + letter.
enum class Ornament : uint8_t {
  None,
  Trill,         ///< &t
  Turn,          ///< &s
  InvertedTurn,  ///< &S
  Glissando,     ///< &g
  StrumUp,       ///< &u
  StrumDown      ///< &d
};

/// @brief Letter following '&' for an ornament ('\0' for None).
char ornamentToChar(Ornament ornament);

/// @brief Human-readable ornament name.
const char* ornamentToString(Ornament ornament);

/// Pitch bends (at most one per Note), encoded as '?' + letter.
enum class PitchBend : uint8_t {
  None,
  UpInto,     ///< ?u
  DownInto,   ///< ?d
  UpOutOf,    ///< ?U
  DownOutOf   ///< ?D (fall)
};

/// @brief Letter following '?' for a bend ('\0' for None).
char pitchBendToChar(PitchBend bend);

/// @brief Human-readable pitch bend name.
const char* pitchBendToString(PitchBend bend);

/// Tie, slur and tremolo role of a Note (at most one).
enum class NoteRole : uint8_t {
  None,
  TieStart,   ///< -
  SlurStart,  ///< (
  SlurEnd,    ///< )
  Tremolo     ///< :
};

/// @brief Encoded character for a role ('\0' for None).
char noteRoleToChar(NoteRole role);

/// @brief Human-readable role name.
const char* noteRoleToString(NoteRole role);

/// Standalone markings inside a channel.
enum class MarkingKind : uint8_t {
  Breath,         ///< ,
  CaesuraShort,   ///< /
  CaesuraLong,    ///< //
  Crescendo,      ///< <
  Decrescendo,    ///< ~
  Pizzicato,      ///< $p
  Arco,           ///< $a
  Mute,           ///< $m
  Open            ///< $o
};

/// @brief Encoded form of a marking (",", "//", "$p", ...).
const char* markingKindToString(MarkingKind kind);

// ---------------------------------------------------------------------------
// Duration letters
// ---------------------------------------------------------------------------

/// @brief Map a duration prefix letter (L V W H Q T S Y X O) to its undotted
///        value. Returns false for any other character.
bool durationFromLetter(char letter, Fraction& out);

/// @brief Find the prefix letter and dot count that encode a duration.
/// @return False when the value is not a dotted power-of-two duration the
///         encoding can express.
bool durationToLetter(const Fraction& value, char& letter, int& dots);

/// @brief Largest undotted duration not exceeding value (its notation class).
///        Values shorter than a 128th map to the 128th class.
Fraction durationClass(const Fraction& value);

}  // namespace engrave

#endif  // ENGRAVE_CORE_BASIC_TYPES_H

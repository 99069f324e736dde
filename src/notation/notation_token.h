// Structured notation events decoded from a channel's text.

#ifndef ENGRAVE_NOTATION_NOTATION_TOKEN_H
#define ENGRAVE_NOTATION_NOTATION_TOKEN_H

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "core/basic_types.h"
#include "core/fraction.h"

namespace engrave {

/// Discriminator for NotationToken.
enum class TokenKind : uint8_t {
  Note,       ///< Pitched note with modifiers.
  Rest,       ///< Silence of a given duration.
  GraceNote,  ///< Pitch only; zero duration for beat accounting.
  Marking     ///< Breath, caesura, hairpin or technique change.
};

/// @brief Convert TokenKind to human-readable string.
const char* tokenKindToString(TokenKind kind);

/// @brief One decoded event of a channel.
///
/// Fields not meaningful for the kind keep their defaults, so two tokens
/// compare equal exactly when they encode the same event. Build tokens with
/// the make*() factories below rather than by hand.
struct NotationToken {
  TokenKind kind = TokenKind::Rest;
  Pitch pitch;                                 ///< Note, GraceNote.
  Fraction duration;                           ///< Note, Rest.
  std::optional<Dynamic> dynamic;              ///< Note only.
  ArticulationSet articulations = 0;           ///< Note only.
  Ornament ornament = Ornament::None;          ///< Note only.
  PitchBend bend = PitchBend::None;            ///< Note only.
  NoteRole role = NoteRole::None;              ///< Note only.
  MarkingKind marking = MarkingKind::Breath;   ///< Marking only.

  /// @brief Duration counted toward the bar (zero for grace notes and markings).
  Fraction beatDuration() const;

  /// @brief True for Note and Rest (tokens that occupy a rhythmic slot).
  bool isRhythmic() const { return kind == TokenKind::Note || kind == TokenKind::Rest; }

  bool operator==(const NotationToken& other) const;
  bool operator!=(const NotationToken& other) const { return !(*this == other); }
};

/// @brief Accumulates modifiers until a Note anchor is scanned.
///
/// Dynamics, articulations, ornaments, bends and roles attach to the next
/// pitch; the builder yields an immutable token only once the pitch and
/// duration are known, so a half-built note never escapes the scanner.
class NoteBuilder {
 public:
  /// @brief Set the pending dynamic. Returns false if one is already pending.
  bool setDynamic(Dynamic dynamic);
  bool hasDynamic() const { return dynamic_.has_value(); }

  void addArticulation(Articulation articulation) {
    articulations_ |= articulationBit(articulation);
  }

  /// @brief Set the ornament. Returns false if one is already set.
  bool setOrnament(Ornament ornament);

  /// @brief Set the pitch bend. Returns false if one is already set.
  bool setBend(PitchBend bend);

  /// @brief Set the tie/slur/tremolo role. Returns false if one is already set.
  bool setRole(NoteRole role);

  /// @brief Produce the Note and clear every pending modifier.
  NotationToken build(const Pitch& pitch, const Fraction& value);

 private:
  std::optional<Dynamic> dynamic_;
  ArticulationSet articulations_ = 0;
  Ornament ornament_ = Ornament::None;
  PitchBend bend_ = PitchBend::None;
  NoteRole role_ = NoteRole::None;
};

/// @brief Create a plain Note without modifiers.
NotationToken makeNote(const Pitch& pitch, const Fraction& value);

/// @brief Create a Rest.
NotationToken makeRest(const Fraction& value);

/// @brief Create a GraceNote.
NotationToken makeGraceNote(const Pitch& pitch);

/// @brief Create a Marking.
NotationToken makeMarking(MarkingKind kind);

/// @brief Short debug description (e.g. "Note(C4 1/4)").
std::string tokenToDebugString(const NotationToken& token);

/// @brief Count of Note and Rest tokens.
size_t rhythmicTokenCount(const std::vector<NotationToken>& tokens);

}  // namespace engrave

#endif  // ENGRAVE_NOTATION_NOTATION_TOKEN_H

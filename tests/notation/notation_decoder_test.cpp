// Tests for notation/notation_decoder.h -- channel text to tokens.

#include "notation/notation_decoder.h"

#include <gtest/gtest.h>

#include <string>

namespace engrave {
namespace {

Pitch pitchOf(PitchLetter letter, Accidental accidental, int octave) {
  return Pitch{letter, accidental, static_cast<int8_t>(octave)};
}

class NotationDecoderTest : public ::testing::Test {
 protected:
  /// Decode and require success.
  std::vector<NotationToken> decodeOk(const std::string& text, bool microtonal = false) {
    DecodeOptions options;
    options.microtonal = microtonal;
    DecodeResult result = decodeNotation(text, options);
    EXPECT_TRUE(result.success) << text << " failed at " << result.error.position;
    return result.tokens;
  }

  /// Decode and require failure of a given kind at a given offset.
  void expectError(const std::string& text, DecodeErrorKind kind, size_t position,
                   bool microtonal = false) {
    DecodeOptions options;
    options.microtonal = microtonal;
    DecodeResult result = decodeNotation(text, options);
    EXPECT_FALSE(result.success) << text;
    EXPECT_TRUE(result.tokens.empty()) << text;
    EXPECT_EQ(result.error.kind, kind) << text << " got "
                                       << decodeErrorKindToString(result.error.kind);
    EXPECT_EQ(result.error.position, position) << text;
  }
};

// ---------------------------------------------------------------------------
// Notes, rests and durations
// ---------------------------------------------------------------------------

TEST_F(NotationDecoderTest, DefaultDurationIsQuarter) {
  auto tokens = decodeOk("C4D4E4");
  ASSERT_EQ(tokens.size(), 3u);
  EXPECT_EQ(tokens[0], makeNote(pitchOf(PitchLetter::C, Accidental::None, 4), duration::quarter()));
  EXPECT_EQ(tokens[1], makeNote(pitchOf(PitchLetter::D, Accidental::None, 4), duration::quarter()));
  EXPECT_EQ(tokens[2], makeNote(pitchOf(PitchLetter::E, Accidental::None, 4), duration::quarter()));
}

TEST_F(NotationDecoderTest, DurationPrefixCarriesForward) {
  auto tokens = decodeOk("TC4D4HE4R");
  ASSERT_EQ(tokens.size(), 4u);
  EXPECT_EQ(tokens[0].duration, duration::eighth());
  EXPECT_EQ(tokens[1].duration, duration::eighth());
  EXPECT_EQ(tokens[2].duration, duration::half());
  EXPECT_EQ(tokens[3].kind, TokenKind::Rest);
  EXPECT_EQ(tokens[3].duration, duration::half());
}

TEST_F(NotationDecoderTest, AugmentationDots) {
  auto tokens = decodeOk("Q.C4TD4H..R");
  ASSERT_EQ(tokens.size(), 3u);
  EXPECT_EQ(tokens[0].duration, Fraction(3, 8));
  EXPECT_EQ(tokens[1].duration, Fraction(1, 8));
  EXPECT_EQ(tokens[2].duration, Fraction(7, 8));
}

TEST_F(NotationDecoderTest, AllDurationLetters) {
  auto tokens = decodeOk("LRVRWRHRQRTRSRYRXROR");
  ASSERT_EQ(tokens.size(), 10u);
  EXPECT_EQ(tokens[0].duration, Fraction(4, 1));
  EXPECT_EQ(tokens[9].duration, Fraction(1, 128));
}

TEST_F(NotationDecoderTest, WhitespaceBetweenTokensIgnored) {
  auto spaced = decodeOk(" TC4  D4\tR ");
  auto packed = decodeOk("TC4D4R");
  EXPECT_EQ(spaced, packed);
}

TEST_F(NotationDecoderTest, EmptyTextDecodesToNothing) {
  DecodeResult result = decodeNotation("");
  EXPECT_TRUE(result.success);
  EXPECT_FALSE(result.measure_repeat);
  EXPECT_TRUE(result.tokens.empty());
}

// ---------------------------------------------------------------------------
// Pitches and accidentals
// ---------------------------------------------------------------------------

TEST_F(NotationDecoderTest, Accidentals) {
  auto tokens = decodeOk("Cbb4Db4Dn4F#4Gx4");
  ASSERT_EQ(tokens.size(), 5u);
  EXPECT_EQ(tokens[0].pitch.accidental, Accidental::DoubleFlat);
  EXPECT_EQ(tokens[1].pitch.accidental, Accidental::Flat);
  EXPECT_EQ(tokens[2].pitch.accidental, Accidental::Natural);
  EXPECT_EQ(tokens[3].pitch.accidental, Accidental::Sharp);
  EXPECT_EQ(tokens[4].pitch.accidental, Accidental::DoubleSharp);
}

TEST_F(NotationDecoderTest, OctaveMinusOneAndNine) {
  auto tokens = decodeOk("C-B9");
  ASSERT_EQ(tokens.size(), 2u);
  EXPECT_EQ(tokens[0].pitch.octave, -1);
  EXPECT_EQ(tokens[0].pitch.relativeOctave(), -5);
  EXPECT_EQ(tokens[1].pitch.octave, 9);
}

TEST_F(NotationDecoderTest, MicrotonalAccidentalsNeedMicrotonalMode) {
  auto tokens = decodeOk("Ed4Edb4Ft4Ft#4", true);
  ASSERT_EQ(tokens.size(), 4u);
  EXPECT_EQ(tokens[0].pitch.accidental, Accidental::QuarterFlat);
  EXPECT_EQ(tokens[1].pitch.accidental, Accidental::ThreeQuarterFlat);
  EXPECT_EQ(tokens[2].pitch.accidental, Accidental::QuarterSharp);
  EXPECT_EQ(tokens[3].pitch.accidental, Accidental::ThreeQuarterSharp);

  expectError("C4Ed4", DecodeErrorKind::InvalidAccidental, 3);
  expectError("Ft#4", DecodeErrorKind::InvalidAccidental, 1);
}

TEST_F(NotationDecoderTest, MissingOctaveIsUnrecognized) {
  expectError("C4D", DecodeErrorKind::UnrecognizedToken, 2);
  expectError("C4F#R", DecodeErrorKind::UnrecognizedToken, 2);
}

// ---------------------------------------------------------------------------
// Note suffixes
// ---------------------------------------------------------------------------

TEST_F(NotationDecoderTest, SingleArticulations) {
  auto tokens = decodeOk("C4'+o@|!");
  ASSERT_EQ(tokens.size(), 1u);
  ArticulationSet expected = articulationBit(Articulation::Staccatissimo) |
                             articulationBit(Articulation::ClosedMute) |
                             articulationBit(Articulation::OpenMute) |
                             articulationBit(Articulation::Harmonic) |
                             articulationBit(Articulation::Pedal) |
                             articulationBit(Articulation::Fermata);
  EXPECT_EQ(tokens[0].articulations, expected);
}

TEST_F(NotationDecoderTest, CombinedArticulationsTakeLongestMatch) {
  auto tokens = decodeOk("C4_.D4^.E4^_F4>.G4>_A4_");
  ASSERT_EQ(tokens.size(), 6u);
  auto pair = [](Articulation lhs, Articulation rhs) {
    return static_cast<ArticulationSet>(articulationBit(lhs) | articulationBit(rhs));
  };
  EXPECT_EQ(tokens[0].articulations, pair(Articulation::Tenuto, Articulation::Staccato));
  EXPECT_EQ(tokens[1].articulations, pair(Articulation::Marcato, Articulation::Staccato));
  EXPECT_EQ(tokens[2].articulations, pair(Articulation::Marcato, Articulation::Tenuto));
  EXPECT_EQ(tokens[3].articulations, pair(Articulation::Accent, Articulation::Staccato));
  EXPECT_EQ(tokens[4].articulations, pair(Articulation::Accent, Articulation::Tenuto));
  EXPECT_EQ(tokens[5].articulations, articulationBit(Articulation::Tenuto));
}

TEST_F(NotationDecoderTest, SeparateAndCombinedFormsAreEquivalent) {
  EXPECT_EQ(decodeOk("C4._"), decodeOk("C4_."));
}

TEST_F(NotationDecoderTest, OrnamentBendAndRole) {
  auto tokens = decodeOk("C4&t?D(D4&S)E4?u-F4:");
  ASSERT_EQ(tokens.size(), 4u);
  EXPECT_EQ(tokens[0].ornament, Ornament::Trill);
  EXPECT_EQ(tokens[0].bend, PitchBend::DownOutOf);
  EXPECT_EQ(tokens[0].role, NoteRole::SlurStart);
  EXPECT_EQ(tokens[1].ornament, Ornament::InvertedTurn);
  EXPECT_EQ(tokens[1].role, NoteRole::SlurEnd);
  EXPECT_EQ(tokens[2].bend, PitchBend::UpInto);
  EXPECT_EQ(tokens[2].role, NoteRole::TieStart);
  EXPECT_EQ(tokens[3].role, NoteRole::Tremolo);
}

TEST_F(NotationDecoderTest, TieAfterLowOctave) {
  auto tokens = decodeOk("C--");
  ASSERT_EQ(tokens.size(), 1u);
  EXPECT_EQ(tokens[0].pitch.octave, -1);
  EXPECT_EQ(tokens[0].role, NoteRole::TieStart);
}

TEST_F(NotationDecoderTest, DuplicateSingleValuedSuffixRejected) {
  expectError("C4&t&s", DecodeErrorKind::UnrecognizedToken, 4);
  expectError("C4?u?d", DecodeErrorKind::UnrecognizedToken, 4);
  expectError("C4-(", DecodeErrorKind::UnrecognizedToken, 3);
  expectError("C4&z", DecodeErrorKind::UnrecognizedToken, 2);
}

// ---------------------------------------------------------------------------
// Dynamics
// ---------------------------------------------------------------------------

TEST_F(NotationDecoderTest, DynamicsLongestMatch) {
  auto tokens = decodeOk("pppC4sfzD4sfE4fpF4mfG4");
  ASSERT_EQ(tokens.size(), 5u);
  EXPECT_EQ(tokens[0].dynamic, Dynamic::PPP);
  EXPECT_EQ(tokens[1].dynamic, Dynamic::SFZ);
  EXPECT_EQ(tokens[2].dynamic, Dynamic::SF);
  EXPECT_EQ(tokens[3].dynamic, Dynamic::FP);
  EXPECT_EQ(tokens[4].dynamic, Dynamic::MF);
}

TEST_F(NotationDecoderTest, FiveCharacterDynamics) {
  auto tokens = decodeOk("pppppC4fffffD4ppppE4");
  ASSERT_EQ(tokens.size(), 3u);
  EXPECT_EQ(tokens[0].dynamic, Dynamic::PPPPP);
  EXPECT_EQ(tokens[1].dynamic, Dynamic::FFFFF);
  EXPECT_EQ(tokens[2].dynamic, Dynamic::PPPP);
}

TEST_F(NotationDecoderTest, DynamicBeforeDurationPrefix) {
  auto tokens = decodeOk("ffHC4");
  ASSERT_EQ(tokens.size(), 1u);
  EXPECT_EQ(tokens[0].dynamic, Dynamic::FF);
  EXPECT_EQ(tokens[0].duration, duration::half());
}

TEST_F(NotationDecoderTest, DynamicSurvivesRestAndMarking) {
  auto tokens = decodeOk("pR<C4");
  ASSERT_EQ(tokens.size(), 3u);
  EXPECT_FALSE(tokens[0].dynamic.has_value());
  EXPECT_EQ(tokens[2].dynamic, Dynamic::P);
}

TEST_F(NotationDecoderTest, DynamicAttachesOnlyToNextNote) {
  auto tokens = decodeOk("pC4D4");
  ASSERT_EQ(tokens.size(), 2u);
  EXPECT_TRUE(tokens[0].dynamic.has_value());
  EXPECT_FALSE(tokens[1].dynamic.has_value());
}

TEST_F(NotationDecoderTest, DanglingDynamic) {
  expectError("C4D4mf", DecodeErrorKind::DanglingModifier, 4);
  expectError("pR", DecodeErrorKind::DanglingModifier, 0);
}

TEST_F(NotationDecoderTest, TwoPendingDynamicsRejected) {
  expectError("pfC4", DecodeErrorKind::UnrecognizedToken, 1);
}

// ---------------------------------------------------------------------------
// Grace groups
// ---------------------------------------------------------------------------

TEST_F(NotationDecoderTest, GraceGroup) {
  auto tokens = decodeOk("{D4E#4}C4");
  ASSERT_EQ(tokens.size(), 3u);
  EXPECT_EQ(tokens[0], makeGraceNote(pitchOf(PitchLetter::D, Accidental::None, 4)));
  EXPECT_EQ(tokens[1], makeGraceNote(pitchOf(PitchLetter::E, Accidental::Sharp, 4)));
  EXPECT_EQ(tokens[2].kind, TokenKind::Note);
}

TEST_F(NotationDecoderTest, GraceGroupErrors) {
  expectError("{C4", DecodeErrorKind::UnrecognizedToken, 0);
  expectError("C4}", DecodeErrorKind::UnrecognizedToken, 2);
  expectError("{}C4", DecodeErrorKind::UnrecognizedToken, 0);
  expectError("{C4{D4}}", DecodeErrorKind::UnrecognizedToken, 3);
  expectError("{TC4}", DecodeErrorKind::UnrecognizedToken, 1);
  expectError("{C4.}", DecodeErrorKind::UnrecognizedToken, 3);
}

// ---------------------------------------------------------------------------
// Markings and measure repeat
// ---------------------------------------------------------------------------

TEST_F(NotationDecoderTest, Markings) {
  auto tokens = decodeOk(",C4/D4//E4<F4~G4$pA4$aB4$mC5$o");
  ASSERT_EQ(tokens.size(), 17u);
  EXPECT_EQ(tokens[0], makeMarking(MarkingKind::Breath));
  EXPECT_EQ(tokens[2], makeMarking(MarkingKind::CaesuraShort));
  EXPECT_EQ(tokens[4], makeMarking(MarkingKind::CaesuraLong));
  EXPECT_EQ(tokens[6], makeMarking(MarkingKind::Crescendo));
  EXPECT_EQ(tokens[8], makeMarking(MarkingKind::Decrescendo));
  EXPECT_EQ(tokens[10], makeMarking(MarkingKind::Pizzicato));
  EXPECT_EQ(tokens[12], makeMarking(MarkingKind::Arco));
  EXPECT_EQ(tokens[14], makeMarking(MarkingKind::Mute));
  EXPECT_EQ(tokens[16], makeMarking(MarkingKind::Open));
}

TEST_F(NotationDecoderTest, UnknownTechniqueMarking) {
  expectError("C4$q", DecodeErrorKind::UnrecognizedToken, 2);
}

TEST_F(NotationDecoderTest, MeasureRepeat) {
  DecodeResult result = decodeNotation(" % ");
  EXPECT_TRUE(result.success);
  EXPECT_TRUE(result.measure_repeat);
  EXPECT_TRUE(result.tokens.empty());
}

TEST_F(NotationDecoderTest, MeasureRepeatMustBeAlone) {
  expectError("C4%", DecodeErrorKind::UnrecognizedToken, 2);
  expectError("%C4", DecodeErrorKind::UnrecognizedToken, 1);
  expectError("p%", DecodeErrorKind::UnrecognizedToken, 1);
  expectError("%%", DecodeErrorKind::UnrecognizedToken, 1);
}

// ---------------------------------------------------------------------------
// Unrecognized input
// ---------------------------------------------------------------------------

TEST_F(NotationDecoderTest, LoneDurationLetter) {
  expectError("Q", DecodeErrorKind::UnrecognizedToken, 0);
}

TEST_F(NotationDecoderTest, DurationWithoutAnchor) {
  expectError("C4Q,", DecodeErrorKind::UnrecognizedToken, 2);
  expectError("Q.....C4", DecodeErrorKind::UnrecognizedToken, 0);
}

TEST_F(NotationDecoderTest, UnknownCharacterReportsOffset) {
  expectError("C4D4*", DecodeErrorKind::UnrecognizedToken, 4);
  expectError("c4", DecodeErrorKind::UnrecognizedToken, 0);
  expectError("Z", DecodeErrorKind::UnrecognizedToken, 0);
}

TEST_F(NotationDecoderTest, Deterministic) {
  const std::string text = "mfT.C#5_.&t{D5}S.D5-R,";
  DecodeResult first = decodeNotation(text);
  DecodeResult second = decodeNotation(text);
  ASSERT_TRUE(first.success);
  EXPECT_EQ(first.tokens, second.tokens);
}

TEST(DecodeErrorKindTest, ToString) {
  EXPECT_STREQ(decodeErrorKindToString(DecodeErrorKind::UnrecognizedToken),
               "unrecognized_token");
  EXPECT_STREQ(decodeErrorKindToString(DecodeErrorKind::InvalidAccidental),
               "invalid_accidental");
  EXPECT_STREQ(decodeErrorKindToString(DecodeErrorKind::DanglingModifier),
               "dangling_modifier");
}

}  // namespace
}  // namespace engrave

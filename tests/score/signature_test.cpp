// Tests for score/signature.h -- time/key signatures and their records.

#include "score/signature.h"

#include <gtest/gtest.h>

namespace engrave {
namespace {

// ---------------------------------------------------------------------------
// TimeSignature
// ---------------------------------------------------------------------------

TEST(TimeSignatureTest, DurationKeepsWrittenForm) {
  TimeSignature six_eight{6, 8};
  EXPECT_EQ(six_eight.duration(), Fraction(3, 4));
  EXPECT_EQ(six_eight.toString(), "6/8");
  EXPECT_NE(six_eight, (TimeSignature{3, 4}));
}

TEST(TimeSignatureTest, Validity) {
  EXPECT_TRUE((TimeSignature{4, 4}).isValid());
  EXPECT_TRUE((TimeSignature{7, 128}).isValid());
  EXPECT_TRUE((TimeSignature{1, 1}).isValid());
  EXPECT_FALSE((TimeSignature{0, 4}).isValid());
  EXPECT_FALSE((TimeSignature{3, 6}).isValid());
  EXPECT_FALSE((TimeSignature{3, 256}).isValid());
  EXPECT_FALSE((TimeSignature{3, 0}).isValid());
}

TEST(TimeSignatureTest, Parse) {
  auto parsed = parseTimeSignature("12/8");
  ASSERT_TRUE(parsed.has_value());
  EXPECT_EQ(parsed->beats, 12);
  EXPECT_EQ(parsed->beat_unit, 8);

  EXPECT_FALSE(parseTimeSignature("4").has_value());
  EXPECT_FALSE(parseTimeSignature("/4").has_value());
  EXPECT_FALSE(parseTimeSignature("4/").has_value());
  EXPECT_FALSE(parseTimeSignature("-3/4").has_value());
  EXPECT_FALSE(parseTimeSignature("3/4x").has_value());
}

TEST(TimeSignatureTest, ParseDoesNotValidate) {
  auto parsed = parseTimeSignature("3/6");
  ASSERT_TRUE(parsed.has_value());
  EXPECT_FALSE(parsed->isValid());
}

// ---------------------------------------------------------------------------
// KeySignature
// ---------------------------------------------------------------------------

TEST(KeySignatureTest, OddKeysForceMicrotonal) {
  KeySignature key;
  EXPECT_FALSE(key.effectiveMicrotonal());
  key.key = 3;
  EXPECT_TRUE(key.effectiveMicrotonal());
  key.key = -1;
  EXPECT_TRUE(key.effectiveMicrotonal());
  key.key = 4;
  key.microtonal = true;
  EXPECT_TRUE(key.effectiveMicrotonal());
}

TEST(KeySignatureTest, Validity) {
  KeySignature key;
  EXPECT_TRUE(key.isValid());
  key.key = kMaxKeyIndex;
  EXPECT_TRUE(key.isValid());
  key.key = -kMaxKeyIndex - 1;
  EXPECT_FALSE(key.isValid());

  KeySignature slow;
  slow.tempo = 0;
  EXPECT_FALSE(slow.isValid());

  KeySignature swung;
  swung.swing = 101;
  EXPECT_FALSE(swung.isValid());
}

TEST(KeyNameTest, SharpSide) {
  EXPECT_EQ(keyName(0), "C");
  EXPECT_EQ(keyName(1), "Ct");
  EXPECT_EQ(keyName(2), "C#");
  EXPECT_EQ(keyName(3), "Ct#");
  EXPECT_EQ(keyName(4), "D");
  EXPECT_EQ(keyName(10), "F");
  EXPECT_EQ(keyName(23), "Bt");
}

TEST(KeyNameTest, FlatSide) {
  EXPECT_EQ(keyName(-1), "Cd");
  EXPECT_EQ(keyName(-4), "Bb");
  EXPECT_EQ(keyName(-10), "G");
  EXPECT_EQ(keyName(-12), "Gb");
}

TEST(KeyNameTest, OutOfRange) {
  EXPECT_EQ(keyName(24), "");
  EXPECT_EQ(keyName(-24), "");
}

// ---------------------------------------------------------------------------
// Signature records
// ---------------------------------------------------------------------------

TEST(SignatureFromJsonTest, FullRecord) {
  auto result = signatureFromJson(
      R"({"key": -4, "time": "6/8", "tempo": 90, "swing": 60, "microtonal": true})");
  ASSERT_TRUE(result.success) << result.error;
  EXPECT_EQ(result.signature.key.key, -4);
  EXPECT_EQ(result.signature.key.tempo, 90);
  EXPECT_EQ(result.signature.key.swing, 60);
  EXPECT_TRUE(result.signature.key.microtonal);
  EXPECT_EQ(result.signature.time, (TimeSignature{6, 8}));
  EXPECT_TRUE(result.signature.isValid());
}

TEST(SignatureFromJsonTest, DefaultsForMissingFields) {
  auto result = signatureFromJson(R"({"time": "3/4"})");
  ASSERT_TRUE(result.success);
  EXPECT_EQ(result.signature.key, KeySignature());
}

TEST(SignatureFromJsonTest, TimeIsRequired) {
  auto result = signatureFromJson(R"({"key": 2})");
  EXPECT_FALSE(result.success);
  EXPECT_EQ(result.error, "time");

  auto bad = signatureFromJson(R"({"time": "three"})");
  EXPECT_FALSE(bad.success);
  EXPECT_EQ(bad.error, "time");
}

TEST(SignatureFromJsonTest, FieldTypesChecked) {
  auto fractional = signatureFromJson(R"({"time": "4/4", "tempo": 90.5})");
  EXPECT_FALSE(fractional.success);
  EXPECT_EQ(fractional.error, "tempo");

  auto text_key = signatureFromJson(R"({"time": "4/4", "key": "D"})");
  EXPECT_FALSE(text_key.success);
  EXPECT_EQ(text_key.error, "key");

  auto micro = signatureFromJson(R"({"time": "4/4", "microtonal": 1})");
  EXPECT_FALSE(micro.success);
  EXPECT_EQ(micro.error, "microtonal");
}

TEST(SignatureFromJsonTest, RangeIsLeftToCaller) {
  auto result = signatureFromJson(R"({"time": "4/4", "key": 30})");
  ASSERT_TRUE(result.success);
  EXPECT_FALSE(result.signature.isValid());
}

TEST(SignatureFromJsonTest, MalformedJson) {
  auto result = signatureFromJson(R"({"time" "4/4"})");
  EXPECT_FALSE(result.success);
  EXPECT_EQ(result.error, "malformed JSON at offset 8");
}

}  // namespace
}  // namespace engrave

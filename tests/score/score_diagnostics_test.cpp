// Tests for score/score_diagnostics.h -- issue collection and report JSON.

#include "score/score_diagnostics.h"

#include <gtest/gtest.h>

#include <string>

namespace engrave {
namespace {

ScoreIssue makeIssue(ScoreIssueKind kind, int bar, int channel = kNoLocation) {
  ScoreIssue issue;
  issue.kind = kind;
  issue.bar = bar;
  issue.channel = channel;
  return issue;
}

// ---------------------------------------------------------------------------
// ScoreIssueKind to string
// ---------------------------------------------------------------------------

TEST(ScoreIssueKindTest, ToStringValues) {
  EXPECT_STREQ(scoreIssueKindToString(ScoreIssueKind::MissingSignature), "missing_signature");
  EXPECT_STREQ(scoreIssueKindToString(ScoreIssueKind::SignatureOutOfRange),
               "signature_out_of_range");
  EXPECT_STREQ(scoreIssueKindToString(ScoreIssueKind::BeatMismatch), "beat_mismatch");
  EXPECT_STREQ(scoreIssueKindToString(ScoreIssueKind::NoPreviousMeasure),
               "no_previous_measure");
  EXPECT_STREQ(scoreIssueKindToString(ScoreIssueKind::ChannelOutOfRange),
               "channel_out_of_range");
}

TEST(ScoreIssueKindTest, DecodeErrorMapping) {
  EXPECT_EQ(issueKindForDecodeError(DecodeErrorKind::UnrecognizedToken),
            ScoreIssueKind::UnrecognizedToken);
  EXPECT_EQ(issueKindForDecodeError(DecodeErrorKind::InvalidAccidental),
            ScoreIssueKind::InvalidAccidental);
  EXPECT_EQ(issueKindForDecodeError(DecodeErrorKind::DanglingModifier),
            ScoreIssueKind::DanglingModifier);
}

// ---------------------------------------------------------------------------
// ScoreReport queries
// ---------------------------------------------------------------------------

TEST(ScoreReportTest, AddIssueKeepsOrder) {
  ScoreReport report;
  EXPECT_FALSE(report.hasErrors());

  report.addIssue(makeIssue(ScoreIssueKind::BeatMismatch, 2, 0));
  report.addIssue(makeIssue(ScoreIssueKind::UnrecognizedToken, 0, 1));
  ASSERT_EQ(report.issues.size(), 2u);
  EXPECT_TRUE(report.hasErrors());
  EXPECT_EQ(report.issues[0].bar, 2);
  EXPECT_EQ(report.issues[1].bar, 0);
}

TEST(ScoreReportTest, IssuesForBar) {
  ScoreReport report;
  report.addIssue(makeIssue(ScoreIssueKind::BeatMismatch, 1, 0));
  report.addIssue(makeIssue(ScoreIssueKind::BeatMismatch, 3, 0));
  report.addIssue(makeIssue(ScoreIssueKind::NoPreviousMeasure, 1, 2));

  auto bar_one = report.issuesForBar(1);
  ASSERT_EQ(bar_one.size(), 2u);
  EXPECT_EQ(bar_one[0].kind, ScoreIssueKind::BeatMismatch);
  EXPECT_EQ(bar_one[1].kind, ScoreIssueKind::NoPreviousMeasure);
  EXPECT_TRUE(report.issuesForBar(7).empty());
}

TEST(ScoreReportTest, IssuesByKind) {
  ScoreReport report;
  report.addIssue(makeIssue(ScoreIssueKind::BeatMismatch, 0, 0));
  report.addIssue(makeIssue(ScoreIssueKind::InvalidEnding, 4));
  report.addIssue(makeIssue(ScoreIssueKind::BeatMismatch, 5, 1));

  auto mismatches = report.issuesByKind(ScoreIssueKind::BeatMismatch);
  ASSERT_EQ(mismatches.size(), 2u);
  EXPECT_EQ(mismatches[1].bar, 5);
  EXPECT_TRUE(report.issuesByKind(ScoreIssueKind::MissingSignature).empty());
}

// ---------------------------------------------------------------------------
// ScoreReport::toJson
// ---------------------------------------------------------------------------

TEST(ScoreReportTest, ToJsonEmpty) {
  ScoreReport report;
  EXPECT_EQ(report.toJson(), "{\n  \"issue_count\": 0,\n  \"issues\": []\n}");
}

TEST(ScoreReportTest, ToJsonBeatMismatchHasDurations) {
  ScoreReport report;
  ScoreIssue issue = makeIssue(ScoreIssueKind::BeatMismatch, 3, 1);
  issue.expected = Fraction(3, 4);
  issue.actual = Fraction(1, 2);
  issue.description = "channel sums to 1/2";
  report.addIssue(issue);

  std::string json = report.toJson();
  EXPECT_NE(json.find("\"issue_count\": 1"), std::string::npos);
  EXPECT_NE(json.find("\"kind\": \"beat_mismatch\""), std::string::npos);
  EXPECT_NE(json.find("\"bar\": 3"), std::string::npos);
  EXPECT_NE(json.find("\"channel\": 1"), std::string::npos);
  EXPECT_NE(json.find("\"expected\": \"3/4\""), std::string::npos);
  EXPECT_NE(json.find("\"actual\": \"1/2\""), std::string::npos);
  EXPECT_NE(json.find("\"description\": \"channel sums to 1/2\""), std::string::npos);
  EXPECT_EQ(json.find("\"position\""), std::string::npos);
  EXPECT_EQ(json.find("\"signature\""), std::string::npos);
}

TEST(ScoreReportTest, ToJsonOmitsDurationsForOtherKinds) {
  ScoreReport report;
  ScoreIssue issue = makeIssue(ScoreIssueKind::UnrecognizedToken, 0, 0);
  issue.position = 5;
  report.addIssue(issue);

  std::string json = report.toJson();
  EXPECT_NE(json.find("\"position\": 5"), std::string::npos);
  EXPECT_EQ(json.find("\"expected\""), std::string::npos);
  EXPECT_EQ(json.find("\"actual\""), std::string::npos);
}

TEST(ScoreReportTest, ToJsonEscapesDescription) {
  ScoreReport report;
  ScoreIssue issue = makeIssue(ScoreIssueKind::InvalidSignature, kNoLocation);
  issue.signature = 0;
  issue.description = "bad \"time\" field";
  report.addIssue(issue);

  std::string json = report.toJson();
  EXPECT_NE(json.find("\"signature\": 0"), std::string::npos);
  EXPECT_NE(json.find("bad \\\"time\\\" field"), std::string::npos);
  EXPECT_EQ(json.find("\"bar\""), std::string::npos);
}

}  // namespace
}  // namespace engrave

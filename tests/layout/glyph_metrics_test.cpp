// Tests for layout/glyph_metrics.h -- default table and JSON overrides.

#include "layout/glyph_metrics.h"

#include <gtest/gtest.h>

namespace engrave {
namespace {

TEST(GlyphCategoryTest, NamesParseBack) {
  for (int idx = 0; idx < kGlyphCategoryCount; ++idx) {
    auto category = static_cast<GlyphCategory>(idx);
    auto parsed = glyphCategoryFromString(glyphCategoryToString(category));
    ASSERT_TRUE(parsed.has_value()) << glyphCategoryToString(category);
    EXPECT_EQ(*parsed, category);
  }
  EXPECT_FALSE(glyphCategoryFromString("stem").has_value());
  EXPECT_STREQ(glyphCategoryToString(GlyphCategory::FlagUnit), "flag_unit");
}

TEST(TableGlyphMetricsTest, DefaultTable) {
  TableGlyphMetrics metrics;
  EXPECT_DOUBLE_EQ(metrics.width(GlyphCategory::Notehead), 266.0);
  EXPECT_DOUBLE_EQ(metrics.width(GlyphCategory::Accidental), 250.0);
  EXPECT_DOUBLE_EQ(metrics.width(GlyphCategory::Barline), 36.0);
  EXPECT_DOUBLE_EQ(metrics.width(GlyphCategory::Measure), 3200.0);
  EXPECT_DOUBLE_EQ(metrics.width(GlyphCategory::GraceScale), 0.6);
}

TEST(TableGlyphMetricsTest, SetWidthThroughInterface) {
  TableGlyphMetrics table;
  table.setWidth(GlyphCategory::Dynamic, 520.0);
  const IGlyphMetrics& metrics = table;
  EXPECT_DOUBLE_EQ(metrics.width(GlyphCategory::Dynamic), 520.0);
  EXPECT_DOUBLE_EQ(metrics.width(GlyphCategory::Marking), 200.0);
}

TEST(GlyphMetricsFromJsonTest, OverridesListedEntries) {
  auto result = glyphMetricsFromJson(R"({"notehead": 300, "grace_scale": 0.5})");
  ASSERT_TRUE(result.success) << result.error;
  EXPECT_DOUBLE_EQ(result.metrics.width(GlyphCategory::Notehead), 300.0);
  EXPECT_DOUBLE_EQ(result.metrics.width(GlyphCategory::GraceScale), 0.5);
  EXPECT_DOUBLE_EQ(result.metrics.width(GlyphCategory::FlagUnit), 100.0);
}

TEST(GlyphMetricsFromJsonTest, RejectsBadEntries) {
  auto unknown = glyphMetricsFromJson(R"({"stem": 10})");
  EXPECT_FALSE(unknown.success);
  EXPECT_EQ(unknown.error, "unknown glyph category: stem");

  auto negative = glyphMetricsFromJson(R"({"barline": -1})");
  EXPECT_FALSE(negative.success);
  EXPECT_EQ(negative.error, "invalid width for barline");

  auto text = glyphMetricsFromJson(R"({"measure": "wide"})");
  EXPECT_FALSE(text.success);

  auto malformed = glyphMetricsFromJson("{");
  EXPECT_FALSE(malformed.success);
  EXPECT_EQ(malformed.error.rfind("malformed JSON", 0), 0u);
}

}  // namespace
}  // namespace engrave

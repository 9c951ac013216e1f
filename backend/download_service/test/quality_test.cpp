#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include "domain/quality.hpp"

using testing::Eq;

using download_service::normalizeQuality;
using download_service::parseQuality;
using download_service::QualityKind;

namespace {

TEST(QualityTest, NormalizesPresetsAndHeights) {
  EXPECT_THAT(normalizeQuality("  Best "), Eq("best"));
  EXPECT_THAT(normalizeQuality("720P"), Eq("720p"));
  EXPECT_THAT(normalizeQuality("WORST"), Eq("lowest"));
  EXPECT_THAT(normalizeQuality("Simple"), Eq("simple"));
}

TEST(QualityTest, ExplicitFormatIdsKeepTheirCase) {
  EXPECT_THAT(normalizeQuality(" best[height<=720][ext=MP4] "), Eq("best[height<=720][ext=MP4]"));
  EXPECT_THAT(normalizeQuality("137"), Eq("137"));
}

TEST(QualityTest, MapsSelectorsToFormatExpressions) {
  auto height = parseQuality("480p");
  EXPECT_THAT(height.kind, Eq(QualityKind::Height));
  EXPECT_THAT(height.height, Eq(480));
  EXPECT_THAT(height.format_expression, Eq("bestvideo[height<=480]+bestaudio/best[height<=480]"));

  EXPECT_THAT(parseQuality("best").format_expression, Eq("bestvideo+bestaudio/best"));
  EXPECT_THAT(parseQuality("lowest").format_expression, Eq("worstvideo+worstaudio/worst"));
  EXPECT_THAT(parseQuality("simple").kind, Eq(QualityKind::Simple));

  auto explicit_id = parseQuality("best[height<=720]");
  EXPECT_THAT(explicit_id.kind, Eq(QualityKind::FormatId));
  EXPECT_THAT(explicit_id.format_expression, Eq("best[height<=720]"));
}

TEST(QualityTest, MalformedHeightIsAFormatId) {
  EXPECT_THAT(parseQuality("0p").kind, Eq(QualityKind::FormatId));
  EXPECT_THAT(parseQuality("p").kind, Eq(QualityKind::FormatId));
  EXPECT_THAT(parseQuality("12ap").kind, Eq(QualityKind::FormatId));
}

} // namespace

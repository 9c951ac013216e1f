#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include "infrastructure/ytdlp_command.hpp"
#include "infrastructure/ytdlp_fetcher.hpp"
#include "infrastructure/ytdlp_resolver.hpp"

using testing::ElementsAre;
using testing::Eq;
using testing::Contains;
using testing::Optional;

using namespace download_service;

namespace {

TEST(YtDlpProgressTest, ParsesTemplateLine) {
  auto progress = parseProgressLine("[progress] 1048576 4194304 NA 524288.5 6");
  ASSERT_TRUE(progress);
  EXPECT_THAT(progress->downloaded_bytes, Eq(1048576u));
  EXPECT_THAT(progress->total_bytes, Optional(Eq(4194304u)));
  EXPECT_THAT(progress->speed, Optional(Eq(524288.5)));
  EXPECT_THAT(progress->eta_seconds, Optional(Eq(6.0)));
}

TEST(YtDlpProgressTest, FallsBackToEstimatedTotal) {
  auto progress = parseProgressLine("[progress] 100 NA 2000.0 None NA");
  ASSERT_TRUE(progress);
  EXPECT_THAT(progress->total_bytes, Optional(Eq(2000u)));
  EXPECT_FALSE(progress->speed);
  EXPECT_FALSE(progress->eta_seconds);
}

TEST(YtDlpProgressTest, IgnoresOtherOutput) {
  EXPECT_FALSE(parseProgressLine("[download] Destination: video.mp4"));
  EXPECT_FALSE(parseProgressLine("[progress] NA NA NA NA NA"));
  EXPECT_FALSE(parseProgressLine("[progress] 12 34"));
}

TEST(YtDlpFileLineTest, ExtractsPath) {
  EXPECT_THAT(parseFileLine("[file] /tmp/a b/My Video.mp4"), Optional(Eq("/tmp/a b/My Video.mp4")));
  EXPECT_FALSE(parseFileLine("[file]   "));
  EXPECT_FALSE(parseFileLine("[download] 100%"));
}

TEST(YtDlpCommandTest, SplitsQuotedArguments) {
  EXPECT_THAT(splitArguments(R"(--proxy "socks5://h:1" --cookies  c.txt)"),
              ElementsAre("--proxy", "socks5://h:1", "--cookies", "c.txt"));
  EXPECT_THAT(splitArguments(R"(--referer "")"), ElementsAre("--referer", ""));
  EXPECT_TRUE(splitArguments("   ").empty());
}

TEST(YtDlpCommandTest, BaseArgumentsCarryRetriesAndExtras) {
  YtDlpOptions options;
  options.retries = 5;
  options.user_agent = "agent/1.0";
  options.extra_args = "--force-ipv4";

  auto args = baseArguments(options);
  EXPECT_THAT(args, Contains("--ignore-config"));
  EXPECT_THAT(args, Contains("5"));
  EXPECT_THAT(args, Contains("agent/1.0"));
  EXPECT_THAT(args.back(), Eq("--force-ipv4"));
}

TEST(YtDlpCommandTest, MissingBinaryIsAnError) {
  YtDlpOptions options;
  options.binary = "definitely-not-an-installed-extractor";
  auto outcome = runYtDlp(options, {"--version"}, nullptr);
  ASSERT_FALSE(outcome);
  EXPECT_THAT(outcome.error(), testing::HasSubstr("not found"));
}

TEST(VideoInfoSummaryTest, OneOptionPerCommonHeight) {
  auto info = nlohmann::json::parse(R"({
    "title": "Sample",
    "duration": 3725,
    "thumbnail": "https://i.example/t.jpg",
    "formats": [
      {"format_id": "18", "ext": "mp4", "height": 360, "vcodec": "avc1", "filesize": 1000},
      {"format_id": "243", "ext": "webm", "height": 360, "vcodec": "vp9", "filesize": 900},
      {"format_id": "137", "ext": "mp4", "height": 1080, "vcodec": "avc1", "filesize": null, "filesize_approx": 50000},
      {"format_id": "248", "ext": "webm", "height": 1080, "vcodec": "vp9", "filesize": 40000},
      {"format_id": "140", "ext": "m4a", "vcodec": "none", "acodec": "mp4a"},
      {"format_id": "394", "ext": "mp4", "height": 144, "vcodec": "av01"}
    ]
  })");

  auto summary = summarizeVideoInfo(info);
  EXPECT_THAT(summary.title, Eq("Sample"));
  EXPECT_THAT(summary.duration, Eq("01:02:05"));
  ASSERT_THAT(summary.formats.size(), Eq(2u));

  EXPECT_THAT(summary.formats[0].format_id, Eq("best[height<=1080]"));
  EXPECT_THAT(summary.formats[0].ext, Eq("mp4"));
  EXPECT_THAT(summary.formats[0].filesize, Optional(Eq(50000u)));
  EXPECT_THAT(summary.formats[0].acodec, Eq("bestaudio"));

  EXPECT_THAT(summary.formats[1].format_id, Eq("best[height<=360]"));
  EXPECT_THAT(summary.formats[1].resolution, Eq("360p"));
  EXPECT_THAT(summary.formats[1].ext, Eq("mp4"));
}

TEST(VideoInfoSummaryTest, FallsBackToFirstPlayableFormat) {
  auto info = nlohmann::json::parse(R"({
    "title": "Odd",
    "formats": [
      {"format_id": "hls-1", "ext": "mp4", "height": 900, "width": 1600, "vcodec": "avc1"}
    ]
  })");

  auto summary = summarizeVideoInfo(info);
  EXPECT_THAT(summary.duration, Eq("Unknown"));
  ASSERT_THAT(summary.formats.size(), Eq(1u));
  EXPECT_THAT(summary.formats[0].format_id, Eq("hls-1"));
  EXPECT_THAT(summary.formats[0].resolution, Eq("900p"));
  EXPECT_FALSE(summary.formats[0].filesize);
}

TEST(VideoInfoSummaryTest, ToleratesMissingFields) {
  auto summary = summarizeVideoInfo(nlohmann::json::object());
  EXPECT_THAT(summary.title, Eq("Unknown Title"));
  EXPECT_TRUE(summary.formats.empty());
}

} // namespace

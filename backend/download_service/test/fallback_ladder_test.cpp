#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include "application/fallback_ladder.hpp"

using testing::ElementsAre;
using testing::Eq;
using testing::Field;

using download_service::FallbackLadder;
using download_service::LadderRung;

namespace {

TEST(FallbackLadderTest, UserChoiceComesFirst) {
  FallbackLadder ladder;
  auto rungs = ladder.build("1080p");
  EXPECT_THAT(rungs, ElementsAre(
    Field(&LadderRung::label, Eq("1080p")),
    Field(&LadderRung::label, Eq("480p")),
    Field(&LadderRung::label, Eq("720p")),
    Field(&LadderRung::label, Eq("lowest"))));
  EXPECT_THAT(rungs.front().format_expression,
              Eq("bestvideo[height<=1080]+bestaudio/best[height<=1080]"));
}

TEST(FallbackLadderTest, DuplicateRungsAreTriedOnce) {
  FallbackLadder ladder;
  EXPECT_THAT(ladder.build("480p"), ElementsAre(
    Field(&LadderRung::label, Eq("480p")),
    Field(&LadderRung::label, Eq("720p")),
    Field(&LadderRung::label, Eq("lowest"))));
  EXPECT_THAT(ladder.build("WORST").size(), Eq(3u));
}

TEST(FallbackLadderTest, ExplicitFormatIdPassesThrough) {
  FallbackLadder ladder;
  auto rungs = ladder.build("best[height<=720]");
  ASSERT_THAT(rungs.size(), Eq(4u));
  EXPECT_THAT(rungs.front().format_expression, Eq("best[height<=720]"));
}

TEST(FallbackLadderTest, CustomFallbacks) {
  FallbackLadder ladder({"360p"});
  EXPECT_THAT(ladder.build("best"), ElementsAre(
    Field(&LadderRung::label, Eq("best")),
    Field(&LadderRung::label, Eq("360p"))));
  EXPECT_TRUE(ladder.build("").size() == 1);
}

} // namespace

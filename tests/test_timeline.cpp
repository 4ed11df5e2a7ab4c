// Component: render plan compilation

#include <gtest/gtest.h>

#include <limits>

#include "fixtures/sample_assets.hpp"
#include "slide_reel/timeline.hpp"

namespace slide_reel {
namespace {

using namespace slide_reel::tests::fixtures;

// -----------------------------------------------------------------------------
// Base timeline: 30 x 2s slideshow + 1.5s fade
// -----------------------------------------------------------------------------
TEST(TimelineTest, BaseDuration) {
  RenderPlan plan = compile_plan(make_assets());

  EXPECT_DOUBLE_EQ(plan.slideshow_duration, 60.0);
  EXPECT_DOUBLE_EQ(plan.total_duration, 61.5);
  EXPECT_DOUBLE_EQ(plan.slideshow_start, 0.0);
  EXPECT_DOUBLE_EQ(plan.thumbnail_duration, 0.0);
  EXPECT_DOUBLE_EQ(plan.fade_out_window.start, 60.0);
  EXPECT_DOUBLE_EQ(plan.fade_out_window.end, 61.5);
  EXPECT_EQ(plan.width, 1920);
  EXPECT_EQ(plan.height, 1080);
  EXPECT_EQ(plan.fps, 30);
  EXPECT_DOUBLE_EQ(plan.soundtrack_weight, 0.0);

  std::vector<EncodeStep> expected = {EncodeStep::kBuildSlideshow,
                                      EncodeStep::kFadeVisual,
                                      EncodeStep::kBuildAudio, EncodeStep::kMux};
  EXPECT_EQ(plan.steps, expected);
}

// -----------------------------------------------------------------------------
// Thumbnail shifts the slideshow by 0.2s and adds a step
// -----------------------------------------------------------------------------
TEST(TimelineTest, ThumbnailShiftsSlideshow) {
  RenderPlan plan = compile_plan(make_assets(true));

  EXPECT_DOUBLE_EQ(plan.total_duration, 61.7);
  EXPECT_DOUBLE_EQ(plan.slideshow_start, 0.2);
  EXPECT_DOUBLE_EQ(plan.fade_out_window.start, 60.2);
  EXPECT_DOUBLE_EQ(plan.fade_out_window.duration(), 1.5);
  ASSERT_GE(plan.steps.size(), 2u);
  EXPECT_EQ(plan.steps[1], EncodeStep::kPrependThumbnail);
}

TEST(TimelineTest, SoundtrackAndFilterSteps) {
  RenderPlan plan = compile_plan(make_assets(true, "calm", "rain"));

  EXPECT_TRUE(plan.has_soundtrack);
  EXPECT_TRUE(plan.has_filter);
  EXPECT_DOUBLE_EQ(plan.narration_weight, 1.0);
  EXPECT_DOUBLE_EQ(plan.soundtrack_weight, 0.3);
  EXPECT_DOUBLE_EQ(plan.soundtrack_min_duration, 63.7);

  std::vector<EncodeStep> expected = {
      EncodeStep::kBuildSlideshow, EncodeStep::kPrependThumbnail,
      EncodeStep::kApplyFilter,    EncodeStep::kFadeVisual,
      EncodeStep::kBuildAudio,     EncodeStep::kMux};
  EXPECT_EQ(plan.steps, expected);
}

// -----------------------------------------------------------------------------
// Same inputs, same plan
// -----------------------------------------------------------------------------
TEST(TimelineTest, Deterministic) {
  AssetSet assets = make_assets(true, "calm");
  EXPECT_EQ(compile_plan(assets), compile_plan(assets));
  EXPECT_NE(compile_plan(assets), compile_plan(make_assets()));
}

// -----------------------------------------------------------------------------
// Loop count: enough extra repetitions to outlast total + margin
// -----------------------------------------------------------------------------
TEST(TimelineTest, SoundtrackLoopCount) {
  RenderPlan plan = compile_plan(make_assets(false, "calm"));
  ASSERT_DOUBLE_EQ(plan.soundtrack_min_duration, 63.5);

  EXPECT_EQ(soundtrack_loop_count(plan, 30.0), 2);  // 3 x 30s = 90s
  EXPECT_EQ(soundtrack_loop_count(plan, 63.0), 1);  // 2 x 63s
  EXPECT_EQ(soundtrack_loop_count(plan, 120.0), 0); // plays once
  EXPECT_EQ(soundtrack_loop_count(plan, std::nullopt), -1);
  EXPECT_EQ(soundtrack_loop_count(plan, 0.0), -1);
  EXPECT_EQ(soundtrack_loop_count(plan, 1e-9), std::numeric_limits<int>::max());
  EXPECT_EQ(soundtrack_loop_count(plan, 1e-300),
            std::numeric_limits<int>::max());

  for (double d : {1.0, 7.3, 30.0, 63.5, 100.0}) {
    int loops = soundtrack_loop_count(plan, d);
    EXPECT_GT((loops + 1) * d, plan.soundtrack_min_duration) << d;
  }
}

TEST(TimelineTest, StepNames) {
  EXPECT_STREQ(step_name(EncodeStep::kBuildSlideshow), "build_slideshow");
  EXPECT_STREQ(step_name(EncodeStep::kPrependThumbnail), "prepend_thumbnail");
  EXPECT_STREQ(step_name(EncodeStep::kApplyFilter), "apply_filter");
  EXPECT_STREQ(step_name(EncodeStep::kFadeVisual), "fade_visual");
  EXPECT_STREQ(step_name(EncodeStep::kBuildAudio), "build_audio");
  EXPECT_STREQ(step_name(EncodeStep::kMux), "mux");
}

} // namespace
} // namespace slide_reel

/**
 * @file timeline.cpp
 * @brief Render plan compilation
 */

#include "slide_reel/timeline.hpp"

#include <cmath>
#include <limits>

namespace slide_reel {

const char *step_name(EncodeStep step) {
  switch (step) {
  case EncodeStep::kBuildSlideshow:
    return "build_slideshow";
  case EncodeStep::kPrependThumbnail:
    return "prepend_thumbnail";
  case EncodeStep::kApplyFilter:
    return "apply_filter";
  case EncodeStep::kFadeVisual:
    return "fade_visual";
  case EncodeStep::kBuildAudio:
    return "build_audio";
  case EncodeStep::kMux:
    return "mux";
  }
  return "unknown";
}

bool RenderPlan::operator==(const RenderPlan &o) const {
  return image_count == o.image_count &&
         per_image_duration == o.per_image_duration &&
         slideshow_duration == o.slideshow_duration &&
         fade_out_duration == o.fade_out_duration &&
         thumbnail_duration == o.thumbnail_duration &&
         slideshow_start == o.slideshow_start &&
         total_duration == o.total_duration &&
         fade_out_window == o.fade_out_window &&
         narration_weight == o.narration_weight &&
         soundtrack_weight == o.soundtrack_weight &&
         has_thumbnail == o.has_thumbnail &&
         has_soundtrack == o.has_soundtrack && has_filter == o.has_filter &&
         soundtrack_min_duration == o.soundtrack_min_duration &&
         width == o.width && height == o.height && fps == o.fps &&
         steps == o.steps;
}

RenderPlan compile_plan(const AssetSet &assets) {
  RenderPlan plan;

  plan.image_count = REQUIRED_IMAGE_COUNT;
  plan.per_image_duration = PER_IMAGE_DURATION_SEC;
  plan.slideshow_duration =
      static_cast<double>(REQUIRED_IMAGE_COUNT) * PER_IMAGE_DURATION_SEC;
  plan.fade_out_duration = FADE_OUT_DURATION_SEC;

  plan.has_thumbnail = assets.has_thumbnail();
  plan.has_soundtrack = assets.has_soundtrack();
  plan.has_filter = assets.has_filter();

  plan.thumbnail_duration = plan.has_thumbnail ? THUMBNAIL_DURATION_SEC : 0.0;
  plan.slideshow_start = plan.thumbnail_duration;
  plan.total_duration = plan.thumbnail_duration + plan.slideshow_duration +
                        plan.fade_out_duration;

  plan.fade_out_window = {plan.slideshow_start + plan.slideshow_duration,
                          plan.total_duration};

  plan.narration_weight = NARRATION_WEIGHT;
  plan.soundtrack_weight = plan.has_soundtrack ? SOUNDTRACK_WEIGHT : 0.0;
  plan.soundtrack_min_duration =
      plan.has_soundtrack ? plan.total_duration + SOUNDTRACK_LOOP_MARGIN_SEC
                          : 0.0;

  plan.width = OUTPUT_WIDTH;
  plan.height = OUTPUT_HEIGHT;
  plan.fps = OUTPUT_FPS;

  plan.steps.push_back(EncodeStep::kBuildSlideshow);
  if (plan.has_thumbnail)
    plan.steps.push_back(EncodeStep::kPrependThumbnail);
  if (plan.has_filter)
    plan.steps.push_back(EncodeStep::kApplyFilter);
  plan.steps.push_back(EncodeStep::kFadeVisual);
  plan.steps.push_back(EncodeStep::kBuildAudio);
  plan.steps.push_back(EncodeStep::kMux);

  return plan;
}

int soundtrack_loop_count(const RenderPlan &plan,
                          std::optional<double> track_duration) {
  if (!track_duration || *track_duration <= 0)
    return -1;
  /// N extra loops play the track N + 1 times; (N + 1) * d must exceed min
  double loops = std::floor(plan.soundtrack_min_duration / *track_duration);
  /// Very short tracks would overflow the count
  constexpr double max_loops = std::numeric_limits<int>::max();
  return loops >= max_loops ? std::numeric_limits<int>::max()
                            : static_cast<int>(loops);
}

} // namespace slide_reel

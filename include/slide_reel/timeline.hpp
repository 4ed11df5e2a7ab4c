/**
 * @file timeline.hpp
 * @brief Render plan: exact timings, mix weights and the encode step list
 *
 * @details compile_plan() is a pure function of which optional inputs an
 *          AssetSet carries. Two AssetSets with the same optional-field
 *          presence produce bit-equal plans.
 *
 * @attention TIMELINE (thumbnail present):
 *
 *   0.0 ── thumbnail ── 0.2 ── 30 images × 2.0s ── 60.2 ── fade ── 61.7
 *
 *   Without a thumbnail the slideshow starts at 0.0 and the run ends at 61.5.
 *   Audio spans the whole timeline; the fade window is shared by picture
 *   and sound.
 */

#ifndef SLIDE_REEL_TIMELINE_HPP
#define SLIDE_REEL_TIMELINE_HPP

#include <optional>
#include <string>
#include <vector>

#include "asset_set.hpp"
#include "types.hpp"

namespace slide_reel {

// **----- PRODUCT CONTRACTS -----**

constexpr double PER_IMAGE_DURATION_SEC = 2.0;
constexpr double FADE_OUT_DURATION_SEC = 1.5;
constexpr double THUMBNAIL_DURATION_SEC = 0.2;

constexpr double NARRATION_WEIGHT = 1.0;
/// Background must never mask narration
constexpr double SOUNDTRACK_WEIGHT = 0.3;

/// Looped soundtrack must outlast the timeline by at least this much
constexpr double SOUNDTRACK_LOOP_MARGIN_SEC = 2.0;

/// Chroma key applied to filter overlays: color, similarity, blend
constexpr const char *FILTER_KEY_COLOR = "green";
constexpr double FILTER_KEY_SIMILARITY = 0.3;
constexpr double FILTER_KEY_BLEND = 0.2;

/**
 * @enum EncodeStep
 * @brief Encode operations of the processing phase, in execution order.
 */
enum class EncodeStep {
  kBuildSlideshow,   //< 30 images -> 60s clip at the output profile
  kPrependThumbnail, //< thumbnail still + slideshow (video only)
  kApplyFilter,      //< chroma-keyed overlay over the visual clip
  kFadeVisual,       //< extend by the fade length, fade to black
  kBuildAudio,       //< narration (+ looped soundtrack), pad/trim, fade
  kMux,              //< faded picture + faded sound -> final container
};

/// snake_case step name used in logs, errors and blob names
const char *step_name(EncodeStep step);

/**
 * @struct RenderPlan
 * @brief Immutable result of compile_plan().
 */
struct RenderPlan {
  size_t image_count;
  double per_image_duration;
  double slideshow_duration;
  double fade_out_duration;
  double thumbnail_duration; //< 0 without a thumbnail
  double slideshow_start;    //< Offset of image #1 on the final timeline
  double total_duration;

  TimeWindow fade_out_window;

  double narration_weight;
  double soundtrack_weight; //< 0 without a soundtrack

  bool has_thumbnail;
  bool has_soundtrack;
  bool has_filter;

  /// Minimum length the looped soundtrack must reach before trimming
  double soundtrack_min_duration;

  int width;
  int height;
  int fps;

  std::vector<EncodeStep> steps;

  bool operator==(const RenderPlan &o) const;
  bool operator!=(const RenderPlan &o) const { return !(*this == o); }
};

/**
 * @brief Compile the plan for an AssetSet.
 * @note No I/O, no clock, no randomness.
 */
RenderPlan compile_plan(const AssetSet &assets);

/**
 * @brief Number of extra repetitions needed so the soundtrack outlasts the
 *        plan by the loop margin.
 * @param plan Compiled plan
 * @param track_duration Catalog duration of the track, if known
 * @return ffmpeg -stream_loop count; -1 (loop forever, bounded by the trim)
 *         when the track duration is unknown
 */
int soundtrack_loop_count(const RenderPlan &plan,
                          std::optional<double> track_duration);

} // namespace slide_reel

#endif // SLIDE_REEL_TIMELINE_HPP

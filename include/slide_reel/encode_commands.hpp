/**
 * @file encode_commands.hpp
 * @brief Translates a RenderPlan into the ordered encoder invocations
 *
 * @details Each planned EncodeStep becomes one EncodeOperation whose
 *          arguments reference blobs by their workspace names. The visual
 *          chain threads the output of one step into the next:
 *
 *          slideshow -> [thumbnail concat] -> [filter overlay] -> fade
 *
 *          The audio step only reads staged inputs; mux joins both chains.
 */

#ifndef SLIDE_REEL_ENCODE_COMMANDS_HPP
#define SLIDE_REEL_ENCODE_COMMANDS_HPP

#include <optional>
#include <string>
#include <vector>

#include "encode_engine.hpp"
#include "timeline.hpp"

namespace slide_reel {

// **----- INTERMEDIATE BLOB NAMES -----**

constexpr const char *SLIDESHOW_BLOB = "slideshow.mp4";
constexpr const char *WITH_THUMBNAIL_BLOB = "with_thumbnail.mp4";
constexpr const char *FILTERED_BLOB = "filtered.mp4";
constexpr const char *VISUAL_BLOB = "visual.mp4";
constexpr const char *AUDIO_BLOB = "audio.wav";
constexpr const char *FINAL_BLOB = "final.mp4";

/**
 * @struct StagedInputs
 * @brief Workspace names of the inputs materialized during preparing.
 */
struct StagedInputs {
  std::vector<std::string> images; //< In screen order
  std::string narration;
  std::optional<std::string> soundtrack;
  int soundtrack_loops = -1; //< -stream_loop count for the soundtrack
  std::optional<std::string> filter;
  bool filter_is_still = false; //< Filter asset is an image, not a clip
  std::optional<std::string> thumbnail;
};

/**
 * @brief Build every operation of the processing phase, in plan order.
 * @note Operations correspond one to one with plan.steps.
 */
std::vector<EncodeOperation> build_operations(const RenderPlan &plan,
                                              const StagedInputs &inputs);

/**
 * @brief Video filter fitting any frame into the output profile.
 * @note Scales down preserving aspect ratio, then letterboxes or
 *       pillarboxes in black.
 */
std::string fit_frame_filter(const RenderPlan &plan);

/// True for extensions the engine should treat as a still image
bool is_still_extension(const std::string &ext);

} // namespace slide_reel

#endif // SLIDE_REEL_ENCODE_COMMANDS_HPP

/**
 * @file encode_commands.cpp
 * @brief Encoder argument and filter graph construction
 */

#include "slide_reel/encode_commands.hpp"

#include <fmt/core.h>

#include "slide_reel/system.hpp"

namespace slide_reel {

namespace {

/// Video encoder settings shared by every step that re-encodes picture
void append_video_codec(std::vector<std::string> &args, const RenderPlan &plan) {
  args.insert(args.end(), {"-c:v", "libx264", "-preset", "veryfast", "-crf",
                           "20", "-pix_fmt", "yuv420p", "-r",
                           std::to_string(plan.fps)});
}

void append_still_input(std::vector<std::string> &args, const RenderPlan &plan,
                        double duration, const std::string &name) {
  args.insert(args.end(), {"-loop", "1", "-framerate", std::to_string(plan.fps),
                           "-t", format_seconds(duration), "-i", name});
}

EncodeOperation slideshow_op(const RenderPlan &plan,
                             const StagedInputs &inputs) {
  EncodeOperation op;
  op.step = step_name(EncodeStep::kBuildSlideshow);
  op.inputs = inputs.images;
  op.output = SLIDESHOW_BLOB;

  /// One still input per image; each lasts exactly per_image_duration
  for (const auto &image : inputs.images)
    append_still_input(op.args, plan, plan.per_image_duration, image);

  std::string graph;
  graph.reserve(inputs.images.size() * 160);
  std::string fit = fit_frame_filter(plan);
  for (size_t i = 0; i < inputs.images.size(); ++i)
    graph += fmt::format("[{}:v]{}[v{}];", i, fit, i);
  for (size_t i = 0; i < inputs.images.size(); ++i)
    graph += fmt::format("[v{}]", i);
  graph += fmt::format("concat=n={}:v=1:a=0[v]", inputs.images.size());

  op.args.insert(op.args.end(), {"-filter_complex", graph, "-map", "[v]"});
  append_video_codec(op.args, plan);
  op.args.insert(op.args.end(),
                 {"-t", format_seconds(plan.slideshow_duration), op.output});
  return op;
}

EncodeOperation thumbnail_op(const RenderPlan &plan, const StagedInputs &inputs,
                             const std::string &visual) {
  std::string thumbnail = inputs.thumbnail.value_or("");
  EncodeOperation op;
  op.step = step_name(EncodeStep::kPrependThumbnail);
  op.inputs = {thumbnail, visual};
  op.output = WITH_THUMBNAIL_BLOB;

  /// Input 0 is the thumbnail so it occupies the head of the timeline
  append_still_input(op.args, plan, plan.thumbnail_duration, thumbnail);
  op.args.insert(op.args.end(), {"-i", visual});

  std::string graph = fmt::format(
      "[0:v]{}[t];[1:v]setsar=1,format=yuv420p[s];[t][s]concat=n=2:v=1:a=0[v]",
      fit_frame_filter(plan));
  op.args.insert(op.args.end(), {"-filter_complex", graph, "-map", "[v]"});
  append_video_codec(op.args, plan);
  op.args.insert(op.args.end(),
                 {"-t",
                  format_seconds(plan.thumbnail_duration +
                                 plan.slideshow_duration),
                  op.output});
  return op;
}

EncodeOperation filter_op(const RenderPlan &plan, const StagedInputs &inputs,
                          const std::string &visual) {
  std::string overlay = inputs.filter.value_or("");
  EncodeOperation op;
  op.step = step_name(EncodeStep::kApplyFilter);
  op.inputs = {visual, overlay};
  op.output = FILTERED_BLOB;

  op.args.insert(op.args.end(), {"-i", visual});
  if (inputs.filter_is_still) {
    op.args.insert(op.args.end(), {"-loop", "1", "-framerate",
                                   std::to_string(plan.fps), "-i", overlay});
  } else {
    /// Overlay clips repeat for as long as the picture runs
    op.args.insert(op.args.end(), {"-stream_loop", "-1", "-i", overlay});
  }

  std::string graph = fmt::format(
      "[1:v]scale={}:{},setsar=1,colorkey={}:{}:{}[fx];"
      "[0:v][fx]overlay=shortest=1,format=yuv420p[v]",
      plan.width, plan.height, FILTER_KEY_COLOR, FILTER_KEY_SIMILARITY,
      FILTER_KEY_BLEND);
  op.args.insert(op.args.end(), {"-filter_complex", graph, "-map", "[v]"});
  append_video_codec(op.args, plan);
  op.args.insert(op.args.end(),
                 {"-t",
                  format_seconds(plan.thumbnail_duration +
                                 plan.slideshow_duration),
                  op.output});
  return op;
}

EncodeOperation fade_op(const RenderPlan &plan, const std::string &visual) {
  EncodeOperation op;
  op.step = step_name(EncodeStep::kFadeVisual);
  op.inputs = {visual};
  op.output = VISUAL_BLOB;

  /// Hold the last frame for the fade length, then fade it to black
  std::string vf = fmt::format(
      "tpad=stop_mode=clone:stop_duration={},fade=t=out:st={}:d={},"
      "format=yuv420p",
      format_seconds(plan.fade_out_duration),
      format_seconds(plan.fade_out_window.start),
      format_seconds(plan.fade_out_window.duration()));

  op.args.insert(op.args.end(), {"-i", visual, "-vf", vf, "-an"});
  append_video_codec(op.args, plan);
  op.args.insert(op.args.end(),
                 {"-t", format_seconds(plan.total_duration), op.output});
  return op;
}

EncodeOperation audio_op(const RenderPlan &plan, const StagedInputs &inputs) {
  EncodeOperation op;
  op.step = step_name(EncodeStep::kBuildAudio);
  op.inputs = {inputs.narration};
  op.output = AUDIO_BLOB;

  std::string normalize = fmt::format(
      "aresample={},aformat=channel_layouts=stereo", AUDIO_SAMPLE_RATE);
  std::string total = format_seconds(plan.total_duration);
  std::string fade = fmt::format("afade=t=out:st={}:d={}",
                                 format_seconds(plan.fade_out_window.start),
                                 format_seconds(plan.fade_out_window.duration()));

  op.args.insert(op.args.end(), {"-i", inputs.narration});

  std::string graph;
  if (plan.has_soundtrack && inputs.soundtrack) {
    op.inputs.push_back(*inputs.soundtrack);
    op.args.insert(op.args.end(),
                   {"-stream_loop", std::to_string(inputs.soundtrack_loops),
                    "-i", *inputs.soundtrack});
    /// Narration is padded so the mix always spans the whole timeline
    graph = fmt::format(
        "[0:a]{0},apad[n];[1:a]{0}[m];"
        "[n][m]amix=inputs=2:duration=first:dropout_transition=0:"
        "weights='{1:g} {2:g}':normalize=0,atrim=duration={3},{4}[a]",
        normalize, plan.narration_weight, plan.soundtrack_weight, total, fade);
  } else {
    graph = fmt::format("[0:a]{},apad=whole_dur={},atrim=duration={},{}[a]",
                        normalize, total, total, fade);
  }

  op.args.insert(op.args.end(),
                 {"-filter_complex", graph, "-map", "[a]", "-c:a", "pcm_s16le",
                  "-ar", std::to_string(AUDIO_SAMPLE_RATE), "-ac",
                  std::to_string(AUDIO_CHANNELS), "-t", total, op.output});
  return op;
}

EncodeOperation mux_op(const RenderPlan &plan) {
  EncodeOperation op;
  op.step = step_name(EncodeStep::kMux);
  op.inputs = {VISUAL_BLOB, AUDIO_BLOB};
  op.output = FINAL_BLOB;

  /// Picture is already H.264 at the output profile; only audio is encoded
  op.args = {"-i",     VISUAL_BLOB, "-i",        AUDIO_BLOB, "-map",
             "0:v:0",  "-map",      "1:a:0",     "-c:v",     "copy",
             "-c:a",   "aac",       "-b:a",      "192k",     "-shortest",
             "-t",     format_seconds(plan.total_duration),
             "-movflags", "+faststart", op.output};
  return op;
}

} // namespace

std::string fit_frame_filter(const RenderPlan &plan) {
  return fmt::format("scale={0}:{1}:force_original_aspect_ratio=decrease,"
                     "pad={0}:{1}:(ow-iw)/2:(oh-ih)/2:black,setsar=1,fps={2},"
                     "format=yuv420p",
                     plan.width, plan.height, plan.fps);
}

bool is_still_extension(const std::string &ext) {
  return ext == "png" || ext == "jpg" || ext == "jpeg" || ext == "gif" ||
         ext == "bmp" || ext == "webp";
}

std::vector<EncodeOperation> build_operations(const RenderPlan &plan,
                                              const StagedInputs &inputs) {
  std::vector<EncodeOperation> ops;
  ops.reserve(plan.steps.size());

  std::string visual;
  for (EncodeStep step : plan.steps) {
    switch (step) {
    case EncodeStep::kBuildSlideshow:
      ops.push_back(slideshow_op(plan, inputs));
      break;
    case EncodeStep::kPrependThumbnail:
      ops.push_back(thumbnail_op(plan, inputs, visual));
      break;
    case EncodeStep::kApplyFilter:
      ops.push_back(filter_op(plan, inputs, visual));
      break;
    case EncodeStep::kFadeVisual:
      ops.push_back(fade_op(plan, visual));
      break;
    case EncodeStep::kBuildAudio:
      ops.push_back(audio_op(plan, inputs));
      break;
    case EncodeStep::kMux:
      ops.push_back(mux_op(plan));
      break;
    }
    /// Visual steps feed the next visual step
    if (step != EncodeStep::kBuildAudio && step != EncodeStep::kMux)
      visual = ops.back().output;
  }
  return ops;
}

} // namespace slide_reel

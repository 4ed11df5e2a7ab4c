// Component: encoder operation construction

#include <gtest/gtest.h>

#include <algorithm>
#include <cstdio>

#include "fixtures/sample_assets.hpp"
#include "slide_reel/encode_commands.hpp"

namespace slide_reel {
namespace {

using namespace slide_reel::tests::fixtures;

StagedInputs staged_inputs(const RenderPlan &plan) {
  StagedInputs in;
  for (size_t i = 0; i < plan.image_count; ++i) {
    char name[32];
    std::snprintf(name, sizeof(name), "image_%03zu.png", i);
    in.images.push_back(name);
  }
  in.narration = "narration.mp3";
  if (plan.has_soundtrack) {
    in.soundtrack = "soundtrack.mp3";
    in.soundtrack_loops = 2;
  }
  if (plan.has_filter)
    in.filter = "filter.mp4";
  if (plan.has_thumbnail)
    in.thumbnail = "thumbnail.jpg";
  return in;
}

bool contains(const std::vector<std::string> &args, const std::string &needle) {
  return std::find(args.begin(), args.end(), needle) != args.end();
}

/// The value following `flag` the first time it appears
std::string arg_after(const std::vector<std::string> &args,
                      const std::string &flag) {
  auto it = std::find(args.begin(), args.end(), flag);
  if (it == args.end() || it + 1 == args.end())
    return "";
  return *(it + 1);
}

// -----------------------------------------------------------------------------
// One operation per planned step, ending in the final container
// -----------------------------------------------------------------------------
TEST(EncodeCommandsTest, OneOperationPerStep) {
  RenderPlan plan = compile_plan(make_assets(true, "calm", "rain"));
  auto ops = build_operations(plan, staged_inputs(plan));

  ASSERT_EQ(ops.size(), plan.steps.size());
  for (size_t i = 0; i < ops.size(); ++i)
    EXPECT_EQ(ops[i].step, step_name(plan.steps[i]));
  EXPECT_EQ(ops.back().output, FINAL_BLOB);
  EXPECT_EQ(ops.back().args.back(), FINAL_BLOB);
}

// -----------------------------------------------------------------------------
// Visual steps chain: each consumes the previous visual output
// -----------------------------------------------------------------------------
TEST(EncodeCommandsTest, VisualChain) {
  RenderPlan plan = compile_plan(make_assets(true, std::nullopt, "rain"));
  auto ops = build_operations(plan, staged_inputs(plan));

  ASSERT_EQ(ops.size(), 6u);
  EXPECT_EQ(ops[0].output, SLIDESHOW_BLOB);
  EXPECT_TRUE(contains(ops[1].inputs, SLIDESHOW_BLOB));
  EXPECT_EQ(ops[1].output, WITH_THUMBNAIL_BLOB);
  EXPECT_TRUE(contains(ops[2].inputs, WITH_THUMBNAIL_BLOB));
  EXPECT_EQ(ops[2].output, FILTERED_BLOB);
  EXPECT_EQ(ops[3].inputs, std::vector<std::string>{FILTERED_BLOB});
  EXPECT_EQ(ops[3].output, VISUAL_BLOB);
  EXPECT_EQ(ops[5].inputs,
            (std::vector<std::string>{VISUAL_BLOB, AUDIO_BLOB}));
}

TEST(EncodeCommandsTest, SlideshowUsesEveryImageInOrder) {
  RenderPlan plan = compile_plan(make_assets());
  StagedInputs in = staged_inputs(plan);
  EncodeOperation op = build_operations(plan, in)[0];

  EXPECT_EQ(op.inputs, in.images);
  std::vector<std::string> inputs;
  for (size_t i = 0; i + 1 < op.args.size(); ++i) {
    if (op.args[i] == "-i")
      inputs.push_back(op.args[i + 1]);
  }
  EXPECT_EQ(inputs, in.images);
  EXPECT_EQ(arg_after(op.args, "-t"), "2");
  EXPECT_NE(arg_after(op.args, "-filter_complex").find("concat=n=30"),
            std::string::npos);
  EXPECT_EQ(arg_after(op.args, "-c:v"), "libx264");
  EXPECT_EQ(arg_after(op.args, "-pix_fmt"), "yuv420p");
}

// -----------------------------------------------------------------------------
// The thumbnail is input 0, so it is the first thing on screen
// -----------------------------------------------------------------------------
TEST(EncodeCommandsTest, ThumbnailIsFirstInput) {
  RenderPlan plan = compile_plan(make_assets(true));
  EncodeOperation op = build_operations(plan, staged_inputs(plan))[1];

  ASSERT_EQ(op.step, "prepend_thumbnail");
  EXPECT_EQ(op.inputs.front(), "thumbnail.jpg");
  EXPECT_EQ(arg_after(op.args, "-i"), "thumbnail.jpg");
  EXPECT_EQ(arg_after(op.args, "-t"), "0.2");
  std::string graph = arg_after(op.args, "-filter_complex");
  EXPECT_NE(graph.find("[t][s]concat=n=2"), std::string::npos);
}

TEST(EncodeCommandsTest, FadeWindow) {
  RenderPlan plan = compile_plan(make_assets(true));
  auto ops = build_operations(plan, staged_inputs(plan));
  const EncodeOperation &fade = ops[2];

  ASSERT_EQ(fade.step, "fade_visual");
  std::string vf = arg_after(fade.args, "-vf");
  EXPECT_NE(vf.find("tpad=stop_mode=clone:stop_duration=1.5"), std::string::npos);
  EXPECT_NE(vf.find("fade=t=out:st=60.2:d=1.5"), std::string::npos);
  EXPECT_TRUE(contains(fade.args, "-an"));
  EXPECT_EQ(fade.args[fade.args.size() - 2], "61.7");
}

// -----------------------------------------------------------------------------
// Soundtrack: looped second input mixed at 1 : 0.3 under the narration
// -----------------------------------------------------------------------------
TEST(EncodeCommandsTest, AudioMixWithSoundtrack) {
  RenderPlan plan = compile_plan(make_assets(false, "calm"));
  auto ops = build_operations(plan, staged_inputs(plan));
  const EncodeOperation &audio = ops[2];

  ASSERT_EQ(audio.step, "build_audio");
  EXPECT_EQ(audio.inputs,
            (std::vector<std::string>{"narration.mp3", "soundtrack.mp3"}));
  EXPECT_EQ(arg_after(audio.args, "-stream_loop"), "2");
  std::string graph = arg_after(audio.args, "-filter_complex");
  EXPECT_NE(graph.find("weights='1 0.3'"), std::string::npos);
  EXPECT_NE(graph.find("normalize=0"), std::string::npos);
  EXPECT_NE(graph.find("atrim=duration=61.5"), std::string::npos);
  EXPECT_NE(graph.find("afade=t=out:st=60:d=1.5"), std::string::npos);
  EXPECT_EQ(arg_after(audio.args, "-c:a"), "pcm_s16le");
}

TEST(EncodeCommandsTest, AudioPadsNarrationWithoutSoundtrack) {
  RenderPlan plan = compile_plan(make_assets());
  auto ops = build_operations(plan, staged_inputs(plan));
  const EncodeOperation &audio = ops[2];

  EXPECT_EQ(audio.inputs, std::vector<std::string>{"narration.mp3"});
  EXPECT_FALSE(contains(audio.args, "-stream_loop"));
  std::string graph = arg_after(audio.args, "-filter_complex");
  EXPECT_NE(graph.find("apad=whole_dur=61.5"), std::string::npos);
  EXPECT_EQ(graph.find("amix"), std::string::npos);
}

TEST(EncodeCommandsTest, FilterOverlayIsChromaKeyed) {
  RenderPlan plan = compile_plan(make_assets(false, std::nullopt, "rain"));
  StagedInputs in = staged_inputs(plan);
  EncodeOperation clip = build_operations(plan, in)[1];

  ASSERT_EQ(clip.step, "apply_filter");
  EXPECT_EQ(arg_after(clip.args, "-stream_loop"), "-1");
  std::string graph = arg_after(clip.args, "-filter_complex");
  EXPECT_NE(graph.find("colorkey=green:0.3:0.2"), std::string::npos);
  EXPECT_NE(graph.find("overlay=shortest=1"), std::string::npos);

  in.filter = "filter.png";
  in.filter_is_still = true;
  EncodeOperation still = build_operations(plan, in)[1];
  EXPECT_FALSE(contains(still.args, "-stream_loop"));
  EXPECT_EQ(arg_after(still.args, "-loop"), "1");
}

TEST(EncodeCommandsTest, MuxCopiesVideoEncodesAac) {
  RenderPlan plan = compile_plan(make_assets());
  EncodeOperation mux = build_operations(plan, staged_inputs(plan)).back();

  EXPECT_EQ(arg_after(mux.args, "-c:v"), "copy");
  EXPECT_EQ(arg_after(mux.args, "-c:a"), "aac");
  EXPECT_EQ(arg_after(mux.args, "-t"), "61.5");
  EXPECT_TRUE(contains(mux.args, "+faststart"));
}

TEST(EncodeCommandsTest, StillExtensions) {
  EXPECT_TRUE(is_still_extension("png"));
  EXPECT_TRUE(is_still_extension("jpg"));
  EXPECT_FALSE(is_still_extension("mp4"));
  EXPECT_FALSE(is_still_extension("webm"));
}

} // namespace
} // namespace slide_reel

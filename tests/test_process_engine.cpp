// Component: ffmpeg child-process engine (storage side and command lines)
//
// Blob storage is exercised against a temp directory. execute() itself needs
// an encoder binary and is covered only for its precondition checks.

#include <gtest/gtest.h>

#include <algorithm>
#include <filesystem>

#include "fixtures/sample_assets.hpp"
#include "slide_reel/process_engine.hpp"
#include "slide_reel/queued_engine.hpp"

namespace slide_reel {
namespace {

using namespace slide_reel::tests::fixtures;
namespace fs = std::filesystem;

class ProcessEngineTest : public ::testing::Test {
protected:
  void SetUp() override { root_ = make_temp_dir("engine"); }
  void TearDown() override {
    std::error_code ec;
    fs::remove_all(root_, ec);
  }

  std::string root_;
};

TEST(ShellQuoteTest, QuotesEverything) {
  EXPECT_EQ(shell_quote("abc"), "'abc'");
  EXPECT_EQ(shell_quote("a b"), "'a b'");
  EXPECT_EQ(shell_quote("it's"), "'it'\\''s'");
  EXPECT_EQ(shell_quote("$(rm -rf /)"), "'$(rm -rf /)'");
}

TEST(SafeNameTest, RejectsPathComponents) {
  EXPECT_TRUE(is_safe_name("image_000.png"));
  EXPECT_FALSE(is_safe_name(""));
  EXPECT_FALSE(is_safe_name("."));
  EXPECT_FALSE(is_safe_name(".."));
  EXPECT_FALSE(is_safe_name("../etc"));
  EXPECT_FALSE(is_safe_name("a/b"));
}

// -----------------------------------------------------------------------------
// Namespaces are directories; create refuses an existing one
// -----------------------------------------------------------------------------
TEST_F(ProcessEngineTest, NamespaceLifecycle) {
  ProcessEngine engine(root_, "ffmpeg");

  EXPECT_FALSE(engine.namespace_exists("run-1"));
  EXPECT_TRUE(engine.create_namespace("run-1"));
  EXPECT_TRUE(fs::is_directory(fs::path(root_) / "run-1"));
  EXPECT_FALSE(engine.create_namespace("run-1"));
  EXPECT_FALSE(engine.create_namespace("../escape"));

  EXPECT_TRUE(engine.drop_namespace("run-1"));
  EXPECT_FALSE(engine.namespace_exists("run-1"));
}

TEST_F(ProcessEngineTest, BlobRoundTrip) {
  ProcessEngine engine(root_, "ffmpeg");
  ASSERT_TRUE(engine.create_namespace("run-2"));

  EXPECT_TRUE(engine.write_blob("run-2", "image_000.png", png_blob()));
  Blob back;
  EXPECT_TRUE(engine.read_blob("run-2", "image_000.png", back));
  EXPECT_EQ(back, png_blob());

  /// No partial file is left behind by the atomic write
  auto names = engine.list_namespace("run-2");
  EXPECT_EQ(names, std::vector<std::string>{"image_000.png"});

  EXPECT_TRUE(engine.delete_blob("run-2", "image_000.png"));
  EXPECT_FALSE(engine.read_blob("run-2", "image_000.png", back));
  EXPECT_TRUE(engine.list_namespace("run-2").empty());
}

TEST_F(ProcessEngineTest, WriteRequiresNamespace) {
  ProcessEngine engine(root_, "ffmpeg");
  EXPECT_FALSE(engine.write_blob("missing", "a.png", png_blob()));
  EXPECT_FALSE(fs::exists(fs::path(root_) / "missing"));
}

TEST_F(ProcessEngineTest, DropRemovesContents) {
  ProcessEngine engine(root_, "ffmpeg");
  ASSERT_TRUE(engine.create_namespace("run-3"));
  ASSERT_TRUE(engine.write_blob("run-3", "a.png", png_blob()));
  ASSERT_TRUE(engine.write_blob("run-3", "b.mp3", mp3_blob()));

  EXPECT_TRUE(engine.drop_namespace("run-3"));
  EXPECT_FALSE(fs::exists(fs::path(root_) / "run-3"));
}

// -----------------------------------------------------------------------------
// Command line: runs inside the namespace with quoted arguments
// -----------------------------------------------------------------------------
TEST_F(ProcessEngineTest, BuildCommand) {
  ProcessEngine engine(root_, "/usr/bin/ffmpeg");
  EncodeOperation op{"mux", {"visual.mp4"}, {"-i", "visual.mp4", "final.mp4"},
                     "final.mp4"};

  std::string cmd = engine.build_command("run-4", op);
  EXPECT_EQ(cmd.rfind("cd '" + (fs::path(root_) / "run-4").string() + "' && ", 0),
            0u);
  EXPECT_NE(cmd.find("'/usr/bin/ffmpeg' -y -hide_banner -nostdin"),
            std::string::npos);
  EXPECT_NE(cmd.find(" '-i' 'visual.mp4' 'final.mp4' 2> "), std::string::npos);
  EXPECT_NE(cmd.find(".mux.stderr'"), std::string::npos);
}

TEST_F(ProcessEngineTest, ExecuteRequiresInitialize) {
  ProcessEngine engine(root_, "ffmpeg");
  ASSERT_TRUE(engine.create_namespace("run-5"));
  EncodeOperation op{"mux", {}, {"final.mp4"}, "final.mp4"};

  ExecResult r = engine.execute("run-5", op);
  EXPECT_FALSE(r.ok);
  EXPECT_EQ(r.cause, "engine not initialized");
}

TEST_F(ProcessEngineTest, MissingEncoderFailsInitialize) {
  ProcessEngine engine(root_, (fs::path(root_) / "no-such-encoder").string());
  EXPECT_FALSE(engine.initialize());
  EXPECT_FALSE(engine.is_initialized());
}

// -----------------------------------------------------------------------------
// The deployment picks the adapter; the pipeline never sees the difference
// -----------------------------------------------------------------------------
TEST_F(ProcessEngineTest, FactorySelectsAdapter) {
  auto queue = std::make_shared<EncodeQueue>();

  auto direct = make_engine_factory("direct", root_, "ffmpeg", queue)();
  ASSERT_NE(direct, nullptr);
  EXPECT_NE(dynamic_cast<ProcessEngine *>(direct.get()), nullptr);

  auto queued = make_engine_factory("queued", root_, "ffmpeg", queue)();
  ASSERT_NE(queued, nullptr);
  EXPECT_NE(dynamic_cast<QueuedEngine *>(queued.get()), nullptr);

  /// Storage calls pass straight through to the wrapped engine
  EXPECT_TRUE(queued->create_namespace("run-q"));
  EXPECT_TRUE(queued->write_blob("run-q", "a.png", png_blob()));
  EXPECT_EQ(queued->list_namespace("run-q"), std::vector<std::string>{"a.png"});
  EXPECT_TRUE(queued->drop_namespace("run-q"));

  queue->stop();
}

} // namespace
} // namespace slide_reel

// Component: persisted run descriptors

#include <gtest/gtest.h>

#include <filesystem>

#include <nlohmann/json.hpp>

#include "fixtures/sample_assets.hpp"
#include "slide_reel/file_util.hpp"
#include "slide_reel/run_store.hpp"

namespace slide_reel {
namespace {

using namespace slide_reel::tests::fixtures;
namespace fs = std::filesystem;

class RunStoreTest : public ::testing::Test {
protected:
  void SetUp() override { dir_ = make_temp_dir("runs"); }
  void TearDown() override {
    std::error_code ec;
    fs::remove_all(dir_, ec);
  }

  static RunSnapshot snapshot(const std::string &id, Phase phase) {
    RunSnapshot s;
    s.run_id = id;
    s.project_name = "Holiday";
    s.phase = phase;
    s.progress_percent = 55;
    s.total_duration = 61.5;
    return s;
  }

  std::string dir_;
};

TEST_F(RunStoreTest, SaveAndLoad) {
  RunStore store(dir_);
  RunSnapshot done = snapshot("run_1", Phase::kCompleted);
  done.progress_percent = 100;
  done.output_ref = "/out/run_1.mp4";

  ASSERT_TRUE(store.save(done));
  auto loaded = store.load("run_1");
  ASSERT_TRUE(loaded.has_value());
  EXPECT_EQ(*loaded, done);
}

TEST_F(RunStoreTest, PersistsErrorDetail) {
  RunStore store(dir_);
  RunSnapshot failed = snapshot("run_2", Phase::kError);
  failed.error = ErrorDetail{ErrorKind::kEncodeStepFailed, "fade_visual",
                             "exit code 1"};
  ASSERT_TRUE(store.save(failed));

  std::string text;
  ASSERT_TRUE(read_text(store.path_for("run_2"), text));
  auto doc = nlohmann::json::parse(text);
  EXPECT_EQ(doc["phase"], "error");
  EXPECT_EQ(doc["error"]["kind"], "EncodeStepFailed");
  EXPECT_EQ(doc["error"]["step"], "fade_visual");
  EXPECT_EQ(doc["error"]["reason"],
            "encode step 'fade_visual' failed: exit code 1");

  auto loaded = store.load("run_2");
  ASSERT_TRUE(loaded.has_value());
  EXPECT_EQ(loaded->error, failed.error);
  EXPECT_EQ(loaded->reason(), "encode step 'fade_visual' failed: exit code 1");
}

TEST_F(RunStoreTest, UnknownRunIsNotFound) {
  RunStore store(dir_);
  EXPECT_FALSE(store.load("run_missing").has_value());
  EXPECT_FALSE(store.load("../escape").has_value());
  EXPECT_FALSE(store.save(snapshot("bad/id", Phase::kLoading)));
}

TEST_F(RunStoreTest, RemoveDescriptor) {
  RunStore store(dir_);
  ASSERT_TRUE(store.save(snapshot("run_3", Phase::kCompleted)));
  EXPECT_TRUE(store.remove("run_3"));
  EXPECT_FALSE(store.load("run_3").has_value());
  EXPECT_FALSE(fs::exists(store.path_for("run_3")));

  /// Absent descriptors are already gone
  EXPECT_TRUE(store.remove("run_3"));
  EXPECT_FALSE(store.remove("../escape"));
}

// -----------------------------------------------------------------------------
// Startup recovery: unfinished runs become cancelled errors, terminal ones
// are left alone
// -----------------------------------------------------------------------------
TEST_F(RunStoreTest, RecoverMarksUnfinishedRuns) {
  RunStore store(dir_);
  ASSERT_TRUE(store.save(snapshot("run_a", Phase::kProcessing)));
  RunSnapshot done = snapshot("run_b", Phase::kCompleted);
  done.progress_percent = 100;
  ASSERT_TRUE(store.save(done));

  auto runs = store.recover();
  ASSERT_EQ(runs.size(), 2u);
  EXPECT_EQ(runs[0].run_id, "run_a");
  EXPECT_EQ(runs[0].phase, Phase::kError);
  ASSERT_TRUE(runs[0].error.has_value());
  EXPECT_EQ(runs[0].error->kind, ErrorKind::kCancelled);
  EXPECT_EQ(runs[0].error->cause, INTERRUPTED_CAUSE);
  EXPECT_EQ(runs[0].progress_percent, 55);
  EXPECT_EQ(runs[1], done);

  /// The rewrite is durable
  auto reloaded = store.load("run_a");
  ASSERT_TRUE(reloaded.has_value());
  EXPECT_EQ(reloaded->phase, Phase::kError);
}

TEST_F(RunStoreTest, SkipsUnreadableDescriptors) {
  RunStore store(dir_);
  ASSERT_TRUE(store.save(snapshot("run_ok", Phase::kCompleted)));
  ASSERT_TRUE(write_file_atomic((fs::path(dir_) / "run_junk.json").string(),
                                std::string("{ not json")));
  ASSERT_TRUE(write_file_atomic((fs::path(dir_) / "run_typed.json").string(),
                                std::string(R"({"runId": "run_typed",
                                   "phase": "loading", "projectName": 7})")));

  auto all = store.load_all();
  ASSERT_EQ(all.size(), 1u);
  EXPECT_EQ(all[0].run_id, "run_ok");
}

TEST_F(RunStoreTest, ValidIds) {
  EXPECT_TRUE(RunStore::is_valid_id("run_1700000000000_1"));
  EXPECT_TRUE(RunStore::is_valid_id("a-b_C9"));
  EXPECT_FALSE(RunStore::is_valid_id(""));
  EXPECT_FALSE(RunStore::is_valid_id("a.b"));
  EXPECT_FALSE(RunStore::is_valid_id(std::string(129, 'a')));
}

} // namespace
} // namespace slide_reel

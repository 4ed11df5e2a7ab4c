// Component: per-run workspace scope

#include <gtest/gtest.h>

#include <stdexcept>

#include "fixtures/fake_engine.hpp"
#include "fixtures/sample_assets.hpp"
#include "slide_reel/workspace.hpp"

namespace slide_reel {
namespace {

using namespace slide_reel::tests::fixtures;

class WorkspaceTest : public ::testing::Test {
protected:
  void SetUp() override { ASSERT_TRUE(engine_.initialize()); }

  FakeEngine engine_;
  WorkspaceManager manager_;
};

TEST_F(WorkspaceTest, NamespaceIsDerivedFromRunId) {
  EXPECT_EQ(WorkspaceManager::namespace_for("abc"), "run-abc");
}

// -----------------------------------------------------------------------------
// Success: body sees its namespace, everything is gone afterwards
// -----------------------------------------------------------------------------
TEST_F(WorkspaceTest, TearsDownAfterSuccess) {
  ScopeOutcome outcome =
      manager_.with_scope(engine_, "r1", [this](Workspace &ws) {
        EXPECT_EQ(ws.name(), "run-r1");
        EXPECT_TRUE(engine_.namespace_exists("run-r1"));
        EXPECT_TRUE(manager_.is_active("r1"));
        EXPECT_TRUE(ws.write("image_000.png", png_blob()));
        Blob back;
        EXPECT_TRUE(ws.read("image_000.png", back));
        EXPECT_EQ(back, png_blob());
        return true;
      });

  EXPECT_EQ(outcome, ScopeOutcome::kBodySucceeded);
  EXPECT_FALSE(engine_.namespace_exists("run-r1"));
  EXPECT_FALSE(manager_.is_active("r1"));
  EXPECT_EQ(manager_.active_count(), 0u);
}

TEST_F(WorkspaceTest, TearsDownAfterFailure) {
  ScopeOutcome outcome = manager_.with_scope(engine_, "r2", [](Workspace &ws) {
    ws.write("narration.mp3", mp3_blob());
    return false;
  });

  EXPECT_EQ(outcome, ScopeOutcome::kBodyFailed);
  EXPECT_FALSE(engine_.namespace_exists("run-r2"));
  EXPECT_EQ(manager_.active_count(), 0u);
}

// -----------------------------------------------------------------------------
// Teardown also runs when the body throws
// -----------------------------------------------------------------------------
TEST_F(WorkspaceTest, TearsDownWhenBodyThrows) {
  EXPECT_THROW(manager_.with_scope(engine_, "r3",
                                   [](Workspace &ws) -> bool {
                                     ws.write("a.png", png_blob());
                                     throw std::runtime_error("boom");
                                   }),
               std::runtime_error);

  EXPECT_FALSE(engine_.namespace_exists("run-r3"));
  EXPECT_FALSE(manager_.is_active("r3"));
}

TEST_F(WorkspaceTest, ExecuteTracksOutput) {
  manager_.with_scope(engine_, "r4", [](Workspace &ws) {
    EXPECT_TRUE(ws.write("in.png", png_blob()));
    EncodeOperation op{"step", {"in.png"}, {"-i", "in.png", "out.mp4"},
                       "out.mp4"};
    ExecResult r = ws.execute(op);
    EXPECT_TRUE(r.ok);
    EXPECT_EQ(ws.tracked().count("out.mp4"), 1u);
    EXPECT_EQ(ws.list().size(), 2u);
    return true;
  });
  EXPECT_EQ(engine_.namespace_count(), 0u);
}

// -----------------------------------------------------------------------------
// A namespace already held by a live scope cannot be acquired again
// -----------------------------------------------------------------------------
TEST_F(WorkspaceTest, RefusesDoubleAcquire) {
  ScopeOutcome inner = ScopeOutcome::kBodySucceeded;
  bool inner_ran = false;

  manager_.with_scope(engine_, "same", [&](Workspace &) {
    inner = manager_.with_scope(engine_, "same", [&](Workspace &) {
      inner_ran = true;
      return true;
    });
    /// The refused attempt must not tear down the holder's namespace
    EXPECT_TRUE(engine_.namespace_exists("run-same"));
    return true;
  });

  EXPECT_EQ(inner, ScopeOutcome::kNotAcquired);
  EXPECT_FALSE(inner_ran);
  EXPECT_FALSE(engine_.namespace_exists("run-same"));
}

// -----------------------------------------------------------------------------
// A leftover namespace from a crashed process is replaced
// -----------------------------------------------------------------------------
TEST_F(WorkspaceTest, ReplacesStaleNamespace) {
  ASSERT_TRUE(engine_.create_namespace("run-stale"));
  ASSERT_TRUE(engine_.write_blob("run-stale", "old.mp4", mp4_blob()));

  ScopeOutcome outcome = manager_.with_scope(engine_, "stale", [](Workspace &ws) {
    EXPECT_TRUE(ws.list().empty());
    return true;
  });

  EXPECT_EQ(outcome, ScopeOutcome::kBodySucceeded);
  EXPECT_FALSE(engine_.namespace_exists("run-stale"));
}

TEST_F(WorkspaceTest, DistinctRunsAreIsolated) {
  manager_.with_scope(engine_, "a", [this](Workspace &a) {
    a.write("x.png", png_blob());
    manager_.with_scope(engine_, "b", [](Workspace &b) {
      Blob out;
      EXPECT_FALSE(b.read("x.png", out));
      return true;
    });
    EXPECT_EQ(manager_.active_count(), 1u);
    return true;
  });
}

} // namespace
} // namespace slide_reel

// Component: progress band mapping

#include <gtest/gtest.h>

#include <cmath>

#include "slide_reel/progress.hpp"

namespace slide_reel {
namespace {

TEST(ProgressReporterTest, Bands) {
  EXPECT_EQ(ProgressReporter::band_start(Phase::kLoading), 0);
  EXPECT_EQ(ProgressReporter::band_end(Phase::kLoading), 10);
  EXPECT_EQ(ProgressReporter::band_start(Phase::kPreparing), 10);
  EXPECT_EQ(ProgressReporter::band_end(Phase::kPreparing), 40);
  EXPECT_EQ(ProgressReporter::band_start(Phase::kProcessing), 40);
  EXPECT_EQ(ProgressReporter::band_end(Phase::kProcessing), 90);
  EXPECT_EQ(ProgressReporter::band_start(Phase::kFinalizing), 90);
  EXPECT_EQ(ProgressReporter::band_end(Phase::kFinalizing), 100);
}

// -----------------------------------------------------------------------------
// Fractions map linearly into the phase's band
// -----------------------------------------------------------------------------
TEST(ProgressReporterTest, MapsFractionIntoBand) {
  ProgressReporter r;
  EXPECT_EQ(r.report(Phase::kLoading, 0.5).percent, 5);
  EXPECT_EQ(r.report(Phase::kPreparing, 0.5).percent, 25);
  EXPECT_EQ(r.report(Phase::kProcessing, 3.0 / 5.0).percent, 70);
  EXPECT_EQ(r.report(Phase::kFinalizing, 0.5).percent, 95);
}

// -----------------------------------------------------------------------------
// Never decreases, even when a caller reports a lower fraction
// -----------------------------------------------------------------------------
TEST(ProgressReporterTest, Monotonic) {
  ProgressReporter r;
  r.report(Phase::kProcessing, 0.5);
  EXPECT_EQ(r.report(Phase::kProcessing, 0.1).percent, 65);
  EXPECT_EQ(r.report(Phase::kPreparing, 1.0).percent, 65);
  EXPECT_EQ(r.percent(), 65);
}

// -----------------------------------------------------------------------------
// 100 is reserved for the completed phase
// -----------------------------------------------------------------------------
TEST(ProgressReporterTest, HundredOnlyWhenCompleted) {
  ProgressReporter r;
  EXPECT_EQ(r.report(Phase::kFinalizing, 1.0).percent, 99);
  EXPECT_EQ(r.report(Phase::kFinalizing, 5.0).percent, 99);
  EXPECT_EQ(r.report(Phase::kCompleted, 0.0).percent, 100);
}

TEST(ProgressReporterTest, ErrorKeepsLastValue) {
  ProgressReporter r;
  r.report(Phase::kPreparing, 0.5);
  ProgressUpdate u = r.report(Phase::kError, 1.0);
  EXPECT_EQ(u.phase, Phase::kError);
  EXPECT_EQ(u.percent, 25);
}

TEST(ProgressReporterTest, ClampsBadFractions) {
  ProgressReporter r;
  EXPECT_EQ(r.report(Phase::kPreparing, -1.0).percent, 10);
  EXPECT_EQ(r.report(Phase::kPreparing, std::nan("")).percent, 10);
  EXPECT_EQ(r.report(Phase::kPreparing, 2.0).percent, 40);
}

} // namespace
} // namespace slide_reel

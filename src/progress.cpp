/**
 * @file progress.cpp
 * @brief Progress band mapping
 */

#include "slide_reel/progress.hpp"

#include <algorithm>
#include <cmath>

namespace slide_reel {

int ProgressReporter::band_start(Phase phase) {
  switch (phase) {
  case Phase::kLoading:
    return 0;
  case Phase::kPreparing:
    return 10;
  case Phase::kProcessing:
    return 40;
  case Phase::kFinalizing:
    return 90;
  case Phase::kCompleted:
    return 100;
  case Phase::kError:
    return 0;
  }
  return 0;
}

int ProgressReporter::band_end(Phase phase) {
  switch (phase) {
  case Phase::kLoading:
    return 10;
  case Phase::kPreparing:
    return 40;
  case Phase::kProcessing:
    return 90;
  case Phase::kFinalizing:
  case Phase::kCompleted:
    return 100;
  case Phase::kError:
    return 0;
  }
  return 0;
}

ProgressUpdate ProgressReporter::report(Phase phase, double fraction) {
  /// An errored run keeps its last known percentage
  if (phase == Phase::kError)
    return {phase, last_percent_};

  if (phase == Phase::kCompleted) {
    last_percent_ = 100;
    return {phase, last_percent_};
  }

  if (!(fraction > 0.0))
    fraction = 0.0; //< also catches NaN
  fraction = std::min(fraction, 1.0);

  int start = band_start(phase);
  int span = band_end(phase) - start;
  /// Epsilon keeps exact sub-step boundaries (3/5 of 50) from flooring low
  int computed = start + static_cast<int>(std::floor(span * fraction + 1e-9));
  computed = std::min(computed, 99);

  last_percent_ = std::max(last_percent_, computed);
  return {phase, last_percent_};
}

} // namespace slide_reel

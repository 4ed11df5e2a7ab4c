/**
 * @file progress.hpp
 * @brief Maps pipeline stage completion onto a monotonic 0-100 scale
 *
 * @attention BANDS:
 *
 *   loading 0-10, preparing 10-40, processing 40-90, finalizing 90-100
 *
 * @note 100 is reserved for kCompleted: transient phases never report more
 *       than 99, so "percent == 100" holds exactly when the run completed.
 */

#ifndef SLIDE_REEL_PROGRESS_HPP
#define SLIDE_REEL_PROGRESS_HPP

#include "types.hpp"

namespace slide_reel {

/**
 * @struct ProgressUpdate
 * @brief Normalized phase and percentage for external consumers.
 */
struct ProgressUpdate {
  Phase phase;
  int percent;
};

/**
 * @class ProgressReporter
 * @brief Pure stage -> percentage mapping with a per-run high-water mark.
 * @note One instance per run. Not thread-safe; only the run's worker
 *       reports.
 */
class ProgressReporter {
public:
  /**
   * @brief Map a stage and the fraction done within it.
   * @param phase Current phase
   * @param fraction 0.0-1.0 within the phase (clamped)
   * @return Phase and max(previous percent, computed percent)
   */
  ProgressUpdate report(Phase phase, double fraction);

  /// Last percent returned
  int percent() const { return last_percent_; }

  /// Lower edge of a phase's band
  static int band_start(Phase phase);

  /// Upper edge of a phase's band
  static int band_end(Phase phase);

private:
  int last_percent_ = 0;
};

} // namespace slide_reel

#endif // SLIDE_REEL_PROGRESS_HPP

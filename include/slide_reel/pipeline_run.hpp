/**
 * @file pipeline_run.hpp
 * @brief The record of one submitted project and its cancellation signal
 *
 * @details A PipelineRun is created on submission and mutated only by the
 *          AssemblyPipeline executing it. Everyone else (status pollers, the
 *          run store, observers) reads immutable RunSnapshot copies.
 */

#ifndef SLIDE_REEL_PIPELINE_RUN_HPP
#define SLIDE_REEL_PIPELINE_RUN_HPP

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "asset_set.hpp"
#include "timeline.hpp"
#include "types.hpp"

namespace slide_reel {

/**
 * @class CancelToken
 * @brief Explicit cancellation flag plus an optional deadline.
 * @note Thread-safe. The pipeline polls it between blob writes and between
 *       encode steps.
 */
class CancelToken {
public:
  using Clock = std::chrono::steady_clock;

  void cancel() { cancelled_.store(true); }
  bool cancelled() const { return cancelled_.load(); }

  /// Arm the deadline `seconds` from now; <= 0 disarms it
  void set_deadline_after(double seconds);

  bool expired() const;

private:
  std::atomic<bool> cancelled_{false};
  mutable std::mutex mutex_;
  std::optional<Clock::time_point> deadline_;
};

/**
 * @struct RunSnapshot
 * @brief Point-in-time copy of a run, safe to hand to any thread.
 */
struct RunSnapshot {
  std::string run_id;
  std::string project_name;
  Phase phase = Phase::kLoading;
  int progress_percent = 0;
  std::optional<ErrorDetail> error;
  std::optional<std::string> output_ref;
  double total_duration = 0.0;

  /// describe(*error) for errored runs, empty otherwise
  std::string reason() const;

  bool operator==(const RunSnapshot &o) const;
  bool operator!=(const RunSnapshot &o) const { return !(*this == o); }
};

/**
 * @class PipelineRun
 * @brief Mutable state of one run.
 *
 * @attention LIFECYCLE:
 *
 * - Phases advance strictly forward; kError is reachable from any
 *   non-terminal phase
 *
 * - Once terminal the record never changes again
 *
 * - Input blobs are released when the run becomes terminal
 */
class PipelineRun {
public:
  PipelineRun(std::string id, AssetSet assets);

  PipelineRun(const PipelineRun &) = delete;
  PipelineRun &operator=(const PipelineRun &) = delete;

  const std::string &id() const { return id_; }
  const RenderPlan &plan() const { return plan_; }
  const AssetSet &assets() const { return assets_; }

  RunSnapshot snapshot() const;
  Phase phase() const;

  /// Phases entered so far, in order
  std::vector<Phase> history() const;

  /// Raise the cancellation signal; no effect once terminal
  void request_cancel();

  CancelToken &cancel_token() { return cancel_; }
  const CancelToken &cancel_token() const { return cancel_; }

  /**
   * @brief Block until the run is terminal.
   * @return false if the timeout elapsed first
   */
  bool wait_terminal(std::chrono::milliseconds timeout) const;

private:
  friend class AssemblyPipeline;

  /// Mark the run as started; false if it was started before or is terminal
  bool claim();
  /// Forward-only phase change; false (and no change) if not allowed
  bool enter(Phase next);
  /// Raise progress; lower values are ignored
  void set_progress(int percent);
  void fail(ErrorDetail error);
  void complete(std::string output_ref);

  const std::string id_;
  AssetSet assets_;
  const RenderPlan plan_;
  CancelToken cancel_;

  mutable std::mutex mutex_;
  mutable std::condition_variable terminal_cv_;
  Phase phase_ = Phase::kLoading;
  int progress_ = 0;
  bool started_ = false;
  std::optional<ErrorDetail> error_;
  std::optional<std::string> output_ref_;
  std::vector<Phase> history_;
};

} // namespace slide_reel

#endif // SLIDE_REEL_PIPELINE_RUN_HPP

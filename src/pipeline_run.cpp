/**
 * @file pipeline_run.cpp
 * @brief Run record and cancellation token
 */

#include "slide_reel/pipeline_run.hpp"

#include <algorithm>

namespace slide_reel {

// **----- CancelToken -----**

void CancelToken::set_deadline_after(double seconds) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (seconds <= 0) {
    deadline_.reset();
    return;
  }
  deadline_ = Clock::now() +
              std::chrono::duration_cast<Clock::duration>(
                  std::chrono::duration<double>(seconds));
}

bool CancelToken::expired() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return deadline_ && Clock::now() >= *deadline_;
}

// **----- RunSnapshot -----**

std::string RunSnapshot::reason() const {
  return error ? describe(*error) : std::string();
}

bool RunSnapshot::operator==(const RunSnapshot &o) const {
  return run_id == o.run_id && project_name == o.project_name &&
         phase == o.phase && progress_percent == o.progress_percent &&
         error == o.error && output_ref == o.output_ref &&
         total_duration == o.total_duration;
}

// **----- PipelineRun -----**

PipelineRun::PipelineRun(std::string id, AssetSet assets)
    : id_(std::move(id)), assets_(std::move(assets)),
      plan_(compile_plan(assets_)) {
  history_.push_back(Phase::kLoading);
}

RunSnapshot PipelineRun::snapshot() const {
  std::lock_guard<std::mutex> lock(mutex_);
  RunSnapshot s;
  s.run_id = id_;
  s.project_name = assets_.project_name;
  s.phase = phase_;
  s.progress_percent = progress_;
  s.error = error_;
  s.output_ref = output_ref_;
  s.total_duration = plan_.total_duration;
  return s;
}

Phase PipelineRun::phase() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return phase_;
}

std::vector<Phase> PipelineRun::history() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return history_;
}

void PipelineRun::request_cancel() {
  if (!is_terminal(phase()))
    cancel_.cancel();
}

bool PipelineRun::wait_terminal(std::chrono::milliseconds timeout) const {
  std::unique_lock<std::mutex> lock(mutex_);
  return terminal_cv_.wait_for(lock, timeout,
                               [this] { return is_terminal(phase_); });
}

bool PipelineRun::claim() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (started_ || is_terminal(phase_))
    return false;
  started_ = true;
  return true;
}

bool PipelineRun::enter(Phase next) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (is_terminal(phase_))
    return false;
  bool forward = next == Phase::kError ||
                 static_cast<int>(next) > static_cast<int>(phase_);
  if (!forward)
    return false;
  phase_ = next;
  history_.push_back(next);
  return true;
}

void PipelineRun::set_progress(int percent) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (is_terminal(phase_))
    return;
  progress_ = std::max(progress_, percent);
}

void PipelineRun::fail(ErrorDetail error) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (is_terminal(phase_))
      return;
    phase_ = Phase::kError;
    history_.push_back(Phase::kError);
    error_ = std::move(error);
    /// Inputs are no longer needed once the run is over
    assets_.images = std::vector<Blob>();
    assets_.narration = Blob();
    if (assets_.thumbnail)
      assets_.thumbnail = Blob();
  }
  terminal_cv_.notify_all();
}

void PipelineRun::complete(std::string output_ref) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (is_terminal(phase_))
      return;
    phase_ = Phase::kCompleted;
    history_.push_back(Phase::kCompleted);
    progress_ = 100;
    output_ref_ = std::move(output_ref);
    assets_.images = std::vector<Blob>();
    assets_.narration = Blob();
    if (assets_.thumbnail)
      assets_.thumbnail = Blob();
  }
  terminal_cv_.notify_all();
}

} // namespace slide_reel

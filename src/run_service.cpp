/**
 * @file run_service.cpp
 * @brief Run service implementation
 *
 * @details Implements:
 *
 *          - Synchronous validation at submission
 *
 *          - Shared run queue consumed by the run workers
 *
 *          - Descriptor persistence on phase transitions
 *
 *          - Recovery of descriptors left by an earlier process
 */

#include "slide_reel/run_service.hpp"

#include <algorithm>

#include <fmt/color.h>
#include <fmt/core.h>

#include "slide_reel/logging.hpp"

namespace slide_reel {

RunService::RunService(EngineFactory engine_factory, const AssetCatalog &catalog,
                       RunServiceOptions options)
    : engine_factory_(std::move(engine_factory)), catalog_(catalog),
      options_(std::move(options)), store_(options_.run_store_dir) {
  options_.workers = std::max(1, options_.workers);
}

RunService::~RunService() { shutdown(true); }

// **---- Lifecycle ----**

size_t RunService::start() {
  if (!workers_.empty())
    return 0;

  std::vector<RunSnapshot> recovered = store_.recover();
  {
    std::lock_guard<std::mutex> lock(runs_mutex_);
    for (auto &s : recovered)
      recovered_[s.run_id] = std::move(s);
  }

  LOG_PHASE("==================== RUN SERVICE ====================");
  LOG_INFO("Run workers: {}", options_.workers);
  LOG_INFO("Run store: {} ({} recovered runs)", store_.dir(), recovered.size());
  LOG_INFO("Output directory: {}", options_.pipeline.output_dir);
  LOG_PHASE("=====================================================");

  accepting_.store(true);
  for (int i = 0; i < options_.workers; ++i)
    workers_.emplace_back(&RunService::run_worker, this, i);
  return recovered.size();
}

void RunService::shutdown(bool cancel_pending) {
  accepting_.store(false);
  if (cancel_pending) {
    std::lock_guard<std::mutex> lock(runs_mutex_);
    for (auto &entry : runs_)
      entry.second->request_cancel();
  }
  queue_.finish();
  for (auto &w : workers_) {
    if (w.joinable())
      w.join();
  }
  workers_.clear();
}

// **---- Submission ----**

std::string RunService::next_run_id() {
  auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::system_clock::now().time_since_epoch())
                .count();
  return fmt::format("run_{}_{}", ms, ++sequence_);
}

SubmitResult RunService::submit(RawSubmission submission) {
  SubmitResult result;

  ValidationResult validated = validate_submission(std::move(submission));
  if (!validated.ok()) {
    for (const auto &f : validated.failures)
      LOG_WARN("Submission rejected: {}", f.to_string());
    result.failures = std::move(validated.failures);
    return result;
  }

  if (!accepting_.load()) {
    LOG_ERROR("Submission refused: run service is not running");
    result.failures.push_back({"service", "not accepting submissions"});
    return result;
  }

  auto run =
      std::make_shared<PipelineRun>(next_run_id(), std::move(*validated.assets));
  RunSnapshot initial = run->snapshot();
  if (!store_.save(initial))
    LOG_WARN("[Run {}] Could not persist descriptor", run->id());

  {
    std::lock_guard<std::mutex> lock(runs_mutex_);
    runs_[run->id()] = run;
  }

  if (!queue_.push(run)) {
    /// Raced with shutdown(); the run is cancelled before it starts
    run->request_cancel();
    LOG_WARN("[Run {}] Queued after shutdown, cancelled", run->id());
  }

  LOG_INFO("[Run {}] Submitted '{}' ({} queued)", run->id(),
           initial.project_name, queue_.size());
  result.run_id = run->id();
  return result;
}

// **---- Queries ----**

std::shared_ptr<PipelineRun> RunService::find(const std::string &run_id) const {
  std::lock_guard<std::mutex> lock(runs_mutex_);
  auto it = runs_.find(run_id);
  return it == runs_.end() ? nullptr : it->second;
}

std::optional<RunSnapshot> RunService::status(const std::string &run_id) const {
  if (auto run = find(run_id))
    return run->snapshot();

  std::lock_guard<std::mutex> lock(runs_mutex_);
  auto it = recovered_.find(run_id);
  if (it != recovered_.end())
    return it->second;
  return std::nullopt;
}

bool RunService::cancel(const std::string &run_id) {
  auto run = find(run_id);
  if (!run)
    return status(run_id).has_value();
  if (!is_terminal(run->phase()))
    LOG_WARN("[Run {}] Cancellation requested", run_id);
  run->request_cancel();
  return true;
}

std::optional<RunSnapshot>
RunService::wait(const std::string &run_id,
                 std::chrono::milliseconds timeout) const {
  auto run = find(run_id);
  if (!run)
    return status(run_id);
  run->wait_terminal(timeout);
  return run->snapshot();
}

bool RunService::archive(const std::string &run_id) {
  std::lock_guard<std::mutex> lock(runs_mutex_);
  auto live = runs_.find(run_id);
  if (live != runs_.end()) {
    if (!is_terminal(live->second->phase()))
      return false;
    runs_.erase(live);
  } else if (recovered_.erase(run_id) == 0) {
    return false;
  }

  {
    std::lock_guard<std::mutex> results_lock(results_mutex_);
    results_.erase(std::remove_if(results_.begin(), results_.end(),
                                  [&run_id](const RunResult &r) {
                                    return r.run_id == run_id;
                                  }),
                   results_.end());
  }
  if (!store_.remove(run_id))
    LOG_WARN("[Run {}] Archived, but its descriptor is still on disk", run_id);
  LOG_INFO("[Run {}] Archived", run_id);
  return true;
}

std::vector<RunResult> RunService::results() const {
  std::lock_guard<std::mutex> lock(results_mutex_);
  return results_;
}

// **---- Workers ----**

void RunService::on_event(const RunSnapshot &snapshot, bool phase_changed) {
  if (phase_changed) {
    /// Held across the write so archive() cannot interleave with it
    std::lock_guard<std::mutex> lock(runs_mutex_);
    if (runs_.count(snapshot.run_id) && !store_.save(snapshot))
      LOG_WARN("[Run {}] Could not persist descriptor", snapshot.run_id);
  }
  if (observer_)
    observer_(snapshot, phase_changed);
}

void RunService::run_worker(int worker_id) {
  LOG_INFO("[Worker {}] Started", worker_id);

  std::shared_ptr<PipelineRun> run;
  int runs_done = 0;
  while (queue_.pop(run)) {
    LOG_PHASE("[Worker {}] ----------------------------------------",
              worker_id);
    LOG_INFO("[Worker {}] Picked up run {}", worker_id, run->id());

    auto start_time = std::chrono::high_resolution_clock::now();

    std::unique_ptr<EncodeEngine> engine =
        engine_factory_ ? engine_factory_() : nullptr;
    AssemblyPipeline pipeline(engine.get(), catalog_, workspaces_,
                              options_.pipeline);
    pipeline.set_observer([this](const RunSnapshot &s, bool changed) {
      on_event(s, changed);
    });

    bool ok = pipeline.run(*run);

    auto end_time = std::chrono::high_resolution_clock::now();

    RunSnapshot final_state = run->snapshot();
    RunResult result;
    result.run_id = run->id();
    result.project_name = final_state.project_name;
    result.success = ok;
    result.reason = final_state.reason();
    result.processing_time_us = static_cast<long>(
        std::chrono::duration_cast<std::chrono::microseconds>(end_time -
                                                              start_time)
            .count());
    {
      std::lock_guard<std::mutex> lock(runs_mutex_);
      if (runs_.count(result.run_id)) {
        std::lock_guard<std::mutex> results_lock(results_mutex_);
        results_.push_back(result);
      }
    }
    ++runs_done;
    run.reset();
  }

  LOG_INFO("[Worker {}] Finished ({} runs)", worker_id, runs_done);
}

// **---- Summary ----**

int RunService::print_summary(double wall_clock_sec) const {
  std::vector<RunResult> results = this->results();

  int total = static_cast<int>(results.size());
  int success = 0;
  int failed = 0;
  long total_time_us = 0;
  for (const auto &r : results) {
    if (r.success)
      success++;
    else
      failed++;
    total_time_us += r.processing_time_us;
  }

  double sum_time_sec = total_time_us / 1000000.0;
  double speedup = (wall_clock_sec > 0) ? sum_time_sec / wall_clock_sec : 1.0;

  std::lock_guard<std::mutex> lock(log_mutex);
  fmt::print("\n");
  fmt::print(fg(fmt::color::cyan),
             "================== RUN SERVICE SUMMARY ===============\n");
  fmt::print("{:<25} {:>25}\n", "Total runs:", total);
  fmt::print("{:<25} {:>25}\n", "Completed:", success);
  fmt::print("{:<25} {:>25}\n", "Failed:", failed);
  fmt::print("{:<25} {:>25}\n", "Run workers:", options_.workers);
  fmt::print("{:<25} {:>22.1f}s\n", "Wall-clock time:", wall_clock_sec);
  fmt::print("{:<25} {:>22.1f}s\n", "Sum of run times:", sum_time_sec);
  fmt::print("{:<25} {:>22.2f}x\n", "Speedup:", speedup);
  if (total > 0) {
    fmt::print("{:<25} {:>22.1f}s\n", "Average time per run:",
               sum_time_sec / total);
  }
  fmt::print(fg(fmt::color::cyan),
             "======================================================\n");

  if (failed > 0) {
    fmt::print(fg(fmt::color::red), "\nFailed runs:\n");
    for (const auto &r : results) {
      if (!r.success) {
        fmt::print(fg(fmt::color::red), "  - {} ({}): {}\n", r.project_name,
                   r.run_id, r.reason);
      }
    }
  }
  std::fflush(stdout);
  return failed;
}

} // namespace slide_reel

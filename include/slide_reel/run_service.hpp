/**
 * @file run_service.hpp
 * @brief Submission, status, cancellation and recovery of pipeline runs
 *
 * @details The RunService is the boundary callers talk to:
 *
 *          - submit() validates synchronously and queues a run
 *
 *          - RUN_WORKERS worker threads pull runs from a shared queue; each
 *            run gets a fresh engine from the EngineFactory
 *
 *          - every phase transition is persisted through the RunStore
 *
 *          - status() answers from live runs first, then from descriptors
 *            recovered at startup
 *
 * @note Callers only ever receive RunSnapshot copies.
 */

#ifndef SLIDE_REEL_RUN_SERVICE_HPP
#define SLIDE_REEL_RUN_SERVICE_HPP

#include <atomic>
#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "assembly_pipeline.hpp"
#include "catalog.hpp"
#include "encode_engine.hpp"
#include "run_queue.hpp"
#include "run_store.hpp"
#include "workspace.hpp"

namespace slide_reel {

/**
 * @struct RunServiceOptions
 * @brief Service settings (see Config for the environment defaults).
 */
struct RunServiceOptions {
  int workers = 1;           //< Concurrent runs
  std::string run_store_dir; //< Persisted descriptors
  PipelineOptions pipeline;  //< Passed to every AssemblyPipeline
};

/**
 * @struct SubmitResult
 * @brief A run id, or every validation failure of the submission.
 */
struct SubmitResult {
  std::optional<std::string> run_id;
  std::vector<ValidationFailure> failures;

  bool ok() const { return run_id.has_value(); }
};

/**
 * @struct RunResult
 * @brief Outcome of one executed run, for the service summary.
 */
struct RunResult {
  std::string run_id;
  std::string project_name;
  bool success;            //< Whether the run completed
  std::string reason;      //< Error reason when !success
  long processing_time_us; //< Wall time of the run on its worker
};

/**
 * @class RunService
 * @brief Owns the run table, the run queue and the run workers.
 *
 * @attention THREAD MODEL:
 *
 * - One worker drives one run at a time, start to finish
 *
 * - Runs never share an engine or a workspace namespace
 *
 * - The observer is invoked from worker threads and must be thread-safe
 */
class RunService {
public:
  RunService(EngineFactory engine_factory, const AssetCatalog &catalog,
             RunServiceOptions options);
  ~RunService();

  RunService(const RunService &) = delete;
  RunService &operator=(const RunService &) = delete;

  /**
   * @brief Recover persisted runs and launch the workers.
   * @return Number of descriptors recovered
   */
  size_t start();

  /**
   * @brief Stop accepting runs and join the workers.
   * @param cancel_pending Cancel queued and running runs instead of
   *        letting them finish
   */
  void shutdown(bool cancel_pending);

  SubmitResult submit(RawSubmission submission);

  /// Current snapshot; std::nullopt means NotFound
  std::optional<RunSnapshot> status(const std::string &run_id) const;

  /**
   * @brief Raise a run's cancellation signal.
   * @return false if the run is unknown
   */
  bool cancel(const std::string &run_id);

  /**
   * @brief Block until a run is terminal or the timeout elapses.
   * @return Latest snapshot; std::nullopt means NotFound
   */
  std::optional<RunSnapshot> wait(const std::string &run_id,
                                  std::chrono::milliseconds timeout) const;

  /**
   * @brief Drop a terminal run from the service and delete its descriptor.
   * @note The published output is left in place.
   * @return false if the run is unknown or not yet terminal
   */
  bool archive(const std::string &run_id);

  /// Must be set before start()
  void set_observer(AssemblyPipeline::Observer observer) {
    observer_ = std::move(observer);
  }

  WorkspaceManager &workspaces() { return workspaces_; }
  const RunStore &store() const { return store_; }
  int worker_count() const { return options_.workers; }

  /// Results of the runs executed so far and not archived
  std::vector<RunResult> results() const;

  /**
   * @brief Print the service summary table.
   * @param wall_clock_sec Elapsed wall-clock time in seconds
   * @return Number of failed runs
   */
  int print_summary(double wall_clock_sec) const;

private:
  EngineFactory engine_factory_;
  const AssetCatalog &catalog_;
  RunServiceOptions options_;
  RunStore store_;
  WorkspaceManager workspaces_;
  RunQueue queue_;
  AssemblyPipeline::Observer observer_;

  mutable std::mutex runs_mutex_;
  std::map<std::string, std::shared_ptr<PipelineRun>> runs_;
  std::map<std::string, RunSnapshot> recovered_;

  mutable std::mutex results_mutex_;
  std::vector<RunResult> results_;

  std::vector<std::thread> workers_;
  std::atomic<bool> accepting_{false};
  std::atomic<unsigned long> sequence_{0};

  std::string next_run_id();
  std::shared_ptr<PipelineRun> find(const std::string &run_id) const;

  /**
   * @brief Worker function for each run thread.
   * @param worker_id The worker's index (0-based), for logging
   */
  void run_worker(int worker_id);

  void on_event(const RunSnapshot &snapshot, bool phase_changed);
};

} // namespace slide_reel

#endif // SLIDE_REEL_RUN_SERVICE_HPP

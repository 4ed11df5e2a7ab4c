/**
 * @file assembly_pipeline.hpp
 * @brief Media assembly state machine
 *
 * @details The AssemblyPipeline drives one PipelineRun to a terminal phase:
 *
 *          1. loading: initialize the encode engine
 *
 *          2. preparing: acquire the run's workspace, resolve catalog
 *             selections, materialize every input blob
 *
 *          3. processing: run the planned encode operations in order
 *
 *          4. finalizing: read back the result, verify it, publish it
 *
 *          5. completed, or error from any earlier phase
 *
 * @note Every log line is prefixed with [Run <id>]. Step timings are
 *       recorded under the run id and printed when the run ends.
 */

#ifndef SLIDE_REEL_ASSEMBLY_PIPELINE_HPP
#define SLIDE_REEL_ASSEMBLY_PIPELINE_HPP

#include <functional>
#include <optional>
#include <string>

#include "catalog.hpp"
#include "encode_commands.hpp"
#include "encode_engine.hpp"
#include "pipeline_run.hpp"
#include "progress.hpp"
#include "workspace.hpp"

namespace slide_reel {

/**
 * @struct PipelineOptions
 * @brief Deployment settings a pipeline needs (see Config for defaults).
 */
struct PipelineOptions {
  std::string output_dir;     //< Finished videos land here as <runId>.mp4
  bool verify_output = true;  //< Probe the artifact before completing
  double deadline_sec = 0.0;  //< Per-run deadline; <= 0 disables it
  bool print_summary = true;  //< Timing table and run summary at the end
};

/**
 * @class AssemblyPipeline
 * @brief Runs the fixed phase sequence against one engine.
 *
 * @attention INTERRUPTION:
 *
 * - The run's CancelToken is polled before every blob write, before every
 *   encode step and before finalizing
 *
 * - Cancellation and deadline expiry end the run as kCancelled or
 *   kTimedOut, after the workspace has been torn down
 *
 * @note Runs one PipelineRun at a time; concurrent runs use separate
 *       pipelines with separate engines.
 */
class AssemblyPipeline {
public:
  /**
   * @brief Called on every progress change and phase transition.
   * @param snapshot Current state of the run
   * @param phase_changed true when the call marks a phase transition
   */
  using Observer =
      std::function<void(const RunSnapshot &snapshot, bool phase_changed)>;

  /**
   * @param engine Engine for this run; nullptr fails the run in loading
   *               with kEngineUnavailable
   */
  AssemblyPipeline(EncodeEngine *engine, const AssetCatalog &catalog,
                   WorkspaceManager &workspaces, PipelineOptions options);

  void set_observer(Observer observer) { observer_ = std::move(observer); }

  /**
   * @brief Drive a run to completion or failure.
   * @note A run is driven at most once; later calls leave it untouched.
   * @return true if the run completed
   */
  bool run(PipelineRun &run);

private:
  EncodeEngine *engine_;
  const AssetCatalog &catalog_;
  WorkspaceManager &workspaces_;
  PipelineOptions options_;
  Observer observer_;

  /// Per-run state, reset by run()
  PipelineRun *run_ = nullptr;
  ProgressReporter reporter_;
  std::optional<ErrorDetail> failure_;

  bool load();
  bool prepare(Workspace &ws, StagedInputs &staged);
  bool process(Workspace &ws, const StagedInputs &staged);
  bool finalize(Workspace &ws, std::string &output_ref);

  /// Stage one input blob under its deterministic name
  bool stage(Workspace &ws, const std::string &name, const Blob &data);

  /// Resolve a catalog selection and stage its file
  bool stage_soundtrack(Workspace &ws, StagedInputs &staged);
  bool stage_filter(Workspace &ws, StagedInputs &staged);

  /// True (with failure_ set) once the run was cancelled or timed out
  bool interrupted();

  void advance(Phase next);
  void report(Phase phase, double fraction);
  void notify(bool phase_changed);

  void print_run_summary(const RunSnapshot &snapshot);

  /**
   * @brief Log a message prefixed with the run id.
   */
  void log_info(const std::string &msg);
  void log_phase(const std::string &msg);
  void log_error(const std::string &msg);
};

} // namespace slide_reel

#endif // SLIDE_REEL_ASSEMBLY_PIPELINE_HPP

/**
 * @file assembly_pipeline.cpp
 * @brief Media assembly state machine implementation
 *
 * @details Phase order is fixed:
 *
 *          loading -> preparing -> processing -> finalizing -> completed
 *
 *          The workspace scope spans preparing through finalizing. The
 *          terminal phase is entered only after the scope is torn down, so
 *          an observer that sees kError or kCompleted also sees an empty
 *          workspace.
 */

#include "slide_reel/assembly_pipeline.hpp"

#include <cctype>
#include <chrono>
#include <filesystem>

#include <fmt/color.h>
#include <fmt/core.h>

#include "slide_reel/file_util.hpp"
#include "slide_reel/logging.hpp"
#include "slide_reel/media_probe.hpp"
#include "slide_reel/system.hpp"

namespace slide_reel {

namespace {

/// Lower-cased extension of a catalog reference, or `fallback` if it has none
std::string ref_extension(const std::string &ref, const char *fallback) {
  std::string ext = std::filesystem::path(ref).extension().string();
  if (!ext.empty() && ext[0] == '.')
    ext.erase(0, 1);
  for (auto &c : ext)
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  return ext.empty() ? std::string(fallback) : ext;
}

long elapsed_us(std::chrono::high_resolution_clock::time_point since) {
  return static_cast<long>(
      std::chrono::duration_cast<std::chrono::microseconds>(
          std::chrono::high_resolution_clock::now() - since)
          .count());
}

} // namespace

// **---- Constructor ----**

AssemblyPipeline::AssemblyPipeline(EncodeEngine *engine,
                                   const AssetCatalog &catalog,
                                   WorkspaceManager &workspaces,
                                   PipelineOptions options)
    : engine_(engine), catalog_(catalog), workspaces_(workspaces),
      options_(std::move(options)) {}

// **---- Logging Helpers ----**

void AssemblyPipeline::log_info(const std::string &msg) {
  LOG_INFO("[Run {}] {}", run_->id(), msg);
}

void AssemblyPipeline::log_phase(const std::string &msg) {
  LOG_PHASE("[Run {}] {}", run_->id(), msg);
}

void AssemblyPipeline::log_error(const std::string &msg) {
  LOG_ERROR("[Run {}] {}", run_->id(), msg);
}

// **---- State Helpers ----**

void AssemblyPipeline::notify(bool phase_changed) {
  if (observer_)
    observer_(run_->snapshot(), phase_changed);
}

void AssemblyPipeline::advance(Phase next) {
  if (run_->enter(next)) {
    run_->set_progress(reporter_.report(next, 0.0).percent);
    notify(true);
  }
}

void AssemblyPipeline::report(Phase phase, double fraction) {
  int before = reporter_.percent();
  ProgressUpdate update = reporter_.report(phase, fraction);
  if (update.percent != before) {
    run_->set_progress(update.percent);
    notify(false);
  }
}

bool AssemblyPipeline::interrupted() {
  const CancelToken &token = run_->cancel_token();
  if (token.cancelled()) {
    failure_ = ErrorDetail{ErrorKind::kCancelled, "", ""};
    return true;
  }
  if (token.expired()) {
    failure_ = ErrorDetail{
        ErrorKind::kTimedOut, "",
        fmt::format("deadline of {}s reached", format_seconds(options_.deadline_sec))};
    return true;
  }
  return false;
}

// **---- Main Processing ----**

bool AssemblyPipeline::run(PipelineRun &run) {
  /// A run is driven once; its record and published output stay as they are
  if (!run.claim()) {
    LOG_WARN("[Run {}] Already started, not running again", run.id());
    return false;
  }

  run_ = &run;
  reporter_ = ProgressReporter();
  failure_.reset();

  TIMER_START(total_run);
  run.cancel_token().set_deadline_after(options_.deadline_sec);

  const RenderPlan &plan = run.plan();
  log_phase(fmt::format("Assembling '{}' ({}s, {} encode steps)",
                        run.assets().project_name,
                        format_seconds(plan.total_duration),
                        plan.steps.size()));
  notify(true);

  // **----- PHASE 1: LOADING -----**

  bool loaded = !interrupted() && load();

  // **----- PHASES 2-4: INSIDE THE WORKSPACE SCOPE -----**

  std::string output_ref;
  if (loaded && !interrupted()) {
    advance(Phase::kPreparing);
    ScopeOutcome outcome = workspaces_.with_scope(
        *engine_, run.id(), [this, &output_ref](Workspace &ws) {
          StagedInputs staged;
          if (!prepare(ws, staged))
            return false;
          advance(Phase::kProcessing);
          if (!process(ws, staged))
            return false;
          advance(Phase::kFinalizing);
          return finalize(ws, output_ref);
        });

    if (outcome == ScopeOutcome::kNotAcquired) {
      failure_ = ErrorDetail{ErrorKind::kAssetWriteFailed,
                             WorkspaceManager::namespace_for(run.id()),
                             "workspace namespace unavailable"};
    } else if (outcome == ScopeOutcome::kBodyFailed && !failure_) {
      failure_ = ErrorDetail{ErrorKind::kEncodeStepFailed, "pipeline",
                             "aborted without a recorded cause"};
    }
  }

  // **----- TERMINAL PHASE -----**

  bool completed = !failure_;
  if (completed) {
    run.complete(output_ref);
    LOG_SUCCESS("[Run {}] Output saved to: {}", run.id(), output_ref);
  } else {
    run.fail(*failure_);
    log_error(describe(*failure_));
  }
  notify(true);

  TIMER_END(run.id(), total_run);

  if (options_.print_summary) {
    TimingCollector::print_summary(run.id());
    print_run_summary(run.snapshot());
  }
  TimingCollector::clear(run.id());

  run_ = nullptr;
  return completed;
}

// **---- Loading ----**

bool AssemblyPipeline::load() {
  log_phase("Loading encode engine...");
  TIMER_START(load_engine);

  if (!engine_) {
    failure_ = ErrorDetail{ErrorKind::kEngineUnavailable, "",
                           "no engine configured"};
    return false;
  }
  if (!engine_->initialize()) {
    failure_ = ErrorDetail{ErrorKind::kEngineUnavailable, "",
                           "engine failed to initialize"};
    return false;
  }

  TIMER_END(run_->id(), load_engine);
  report(Phase::kLoading, 1.0);
  return true;
}

// **---- Preparing ----**

bool AssemblyPipeline::stage(Workspace &ws, const std::string &name,
                             const Blob &data) {
  if (interrupted())
    return false;
  if (!ws.write(name, data)) {
    failure_ = ErrorDetail{ErrorKind::kAssetWriteFailed, name,
                           "workspace write failed"};
    return false;
  }
  return true;
}

bool AssemblyPipeline::stage_soundtrack(Workspace &ws, StagedInputs &staged) {
  const std::string &id = *run_->assets().soundtrack_id;
  auto entry = catalog_.find_soundtrack(id);
  if (!entry) {
    failure_ = ErrorDetail{ErrorKind::kAssetWriteFailed, "soundtrack",
                           fmt::format("unknown soundtrack id '{}'", id)};
    return false;
  }

  Blob data;
  if (!catalog_.fetch(entry->file_ref, data) || data.empty()) {
    failure_ = ErrorDetail{ErrorKind::kAssetWriteFailed, "soundtrack",
                           fmt::format("cannot read '{}'", entry->file_ref)};
    return false;
  }

  std::string name =
      "soundtrack." + sniff_extension(data, ref_extension(entry->file_ref, "mp3"));
  if (!stage(ws, name, data))
    return false;

  staged.soundtrack = name;
  staged.soundtrack_loops =
      soundtrack_loop_count(run_->plan(), entry->duration_seconds);
  log_info(fmt::format("Soundtrack '{}' ({} loops)", entry->name,
                       staged.soundtrack_loops < 0
                           ? std::string("unbounded")
                           : std::to_string(staged.soundtrack_loops)));
  return true;
}

bool AssemblyPipeline::stage_filter(Workspace &ws, StagedInputs &staged) {
  const std::string &id = *run_->assets().filter_id;
  auto entry = catalog_.find_filter(id);
  if (!entry) {
    failure_ = ErrorDetail{ErrorKind::kAssetWriteFailed, "filter",
                           fmt::format("unknown filter id '{}'", id)};
    return false;
  }

  Blob data;
  if (!catalog_.fetch(entry->file_ref, data) || data.empty()) {
    failure_ = ErrorDetail{ErrorKind::kAssetWriteFailed, "filter",
                           fmt::format("cannot read '{}'", entry->file_ref)};
    return false;
  }

  std::string ext = sniff_extension(data, ref_extension(entry->file_ref, "mp4"));
  std::string name = "filter." + ext;
  if (!stage(ws, name, data))
    return false;

  staged.filter = name;
  staged.filter_is_still = is_still_extension(ext);
  log_info(fmt::format("Filter '{}'", entry->name));
  return true;
}

bool AssemblyPipeline::prepare(Workspace &ws, StagedInputs &staged) {
  log_phase(fmt::format("Preparing workspace {}...", ws.name()));
  TIMER_START(prepare);

  const AssetSet &assets = run_->assets();
  const RenderPlan &plan = run_->plan();

  size_t total = assets.images.size() + 1 + (plan.has_soundtrack ? 1 : 0) +
                 (plan.has_filter ? 1 : 0) + (plan.has_thumbnail ? 1 : 0);
  size_t done = 0;
  auto step_done = [&] {
    ++done;
    report(Phase::kPreparing,
           static_cast<double>(done) / static_cast<double>(total));
  };

  /// Catalog selections first: an unknown id fails before any bulk write
  if (plan.has_soundtrack) {
    if (!stage_soundtrack(ws, staged))
      return false;
    step_done();
  }
  if (plan.has_filter) {
    if (!stage_filter(ws, staged))
      return false;
    step_done();
  }

  /// Zero-padded index keeps lexical order equal to screen order
  staged.images.reserve(assets.images.size());
  for (size_t i = 0; i < assets.images.size(); ++i) {
    std::string name = fmt::format("image_{:03d}.{}", i,
                                   sniff_extension(assets.images[i], "png"));
    if (!stage(ws, name, assets.images[i]))
      return false;
    staged.images.push_back(name);
    step_done();
  }

  std::string narration = "narration." + sniff_extension(assets.narration, "mp3");
  if (!stage(ws, narration, assets.narration))
    return false;
  staged.narration = narration;
  step_done();

  if (plan.has_thumbnail) {
    std::string name = "thumbnail." + sniff_extension(*assets.thumbnail, "png");
    if (!stage(ws, name, *assets.thumbnail))
      return false;
    staged.thumbnail = name;
    step_done();
  }

  TIMER_END(run_->id(), prepare);
  log_info(fmt::format("Staged {} blobs", done));
  return true;
}

// **---- Processing ----**

bool AssemblyPipeline::process(Workspace &ws, const StagedInputs &staged) {
  std::vector<EncodeOperation> ops = build_operations(run_->plan(), staged);

  for (size_t i = 0; i < ops.size(); ++i) {
    if (interrupted())
      return false;

    const EncodeOperation &op = ops[i];
    log_phase(fmt::format("Step {}/{}: {}", i + 1, ops.size(), op.step));

    auto step_start = std::chrono::high_resolution_clock::now();
    ExecResult result = ws.execute(op);
    TimingCollector::record(run_->id(), op.step, elapsed_us(step_start));

    if (!result.ok) {
      failure_ =
          ErrorDetail{ErrorKind::kEncodeStepFailed, op.step, result.cause};
      return false;
    }

    report(Phase::kProcessing,
           static_cast<double>(i + 1) / static_cast<double>(ops.size()));
  }
  return true;
}

// **---- Finalizing ----**

bool AssemblyPipeline::finalize(Workspace &ws, std::string &output_ref) {
  if (interrupted())
    return false;

  log_phase("Finalizing...");
  TIMER_START(finalize);

  Blob artifact;
  if (!ws.read(FINAL_BLOB, artifact) || artifact.empty()) {
    failure_ = ErrorDetail{ErrorKind::kEncodeStepFailed, "finalize",
                           "final video could not be read back"};
    return false;
  }
  report(Phase::kFinalizing, 1.0 / 3.0);

  if (options_.verify_output) {
    std::string error;
    auto info = probe_media(artifact, &error);
    if (!info) {
      failure_ = ErrorDetail{ErrorKind::kEncodeStepFailed, "verify_output",
                             "unreadable container: " + error};
      return false;
    }
    std::string mismatch = verify_artifact(*info, run_->plan().total_duration);
    if (!mismatch.empty()) {
      failure_ =
          ErrorDetail{ErrorKind::kEncodeStepFailed, "verify_output", mismatch};
      return false;
    }
    log_info(fmt::format("Verified {} {}x{} + {}, {}s", info->video_codec,
                         info->width, info->height, info->audio_codec,
                         format_seconds(info->duration_seconds)));
  }
  report(Phase::kFinalizing, 2.0 / 3.0);

  if (interrupted())
    return false;

  std::string path =
      (std::filesystem::path(options_.output_dir) / (run_->id() + ".mp4"))
          .string();
  if (!write_file_atomic(path, artifact)) {
    failure_ = ErrorDetail{ErrorKind::kEncodeStepFailed, "finalize",
                           "could not publish the final video"};
    return false;
  }
  output_ref = path;

  TIMER_END(run_->id(), finalize);
  report(Phase::kFinalizing, 1.0);
  return true;
}

// **---- Run Summary ----**

void AssemblyPipeline::print_run_summary(const RunSnapshot &snapshot) {
  std::string prefix = fmt::format("[Run {}] ", snapshot.run_id);
  bool ok = snapshot.phase == Phase::kCompleted;

  std::lock_guard<std::mutex> lock(log_mutex);
  fmt::print("\n");
  fmt::print(fg(fmt::color::cyan), "{}========= RUN SUMMARY =========\n",
             prefix);
  fmt::print("{}{:<12} {}\n", prefix, "Project:", snapshot.project_name);
  fmt::print("{}{:<12} {}\n", prefix, "Duration:",
             format_time(snapshot.total_duration));
  fmt::print("{}{:<12} {}%\n", prefix, "Progress:", snapshot.progress_percent);
  if (ok) {
    fmt::print(fg(fmt::color::green), "{}{:<12} {}\n", prefix, "Output:",
               snapshot.output_ref.value_or(""));
  } else {
    fmt::print(fg(fmt::color::red), "{}{:<12} {}\n", prefix, "Error:",
               snapshot.reason());
  }
  fmt::print(fg(fmt::color::cyan), "{}===============================\n",
             prefix);
  std::fflush(stdout);
}

} // namespace slide_reel

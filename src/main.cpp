/**
 * @file main.cpp
 * @brief Entry point for the Slide Reel application
 *
 * @details Main entry point that handles:
 *
 *          - Command-line argument parsing
 *
 *          - run: assemble one project manifest and wait for it
 *
 *          - batch: assemble every manifest in a directory concurrently
 *
 *          - status: print the persisted state of a run
 *
 * @note Set RUN_WORKERS to control how many runs a batch executes at once
 *       and ENGINE_MODE=queued to serialize encoder invocations across runs.
 */

#include <algorithm>
#include <chrono>
#include <cstdio>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include <fmt/color.h>
#include <fmt/core.h>

#include "slide_reel/config.hpp"
#include "slide_reel/encode_queue.hpp"
#include "slide_reel/logging.hpp"
#include "slide_reel/manifest.hpp"
#include "slide_reel/queued_engine.hpp"
#include "slide_reel/run_service.hpp"
#include "slide_reel/run_store.hpp"
#include "slide_reel/system.hpp"

using namespace slide_reel;

namespace {

/// A run that outlives this is reported as still running
constexpr std::chrono::hours WAIT_LIMIT{24};

void print_usage() {
  LOG_WARN("Usage: slide_reel run <manifest.json>");
  LOG_WARN("       slide_reel batch <manifest_dir>");
  LOG_WARN("       slide_reel status <runId>");
}

void print_snapshot(const RunSnapshot &s) {
  bool ok = s.phase == Phase::kCompleted;
  auto color = ok ? fmt::color::green
                  : (s.phase == Phase::kError ? fmt::color::red
                                              : fmt::color::yellow);
  fmt::print("{:<12} {}\n", "Run:", s.run_id);
  fmt::print("{:<12} {}\n", "Project:", s.project_name);
  fmt::print(fg(color), "{:<12} {}\n", "Phase:", phase_name(s.phase));
  fmt::print("{:<12} {}%\n", "Progress:", s.progress_percent);
  fmt::print("{:<12} {}\n", "Duration:", format_time(s.total_duration));
  if (s.output_ref)
    fmt::print("{:<12} {}\n", "Output:", *s.output_ref);
  if (s.error)
    fmt::print(fg(fmt::color::red), "{:<12} {}\n", "Error:", s.reason());
  std::fflush(stdout);
}

int print_status(const std::string &run_id) {
  RunStore store(Config::run_store_dir());
  auto s = store.load(run_id);
  if (!s) {
    LOG_ERROR("NotFound: no run '{}' in {}", run_id, store.dir());
    return 1;
  }
  print_snapshot(*s);
  return 0;
}

/// Manifests of a batch directory, in name order
std::vector<std::string> collect_manifests(const std::string &dir) {
  namespace fs = std::filesystem;
  std::vector<std::string> files;
  std::error_code ec;
  for (fs::directory_iterator it(dir, ec), end; !ec && it != end;
       it.increment(ec)) {
    if (it->is_regular_file(ec) && it->path().extension() == ".json")
      files.push_back(it->path().string());
  }
  std::sort(files.begin(), files.end());
  return files;
}

/// Submit one manifest; returns the run id or an empty string
std::string submit_manifest(RunService &service, const std::string &path) {
  RawSubmission submission;
  std::string error;
  if (!load_manifest(path, submission, error)) {
    LOG_ERROR("{}: {}", path, error);
    return "";
  }

  SubmitResult result = service.submit(std::move(submission));
  if (!result.ok()) {
    LOG_ERROR("{}: validation failed", path);
    for (const auto &f : result.failures)
      LOG_ERROR("  - {}", f.to_string());
    return "";
  }
  return *result.run_id;
}

} // namespace

// **---- MAIN ----**

int main(int argc, char *argv[]) {
  /// Disable stdout buffering for real-time log visibility
  std::setvbuf(stdout, nullptr, _IONBF, 0);

  if (argc < 3) {
    print_usage();
    return 1;
  }

  std::string command = argv[1];
  std::string arg = argv[2];

  if (command == "status")
    return print_status(arg);

  if (command != "run" && command != "batch") {
    print_usage();
    return 1;
  }

  // **---- SHARED SETUP ----**

  JsonCatalog catalog(Config::asset_root());
  if (!catalog.load_files(Config::soundtrack_catalog(),
                          Config::filter_catalog())) {
    return 1;
  }
  LOG_INFO("Catalogs: {} soundtracks, {} filters", catalog.soundtrack_count(),
           catalog.filter_count());

  auto encode_queue = std::make_shared<EncodeQueue>();
  EngineFactory factory =
      make_engine_factory(Config::engine_mode(), Config::workspace_root(),
                          Config::ffmpeg_path(), encode_queue);

  RunServiceOptions options;
  options.workers = (command == "batch") ? calculate_run_workers() : 1;
  options.run_store_dir = Config::run_store_dir();
  options.pipeline.output_dir = Config::output_dir();
  options.pipeline.verify_output = Config::verify_output();
  options.pipeline.deadline_sec = Config::run_deadline_sec();

  RunService service(factory, catalog, options);
  service.set_observer([](const RunSnapshot &s, bool phase_changed) {
    if (!phase_changed && !is_terminal(s.phase))
      LOG_INFO("[Run {}] {} {}%", s.run_id, phase_name(s.phase),
               s.progress_percent);
  });
  service.start();

  if (command == "run") {
    // **---- SINGLE PROJECT MODE ----**

    LOG_INFO("Slide Reel - Single Project Mode");
    LOG_INFO("Manifest: {}", arg);

    std::string run_id = submit_manifest(service, arg);
    if (run_id.empty()) {
      service.shutdown(true);
      return 1;
    }

    auto final_state = service.wait(run_id, WAIT_LIMIT);
    service.shutdown(true);
    encode_queue->stop();
    return (final_state && final_state->phase == Phase::kCompleted) ? 0 : 1;
  }

  // **---- BATCH MODE - Concurrent runs ----**

  LOG_INFO("Slide Reel - Batch Mode");
  LOG_INFO("Manifest directory: {}", arg);

  std::vector<std::string> manifests = collect_manifests(arg);
  if (manifests.empty()) {
    LOG_WARN("No manifests found in directory");
    service.shutdown(true);
    return 0;
  }
  LOG_INFO("Found {} manifests", manifests.size());

  auto batch_start = std::chrono::high_resolution_clock::now();

  int rejected = 0;
  std::vector<std::string> run_ids;
  for (const auto &m : manifests) {
    std::string id = submit_manifest(service, m);
    if (id.empty())
      ++rejected;
    else
      run_ids.push_back(id);
  }

  for (const auto &id : run_ids)
    service.wait(id, WAIT_LIMIT);

  /// Queued runs are all terminal; let the workers drain and exit
  service.shutdown(false);
  encode_queue->stop();

  double elapsed_sec = std::chrono::duration<double>(
                           std::chrono::high_resolution_clock::now() -
                           batch_start)
                           .count();
  int failures = service.print_summary(elapsed_sec);
  if (rejected > 0)
    LOG_WARN("{} manifests rejected before submission", rejected);
  return failures + rejected;
}

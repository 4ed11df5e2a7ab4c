/**
 * @file run_store.hpp
 * @brief Persisted run descriptors for status recovery across restarts
 *
 * @details One flat JSON document per run, named <runId>.json:
 *
 *          {"runId", "projectName", "phase", "progressPercent",
 *           "totalDurationSeconds", "error"?: {"kind", "step"?, "cause",
 *           "reason"}, "outputRef"?}
 *
 *          Documents are replaced atomically, so a reader never sees a
 *          half-written descriptor.
 */

#ifndef SLIDE_REEL_RUN_STORE_HPP
#define SLIDE_REEL_RUN_STORE_HPP

#include <optional>
#include <string>
#include <vector>

#include "pipeline_run.hpp"

namespace slide_reel {

/// Cause recorded for runs found unfinished at startup
constexpr const char *INTERRUPTED_CAUSE = "interrupted by service restart";

class RunStore {
public:
  explicit RunStore(std::string dir);

  /// Write (or replace) the descriptor of a run
  bool save(const RunSnapshot &snapshot);

  /// Load one descriptor; std::nullopt if absent or unreadable
  std::optional<RunSnapshot> load(const std::string &run_id) const;

  /// Delete a descriptor; true if it is gone afterwards
  bool remove(const std::string &run_id);

  /// Every readable descriptor in the directory; unreadable ones are skipped
  std::vector<RunSnapshot> load_all() const;

  /**
   * @brief Rewrite every non-terminal descriptor as a cancelled error.
   * @note Runs are never resumed; their inputs did not survive the restart.
   * @return The descriptors after recovery
   */
  std::vector<RunSnapshot> recover();

  std::string path_for(const std::string &run_id) const;

  const std::string &dir() const { return dir_; }

  static std::string to_json(const RunSnapshot &snapshot);
  static std::optional<RunSnapshot> from_json(const std::string &text);

  /// Run ids are restricted to [A-Za-z0-9_-] so they map to file names
  static bool is_valid_id(const std::string &run_id);

private:
  std::string dir_;
};

} // namespace slide_reel

#endif // SLIDE_REEL_RUN_STORE_HPP

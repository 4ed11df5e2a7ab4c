/**
 * @file workspace.hpp
 * @brief Per-run storage scope with guaranteed teardown
 *
 * @details WorkspaceManager::with_scope() acquires an isolated engine
 *          namespace for a run, hands a Workspace to the body and removes
 *          every blob plus the namespace itself on the way out, however the
 *          body ends (success, failure return, or an exception unwinding
 *          through it).
 */

#ifndef SLIDE_REEL_WORKSPACE_HPP
#define SLIDE_REEL_WORKSPACE_HPP

#include <functional>
#include <mutex>
#include <set>
#include <string>
#include <vector>

#include "encode_engine.hpp"

namespace slide_reel {

/**
 * @class Workspace
 * @brief Handle on one run's namespace.
 * @note Remembers every blob it wrote or had produced so teardown can
 *       remove them even if the engine cannot list the namespace.
 */
class Workspace {
public:
  Workspace(EncodeEngine &engine, std::string ns)
      : engine_(engine), ns_(std::move(ns)) {}

  const std::string &name() const { return ns_; }

  bool write(const std::string &blob, const Blob &data);
  bool read(const std::string &blob, Blob &out) const;

  /// Run an operation inside this namespace; its output is tracked
  ExecResult execute(const EncodeOperation &op);

  std::vector<std::string> list() const { return engine_.list_namespace(ns_); }

  const std::set<std::string> &tracked() const { return tracked_; }

private:
  EncodeEngine &engine_;
  std::string ns_;
  std::set<std::string> tracked_;
};

/**
 * @enum ScopeOutcome
 * @brief How a with_scope() call ended.
 */
enum class ScopeOutcome {
  kNotAcquired,   //< Namespace could not be created; body never ran
  kBodyFailed,    //< Body returned false
  kBodySucceeded, //< Body returned true
};

/**
 * @class WorkspaceManager
 * @brief Hands out run namespaces and tears them down.
 *
 * @attention ISOLATION:
 *
 * - A namespace is derived from the run id and is held by at most one
 *   scope at a time; a second with_scope() for an active run id is refused
 *
 * - A namespace left on disk by a crashed process is removed before reuse
 *
 * @note Thread-safe; one manager is shared by all run workers.
 */
class WorkspaceManager {
public:
  using Body = std::function<bool(Workspace &)>;

  /// Deterministic namespace name for a run
  static std::string namespace_for(const std::string &run_id);

  /**
   * @brief Acquire the run's namespace, run the body, tear down.
   * @param engine Initialized engine owning the storage
   * @param run_id Run the namespace belongs to
   * @param body Work to perform inside the scope
   */
  ScopeOutcome with_scope(EncodeEngine &engine, const std::string &run_id,
                          const Body &body);

  bool is_active(const std::string &run_id) const;
  size_t active_count() const;

private:
  mutable std::mutex mutex_;
  std::set<std::string> active_;

  bool acquire(EncodeEngine &engine, const std::string &ns);
  void release(EncodeEngine &engine, const Workspace &ws);
};

} // namespace slide_reel

#endif // SLIDE_REEL_WORKSPACE_HPP

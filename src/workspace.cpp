/**
 * @file workspace.cpp
 * @brief Workspace scope implementation
 */

#include "slide_reel/workspace.hpp"

#include "slide_reel/logging.hpp"

namespace slide_reel {

// **----- Workspace -----**

bool Workspace::write(const std::string &blob, const Blob &data) {
  tracked_.insert(blob);
  return engine_.write_blob(ns_, blob, data);
}

bool Workspace::read(const std::string &blob, Blob &out) const {
  return engine_.read_blob(ns_, blob, out);
}

ExecResult Workspace::execute(const EncodeOperation &op) {
  tracked_.insert(op.output);
  return engine_.execute(ns_, op);
}

// **----- WorkspaceManager -----**

namespace {

/// Releases a scope when it goes out of scope, whatever the exit path
class ScopeGuard {
public:
  explicit ScopeGuard(std::function<void()> release) : release_(std::move(release)) {}
  ~ScopeGuard() { release_(); }

  ScopeGuard(const ScopeGuard &) = delete;
  ScopeGuard &operator=(const ScopeGuard &) = delete;

private:
  std::function<void()> release_;
};

} // namespace

std::string WorkspaceManager::namespace_for(const std::string &run_id) {
  return "run-" + run_id;
}

bool WorkspaceManager::acquire(EncodeEngine &engine, const std::string &ns) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!active_.insert(ns).second) {
      LOG_ERROR("Namespace {} is already held by another scope", ns);
      return false;
    }
  }

  if (engine.namespace_exists(ns)) {
    LOG_WARN("Removing stale namespace {} left by an earlier process", ns);
    engine.drop_namespace(ns);
  }

  if (!engine.create_namespace(ns)) {
    std::lock_guard<std::mutex> lock(mutex_);
    active_.erase(ns);
    return false;
  }
  return true;
}

void WorkspaceManager::release(EncodeEngine &engine, const Workspace &ws) {
  const std::string &ns = ws.name();

  std::set<std::string> blobs = ws.tracked();
  for (const auto &name : engine.list_namespace(ns))
    blobs.insert(name);

  size_t leftover = 0;
  for (const auto &name : blobs) {
    if (!engine.delete_blob(ns, name))
      ++leftover;
  }

  if (!engine.drop_namespace(ns) || engine.namespace_exists(ns)) {
    LOG_WARN("Namespace {} not fully removed ({} blobs refused deletion)", ns,
             leftover);
  }

  std::lock_guard<std::mutex> lock(mutex_);
  active_.erase(ns);
}

ScopeOutcome WorkspaceManager::with_scope(EncodeEngine &engine,
                                          const std::string &run_id,
                                          const Body &body) {
  std::string ns = namespace_for(run_id);
  if (!acquire(engine, ns))
    return ScopeOutcome::kNotAcquired;

  Workspace ws(engine, ns);
  ScopeGuard guard([this, &engine, &ws] { release(engine, ws); });

  return body(ws) ? ScopeOutcome::kBodySucceeded : ScopeOutcome::kBodyFailed;
}

bool WorkspaceManager::is_active(const std::string &run_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return active_.count(namespace_for(run_id)) > 0;
}

size_t WorkspaceManager::active_count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return active_.size();
}

} // namespace slide_reel

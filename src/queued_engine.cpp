/**
 * @file queued_engine.cpp
 * @brief Queued engine and engine factory
 */

#include "slide_reel/queued_engine.hpp"

#include <fmt/core.h>

#include "slide_reel/logging.hpp"

namespace slide_reel {

QueuedEngine::QueuedEngine(std::unique_ptr<ProcessEngine> inner,
                           std::shared_ptr<EncodeQueue> queue)
    : inner_(std::move(inner)), queue_(std::move(queue)) {}

bool QueuedEngine::initialize() {
  if (!queue_) {
    LOG_ERROR("Queued engine has no encode queue");
    return false;
  }
  return inner_->initialize();
}

bool QueuedEngine::is_initialized() const { return inner_->is_initialized(); }

bool QueuedEngine::create_namespace(const std::string &ns) {
  return inner_->create_namespace(ns);
}

bool QueuedEngine::drop_namespace(const std::string &ns) {
  return inner_->drop_namespace(ns);
}

bool QueuedEngine::namespace_exists(const std::string &ns) const {
  return inner_->namespace_exists(ns);
}

ExecResult QueuedEngine::execute(const std::string &ns,
                                 const EncodeOperation &op) {
  ProcessEngine *engine = inner_.get();
  auto future = queue_->submit(fmt::format("{}/{}", ns, op.step),
                               [engine, ns, op] { return engine->execute(ns, op); });
  return future.get();
}

bool QueuedEngine::write_blob(const std::string &ns, const std::string &name,
                              const Blob &data) {
  return inner_->write_blob(ns, name, data);
}

bool QueuedEngine::read_blob(const std::string &ns, const std::string &name,
                             Blob &out) const {
  return inner_->read_blob(ns, name, out);
}

std::vector<std::string>
QueuedEngine::list_namespace(const std::string &ns) const {
  return inner_->list_namespace(ns);
}

bool QueuedEngine::delete_blob(const std::string &ns, const std::string &name) {
  return inner_->delete_blob(ns, name);
}

EngineFactory make_engine_factory(const std::string &mode,
                                  const std::string &workspace_root,
                                  const std::string &ffmpeg_path,
                                  std::shared_ptr<EncodeQueue> queue) {
  if (mode == "queued" && queue) {
    queue->start();
    return [workspace_root, ffmpeg_path, queue]() -> std::unique_ptr<EncodeEngine> {
      return std::make_unique<QueuedEngine>(
          std::make_unique<ProcessEngine>(workspace_root, ffmpeg_path), queue);
    };
  }
  if (mode == "queued")
    LOG_WARN("ENGINE_MODE=queued without an encode queue, using direct");
  else if (mode != "direct")
    LOG_WARN("Unknown ENGINE_MODE '{}', using direct", mode);
  return [workspace_root, ffmpeg_path]() -> std::unique_ptr<EncodeEngine> {
    return std::make_unique<ProcessEngine>(workspace_root, ffmpeg_path);
  };
}

} // namespace slide_reel

/**
 * @file queued_engine.hpp
 * @brief EncodeEngine that funnels encoder invocations through an EncodeQueue
 *
 * @details Blob and namespace operations go straight to the wrapped
 *          ProcessEngine. Only execute() is serialized, so runs keep
 *          preparing their workspaces in parallel.
 */

#ifndef SLIDE_REEL_QUEUED_ENGINE_HPP
#define SLIDE_REEL_QUEUED_ENGINE_HPP

#include <memory>
#include <string>
#include <vector>

#include "encode_queue.hpp"
#include "process_engine.hpp"

namespace slide_reel {

class QueuedEngine : public EncodeEngine {
public:
  QueuedEngine(std::unique_ptr<ProcessEngine> inner,
               std::shared_ptr<EncodeQueue> queue);

  bool initialize() override;
  bool is_initialized() const override;

  bool create_namespace(const std::string &ns) override;
  bool drop_namespace(const std::string &ns) override;
  bool namespace_exists(const std::string &ns) const override;

  /// Blocks until the queue's worker has run the operation
  ExecResult execute(const std::string &ns, const EncodeOperation &op) override;

  bool write_blob(const std::string &ns, const std::string &name,
                  const Blob &data) override;
  bool read_blob(const std::string &ns, const std::string &name,
                 Blob &out) const override;
  std::vector<std::string> list_namespace(const std::string &ns) const override;
  bool delete_blob(const std::string &ns, const std::string &name) override;

private:
  std::unique_ptr<ProcessEngine> inner_;
  std::shared_ptr<EncodeQueue> queue_;
};

/**
 * @brief Engine factory selected by the ENGINE_MODE setting.
 * @param mode "direct" or "queued"; anything else falls back to direct
 * @param queue Shared queue for queued mode; started on first use
 */
EngineFactory make_engine_factory(const std::string &mode,
                                  const std::string &workspace_root,
                                  const std::string &ffmpeg_path,
                                  std::shared_ptr<EncodeQueue> queue);

} // namespace slide_reel

#endif // SLIDE_REEL_QUEUED_ENGINE_HPP

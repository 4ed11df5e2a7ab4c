/**
 * @file run_queue.hpp
 * @brief Thread-safe FIFO of submitted runs
 */

#ifndef SLIDE_REEL_RUN_QUEUE_HPP
#define SLIDE_REEL_RUN_QUEUE_HPP

#include <atomic>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <queue>

#include "pipeline_run.hpp"

namespace slide_reel {

/**
 * @class RunQueue
 * @brief Shared queue the run workers pull from.
 *
 * @attention DESIGN:
 *
 * - Workers pop runs from one shared queue
 *
 * - A long run keeps one worker busy while the others continue
 *
 * - Submission order is preserved; completion order is not
 */
class RunQueue {
  std::queue<std::shared_ptr<PipelineRun>> runs;
  mutable std::mutex mutex;
  std::condition_variable cv;
  std::atomic<bool> done{false};

public:
  /**
   * @brief Add a run to the queue.
   * @note Thread-safe; notifies one waiting worker.
   * @return false once finish() was called
   */
  bool push(std::shared_ptr<PipelineRun> run);

  /**
   * @brief Pop a run from the queue.
   * @note Blocks until a run is available or queue is finished.
   * @return true if a run was retrieved, false if queue is empty and done
   */
  bool pop(std::shared_ptr<PipelineRun> &run);

  /**
   * @brief Signal that no more runs will be added.
   * @note Wakes all waiting workers so they can exit once drained.
   */
  void finish();

  size_t size() const;
};

} // namespace slide_reel

#endif // SLIDE_REEL_RUN_QUEUE_HPP

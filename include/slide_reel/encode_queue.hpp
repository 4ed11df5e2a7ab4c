/**
 * @file encode_queue.hpp
 * @brief Shared encode queue for producer-consumer execution
 *
 * @details Lets several runs prepare their workspaces in parallel while
 *          encoder invocations execute one at a time:
 *
 *          - Run workers (producers) push encode jobs and wait on a future
 *
 *          - The queue's worker thread (consumer) executes jobs in order
 *
 *          - Keeps concurrent runs from fighting over CPU and disk
 */

#ifndef SLIDE_REEL_ENCODE_QUEUE_HPP
#define SLIDE_REEL_ENCODE_QUEUE_HPP

#include <atomic>
#include <condition_variable>
#include <functional>
#include <future>
#include <mutex>
#include <queue>
#include <string>
#include <thread>

#include "encode_engine.hpp"

namespace slide_reel {

/**
 * @struct EncodeJob
 * @brief A single queued encoder invocation.
 */
struct EncodeJob {
  std::string label;                 //< "<namespace>/<step>" for logging
  std::function<ExecResult()> work;  //< Runs the invocation
  std::promise<ExecResult> result;   //< Fulfilled by the worker
};

/**
 * @class EncodeQueue
 * @brief Thread-safe FIFO of encode jobs with its own consumer thread.
 *
 * @attention USAGE:
 *
 *   - Call start() once before submitting
 *
 *   - Producers call submit() and block on the returned future
 *
 *   - stop() drains what is queued, then joins the worker
 */
class EncodeQueue {
public:
  EncodeQueue() = default;
  ~EncodeQueue();

  EncodeQueue(const EncodeQueue &) = delete;
  EncodeQueue &operator=(const EncodeQueue &) = delete;

  /// Spawn the consumer thread; no-op if already running
  void start();

  /// Finish the queue and join the consumer
  void stop();

  /**
   * @brief Queue a job.
   * @return Future for the job's result. After stop() the future is
   *         immediately ready with a failed result.
   */
  std::future<ExecResult> submit(std::string label,
                                 std::function<ExecResult()> work);

  /**
   * @brief Push a job to the queue.
   * @return false if the queue has been finished
   */
  bool push(EncodeJob job);

  /**
   * @brief Pop a job from the queue (blocking).
   * @return true if a job was retrieved, false if finished and empty
   */
  bool pop(EncodeJob &job);

  /// Signal that no more jobs will be pushed
  void finish();

  bool empty() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return jobs_.empty();
  }

  size_t size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return jobs_.size();
  }

  /// Jobs executed so far
  size_t executed() const { return executed_.load(); }

private:
  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::queue<EncodeJob> jobs_;
  std::atomic<bool> done_{false};
  std::atomic<size_t> executed_{0};
  std::thread worker_;

  void run();
};

} // namespace slide_reel

#endif // SLIDE_REEL_ENCODE_QUEUE_HPP

/**
 * @file run_queue.cpp
 * @brief Run queue implementation
 */

#include "slide_reel/run_queue.hpp"

namespace slide_reel {

bool RunQueue::push(std::shared_ptr<PipelineRun> run) {
  {
    std::lock_guard<std::mutex> lock(mutex);
    if (done.load())
      return false;
    runs.push(std::move(run));
  }
  cv.notify_one();
  return true;
}

bool RunQueue::pop(std::shared_ptr<PipelineRun> &run) {
  std::unique_lock<std::mutex> lock(mutex);
  cv.wait(lock, [this] { return !runs.empty() || done.load(); });
  if (runs.empty())
    return false;
  run = std::move(runs.front());
  runs.pop();
  return true;
}

void RunQueue::finish() {
  {
    std::lock_guard<std::mutex> lock(mutex);
    done.store(true);
  }
  cv.notify_all();
}

size_t RunQueue::size() const {
  std::lock_guard<std::mutex> lock(mutex);
  return runs.size();
}

} // namespace slide_reel

/**
 * @file encode_queue.cpp
 * @brief Encode queue implementation
 */

#include "slide_reel/encode_queue.hpp"

#include "slide_reel/logging.hpp"

namespace slide_reel {

EncodeQueue::~EncodeQueue() { stop(); }

void EncodeQueue::start() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (worker_.joinable() || done_.load())
    return;
  worker_ = std::thread(&EncodeQueue::run, this);
}

void EncodeQueue::stop() {
  finish();
  if (worker_.joinable())
    worker_.join();
}

std::future<ExecResult> EncodeQueue::submit(std::string label,
                                            std::function<ExecResult()> work) {
  EncodeJob job;
  job.label = std::move(label);
  job.work = std::move(work);
  std::future<ExecResult> future = job.result.get_future();

  std::string label_copy = job.label;
  if (!push(std::move(job))) {
    /// push() failed without taking the job; answer through a fresh promise
    std::promise<ExecResult> rejected;
    ExecResult r;
    r.cause = "encode queue stopped";
    rejected.set_value(r);
    LOG_WARN("Encode queue stopped, rejecting {}", label_copy);
    return rejected.get_future();
  }
  return future;
}

bool EncodeQueue::push(EncodeJob job) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (done_.load())
      return false;
    jobs_.push(std::move(job));
  }
  cv_.notify_one();
  return true;
}

bool EncodeQueue::pop(EncodeJob &job) {
  std::unique_lock<std::mutex> lock(mutex_);
  cv_.wait(lock, [this] { return !jobs_.empty() || done_.load(); });

  if (jobs_.empty()) {
    return false;
  }

  job = std::move(jobs_.front());
  jobs_.pop();
  return true;
}

void EncodeQueue::finish() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    done_.store(true);
  }
  cv_.notify_all();
}

void EncodeQueue::run() {
  EncodeJob job;
  while (pop(job)) {
    LOG_INFO("[Encode] {} started ({} waiting)", job.label, size());
    ExecResult result;
    if (job.work)
      result = job.work();
    else
      result.cause = "empty job";
    executed_.fetch_add(1);
    job.result.set_value(std::move(result));
  }
}

} // namespace slide_reel

// Component: shared encode queue

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <mutex>
#include <thread>
#include <vector>

#include "slide_reel/encode_queue.hpp"

namespace slide_reel {
namespace {

ExecResult ok_result() {
  ExecResult r;
  r.ok = true;
  r.exit_code = 0;
  return r;
}

TEST(EncodeQueueTest, RunsSubmittedWork) {
  EncodeQueue queue;
  queue.start();

  auto future = queue.submit("run-1/mux", [] { return ok_result(); });
  ExecResult r = future.get();
  EXPECT_TRUE(r.ok);
  EXPECT_EQ(queue.executed(), 1u);

  queue.stop();
}

// -----------------------------------------------------------------------------
// One consumer: jobs from many producers never overlap
// -----------------------------------------------------------------------------
TEST(EncodeQueueTest, SerializesConcurrentProducers) {
  EncodeQueue queue;
  queue.start();

  std::atomic<int> running{0};
  std::atomic<int> max_running{0};
  auto work = [&] {
    int now = running.fetch_add(1) + 1;
    int seen = max_running.load();
    while (now > seen && !max_running.compare_exchange_weak(seen, now)) {
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
    running.fetch_sub(1);
    return ok_result();
  };

  std::vector<std::thread> producers;
  for (int p = 0; p < 4; ++p) {
    producers.emplace_back([&queue, &work, p] {
      for (int i = 0; i < 5; ++i) {
        ExecResult r =
            queue.submit("run-" + std::to_string(p) + "/step", work).get();
        EXPECT_TRUE(r.ok);
      }
    });
  }
  for (auto &t : producers)
    t.join();

  EXPECT_EQ(queue.executed(), 20u);
  EXPECT_EQ(max_running.load(), 1);
  queue.stop();
}

TEST(EncodeQueueTest, PreservesSubmissionOrder) {
  EncodeQueue queue;
  std::mutex order_mutex;
  std::vector<int> order;

  std::vector<std::future<ExecResult>> futures;
  for (int i = 0; i < 5; ++i) {
    futures.push_back(queue.submit("job", [&, i] {
      std::lock_guard<std::mutex> lock(order_mutex);
      order.push_back(i);
      return ok_result();
    }));
  }
  /// Started after the pushes so every job is waiting in the queue
  queue.start();
  for (auto &f : futures)
    f.get();

  EXPECT_EQ(order, (std::vector<int>{0, 1, 2, 3, 4}));
  queue.stop();
}

// -----------------------------------------------------------------------------
// After stop(), submissions fail immediately instead of blocking forever
// -----------------------------------------------------------------------------
TEST(EncodeQueueTest, RejectsAfterStop) {
  EncodeQueue queue;
  queue.start();
  queue.stop();

  bool ran = false;
  ExecResult r = queue.submit("late", [&] {
                        ran = true;
                        return ok_result();
                      }).get();
  EXPECT_FALSE(r.ok);
  EXPECT_EQ(r.cause, "encode queue stopped");
  EXPECT_FALSE(ran);
  EXPECT_FALSE(queue.push(EncodeJob{}));
}

TEST(EncodeQueueTest, DrainsPendingJobsOnStop) {
  EncodeQueue queue;
  auto a = queue.submit("a", [] { return ok_result(); });
  auto b = queue.submit("b", [] { return ok_result(); });
  EXPECT_EQ(queue.size(), 2u);

  queue.start();
  queue.stop();
  EXPECT_TRUE(a.get().ok);
  EXPECT_TRUE(b.get().ok);
  EXPECT_TRUE(queue.empty());
}

} // namespace
} // namespace slide_reel

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <future>
#include <stdexcept>
#include <thread>

#include "scribe_core/async/job_queue.hpp"
#include "scribe_core/async/worker_pool.hpp"
#include "utilities_test.hpp"

namespace scribe_tests {

using namespace scribe_core::async;

TEST(WorkerPoolTest, ConstructorThrowsOnZeroThreads) {
  EXPECT_THROW({ WorkerPool pool(0); }, std::invalid_argument);
}

TEST(WorkerPoolTest, StopWithoutStartIsNoOp) {
  EXPECT_NO_THROW({
    WorkerPool pool(1);
    pool.stop();
  });
}

TEST(WorkerPoolTest, StartTwiceShowsWarningAndNoThrow) {
  EXPECT_NO_THROW({
    WorkerPool pool(2);
    pool.start();
    // Second call should be a no-op with a warning, not an exception
    pool.start();
    EXPECT_TRUE(pool.is_running());
    pool.stop();
  });
}

TEST(WorkerPoolTest, SubmitBeforeStartIsRejected) {
  WorkerPool pool(1);
  EXPECT_FALSE(pool.submit([] {}));
}

TEST(WorkerPoolTest, RunsSubmittedJobs) {
  WorkerPool pool(3);
  pool.start();

  std::atomic<int> completed{0};
  for (int i = 0; i < 20; ++i) {
    ASSERT_TRUE(pool.submit([&completed] { ++completed; }));
  }

  EXPECT_TRUE(TestUtilities::wait_for([&] { return completed.load() == 20; }));
  pool.stop();
  EXPECT_FALSE(pool.is_running());
  EXPECT_FALSE(pool.submit([] {}));
}

TEST(WorkerPoolTest, ThrowingJobDoesNotKillWorker) {
  WorkerPool pool(1);
  pool.start();

  std::promise<void> ran;
  auto done = ran.get_future();
  pool.submit([] { throw std::runtime_error("boom"); });
  pool.submit([&ran] { ran.set_value(); });

  EXPECT_EQ(done.wait_for(std::chrono::seconds(2)), std::future_status::ready);
}

TEST(WorkerPoolTest, CanRestartAfterStop) {
  WorkerPool pool(1);
  pool.start();
  pool.stop();
  pool.start();

  std::atomic<bool> ran{false};
  ASSERT_TRUE(pool.submit([&ran] { ran = true; }));
  EXPECT_TRUE(TestUtilities::wait_for([&] { return ran.load(); }));
}

TEST(JobQueueTest, ClosedQueueRejectsAndReleasesWaiters) {
  JobQueue queue;
  EXPECT_TRUE(queue.push([] {}));
  EXPECT_EQ(queue.pending(), 1u);

  auto waiter = std::async(std::launch::async, [&queue] {
    // Drains the one job, then blocks until close()
    queue.pop();
    return queue.pop().has_value();
  });
  std::this_thread::sleep_for(std::chrono::milliseconds(20));
  queue.close();

  EXPECT_FALSE(waiter.get());
  EXPECT_FALSE(queue.push([] {}));
  queue.reopen();
  EXPECT_TRUE(queue.push([] {}));
}

}  // namespace scribe_tests

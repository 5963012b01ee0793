#pragma once

#include <atomic>
#include <thread>

#include "scribe_core/async/job_queue.hpp"

namespace scribe_core::async {

/**
 * @class Worker
 * @brief A single background thread that runs jobs from a shared queue.
 *
 * A Worker is managed by a WorkerPool. It is non-copyable and non-movable to
 * keep ownership of the underlying thread clear.
 */
class Worker {
 public:
  Worker(int worker_id, JobQueue &queue);

  /**
   * @brief Stops the worker and joins its thread.
   *
   * The queue must already be closed or the join blocks until the next job.
   */
  ~Worker();

  /**
   * @brief Starts the run loop in a new thread.
   * @throws std::runtime_error if the worker is already running.
   */
  void start();

  // Signals the loop to exit after the current job. Does not block.
  void stop();

  // Waits for the thread to exit.
  void join();

  Worker(const Worker &) = delete;
  Worker &operator=(const Worker &) = delete;
  Worker(Worker &&) = delete;
  Worker &operator=(Worker &&) = delete;

 private:
  void run_loop();

  int worker_id_;
  JobQueue &queue_;
  std::atomic<bool> should_stop_{false};
  std::thread thread_;
};

}  // namespace scribe_core::async

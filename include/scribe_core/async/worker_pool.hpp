#pragma once

#include <memory>
#include <mutex>
#include <vector>

#include "scribe_core/async/job_queue.hpp"
#include "scribe_core/async/worker.hpp"

namespace scribe_core::async {

/**
 * @class WorkerPool
 * @brief Fixed set of Worker threads draining one JobQueue.
 *
 * Owns the whole lifecycle of its threads: creating, starting and joining
 * them when the pool is stopped or destroyed.
 */
class WorkerPool {
 public:
  /**
   * @param num_threads The number of worker threads to create.
   * @throws std::invalid_argument if num_threads is zero.
   */
  explicit WorkerPool(size_t num_threads);

  // Stops and joins all workers.
  ~WorkerPool();

  void start();

  /**
   * @brief Stops all workers and waits for them to exit.
   *
   * Jobs already running finish; jobs still queued are dropped.
   */
  void stop();

  // @return false if the pool is not running.
  bool submit(Job job);

  bool is_running() const;
  size_t size() const {
    return workers_.size();
  }

  WorkerPool(const WorkerPool &) = delete;
  WorkerPool &operator=(const WorkerPool &) = delete;
  WorkerPool(WorkerPool &&) = delete;
  WorkerPool &operator=(WorkerPool &&) = delete;

 private:
  JobQueue queue_;
  std::vector<std::unique_ptr<Worker>> workers_;
  mutable std::mutex state_mutex_;
  bool is_running_ = false;
};

}  // namespace scribe_core::async

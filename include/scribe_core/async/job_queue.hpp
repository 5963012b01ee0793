#pragma once

#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <optional>

namespace scribe_core::async {

using Job = std::function<void()>;

/**
 * @class JobQueue
 * @brief Blocking FIFO of jobs shared by the workers of a pool.
 */
class JobQueue {
 public:
  // @return false if the queue has been closed.
  bool push(Job job);

  // Blocks until a job is available. Returns nullopt once closed.
  std::optional<Job> pop();

  // Wakes every waiting worker. Pending jobs are discarded.
  void close();

  // Makes a closed queue usable again.
  void reopen();

  size_t pending() const;

 private:
  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::deque<Job> jobs_;
  bool closed_ = false;
};

}  // namespace scribe_core::async

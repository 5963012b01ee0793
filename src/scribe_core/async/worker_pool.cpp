#include "scribe_core/async/worker_pool.hpp"

#include <iostream>
#include <stdexcept>

namespace scribe_core::async {

WorkerPool::WorkerPool(size_t num_threads) {
  if (num_threads == 0) {
    throw std::invalid_argument("WorkerPool must have at least one thread.");
  }

  workers_.reserve(num_threads);
  for (size_t i = 0; i < num_threads; ++i) {
    workers_.emplace_back(std::make_unique<Worker>(static_cast<int>(i), queue_));
  }
}

WorkerPool::~WorkerPool() {
  stop();
}

void WorkerPool::start() {
  std::lock_guard<std::mutex> lock(state_mutex_);
  if (is_running_) {
    std::cerr << "[Worker] Warning: WorkerPool is already running." << std::endl;
    return;
  }
  queue_.reopen();
  for (const auto &worker : workers_) {
    worker->start();
  }
  is_running_ = true;
  std::cout << "[Worker] Started " << workers_.size() << " workers" << std::endl;
}

void WorkerPool::stop() {
  std::lock_guard<std::mutex> lock(state_mutex_);
  if (!is_running_) {
    return;
  }
  for (const auto &worker : workers_) {
    worker->stop();
  }
  queue_.close();
  for (const auto &worker : workers_) {
    worker->join();
  }
  is_running_ = false;
  std::cout << "[Worker] All workers stopped" << std::endl;
}

bool WorkerPool::submit(Job job) {
  std::lock_guard<std::mutex> lock(state_mutex_);
  if (!is_running_) {
    return false;
  }
  return queue_.push(std::move(job));
}

bool WorkerPool::is_running() const {
  std::lock_guard<std::mutex> lock(state_mutex_);
  return is_running_;
}

}  // namespace scribe_core::async

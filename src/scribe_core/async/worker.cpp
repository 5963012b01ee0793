#include "scribe_core/async/worker.hpp"

#include <iostream>
#include <stdexcept>

namespace scribe_core::async {

Worker::Worker(int worker_id, JobQueue &queue) : worker_id_(worker_id), queue_(queue) {}

Worker::~Worker() {
  stop();
  join();
}

void Worker::start() {
  if (thread_.joinable()) {
    throw std::runtime_error("Worker is already running.");
  }
  should_stop_.store(false);
  thread_ = std::thread(&Worker::run_loop, this);
}

void Worker::stop() {
  should_stop_.store(true);
}

void Worker::join() {
  if (thread_.joinable()) {
    thread_.join();
  }
}

void Worker::run_loop() {
  while (!should_stop_.load()) {
    std::optional<Job> job = queue_.pop();
    if (!job) {
      break;
    }
    try {
      (*job)();
    } catch (const std::exception &e) {
      std::cerr << "[Worker] [" << worker_id_ << "] ERROR running job: " << e.what() << std::endl;
    }
  }
}

}  // namespace scribe_core::async

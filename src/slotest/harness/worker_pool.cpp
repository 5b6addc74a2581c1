#include "slotest/harness/worker_pool.hpp"

#include <cstddef>
#include <functional>
#include <mutex>
#include <stop_token>
#include <thread>
#include <utility>

namespace slotest::harness {

WorkerPool::WorkerPool(std::size_t workers) {
  if (workers == 0) {
    workers = 1;
  }
  workers_.reserve(workers);
  for (std::size_t i = 0; i < workers; ++i) {
    workers_.emplace_back(
        [this](std::stop_token st) { WorkerLoop(std::move(st)); });
  }
}

WorkerPool::~WorkerPool() {
  for (auto& worker : workers_) {
    worker.request_stop();
  }
  cv_.notify_all();
  // jthread destructors join
  workers_.clear();
}

void WorkerPool::WorkerLoop(std::stop_token stop_token) {
  while (true) {
    std::move_only_function<void()> task;
    {
      std::unique_lock lock(mutex_);
      cv_.wait(lock, stop_token, [&] { return !tasks_.empty(); });
      if (tasks_.empty()) {
        // Stop requested and nothing left to drain
        return;
      }
      task = std::move(tasks_.front());
      tasks_.pop();
    }
    task();
  }
}

}  // namespace slotest::harness

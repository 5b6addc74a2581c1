#pragma once

#include <condition_variable>
#include <cstddef>
#include <functional>
#include <future>
#include <mutex>
#include <queue>
#include <stop_token>
#include <thread>
#include <type_traits>
#include <utility>
#include <vector>

namespace slotest::harness {

// Fixed-size pool of worker threads consuming a FIFO task queue.
//
// Submit() hands back a future per task, so callers collect results in
// submission order no matter which worker finishes first. Destruction drains
// the queue: every submitted task runs before the workers are joined.
class WorkerPool {
 public:
  explicit WorkerPool(std::size_t workers);
  ~WorkerPool();

  WorkerPool(const WorkerPool&) = delete;
  auto operator=(const WorkerPool&) -> WorkerPool& = delete;
  WorkerPool(WorkerPool&&) = delete;
  auto operator=(WorkerPool&&) -> WorkerPool& = delete;

  template <typename F>
  auto Submit(F&& task) -> std::future<std::invoke_result_t<std::decay_t<F>>> {
    using ResultType = std::invoke_result_t<std::decay_t<F>>;
    std::packaged_task<ResultType()> packaged(std::forward<F>(task));
    auto future = packaged.get_future();
    {
      std::lock_guard lock(mutex_);
      tasks_.emplace(std::move(packaged));
    }
    cv_.notify_one();
    return future;
  }

  [[nodiscard]] auto Size() const -> std::size_t {
    return workers_.size();
  }

 private:
  void WorkerLoop(std::stop_token stop_token);

  std::mutex mutex_;
  std::condition_variable_any cv_;
  std::queue<std::move_only_function<void()>> tasks_;

  // Declared last: joined before the queue and mutex are destroyed
  std::vector<std::jthread> workers_;
};

}  // namespace slotest::harness

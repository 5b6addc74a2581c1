#pragma once

#include <atomic>

namespace slotest::common {

// Cooperative cancellation flag shared between the operator (signal handler
// or test) and the code waiting on subprocesses. Lock-free, so raising it from
// a signal handler is safe.
class InterruptFlag {
 public:
  InterruptFlag() = default;
  InterruptFlag(const InterruptFlag&) = delete;
  auto operator=(const InterruptFlag&) -> InterruptFlag& = delete;

  void Request() noexcept {
    requested_.store(true, std::memory_order_relaxed);
  }

  [[nodiscard]] auto Requested() const noexcept -> bool {
    return requested_.load(std::memory_order_relaxed);
  }

  void Reset() noexcept {
    requested_.store(false, std::memory_order_relaxed);
  }

 private:
  std::atomic<bool> requested_{false};
};

// Process-wide flag raised by SIGINT/SIGTERM once
// InstallInterruptHandlers() has run.
auto ProcessInterruptFlag() -> InterruptFlag&;

// Route SIGINT and SIGTERM to ProcessInterruptFlag(). Handlers are installed
// without SA_RESTART so blocking waits return early with EINTR. Returns false
// if either handler could not be installed.
auto InstallInterruptHandlers() -> bool;

}  // namespace slotest::common

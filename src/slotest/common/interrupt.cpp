#include "slotest/common/interrupt.hpp"

#include <csignal>

namespace slotest::common {

namespace {

static_assert(std::atomic<bool>::is_always_lock_free);

InterruptFlag g_process_interrupt;

void HandleInterruptSignal(int /*signal*/) {
  g_process_interrupt.Request();
}

}  // namespace

auto ProcessInterruptFlag() -> InterruptFlag& {
  return g_process_interrupt;
}

auto InstallInterruptHandlers() -> bool {
  struct sigaction action{};
  action.sa_handler = HandleInterruptSignal;
  sigemptyset(&action.sa_mask);
  action.sa_flags = 0;
  return sigaction(SIGINT, &action, nullptr) == 0 &&
         sigaction(SIGTERM, &action, nullptr) == 0;
}

}  // namespace slotest::common

#include "slotest/common/subprocess.hpp"

#include <array>
#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstring>
#include <string>
#include <thread>
#include <vector>

#include <fcntl.h>
#include <poll.h>
#include <spawn.h>
#include <sys/wait.h>
#include <unistd.h>

#include <fmt/core.h>

namespace slotest::common {

namespace {

using Clock = std::chrono::steady_clock;

// How often a running child is checked against the interrupt flag/deadline
constexpr int kPollIntervalMs = 50;

enum class StopReason : uint8_t { kNone, kTimedOut, kInterrupted };

auto CheckStop(const SubprocessOptions& options, Clock::time_point deadline)
    -> StopReason {
  if (options.interrupt != nullptr && options.interrupt->Requested()) {
    return StopReason::kInterrupted;
  }
  if (options.timeout.count() > 0 && Clock::now() >= deadline) {
    return StopReason::kTimedOut;
  }
  return StopReason::kNone;
}

// A limit past the clock's range never expires
auto DeadlineAfter(std::chrono::milliseconds timeout) -> Clock::time_point {
  auto now = Clock::now();
  if (timeout.count() <= 0 ||
      timeout >= std::chrono::duration_cast<std::chrono::milliseconds>(
                     Clock::time_point::max() - now)) {
    return Clock::time_point::max();
  }
  return now + timeout;
}

// Block until pid is reaped, retrying on EINTR
auto WaitBlocking(pid_t pid, int& status) -> bool {
  while (waitpid(pid, &status, 0) == -1) {
    if (errno != EINTR) {
      return false;
    }
  }
  return true;
}

auto KillAndReap(pid_t pid, StopReason reason, std::string output)
    -> SubprocessResult {
  kill(pid, SIGKILL);
  int status = 0;
  WaitBlocking(pid, status);
  return SubprocessResult{
      .status = reason == StopReason::kTimedOut
                    ? SubprocessStatus::kTimedOut
                    : SubprocessStatus::kInterrupted,
      .exit_code = -1,
      .output = std::move(output),
      .error = reason == StopReason::kTimedOut ? "timed out" : "interrupted",
  };
}

auto DecodeWaitStatus(int status, std::string output) -> SubprocessResult {
  SubprocessResult result;
  result.output = std::move(output);
  if (WIFEXITED(status)) {
    result.status = SubprocessStatus::kExited;
    result.exit_code = WEXITSTATUS(status);
  } else if (WIFSIGNALED(status)) {
    result.status = SubprocessStatus::kSignaled;
    result.exit_code = 128 + WTERMSIG(status);
    result.error = fmt::format(
        "terminated by signal {} ({})", WTERMSIG(status),
        strsignal(WTERMSIG(status)));
  } else {
    result.status = SubprocessStatus::kSignaled;
    result.error = "process did not exit normally";
  }
  return result;
}

}  // namespace

auto RunSubprocess(
    const std::vector<std::string>& argv, const SubprocessOptions& options)
    -> SubprocessResult {
  if (argv.empty()) {
    return SubprocessResult{.error = "empty argv"};
  }

  // O_CLOEXEC keeps the pipe out of sibling children spawned concurrently
  // by other workers; dup2 in the child clears it on STDOUT_FILENO.
  std::array<int, 2> pipe_fds{};
  if (pipe2(pipe_fds.data(), O_CLOEXEC) != 0) {
    return SubprocessResult{
        .error = fmt::format("pipe2() failed: {}", std::strerror(errno))};
  }

  // Build argv array (must be null-terminated)
  std::vector<char*> c_argv;
  c_argv.reserve(argv.size() + 1);
  for (const auto& arg : argv) {
    // NOLINTNEXTLINE(cppcoreguidelines-pro-type-const-cast)
    c_argv.push_back(const_cast<char*>(arg.c_str()));
  }
  c_argv.push_back(nullptr);

  posix_spawn_file_actions_t actions;
  posix_spawn_file_actions_init(&actions);
  posix_spawn_file_actions_adddup2(&actions, pipe_fds[1], STDOUT_FILENO);
  if (options.capture_stderr) {
    posix_spawn_file_actions_adddup2(&actions, pipe_fds[1], STDERR_FILENO);
  } else {
    posix_spawn_file_actions_addopen(
        &actions, STDERR_FILENO, "/dev/null", O_WRONLY, 0);
  }

  pid_t pid = 0;
  // NOLINTNEXTLINE(misc-include-cleaner) - environ is from unistd.h
  int spawn_result = posix_spawnp(
      &pid, c_argv[0], &actions, nullptr, c_argv.data(), environ);
  posix_spawn_file_actions_destroy(&actions);

  if (spawn_result != 0) {
    close(pipe_fds[0]);
    close(pipe_fds[1]);
    return SubprocessResult{
        .error = fmt::format(
            "posix_spawnp() failed: {}", std::strerror(spawn_result))};
  }

  // Close write end in parent
  close(pipe_fds[1]);

  const auto deadline = DeadlineAfter(options.timeout);
  std::string output;
  std::array<char, 4096> buffer{};

  // Drain stdout until EOF, waking periodically to honour interrupt/timeout
  while (true) {
    if (auto reason = CheckStop(options, deadline);
        reason != StopReason::kNone) {
      close(pipe_fds[0]);
      return KillAndReap(pid, reason, std::move(output));
    }

    pollfd poll_fd{.fd = pipe_fds[0], .events = POLLIN, .revents = 0};
    int ready = poll(&poll_fd, 1, kPollIntervalMs);
    if (ready == -1) {
      if (errno == EINTR) {
        continue;
      }
      std::string error =
          fmt::format("poll() failed: {}", std::strerror(errno));
      close(pipe_fds[0]);
      auto result = KillAndReap(pid, StopReason::kInterrupted, {});
      result.status = SubprocessStatus::kSpawnFailed;
      result.error = std::move(error);
      return result;
    }
    if (ready == 0) {
      continue;
    }

    ssize_t bytes_read = read(pipe_fds[0], buffer.data(), buffer.size());
    if (bytes_read > 0) {
      output.append(buffer.data(), static_cast<size_t>(bytes_read));
      continue;
    }
    if (bytes_read == -1 && errno == EINTR) {
      continue;
    }
    // EOF (or a read error): the child closed its end
    break;
  }
  close(pipe_fds[0]);

  // The child may outlive its stdout; keep honouring interrupt/timeout
  int status = 0;
  while (true) {
    pid_t waited = waitpid(pid, &status, WNOHANG);
    if (waited == pid) {
      break;
    }
    if (waited == -1 && errno != EINTR) {
      return SubprocessResult{
          .output = std::move(output),
          .error = fmt::format("waitpid() failed: {}", std::strerror(errno)),
      };
    }
    if (auto reason = CheckStop(options, deadline);
        reason != StopReason::kNone) {
      return KillAndReap(pid, reason, std::move(output));
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(kPollIntervalMs));
  }

  // A terminal Ctrl-C reaches the child as well; the interrupt wins over
  // whatever status the child died with
  if (options.interrupt != nullptr && options.interrupt->Requested()) {
    return SubprocessResult{
        .status = SubprocessStatus::kInterrupted,
        .exit_code = -1,
        .output = std::move(output),
        .error = "interrupted",
    };
  }

  return DecodeWaitStatus(status, std::move(output));
}

}  // namespace slotest::common

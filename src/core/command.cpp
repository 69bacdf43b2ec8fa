#include "core/command.hpp"

#include <poll.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <string>
#include <vector>

namespace device_agent::core {
namespace {

constexpr std::size_t kMaxCapturedOutput = 64 * 1024;

int wait_for_exit(const pid_t pid) {
  int status = 0;
  pid_t result = 0;
  do {
    result = waitpid(pid, &status, 0);
  } while (result < 0 && errno == EINTR);

  if (result < 0) {
    return -1;
  }
  if (WIFEXITED(status)) {
    return WEXITSTATUS(status);
  }
  return -1;
}

}  // namespace

CommandResult run_command(const std::vector<std::string>& argv, const std::chrono::milliseconds timeout) {
  CommandResult result{};
  if (argv.empty()) {
    return result;
  }

  std::vector<char*> args;
  args.reserve(argv.size() + 1);
  for (const auto& arg : argv) {
    args.push_back(const_cast<char*>(arg.c_str()));
  }
  args.push_back(nullptr);

  int pipe_fds[2]{};
  if (pipe(pipe_fds) != 0) {
    return result;
  }

  const pid_t pid = fork();
  if (pid < 0) {
    close(pipe_fds[0]);
    close(pipe_fds[1]);
    return result;
  }

  if (pid == 0) {
    close(pipe_fds[0]);
    dup2(pipe_fds[1], STDOUT_FILENO);
    dup2(pipe_fds[1], STDERR_FILENO);
    close(pipe_fds[1]);

    execvp(args[0], args.data());
    _exit(127);
  }

  close(pipe_fds[1]);
  result.launched = true;

  const auto deadline = std::chrono::steady_clock::now() + timeout;
  char chunk[4096]{};
  while (true) {
    const auto remaining =
        std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
    if (remaining.count() <= 0) {
      result.timed_out = true;
      break;
    }

    pollfd descriptor{pipe_fds[0], POLLIN, 0};
    const int ready = poll(&descriptor, 1, static_cast<int>(remaining.count()));
    if (ready < 0) {
      if (errno == EINTR) {
        continue;
      }
      break;
    }
    if (ready == 0) {
      result.timed_out = true;
      break;
    }

    const ssize_t bytes_read = ::read(pipe_fds[0], chunk, sizeof(chunk));
    if (bytes_read > 0) {
      if (result.output.size() < kMaxCapturedOutput) {
        result.output.append(chunk, static_cast<std::size_t>(bytes_read));
      }
      continue;
    }
    if (bytes_read < 0 && errno == EINTR) {
      continue;
    }
    break;
  }

  close(pipe_fds[0]);

  if (result.timed_out) {
    kill(pid, SIGKILL);
  }
  result.exit_code = wait_for_exit(pid);
  if (result.exit_code == 127 && !result.timed_out) {
    result.launched = false;
  }
  return result;
}

}  // namespace device_agent::core

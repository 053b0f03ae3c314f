#include "remotegate/common/process.hpp"

#include <algorithm>
#include <array>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace remotegate::common {

namespace {

constexpr std::size_t kMaxOutputBytes = 64 * 1024;

void append_capped(std::string &output, const char *data, const std::size_t size) {
  const std::size_t remaining =
      kMaxOutputBytes > output.size() ? kMaxOutputBytes - output.size() : 0;
  output.append(data, std::min(remaining, size));
}

} // namespace

Result<ProcessOutput> run_process(const std::vector<std::string> &argv,
                                  const std::chrono::milliseconds timeout) {
  if (argv.empty() || argv.front().empty()) {
    return Result<ProcessOutput>::failure("empty command");
  }

  std::vector<char *> c_argv;
  c_argv.reserve(argv.size() + 1);
  for (const auto &arg : argv) {
    c_argv.push_back(const_cast<char *>(arg.c_str()));
  }
  c_argv.push_back(nullptr);

  int pipefd[2] = {-1, -1};
  if (pipe(pipefd) != 0) {
    return Result<ProcessOutput>::failure(std::string("pipe failed: ") + std::strerror(errno));
  }

  const pid_t pid = fork();
  if (pid < 0) {
    const std::string msg = std::strerror(errno);
    close(pipefd[0]);
    close(pipefd[1]);
    return Result<ProcessOutput>::failure("fork failed: " + msg);
  }

  if (pid == 0) {
    close(pipefd[0]);
    dup2(pipefd[1], STDOUT_FILENO);
    dup2(pipefd[1], STDERR_FILENO);
    close(pipefd[1]);
    execvp(c_argv[0], c_argv.data());
    _exit(127);
  }

  close(pipefd[1]);
  const int flags = fcntl(pipefd[0], F_GETFL, 0);
  fcntl(pipefd[0], F_SETFL, flags | O_NONBLOCK);

  ProcessOutput result;
  const auto started = std::chrono::steady_clock::now();
  std::array<char, 4096> buffer{};
  int status = 0;
  bool running = true;

  while (running) {
    if (std::chrono::steady_clock::now() - started > timeout) {
      kill(pid, SIGKILL);
      (void)waitpid(pid, &status, 0);
      result.timed_out = true;
      break;
    }

    struct pollfd pfd {
      .fd = pipefd[0], .events = POLLIN, .revents = 0,
    };
    (void)poll(&pfd, 1, 50);

    const ssize_t bytes = read(pipefd[0], buffer.data(), buffer.size());
    if (bytes > 0) {
      append_capped(result.output, buffer.data(), static_cast<std::size_t>(bytes));
    }

    if (waitpid(pid, &status, WNOHANG) == pid) {
      running = false;
    }
  }

  while (true) {
    const ssize_t bytes = read(pipefd[0], buffer.data(), buffer.size());
    if (bytes <= 0) {
      break;
    }
    append_capped(result.output, buffer.data(), static_cast<std::size_t>(bytes));
  }
  close(pipefd[0]);

  if (!result.timed_out) {
    if (WIFEXITED(status)) {
      result.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
      result.exit_code = 128 + WTERMSIG(status);
    }
  }
  return Result<ProcessOutput>::success(std::move(result));
}

} // namespace remotegate::common

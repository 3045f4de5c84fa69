#include "smoke/common/subprocess.hpp"

#include <algorithm>
#include <array>
#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <string>
#include <utility>
#include <vector>

#include <fcntl.h>
#include <poll.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace smoke::common {

namespace {

void AppendBounded(
    std::string& out, const char* data, size_t size, size_t limit) {
  if (out.size() >= limit) {
    return;
  }
  out.append(data, std::min(size, limit - out.size()));
}

void CloseIfOpen(int& fd) {
  if (fd >= 0) {
    close(fd);
    fd = -1;
  }
}

[[noreturn]] void ExecChild(
    const std::vector<std::string>& argv, const SubprocessOptions& options,
    int stdout_fd, int stderr_fd) {
  // Own process group so a timeout kill also reaches grandchildren
  // (npx -> node -> browser).
  setpgid(0, 0);

  if (stdout_fd >= 0) {
    dup2(stdout_fd, STDOUT_FILENO);
  }
  dup2(stderr_fd, STDERR_FILENO);

  if (options.working_dir.has_value() &&
      chdir(options.working_dir->c_str()) != 0) {
    std::fprintf(
        stderr, "chdir(%s) failed: %s\n", options.working_dir->c_str(),
        std::strerror(errno));
    _exit(127);
  }

  for (const auto& [key, value] : options.env) {
    setenv(key.c_str(), value.c_str(), 1);
  }

  std::vector<char*> c_argv;
  c_argv.reserve(argv.size() + 1);
  for (const auto& arg : argv) {
    // NOLINTNEXTLINE(cppcoreguidelines-pro-type-const-cast)
    c_argv.push_back(const_cast<char*>(arg.c_str()));
  }
  c_argv.push_back(nullptr);

  execvp(c_argv[0], c_argv.data());
  std::fprintf(
      stderr, "%s: spawn failed: ENOENT or not executable (%s)\n", c_argv[0],
      std::strerror(errno));
  _exit(127);
}

}  // namespace

auto RunSubprocess(
    const std::vector<std::string>& argv, const SubprocessOptions& options)
    -> SubprocessResult {
  SubprocessResult result;
  if (argv.empty()) {
    result.stderr_output = "Empty argv";
    return result;
  }

  std::array<int, 2> err_pipe{-1, -1};
  if (pipe(err_pipe.data()) != 0) {
    result.stderr_output = "pipe() failed: " + std::string(strerror(errno));
    return result;
  }

  std::array<int, 2> out_pipe{-1, -1};
  int child_stdout = -1;
  if (options.stdout_mode == StdoutMode::kCapture) {
    if (pipe(out_pipe.data()) != 0) {
      close(err_pipe[0]);
      close(err_pipe[1]);
      result.stderr_output = "pipe() failed: " + std::string(strerror(errno));
      return result;
    }
    child_stdout = out_pipe[1];
  } else if (options.stdout_mode == StdoutMode::kDiscard) {
    child_stdout = open("/dev/null", O_WRONLY | O_CLOEXEC);
  }

  pid_t pid = fork();
  if (pid == -1) {
    result.stderr_output = "fork() failed: " + std::string(strerror(errno));
    CloseIfOpen(err_pipe[0]);
    CloseIfOpen(err_pipe[1]);
    CloseIfOpen(out_pipe[0]);
    CloseIfOpen(out_pipe[1]);
    if (options.stdout_mode == StdoutMode::kDiscard) {
      CloseIfOpen(child_stdout);
    }
    return result;
  }

  if (pid == 0) {
    close(err_pipe[0]);
    if (out_pipe[0] >= 0) {
      close(out_pipe[0]);
    }
    ExecChild(argv, options, child_stdout, err_pipe[1]);
  }

  // Parent: close write ends
  CloseIfOpen(err_pipe[1]);
  CloseIfOpen(out_pipe[1]);
  if (options.stdout_mode == StdoutMode::kDiscard) {
    CloseIfOpen(child_stdout);
  }

  const bool has_deadline = options.timeout.count() > 0;
  const auto deadline = std::chrono::steady_clock::now() + options.timeout;

  std::array<char, 4096> buffer{};
  while (err_pipe[0] >= 0 || out_pipe[0] >= 0) {
    int wait_ms = -1;
    if (has_deadline) {
      auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
          deadline - std::chrono::steady_clock::now());
      if (remaining.count() <= 0) {
        kill(-pid, SIGKILL);
        kill(pid, SIGKILL);
        result.timed_out = true;
        break;
      }
      wait_ms = static_cast<int>(std::min<int64_t>(remaining.count(), 1000));
    }

    std::array<pollfd, 2> fds{};
    nfds_t count = 0;
    if (err_pipe[0] >= 0) {
      fds[count++] = pollfd{.fd = err_pipe[0], .events = POLLIN, .revents = 0};
    }
    if (out_pipe[0] >= 0) {
      fds[count++] = pollfd{.fd = out_pipe[0], .events = POLLIN, .revents = 0};
    }

    int ready = poll(fds.data(), count, wait_ms);
    if (ready < 0) {
      if (errno == EINTR) {
        continue;
      }
      break;
    }

    for (nfds_t i = 0; i < count; ++i) {
      if (fds[i].revents == 0) {
        continue;
      }
      ssize_t bytes_read = read(fds[i].fd, buffer.data(), buffer.size());
      if (bytes_read < 0 && errno == EINTR) {
        continue;
      }
      bool is_err = fds[i].fd == err_pipe[0];
      if (bytes_read <= 0) {
        CloseIfOpen(is_err ? err_pipe[0] : out_pipe[0]);
        continue;
      }
      AppendBounded(
          is_err ? result.stderr_output : result.stdout_output, buffer.data(),
          static_cast<size_t>(bytes_read), options.max_capture_bytes);
    }
  }
  CloseIfOpen(err_pipe[0]);
  CloseIfOpen(out_pipe[0]);

  int status = 0;
  while (waitpid(pid, &status, 0) == -1) {
    if (errno != EINTR) {
      return result;
    }
  }

  if (WIFEXITED(status)) {
    result.exit_code = WEXITSTATUS(status);
  } else if (WIFSIGNALED(status)) {
    result.exit_code = 128 + WTERMSIG(status);
  }
  return result;
}

}  // namespace smoke::common

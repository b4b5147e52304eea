/**
 * @file system.cpp
 * @brief System utilities implementation
 *
 * @details Provides:
 *
 *          - Cgroup-aware CPU limit detection for Docker containers
 *
 *          - Subprocess execution with stderr capture and cancellation
 *
 *          - Time formatting utilities
 */

#include "cut_render/system.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <string>
#include <thread>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <fmt/core.h>

#include "cut_render/logging.hpp"

namespace cut_render {

// **---- Internal Helpers ----**

namespace {

/// Poll interval while waiting on a child
constexpr int POLL_INTERVAL_MS = 100;

/// Grace period between SIGTERM and SIGKILL
constexpr auto KILL_GRACE = std::chrono::seconds(5);

/// Helper to read a number from a file
long read_long_from_file(const char *path) {
  std::ifstream f(path);
  if (!f)
    return -1;
  long val;
  f >> val;
  return f.good() ? val : -1;
}

/// Count CPUs in a cpuset string like "0,2,4,6,8" or "0-3"
int count_cpuset_string(const std::string &line) {
  int count = 0;
  std::size_t pos = 0;
  while (pos < line.size()) {
    std::size_t end = line.find(',', pos);
    if (end == std::string::npos)
      end = line.size();

    std::string item = line.substr(pos, end - pos);
    std::size_t dash = item.find('-');
    try {
      if (dash == std::string::npos) {
        std::stoi(item);
        ++count;
      } else {
        int lo = std::stoi(item.substr(0, dash));
        int hi = std::stoi(item.substr(dash + 1));
        count += std::max(0, hi - lo + 1);
      }
    } catch (const std::exception &) {
      return -1;
    }
    pos = end + 1;
  }
  return count > 0 ? count : -1;
}

/// Helper to count CPUs from cpuset file
int count_cpuset(const char *path) {
  std::ifstream f(path);
  if (!f)
    return -1;
  std::string line;
  std::getline(f, line);
  return count_cpuset_string(line);
}

/// Keep only the last STDERR_TAIL_BYTES of the captured text
void append_tail(std::string &out, const char *data, std::size_t n) {
  out.append(data, n);
  if (out.size() > STDERR_TAIL_BYTES) {
    out.erase(0, out.size() - STDERR_TAIL_BYTES);
  }
}

} // anonymous namespace

// **---- CPU Detection ----**

int detect_cpu_limit() {
  int limit = -1;

  /// Try cgroup v2 first (unified hierarchy)
  {
    std::ifstream f("/sys/fs/cgroup/cpu.max");
    if (f) {
      std::string quota_str, period_str;
      f >> quota_str >> period_str;
      if (quota_str != "max" && !period_str.empty()) {
        try {
          long quota = std::stol(quota_str);
          long period = std::stol(period_str);
          if (quota > 0 && period > 0) {
            limit = static_cast<int>((quota + period - 1) / period);
          }
        } catch (const std::exception &) {
          limit = -1;
        }
      }
    }
  }

  /// Try cgroup v1 CPU quota
  if (limit <= 0) {
    long quota = read_long_from_file("/sys/fs/cgroup/cpu/cpu.cfs_quota_us");
    long period = read_long_from_file("/sys/fs/cgroup/cpu/cpu.cfs_period_us");
    if (quota > 0 && period > 0) {
      limit = static_cast<int>((quota + period - 1) / period);
    }
  }

  /// Try cpuset (counts actual allowed cores)
  if (limit <= 0) {
    limit = count_cpuset("/sys/fs/cgroup/cpuset.cpus.effective");
    if (limit <= 0) {
      limit = count_cpuset("/sys/fs/cgroup/cpuset/cpuset.cpus");
    }
  }

  /// Fallback to hardware_concurrency
  if (limit <= 0) {
    limit = static_cast<int>(std::thread::hardware_concurrency());
  }

  /// Sanity checks
  if (limit <= 0)
    limit = 4;
  if (limit > 64)
    limit = 64;

  return limit;
}

int resolve_thread_count(int configured) {
  return configured > 0 ? configured : detect_cpu_limit();
}

// **---- Subprocess ----**

ProcessResult run_process(const std::vector<std::string> &argv,
                          const CancellationToken &cancel,
                          std::chrono::seconds timeout) {
  ProcessResult result;
  if (argv.empty()) {
    result.stderr_text = "empty command line";
    return result;
  }

  int err_pipe[2];
  if (pipe2(err_pipe, O_CLOEXEC) == -1) {
    result.stderr_text = fmt::format("pipe2 failed: {}", std::strerror(errno));
    LOG_ERROR("{}", result.stderr_text);
    return result;
  }

  /// Built before fork: the child may only make async-signal-safe calls
  std::vector<char *> c_argv;
  c_argv.reserve(argv.size() + 1);
  for (const auto &arg : argv) {
    c_argv.push_back(const_cast<char *>(arg.c_str()));
  }
  c_argv.push_back(nullptr);

  pid_t pid = fork();
  if (pid == -1) {
    result.stderr_text = fmt::format("fork failed: {}", std::strerror(errno));
    LOG_ERROR("{}", result.stderr_text);
    close(err_pipe[0]);
    close(err_pipe[1]);
    return result;
  }

  if (pid == 0) {
    int devnull = open("/dev/null", O_RDWR | O_CLOEXEC);
    if (devnull != -1) {
      dup2(devnull, STDIN_FILENO);
      dup2(devnull, STDOUT_FILENO);
    }
    dup2(err_pipe[1], STDERR_FILENO);
    execvp(c_argv[0], c_argv.data());

    static const char msg[] = "exec failed: program not found or not "
                              "executable\n";
    ssize_t ignored = write(STDERR_FILENO, msg, sizeof(msg) - 1);
    (void)ignored;
    _exit(127);
  }

  close(err_pipe[1]);
  result.started = true;

  const auto start = std::chrono::steady_clock::now();
  std::chrono::steady_clock::time_point term_sent;
  bool term_signalled = false;
  bool kill_signalled = false;

  pollfd pfd{err_pipe[0], POLLIN, 0};
  bool reading = true;
  char buf[4096];

  while (reading) {
    int ready = poll(&pfd, 1, POLL_INTERVAL_MS);
    if (ready > 0) {
      ssize_t n = read(err_pipe[0], buf, sizeof(buf));
      if (n > 0) {
        append_tail(result.stderr_text, buf, static_cast<std::size_t>(n));
      } else if (n == 0 || (errno != EINTR && errno != EAGAIN)) {
        reading = false;
      }
    } else if (ready < 0 && errno != EINTR) {
      reading = false;
    }

    auto now = std::chrono::steady_clock::now();
    if (!term_signalled) {
      bool expired = timeout.count() > 0 && now - start >= timeout;
      if (cancel.is_cancelled() || expired) {
        result.cancelled = true;
        result.timed_out = expired && !cancel.is_cancelled();
        kill(pid, SIGTERM);
        term_signalled = true;
        term_sent = now;
      }
    } else if (!kill_signalled && now - term_sent >= KILL_GRACE) {
      kill(pid, SIGKILL);
      kill_signalled = true;
    }
  }
  close(err_pipe[0]);

  int status = 0;
  while (waitpid(pid, &status, 0) == -1) {
    if (errno != EINTR) {
      LOG_ERROR("waitpid failed: {}", std::strerror(errno));
      return result;
    }
  }

  if (WIFEXITED(status)) {
    result.exit_code = WEXITSTATUS(status);
  } else if (WIFSIGNALED(status)) {
    result.exit_code = -WTERMSIG(status);
  }
  return result;
}

// **---- Utilities ----**

std::string format_time(double seconds) {
  int h = static_cast<int>(seconds) / 3600;
  int m = (static_cast<int>(seconds) % 3600) / 60;
  int s = static_cast<int>(seconds) % 60;
  return fmt::format("{:02d}:{:02d}:{:02d}", h, m, s);
}

} // namespace cut_render

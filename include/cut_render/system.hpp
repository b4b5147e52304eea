/**
 * @file system.hpp
 * @brief System utilities: CPU detection, subprocess execution, time format
 *
 * @details Provides:
 *
 *          - Cgroup-aware CPU limit detection for Docker containers
 *
 *          - CancellationToken for caller-driven cancellation
 *
 *          - run_process: fork/exec with stderr capture, timeout and cancel
 *
 *          - Time formatting utilities
 *
 * @note run_process is POSIX-only (fork, execvp, poll, waitpid).
 */

#ifndef CUT_RENDER_SYSTEM_HPP
#define CUT_RENDER_SYSTEM_HPP

#include <atomic>
#include <chrono>
#include <string>
#include <vector>

namespace cut_render {

// **---- CPU Detection ----**

/**
 * @brief Detect the actual number of CPUs available to this process.
 *
 * @note In Docker containers, std::thread::hardware_concurrency() returns the
 *       HOST's total cores, not the container's cgroup limit. This function
 *       reads cgroup files to detect the actual limit.
 *
 *       Supports:
 *
 *        - Cgroup v1: `/sys/fs/cgroup/cpu/cpu.cfs_quota_us` and
 *          `cpu.cfs_period_us`
 *
 *        - Cgroup v2: `/sys/fs/cgroup/cpu.max`
 *
 *        - Cpuset: `/sys/fs/cgroup/cpuset/cpuset.cpus` (counts allowed cores)
 *
 * @return Detected CPU limit, or hardware_concurrency() as fallback
 */
int detect_cpu_limit();

/**
 * @brief Resolve the encoder thread count.
 * @param configured Configured threads (0 = auto)
 * @return configured if > 0, otherwise detect_cpu_limit()
 */
int resolve_thread_count(int configured);

// **---- Cancellation ----**

/**
 * @class CancellationToken
 * @brief Flag shared between a caller and a running compose().
 * @note Any thread may call cancel(); the running subprocess is terminated
 *       at its next poll.
 */
class CancellationToken {
public:
  CancellationToken() = default;
  CancellationToken(const CancellationToken &) = delete;
  CancellationToken &operator=(const CancellationToken &) = delete;

  void cancel() { cancelled_.store(true); }
  bool is_cancelled() const { return cancelled_.load(); }

private:
  std::atomic<bool> cancelled_{false};
};

// **---- Subprocess ----**

/**
 * @struct ProcessResult
 * @brief Outcome of run_process().
 */
struct ProcessResult {
  bool started = false;    //< fork/exec succeeded
  int exit_code = -1;      //< Exit status, or -signal when killed
  bool cancelled = false;  //< Terminated through the token
  bool timed_out = false;  //< Terminated by the timeout
  std::string stderr_text; //< Captured stderr (tail, bounded)
};

/// Bytes of stderr retained by run_process
constexpr std::size_t STDERR_TAIL_BYTES = 64 * 1024;

/**
 * @brief Run a program and wait for it.
 *
 * @param argv Program and arguments; argv[0] is resolved through PATH
 * @param cancel Checked between polls; terminates the child when set
 * @param timeout Zero for none
 * @return Exit status and the tail of stderr. stdout is discarded.
 */
ProcessResult run_process(const std::vector<std::string> &argv,
                          const CancellationToken &cancel,
                          std::chrono::seconds timeout);

// **---- Utilities ----**

/**
 * @brief Format seconds as HH:MM:SS string.
 * @param seconds Time in seconds
 * @return Formatted string in HH:MM:SS format
 */
std::string format_time(double seconds);

} // namespace cut_render

#endif // CUT_RENDER_SYSTEM_HPP

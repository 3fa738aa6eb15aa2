#ifndef PERFCAP_SUBPROCESS_HPP
#define PERFCAP_SUBPROCESS_HPP
/**
 * @file Subprocess.hpp
 * @brief Ownership handle for one forked child process.
 *
 * Behavior:
 *  - spawn() forks and execs argv[0] (PATH lookup), optionally redirecting
 *    stdout/stderr to files and extending the environment. Exec failures are reported back to the parent
 *    through a close-on-exec pipe and surface as SpawnError.
 *  - The child starts with an empty signal mask and default dispositions, so
 *    signals blocked by the controller's SignalChannel do not leak into it.
 *  - wait() blocks until exit and reaps. hasExited() observes exit without
 *    reaping (waitid + WNOWAIT) so callers can order reaping explicitly.
 *  - Destroying a handle whose child is still running interrupts it, escalates
 *    to SIGKILL after a grace period, and reaps it.
 *
 * Notes:
 *  - Linux/POSIX only.
 */

#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <sys/types.h>

namespace perfcap {
namespace capture {

/* ----------------------------- SpawnOptions ----------------------------- */

struct SpawnOptions {
  std::string stdoutPath; ///< Truncate and redirect stdout here (empty = inherit)
  std::string stderrPath; ///< Truncate and redirect stderr here (empty = inherit)
  std::vector<std::pair<std::string, std::string>> extraEnv; ///< Added to (or replacing) environ
};

/* ------------------------------ Subprocess ------------------------------ */

class Subprocess {
public:
  Subprocess() = default;
  ~Subprocess();

  Subprocess(const Subprocess&) = delete;
  Subprocess& operator=(const Subprocess&) = delete;
  Subprocess(Subprocess&& other) noexcept;
  Subprocess& operator=(Subprocess&& other) noexcept;

  /**
   * @brief Fork and exec argv.
   * @throws SpawnError if argv is empty, fork fails, a redirect cannot be opened,
   *         or exec fails.
   */
  static Subprocess spawn(const std::vector<std::string>& argv, const SpawnOptions& opts = {});

  pid_t pid() const noexcept { return pid_; }

  /** @return true once spawned and until reaped. */
  bool running() const noexcept { return pid_ > 0 && !status_.has_value(); }

  /** @return the raw wait status once reaped. */
  std::optional<int> status() const noexcept { return status_; }

  /** @brief Send sig to the child. @return false if not running or kill() failed. */
  bool signal(int sig) noexcept;

  /** @brief Block until the child exits and reap it. @return raw wait status. */
  int wait();

  /** @brief True if the child exited (or was reaped); does not reap. */
  bool hasExited();

  /** @brief SIGINT, grace period, SIGKILL; then reap. No-op if not running. */
  void terminate(int graceMs = 200) noexcept;

private:
  explicit Subprocess(pid_t pid) noexcept : pid_(pid) {}

  pid_t pid_ = -1;
  std::optional<int> status_;
};

/* --------------------------------- API --------------------------------- */

/** @return true if status means "exited normally with code 0". */
bool exitedSuccessfully(int status) noexcept;

/** @return "exited with status N" / "killed by signal N (NAME)". */
std::string describeStatus(int status);

/** @return true if a process with this PID exists (EPERM counts as existing). */
bool processExists(pid_t pid) noexcept;

} // namespace capture
} // namespace perfcap

#endif // PERFCAP_SUBPROCESS_HPP

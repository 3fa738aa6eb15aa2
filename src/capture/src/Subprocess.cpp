/**
 * @file Subprocess.cpp
 * @brief fork/exec child ownership.
 */

#include "src/capture/inc/Subprocess.hpp"

#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstring>
#include <string>
#include <thread>
#include <utility>

#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>

#include "src/capture/inc/CaptureErrors.hpp"
#include "src/capture/inc/CaptureLog.hpp"

namespace perfcap {
namespace capture {

/* ----------------------------- Child Side ----------------------------- */

namespace {

std::vector<std::string> buildEnvironment(
    const std::vector<std::pair<std::string, std::string>>& extra) {
  std::vector<std::string> env;
  for (char** e = environ; e != nullptr && *e != nullptr; ++e) {
    const std::string ENTRY = *e;
    const std::string KEY = ENTRY.substr(0, ENTRY.find('='));
    bool overridden = false;
    for (const auto& kv : extra) {
      overridden = overridden || kv.first == KEY;
    }
    if (!overridden) {
      env.push_back(ENTRY);
    }
  }
  for (const auto& kv : extra) {
    env.push_back(kv.first + "=" + kv.second);
  }
  return env;
}

// Everything below runs between fork() and exec(): async-signal-safe calls only.
[[noreturn]] void failChild(int statusFd, int err) {
  ssize_t ignored = ::write(statusFd, &err, sizeof(err));
  (void)ignored;
  ::_exit(127);
}

void redirect(int statusFd, const char* path, int targetFd) {
  int fd = ::open(path, O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
  if (fd < 0) {
    failChild(statusFd, errno);
  }
  if (::dup2(fd, targetFd) < 0) {
    failChild(statusFd, errno);
  }
  ::close(fd);
}

[[noreturn]] void execChild(int statusFd, char* const* argv, char* const* envp,
                            const char* outPath, const char* errPath) {
  // Undo whatever the controller blocked or redirected for itself.
  sigset_t none;
  sigemptyset(&none);
  ::sigprocmask(SIG_SETMASK, &none, nullptr);
  for (int sig : {SIGINT, SIGTERM, SIGUSR1, SIGUSR2, SIGCHLD, SIGPIPE}) {
    ::signal(sig, SIG_DFL);
  }

  if (outPath != nullptr) {
    redirect(statusFd, outPath, STDOUT_FILENO);
  }
  if (errPath != nullptr) {
    redirect(statusFd, errPath, STDERR_FILENO);
  }

  ::execvpe(argv[0], argv, envp);
  failChild(statusFd, errno);
}

} // namespace

/* ----------------------------- Subprocess ----------------------------- */

Subprocess::~Subprocess() { terminate(); }

Subprocess::Subprocess(Subprocess&& other) noexcept
    : pid_(std::exchange(other.pid_, -1)), status_(std::exchange(other.status_, std::nullopt)) {}

Subprocess& Subprocess::operator=(Subprocess&& other) noexcept {
  if (this != &other) {
    terminate();
    pid_ = std::exchange(other.pid_, -1);
    status_ = std::exchange(other.status_, std::nullopt);
  }
  return *this;
}

Subprocess Subprocess::spawn(const std::vector<std::string>& argv, const SpawnOptions& opts) {
  if (argv.empty() || argv.front().empty()) {
    throw SpawnError("empty command line");
  }

  // Build everything the child needs before forking.
  std::vector<char*> cargv;
  cargv.reserve(argv.size() + 1);
  for (const auto& a : argv) {
    cargv.push_back(const_cast<char*>(a.c_str()));
  }
  cargv.push_back(nullptr);
  const std::vector<std::string> ENV = buildEnvironment(opts.extraEnv);
  std::vector<char*> cenv;
  cenv.reserve(ENV.size() + 1);
  for (const auto& e : ENV) {
    cenv.push_back(const_cast<char*>(e.c_str()));
  }
  cenv.push_back(nullptr);
  const char* outPath = opts.stdoutPath.empty() ? nullptr : opts.stdoutPath.c_str();
  const char* errPath = opts.stderrPath.empty() ? nullptr : opts.stderrPath.c_str();

  int statusPipe[2];
  if (::pipe2(statusPipe, O_CLOEXEC) != 0) {
    throw SpawnError("pipe failed for '" + argv.front() + "': " + std::strerror(errno));
  }

  pid_t child = ::fork();
  if (child < 0) {
    int err = errno;
    ::close(statusPipe[0]);
    ::close(statusPipe[1]);
    throw SpawnError("fork failed for '" + argv.front() + "': " + std::strerror(err));
  }
  if (child == 0) {
    ::close(statusPipe[0]);
    execChild(statusPipe[1], cargv.data(), cenv.data(), outPath, errPath);
  }

  // Parent: the pipe closes on successful exec; otherwise it carries errno.
  ::close(statusPipe[1]);
  int childErr = 0;
  ssize_t n = 0;
  do {
    n = ::read(statusPipe[0], &childErr, sizeof(childErr));
  } while (n < 0 && errno == EINTR);
  ::close(statusPipe[0]);

  if (n > 0) {
    int status = 0;
    while (::waitpid(child, &status, 0) < 0 && errno == EINTR) {
    }
    throw SpawnError("cannot execute '" + argv.front() + "': " + std::strerror(childErr));
  }

  logDebug("spawned pid %d: %s", static_cast<int>(child), argv.front().c_str());
  return Subprocess(child);
}

bool Subprocess::signal(int sig) noexcept {
  if (!running()) {
    return false;
  }
  return ::kill(pid_, sig) == 0;
}

int Subprocess::wait() {
  if (status_) {
    return *status_;
  }
  if (pid_ <= 0) {
    throw SpawnError("wait on a process that was never started");
  }
  int status = 0;
  pid_t r = -1;
  do {
    r = ::waitpid(pid_, &status, 0);
  } while (r < 0 && errno == EINTR);
  if (r < 0) {
    throw SpawnError("waitpid(" + std::to_string(pid_) + ") failed: " + std::strerror(errno));
  }
  status_ = status;
  return status;
}

bool Subprocess::hasExited() {
  if (status_) {
    return true;
  }
  if (pid_ <= 0) {
    return false;
  }
  siginfo_t info{};
  if (::waitid(P_PID, static_cast<id_t>(pid_), &info, WEXITED | WNOHANG | WNOWAIT) != 0) {
    if (errno == EINTR) {
      return false;
    }
    throw SpawnError("waitid(" + std::to_string(pid_) + ") failed: " + std::strerror(errno));
  }
  // si_pid stays 0 while the child is still running.
  return info.si_pid == pid_;
}

void Subprocess::terminate(int graceMs) noexcept {
  if (!running()) {
    return;
  }
  int status = 0;
  ::kill(pid_, SIGINT);
  constexpr int POLL_INTERVAL_MS = 20;
  for (int elapsed = 0; elapsed < graceMs; elapsed += POLL_INTERVAL_MS) {
    if (::waitpid(pid_, &status, WNOHANG) == pid_) {
      status_ = status;
      return;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(POLL_INTERVAL_MS));
  }
  logWarn("pid %d did not exit after %dms - forcing termination", static_cast<int>(pid_), graceMs);
  ::kill(pid_, SIGKILL);
  while (::waitpid(pid_, &status, 0) < 0 && errno == EINTR) {
  }
  status_ = status;
}

/* --------------------------------- API --------------------------------- */

bool exitedSuccessfully(int status) noexcept {
  return WIFEXITED(status) && WEXITSTATUS(status) == 0;
}

std::string describeStatus(int status) {
  if (WIFEXITED(status)) {
    return "exited with status " + std::to_string(WEXITSTATUS(status));
  }
  if (WIFSIGNALED(status)) {
    const int SIG = WTERMSIG(status);
    const char* name = ::strsignal(SIG);
    return "killed by signal " + std::to_string(SIG) + " (" + (name ? name : "?") + ")";
  }
  return "ended with wait status " + std::to_string(status);
}

bool processExists(pid_t pid) noexcept {
  if (pid <= 0) {
    return false;
  }
  return ::kill(pid, 0) == 0 || errno == EPERM;
}

} // namespace capture
} // namespace perfcap

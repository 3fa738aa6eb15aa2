/**
 * @file Handshake.cpp
 * @brief Target-side handshake signals.
 */

#include "src/capture/inc/Handshake.hpp"

#include <cerrno>
#include <climits>
#include <cstdlib>
#include <ctime>

#include <pthread.h>
#include <signal.h>

#include "src/capture/inc/CaptureConfig.hpp"

namespace perfcap {
namespace capture {

namespace {

pid_t resolveController(const HandshakeOptions& opts) noexcept {
  return opts.controller > 0 ? opts.controller : controllerFromEnv();
}

} // namespace

pid_t controllerFromEnv() noexcept {
  const char* v = std::getenv(CONTROLLER_PID_ENV);
  if (v == nullptr || *v == '\0') {
    return 0;
  }
  char* end = nullptr;
  long pid = std::strtol(v, &end, 10);
  if (*end != '\0' || pid <= 0 || pid > INT_MAX) {
    return 0;
  }
  return static_cast<pid_t>(pid);
}

int ackSignalFromEnv() {
  const char* v = std::getenv(ACK_SIGNAL_ENV);
  const int SIG = (v != nullptr) ? parseSignalSpec(v) : 0;
  return (SIG > 0) ? SIG : SIGRTMIN;
}

bool requestCollectionStart(const HandshakeOptions& opts) {
  const pid_t CONTROLLER = resolveController(opts);
  if (CONTROLLER <= 0) {
    return false;
  }
  const int ACK = (opts.ackSignal > 0) ? opts.ackSignal : ackSignalFromEnv();

  // Block the ack before asking, so it cannot arrive unhandled.
  sigset_t ack;
  sigemptyset(&ack);
  sigaddset(&ack, ACK);
  if (::pthread_sigmask(SIG_BLOCK, &ack, nullptr) != 0) {
    return false;
  }

  if (::kill(CONTROLLER, opts.beginSignal) != 0) {
    return false;
  }

  timespec timeout{};
  timeout.tv_sec = opts.ackTimeoutMs / 1000;
  timeout.tv_nsec = static_cast<long>(opts.ackTimeoutMs % 1000) * 1000000L;
  int sig = -1;
  do {
    sig = ::sigtimedwait(&ack, nullptr, &timeout);
  } while (sig < 0 && errno == EINTR);
  return sig == ACK;
}

bool requestCollectionStop(const HandshakeOptions& opts) {
  const pid_t CONTROLLER = resolveController(opts);
  if (CONTROLLER <= 0) {
    return false;
  }
  return ::kill(CONTROLLER, opts.endSignal) == 0;
}

} // namespace capture
} // namespace perfcap

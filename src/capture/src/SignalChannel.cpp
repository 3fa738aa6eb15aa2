/**
 * @file SignalChannel.cpp
 * @brief sigprocmask + sigwaitinfo based signal channel.
 */

#include "src/capture/inc/SignalChannel.hpp"

#include <cerrno>
#include <cstring>
#include <ctime>
#include <string>

#include <pthread.h>

#include "src/capture/inc/CaptureErrors.hpp"
#include "src/capture/inc/CaptureLog.hpp"

namespace perfcap {
namespace capture {

SignalChannel::SignalChannel(std::initializer_list<int> signals) {
  sigemptyset(&set_);
  for (int sig : signals) {
    sigaddset(&set_, sig);
  }
  int rc = ::pthread_sigmask(SIG_BLOCK, &set_, &previous_);
  if (rc != 0) {
    throw SpawnError(std::string("cannot block signals: ") + std::strerror(rc));
  }
}

SignalChannel::~SignalChannel() {
  int dropped = drain();
  if (dropped > 0) {
    logDebug("discarded %d pending signal(s)", dropped);
  }
  ::pthread_sigmask(SIG_SETMASK, &previous_, nullptr);
}

SignalEvent SignalChannel::next() {
  siginfo_t info{};
  int sig = -1;
  do {
    sig = ::sigwaitinfo(&set_, &info);
  } while (sig < 0 && errno == EINTR);
  if (sig < 0) {
    throw SpawnError(std::string("sigwaitinfo failed: ") + std::strerror(errno));
  }
  return SignalEvent{sig, info.si_pid};
}

SignalEvent SignalChannel::poll() {
  siginfo_t info{};
  const timespec ZERO{0, 0};
  int sig = ::sigtimedwait(&set_, &info, &ZERO);
  if (sig < 0) {
    if (errno == EAGAIN || errno == EINTR) {
      return SignalEvent{};
    }
    throw SpawnError(std::string("sigtimedwait failed: ") + std::strerror(errno));
  }
  return SignalEvent{sig, info.si_pid};
}

int SignalChannel::drain() noexcept {
  int count = 0;
  siginfo_t info{};
  const timespec ZERO{0, 0};
  while (::sigtimedwait(&set_, &info, &ZERO) > 0) {
    ++count;
  }
  return count;
}

} // namespace capture
} // namespace perfcap

#ifndef PERFCAP_SIGNALCHANNEL_HPP
#define PERFCAP_SIGNALCHANNEL_HPP
/**
 * @file SignalChannel.hpp
 * @brief Synchronous delivery of process signals to the controller loop.
 *
 * The channel blocks its signal set for the calling thread on construction and
 * hands signals out one at a time from next(). No handler ever runs
 * asynchronously, so stop logic may block on waitpid() safely.
 *
 * On destruction, signals of the set that are still pending are discarded
 * (a second Ctrl+C arriving while stopping must not kill the controller once
 * the mask is restored), then the previous mask is restored.
 *
 * Include SIGCHLD in the set to be woken when a child exits.
 */

#include <initializer_list>

#include <signal.h>
#include <sys/types.h>

namespace perfcap {
namespace capture {

/* ----------------------------- SignalEvent ----------------------------- */

struct SignalEvent {
  int signo = 0;
  pid_t sender = 0; ///< si_pid of the sender (0 for kernel-generated signals)
};

/* ----------------------------- SignalChannel ----------------------------- */

class SignalChannel {
public:
  /** @throws SpawnError if the signal mask cannot be changed. */
  explicit SignalChannel(std::initializer_list<int> signals);
  ~SignalChannel();

  SignalChannel(const SignalChannel&) = delete;
  SignalChannel& operator=(const SignalChannel&) = delete;

  /** @brief Block until one signal of the set arrives. */
  SignalEvent next();

  /** @brief Non-blocking variant; returns signo 0 when nothing is pending. */
  SignalEvent poll();

  /** @brief Discard every pending signal of the set. @return number discarded. */
  int drain() noexcept;

private:
  sigset_t set_{};
  sigset_t previous_{};
};

} // namespace capture
} // namespace perfcap

#endif // PERFCAP_SIGNALCHANNEL_HPP

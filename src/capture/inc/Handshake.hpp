#ifndef PERFCAP_HANDSHAKE_HPP
#define PERFCAP_HANDSHAKE_HPP
/**
 * @file Handshake.hpp
 * @brief Target-side helpers for the interactive (-I) counter handshake.
 *
 * A program launched with `perfcap -E <prog> -I` finds the controller's PID in
 * PERFCAP_CONTROLLER_PID and the acknowledge signal in PERFCAP_ACK_SIGNAL
 * (SIGRTMIN unless the controller was given --ack-signal). It brackets the
 * region to measure:
 *
 * @code{.cpp}
 *   perfcap::capture::requestCollectionStart(); // SIGUSR1, then wait for the ack
 *   runHotLoop();
 *   perfcap::capture::requestCollectionStop();  // SIGUSR2
 * @endcode
 *
 * Without PERFCAP_CONTROLLER_PID both calls return false and signal nobody,
 * so the program also runs standalone.
 *
 * The ack signal stays blocked after requestCollectionStart() returns; a late
 * ack is therefore harmless.
 */

#include <csignal>

#include <sys/types.h>

namespace perfcap {
namespace capture {

/** @brief Environment variable carrying the controller PID to the target. */
inline constexpr const char* CONTROLLER_PID_ENV = "PERFCAP_CONTROLLER_PID";

struct HandshakeOptions {
  pid_t controller = 0;       ///< 0 = read PERFCAP_CONTROLLER_PID
  int beginSignal = SIGUSR1;  ///< "start collection"
  int endSignal = SIGUSR2;    ///< "stop collection"
  int ackSignal = 0;          ///< 0 = ackSignalFromEnv()
  int ackTimeoutMs = 10000;   ///< Give up waiting for the ack after this long
};

/** @return controller PID from the environment, or 0. */
pid_t controllerFromEnv() noexcept;

/** @return ack signal named by PERFCAP_ACK_SIGNAL, or SIGRTMIN. */
int ackSignalFromEnv();

/**
 * @brief Signal the controller to start collection and wait for its ack.
 * @return true once acknowledged; false without a controller or on timeout.
 */
bool requestCollectionStart(const HandshakeOptions& opts = {});

/** @brief Signal the controller to stop collection. @return false without a controller. */
bool requestCollectionStop(const HandshakeOptions& opts = {});

} // namespace capture
} // namespace perfcap

#endif // PERFCAP_HANDSHAKE_HPP

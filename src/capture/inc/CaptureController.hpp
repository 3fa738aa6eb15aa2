#ifndef PERFCAP_CAPTURECONTROLLER_HPP
#define PERFCAP_CAPTURECONTROLLER_HPP
/**
 * @file CaptureController.hpp
 * @brief Process lifecycle state machine for one capture session.
 *
 * States: Idle -> Sampling -> Stopping -> Done, with Failed reachable from any
 * state when an error propagates out of run().
 *
 * Modes:
 *  - PidTimed:          `perf record ... -p <pid> -- sleep <D>`, block until it exits.
 *  - PidUntilInterrupt: unbounded `perf record -p <pid>`; the first SIGINT/SIGTERM
 *                       interrupts it. Later stop signals are ignored.
 *
 * Every `perf record` starts with the previous raw file removed, so a sampler
 * that fails without writing can never hand stale samples to the pipeline.
 *  - ExecRecord:        `perf record ... -- <exec>`, block until it exits.
 *  - ExecInteractive:   launch <exec>; SIGUSR1 from it starts `perf stat -p`,
 *                       after which the target gets the acknowledge signal
 *                       (CaptureConfig::ackSignal, exported as PERFCAP_ACK_SIGNAL);
 *                       SIGUSR2 stops perf stat and waits for the target.
 *
 * The sampler is always asked to stop and reaped before the target is reaped.
 * Signals are consumed synchronously through a SignalChannel, never from an
 * asynchronous handler.
 */

#include <functional>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <sys/types.h>

#include "src/capture/inc/ArtifactPipeline.hpp"
#include "src/capture/inc/CaptureConfig.hpp"
#include "src/capture/inc/Session.hpp"
#include "src/capture/inc/SignalChannel.hpp"
#include "src/capture/inc/Subprocess.hpp"

namespace perfcap {
namespace capture {

/* --------------------------------- Enums --------------------------------- */

enum class ControllerState { Idle, Sampling, Stopping, Done, Failed };

enum class SamplerState { NotStarted, Running, Stopping, Exited };

/** @brief Observable milestones, reported to the event hook in order. */
enum class ControllerEvent {
  TargetStarted,
  SamplerStarted,
  HandshakeAcknowledged,
  SamplerStopRequested,
  SamplerExited,
  TargetExited,
  ArtifactsWritten
};

const char* controllerStateName(ControllerState s) noexcept;
const char* controllerEventName(ControllerEvent e) noexcept;

/* ----------------------------- SamplerHandle ----------------------------- */

/** @brief The session's single sampling subprocess. */
struct SamplerHandle {
  Subprocess proc;
  SamplerState state = SamplerState::NotStarted;
};

/* --------------------------- CaptureController --------------------------- */

class CaptureController {
public:
  using EventHook = std::function<void(ControllerEvent)>;

  CaptureController(CaptureConfig cfg, Session session);

  /** @brief Observe lifecycle milestones (tests, verbose tracing). */
  void setEventHook(EventHook hook) { hook_ = std::move(hook); }

  /**
   * @brief Drive the session to completion.
   * @return the artifact set for sampling modes; std::nullopt for ExecInteractive.
   * @throws SpawnError, PipelineError (state becomes Failed).
   */
  std::optional<ArtifactSet> run();

  ControllerState state() const noexcept { return state_; }
  SamplerState samplerState() const noexcept { return sampler_.state; }
  const Session& session() const noexcept { return session_; }

private:
  void runPidTimed();
  void runPidUntilInterrupt();
  void runExecRecord();
  void runExecInteractive();

  // Interactive handshake steps; each returns true when the session is over.
  void onBeginCollection(const SignalEvent& ev);
  bool onEndCollection(const SignalEvent& ev);
  bool onChildExit();
  void onAbort(const SignalEvent& ev);

  std::vector<std::string> recordCommand() const;
  void requireLiveTarget() const;
  void requireLaunchable() const;

  void startRecording(const std::vector<std::string>& argv);
  void startSampler(const std::vector<std::string>& argv);
  void requestSamplerStop();
  int awaitSampler();
  int awaitTarget();
  void checkRecordExit(int status);

  ArtifactSet generateArtifacts();
  void transition(ControllerState next);
  void emit(ControllerEvent ev);

  CaptureConfig cfg_;
  Session session_;
  ControllerState state_ = ControllerState::Idle;
  EventHook hook_;

  // Declaration order matters: sampler_ is destroyed (stopped) before target_.
  Subprocess target_;
  SamplerHandle sampler_;
};

} // namespace capture
} // namespace perfcap

#endif // PERFCAP_CAPTURECONTROLLER_HPP

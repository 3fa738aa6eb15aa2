/**
 * @file CaptureController.cpp
 * @brief Per-mode subprocess lifecycle and signal handling.
 */

#include "src/capture/inc/CaptureController.hpp"

#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <cstring>
#include <filesystem>
#include <system_error>
#include <thread>

#include <unistd.h>

#include "src/capture/inc/CaptureErrors.hpp"
#include "src/capture/inc/CaptureLog.hpp"
#include "src/capture/inc/Handshake.hpp"
#include "src/capture/inc/Preflight.hpp"

namespace perfcap {
namespace capture {

/* ----------------------------- Helpers ----------------------------- */

namespace {

std::string formatSeconds(double secs) {
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%g", secs);
  return buf;
}

const char* signalName(int sig) {
  switch (sig) {
  case SIGINT:
    return "SIGINT";
  case SIGTERM:
    return "SIGTERM";
  case SIGUSR1:
    return "SIGUSR1";
  case SIGUSR2:
    return "SIGUSR2";
  case SIGCHLD:
    return "SIGCHLD";
  default:
    return "signal";
  }
}

} // namespace

const char* controllerStateName(ControllerState s) noexcept {
  switch (s) {
  case ControllerState::Idle:
    return "IDLE";
  case ControllerState::Sampling:
    return "SAMPLING";
  case ControllerState::Stopping:
    return "STOPPING";
  case ControllerState::Done:
    return "DONE";
  case ControllerState::Failed:
    return "FAILED";
  }
  return "UNKNOWN";
}

const char* controllerEventName(ControllerEvent e) noexcept {
  switch (e) {
  case ControllerEvent::TargetStarted:
    return "target-started";
  case ControllerEvent::SamplerStarted:
    return "sampler-started";
  case ControllerEvent::HandshakeAcknowledged:
    return "handshake-acknowledged";
  case ControllerEvent::SamplerStopRequested:
    return "sampler-stop-requested";
  case ControllerEvent::SamplerExited:
    return "sampler-exited";
  case ControllerEvent::TargetExited:
    return "target-exited";
  case ControllerEvent::ArtifactsWritten:
    return "artifacts-written";
  }
  return "unknown";
}

/* --------------------------- CaptureController --------------------------- */

CaptureController::CaptureController(CaptureConfig cfg, Session session)
    : cfg_(std::move(cfg)), session_(std::move(session)) {
  resolveToolchainPaths(cfg_);
}

std::optional<ArtifactSet> CaptureController::run() {
  if (state_ != ControllerState::Idle) {
    throw SpawnError("capture session already ran");
  }
  logDebug("session mode %s", modeName(session_.mode));

  try {
    switch (session_.mode) {
    case Mode::PidTimed:
      runPidTimed();
      break;
    case Mode::PidUntilInterrupt:
      runPidUntilInterrupt();
      break;
    case Mode::ExecRecord:
      runExecRecord();
      break;
    case Mode::ExecInteractive:
      runExecInteractive();
      break;
    }
    transition(ControllerState::Done);

    if (!producesArtifacts(session_.mode)) {
      return std::nullopt;
    }
    return generateArtifacts();
  } catch (...) {
    transition(ControllerState::Failed);
    throw;
  }
}

/* ------------------------------ Modes ------------------------------ */

void CaptureController::runPidTimed() {
  requireLiveTarget();
  const pid_t PID = *session_.targetPid;
  const std::string SECS = formatSeconds(session_.durationSec.value_or(0.0));

  auto argv = recordCommand();
  argv.insert(argv.end(), {"-p", std::to_string(PID), "--", "sleep", SECS});

  logInfo("Recording performance data for PID %d for %s seconds...", static_cast<int>(PID),
          SECS.c_str());
  startRecording(argv);
  transition(ControllerState::Sampling);

  // perf stops itself when `sleep` ends; nothing to signal here.
  const int STATUS = awaitSampler();
  if (!exitedSuccessfully(STATUS)) {
    throw SpawnError("perf record failed to attach to PID " + std::to_string(PID) + " (" +
                     describeStatus(STATUS) + ")");
  }
}

void CaptureController::runPidUntilInterrupt() {
  requireLiveTarget();
  const pid_t PID = *session_.targetPid;

  // Block before spawning so an early Ctrl+C is queued rather than lost.
  SignalChannel channel{SIGINT, SIGTERM, SIGCHLD};

  auto argv = recordCommand();
  argv.insert(argv.end(), {"-p", std::to_string(PID)});

  logInfo("Recording performance data for PID %d. Press Ctrl+C to stop recording...",
          static_cast<int>(PID));
  startRecording(argv);
  transition(ControllerState::Sampling);

  while (state_ == ControllerState::Sampling) {
    const SignalEvent EV = channel.next();

    if (EV.signo == SIGCHLD) {
      if (!sampler_.proc.hasExited()) {
        continue;
      }
      // perf ended without being asked: the target exited, or the attach failed.
      const int STATUS = awaitSampler();
      if (!exitedSuccessfully(STATUS)) {
        throw SpawnError("perf record for PID " + std::to_string(PID) + " " +
                         describeStatus(STATUS));
      }
      logInfo("perf record finished on its own (target %d exited).", static_cast<int>(PID));
      transition(ControllerState::Stopping);
      break;
    }

    logInfo("%s received: Stopping perf record...", signalName(EV.signo));
    transition(ControllerState::Stopping);
    requestSamplerStop();
    checkRecordExit(awaitSampler());
  }
  // The attached target is not ours to reap; it keeps running.
}

void CaptureController::runExecRecord() {
  requireLaunchable();

  auto argv = recordCommand();
  argv.push_back("--");
  argv.push_back(*session_.execPath);
  argv.insert(argv.end(), session_.execArgs.begin(), session_.execArgs.end());

  logInfo("Recording performance data for executable %s...", session_.execPath->c_str());
  startRecording(argv);
  transition(ControllerState::Sampling);

  // perf launched the target itself; its exit covers both processes.
  checkRecordExit(awaitSampler());
}

void CaptureController::runExecInteractive() {
  requireLaunchable();

  // The target may signal immediately after exec; block first so nothing is lost.
  SignalChannel channel{SIGUSR1, SIGUSR2, SIGINT, SIGTERM, SIGCHLD};

  logInfo("Running in interactive mode, only perf stat is supported currently.");
  std::vector<std::string> argv{*session_.execPath};
  argv.insert(argv.end(), session_.execArgs.begin(), session_.execArgs.end());
  SpawnOptions opts;
  opts.extraEnv.emplace_back(CONTROLLER_PID_ENV, std::to_string(::getpid()));
  opts.extraEnv.emplace_back(ACK_SIGNAL_ENV, std::to_string(cfg_.ackSignal));
  target_ = Subprocess::spawn(argv, opts);
  session_.targetPid = target_.pid();
  emit(ControllerEvent::TargetStarted);
  logInfo("Launched %s as PID %d; waiting for SIGUSR1 to start collection.",
          session_.execPath->c_str(), static_cast<int>(target_.pid()));

  bool finished = false;
  while (!finished) {
    const SignalEvent EV = channel.next();
    switch (EV.signo) {
    case SIGUSR1:
      onBeginCollection(EV);
      break;
    case SIGUSR2:
      finished = onEndCollection(EV);
      break;
    case SIGCHLD:
      finished = onChildExit();
      break;
    default:
      onAbort(EV);
      finished = true;
      break;
    }
  }
}

/* ------------------------- Interactive Handshake ------------------------- */

void CaptureController::onBeginCollection(const SignalEvent& ev) {
  if (state_ != ControllerState::Idle) {
    logWarn("SIGUSR1 from PID %d ignored: collection already %s.", static_cast<int>(ev.sender),
            state_ == ControllerState::Sampling ? "running" : "finished");
    return;
  }
  const pid_t PID = target_.pid();
  logInfo("SIGUSR1 received from PID %d: Starting perf stat...", static_cast<int>(ev.sender));

  if (cfg_.handshakeGraceMs > 0) {
    std::this_thread::sleep_for(std::chrono::milliseconds(cfg_.handshakeGraceMs));
  }

  startSampler({cfg_.samplerPath, "stat", "-e", joinedStatEvents(cfg_), "-p",
                std::to_string(PID)});
  transition(ControllerState::Sampling);

  if (target_.signal(cfg_.ackSignal)) {
    emit(ControllerEvent::HandshakeAcknowledged);
  } else {
    logWarn("could not acknowledge PID %d: %s", static_cast<int>(PID), std::strerror(errno));
  }
}

bool CaptureController::onEndCollection(const SignalEvent& ev) {
  if (state_ != ControllerState::Sampling) {
    logWarn("SIGUSR2 from PID %d ignored: no collection is running.",
            static_cast<int>(ev.sender));
    return false;
  }
  logInfo("SIGUSR2 received from PID %d: Stopping perf stat...", static_cast<int>(ev.sender));
  transition(ControllerState::Stopping);
  requestSamplerStop();
  awaitSampler();
  awaitTarget();
  return true;
}

bool CaptureController::onChildExit() {
  if (sampler_.state == SamplerState::Running && sampler_.proc.hasExited()) {
    const bool TARGET_GONE = target_.hasExited();
    const int STATUS = awaitSampler();
    if (!TARGET_GONE && !exitedSuccessfully(STATUS)) {
      throw SpawnError("perf stat for PID " + std::to_string(target_.pid()) + " " +
                       describeStatus(STATUS));
    }
    logInfo("perf stat finished (%s).", describeStatus(STATUS).c_str());
    transition(ControllerState::Stopping);
  }

  if (!target_.hasExited()) {
    return false;
  }

  // Target ended by itself: finish the sampler first, then reap the target.
  if (sampler_.state == SamplerState::Running) {
    transition(ControllerState::Stopping);
    requestSamplerStop();
    awaitSampler();
  }
  awaitTarget();
  return true;
}

void CaptureController::onAbort(const SignalEvent& ev) {
  logInfo("%s received: stopping interactive session...", signalName(ev.signo));
  transition(ControllerState::Stopping);
  if (sampler_.state == SamplerState::Running) {
    requestSamplerStop();
    awaitSampler();
  }
  if (target_.running()) {
    target_.signal(SIGTERM);
  }
  awaitTarget();
}

/* ----------------------------- Subprocesses ----------------------------- */

std::vector<std::string> CaptureController::recordCommand() const {
  return {cfg_.samplerPath, "record", "-F", std::to_string(cfg_.captureFrequency),
          "--call-graph=dwarf", "-g", "-o", rawDataPath(cfg_)};
}

void CaptureController::requireLiveTarget() const {
  if (!session_.targetPid || !processExists(*session_.targetPid)) {
    throw SpawnError("target process " +
                     (session_.targetPid ? std::to_string(*session_.targetPid) : "<none>") +
                     " does not exist");
  }
}

void CaptureController::requireLaunchable() const {
  if (!session_.execPath || !isToolAvailable(*session_.execPath)) {
    throw SpawnError("cannot launch '" + session_.execPath.value_or("") +
                     "': not an executable file");
  }
}

void CaptureController::startRecording(const std::vector<std::string>& argv) {
  // A perf.data left by an earlier session must never stand in for this one's.
  const std::string RAW = rawDataPath(cfg_);
  std::error_code ec;
  std::filesystem::remove(RAW, ec);
  if (ec) {
    throw SpawnError("cannot remove stale " + RAW + ": " + ec.message());
  }
  startSampler(argv);
}

void CaptureController::startSampler(const std::vector<std::string>& argv) {
  if (sampler_.state != SamplerState::NotStarted) {
    throw SpawnError("sampler already started for this session");
  }
  sampler_.proc = Subprocess::spawn(argv);
  sampler_.state = SamplerState::Running;
  logDebug("sampler pid %d", static_cast<int>(sampler_.proc.pid()));
  emit(ControllerEvent::SamplerStarted);
}

void CaptureController::requestSamplerStop() {
  if (sampler_.state != SamplerState::Running) {
    return;
  }
  sampler_.state = SamplerState::Stopping;
  emit(ControllerEvent::SamplerStopRequested);
  if (!sampler_.proc.signal(SIGINT)) {
    logDebug("sampler pid %d already gone", static_cast<int>(sampler_.proc.pid()));
  }
}

int CaptureController::awaitSampler() {
  const int STATUS = sampler_.proc.wait();
  sampler_.state = SamplerState::Exited;
  emit(ControllerEvent::SamplerExited);
  return STATUS;
}

int CaptureController::awaitTarget() {
  const int STATUS = target_.wait();
  emit(ControllerEvent::TargetExited);
  if (exitedSuccessfully(STATUS)) {
    logInfo("Target %d finished.", static_cast<int>(target_.pid()));
  } else {
    logWarn("target %d %s", static_cast<int>(target_.pid()), describeStatus(STATUS).c_str());
  }
  return STATUS;
}

void CaptureController::checkRecordExit(int status) {
  if (exitedSuccessfully(status)) {
    return;
  }
  // startRecording() removed any older file, so whatever exists now is this run's.
  // A failing workload still leaves usable samples; a failing perf leaves none.
  std::error_code ec;
  const std::string RAW = rawDataPath(cfg_);
  if (!std::filesystem::exists(RAW, ec) || std::filesystem::file_size(RAW, ec) == 0) {
    throw SpawnError("perf record " + describeStatus(status) + " without writing " + RAW);
  }
  logWarn("perf record %s; continuing with the recorded data.", describeStatus(status).c_str());
}

/* ------------------------------ Bookkeeping ------------------------------ */

ArtifactSet CaptureController::generateArtifacts() {
  ArtifactPipeline pipeline(cfg_);
  ArtifactSet set = pipeline.run(rawDataPath(cfg_), modeTag(session_.mode));
  emit(ControllerEvent::ArtifactsWritten);
  logInfo("Flamegraph saved as %s", set.image.c_str());
  return set;
}

void CaptureController::transition(ControllerState next) {
  if (next == state_) {
    return;
  }
  logDebug("%s -> %s", controllerStateName(state_), controllerStateName(next));
  state_ = next;
}

void CaptureController::emit(ControllerEvent ev) {
  logDebug("event %s", controllerEventName(ev));
  if (hook_) {
    hook_(ev);
  }
}

} // namespace capture
} // namespace perfcap

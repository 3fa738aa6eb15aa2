#ifndef PERFCAP_CAPTURECONFIG_HPP
#define PERFCAP_CAPTURECONFIG_HPP
/**
 * @file CaptureConfig.hpp
 * @brief Tool locations and tunables for a capture session.
 *
 * Values come from three layers, later ones winning:
 *   1. Defaults below.
 *   2. Environment (populateFromEnv): PERFCAP_SAMPLER, PERFCAP_FLAMEGRAPH_DIR,
 *      PERFCAP_OUTPUT_DIR, PERFCAP_FREQUENCY, PERFCAP_ACK_SIGNAL, PERFCAP_VERBOSE.
 *   3. Long CLI flags (parseCaptureFlags in ModeResolver.hpp).
 *
 * Tests inject fake tools by filling the path fields directly.
 */

#include <algorithm> // std::max
#include <cctype>    // std::tolower
#include <csignal>   // SIGRTMIN, SIGUSR1
#include <cstdlib>   // std::getenv, std::atoi
#include <string>
#include <vector>

namespace perfcap {
namespace capture {

/* ----------------------------- CaptureConfig ----------------------------- */

/** @brief External tool locations and capture knobs. */
struct CaptureConfig {
  std::string samplerPath = "perf";              ///< Resolved on PATH when it has no '/'
  std::string flamegraphDir = "/opt/FlameGraph"; ///< Checkout of brendangregg/FlameGraph
  std::string collapseToolPath;                  ///< Empty = <flamegraphDir>/stackcollapse-perf.pl
  std::string renderToolPath;                    ///< Empty = <flamegraphDir>/flamegraph.pl
  std::string outputDir = "./perf_log";          ///< Raw data and artifacts land here
  int captureFrequency = 499;                    ///< perf record -F (Hz)

  // ---- Interactive (counter) mode ----
  std::vector<std::string> statEvents{"cpu-clock",  "cycles",          "instructions",
                                      "branches",   "branch-misses",   "LLC-loads",
                                      "LLC-load-misses", "dTLB-loads", "dTLB-load-misses"};
  int handshakeGraceMs = 1000; ///< Delay between SIGUSR1 and starting perf stat
  int ackSignal = SIGRTMIN;    ///< Sent to the target once perf stat is running

  bool verbose = false; ///< Enables logDebug output
};

/* --------------------------------- API --------------------------------- */

/** @brief Ack signal override; also exported to interactive targets. */
inline constexpr const char* ACK_SIGNAL_ENV = "PERFCAP_ACK_SIGNAL";

/**
 * @brief Parse "USR1", "SIGUSR2", "RTMIN", "SIGRTMIN+3" or a plain signal number.
 * @return the signal number, or 0 if the text names no signal a target can catch.
 */
inline int parseSignalSpec(std::string spec) {
  if (spec.rfind("SIG", 0) == 0) {
    spec.erase(0, 3);
  }
  if (spec == "USR1") {
    return SIGUSR1;
  }
  if (spec == "USR2") {
    return SIGUSR2;
  }

  constexpr const char* DIGITS = "0123456789";
  int sig = 0;
  if (spec.rfind("RTMIN", 0) == 0) {
    const std::string OFFSET = spec.substr(5);
    if (!OFFSET.empty()) {
      if (OFFSET[0] != '+' || OFFSET.size() < 2 || OFFSET.size() > 3 ||
          OFFSET.find_first_not_of(DIGITS, 1) != std::string::npos) {
        return 0;
      }
      sig = std::atoi(OFFSET.c_str() + 1);
    }
    sig += SIGRTMIN;
  } else if (!spec.empty() && spec.size() <= 3 &&
             spec.find_first_not_of(DIGITS) == std::string::npos) {
    sig = std::atoi(spec.c_str());
  } else {
    return 0;
  }

  if (sig <= 0 || sig > SIGRTMAX || sig == SIGKILL || sig == SIGSTOP) {
    return 0;
  }
  return sig;
}

namespace detail {

inline bool truthy(std::string val) {
  for (char& ch : val) {
    ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
  }
  return (val == "1" || val == "true" || val == "yes");
}

} // namespace detail

/** @brief Apply PERFCAP_* environment overrides. */
inline void populateFromEnv(CaptureConfig& cfg) {
  if (const char* v = std::getenv("PERFCAP_SAMPLER")) {
    cfg.samplerPath = v;
  }
  if (const char* v = std::getenv("PERFCAP_FLAMEGRAPH_DIR")) {
    cfg.flamegraphDir = v;
  }
  if (const char* v = std::getenv("PERFCAP_OUTPUT_DIR")) {
    cfg.outputDir = v;
  }
  if (const char* v = std::getenv("PERFCAP_FREQUENCY")) {
    cfg.captureFrequency = std::max(1, std::atoi(v));
  }
  if (const char* v = std::getenv(ACK_SIGNAL_ENV)) {
    if (const int SIG = parseSignalSpec(v)) {
      cfg.ackSignal = SIG;
    }
  }
  if (const char* v = std::getenv("PERFCAP_VERBOSE")) {
    cfg.verbose = detail::truthy(v);
  }
}

/** @brief Fill empty collapse/render paths from flamegraphDir. */
inline void resolveToolchainPaths(CaptureConfig& cfg) {
  if (cfg.collapseToolPath.empty()) {
    cfg.collapseToolPath = cfg.flamegraphDir + "/stackcollapse-perf.pl";
  }
  if (cfg.renderToolPath.empty()) {
    cfg.renderToolPath = cfg.flamegraphDir + "/flamegraph.pl";
  }
}

/** @brief Raw sample file written by perf record and read by perf script. */
inline std::string rawDataPath(const CaptureConfig& cfg) { return cfg.outputDir + "/perf.data"; }

/** @brief Comma-joined event list for perf stat -e. */
inline std::string joinedStatEvents(const CaptureConfig& cfg) {
  std::string out;
  for (const auto& ev : cfg.statEvents) {
    if (!out.empty()) {
      out += ',';
    }
    out += ev;
  }
  return out;
}

} // namespace capture
} // namespace perfcap

#endif // PERFCAP_CAPTURECONFIG_HPP

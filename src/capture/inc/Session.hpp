#ifndef PERFCAP_SESSION_HPP
#define PERFCAP_SESSION_HPP
/**
 * @file Session.hpp
 * @brief One controller invocation: operating mode plus its target.
 */

#include <optional>
#include <string>
#include <vector>

#include <sys/types.h>

namespace perfcap {
namespace capture {

/* --------------------------------- Mode --------------------------------- */

enum class Mode {
  PidTimed,          ///< -P <pid> -D <seconds>
  PidUntilInterrupt, ///< -P <pid>
  ExecRecord,        ///< -E <path>
  ExecInteractive    ///< -E <path> -I
};

/** @return human-readable mode name ("pid-timed", ...). */
const char* modeName(Mode mode) noexcept;

/** @return artifact tag used in the image file name: "pid" or "exec". */
const char* modeTag(Mode mode) noexcept;

/** @return true when the mode ends with a flamegraph (every mode except ExecInteractive). */
bool producesArtifacts(Mode mode) noexcept;

/* -------------------------------- Session -------------------------------- */

/**
 * @brief Validated parameters of a single capture run.
 *
 * Exactly one of targetPid / execPath is set. durationSec is only set for
 * Mode::PidTimed. A Session is built once by resolveSession() and never reused.
 */
struct Session {
  Mode mode = Mode::PidUntilInterrupt;
  std::optional<pid_t> targetPid;
  std::optional<double> durationSec;
  std::optional<std::string> execPath;
  std::vector<std::string> execArgs; ///< Words following the path inside the -E value
};

} // namespace capture
} // namespace perfcap

#endif // PERFCAP_SESSION_HPP

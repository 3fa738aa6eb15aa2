#ifndef PERFCAP_MODERESOLVER_HPP
#define PERFCAP_MODERESOLVER_HPP
/**
 * @file ModeResolver.hpp
 * @brief Command-line parsing into a validated Session.
 *
 * Short flags (session):
 *   -P <pid>       attach to an existing process       (exclusive with -E)
 *   -D <seconds>   bounded sampling duration           (only with -P)
 *   -E <path>      executable to launch and profile    (exclusive with -P)
 *   -I             interactive counter handshake       (only with -E)
 *   -h, --help     print usage
 *
 * Long flags (configuration, see CaptureConfig.hpp):
 *   --output-dir PATH  --flamegraph-dir PATH  --sampler PATH
 *   --frequency N      --ack-signal SIG      --verbose
 *
 * Values may be attached to short flags (-P1234) or given separately (-P 1234).
 */

#include <optional>
#include <string>

#include "src/capture/inc/CaptureConfig.hpp"
#include "src/capture/inc/Session.hpp"

namespace perfcap {
namespace capture {

/* ------------------------------- RawFlags ------------------------------- */

/** @brief Flags as typed, before cross-flag validation. */
struct RawFlags {
  std::optional<std::string> pid;      ///< -P
  std::optional<std::string> duration; ///< -D
  std::optional<std::string> exec;     ///< -E
  bool interactive = false;            ///< -I
  bool help = false;                   ///< -h / --help
};

/* --------------------------------- API --------------------------------- */

/** @return the one-line usage string. */
std::string usageLine(const std::string& prog);

/** @return full help text (usage plus option list). */
std::string helpText(const std::string& prog);

/**
 * @brief Parse argv into RawFlags, applying long configuration flags to cfg.
 * @throws ArgumentError on unknown options, missing values or stray arguments.
 */
RawFlags parseCaptureFlags(CaptureConfig& cfg, int argc, char** argv);

/**
 * @brief Validate flag combinations and map them to exactly one Mode.
 *
 * Checked in order: -P with -E, neither -P nor -E, then value syntax.
 * -D with -E and -I with -P are accepted and ignored (a warning is logged).
 *
 * @throws ArgumentError on contradictory or malformed input.
 */
Session resolveSession(const RawFlags& flags);

} // namespace capture
} // namespace perfcap

#endif // PERFCAP_MODERESOLVER_HPP

#ifndef PERFCAP_PREFLIGHT_HPP
#define PERFCAP_PREFLIGHT_HPP
/**
 * @file Preflight.hpp
 * @brief Environment checks run once before any subprocess starts.
 *
 * Checks, in order:
 *  - Output directory exists (created if missing).
 *  - Sampler (perf) resolvable on PATH or executable at the given path.
 *  - FlameGraph directory exists and its collapse/render scripts are executable.
 *
 * Each failure throws EnvironmentError. There are no retries.
 */

#include <string>

#include "src/capture/inc/CaptureConfig.hpp"

namespace perfcap {
namespace capture {

/* --------------------------------- API --------------------------------- */

/** @return true if tool is an executable path, or `command -v <tool>` succeeds. */
bool isToolAvailable(const std::string& tool);

/**
 * @brief Run all checks.
 * @param cfg Config with resolved toolchain paths.
 * @throws EnvironmentError on the first failed check.
 */
void runPreflight(const CaptureConfig& cfg);

} // namespace capture
} // namespace perfcap

#endif // PERFCAP_PREFLIGHT_HPP

#ifndef PERFCAP_CAPTUREAPP_HPP
#define PERFCAP_CAPTUREAPP_HPP
/**
 * @file CaptureApp.hpp
 * @brief Command-line entry: flags -> preflight -> controller -> exit code.
 *
 * Exit codes: 0 on success (or --help), 1 for every failure. Failures print
 * one "[perfcap] Error: ..." line naming the failed step.
 */

namespace perfcap {
namespace capture {

/** @brief Run one capture session as the perfcap executable would. */
int runCapture(int argc, char** argv);

} // namespace capture
} // namespace perfcap

#endif // PERFCAP_CAPTUREAPP_HPP

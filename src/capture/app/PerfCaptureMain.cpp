/**
 * @file PerfCaptureMain.cpp
 * @brief perfcap executable.
 *
 * Usage:
 *   @code{.sh}
 *   perfcap -P 1234 -D 10        # record PID 1234 for 10 s, then render
 *   perfcap -P 1234              # record until Ctrl+C, then render
 *   perfcap -E "./server --fast" # launch under perf record, render on exit
 *   perfcap -E ./handshake -I    # perf stat between SIGUSR1 and SIGUSR2
 *   @endcode
 */

#include "src/capture/inc/CaptureApp.hpp"

int main(int argc, char** argv) { return perfcap::capture::runCapture(argc, argv); }

/**
 * @file HandshakeTarget_Demo.cpp
 * @brief Demo target for perfcap's interactive counter mode.
 *
 * Setup work runs unmeasured; only the bracketed workload is counted by
 * `perf stat`. Run standalone it simply executes the workload.
 *
 * Usage:
 *   @code{.sh}
 *   # Counters for the workload only
 *   perfcap -E "./HandshakeTarget_Demo 20" -I
 *
 *   # Whole-program flamegraph instead
 *   perfcap -E "./HandshakeTarget_Demo 20"
 *   @endcode
 *
 * Argument: number of workload rounds (default 10).
 */

#include <algorithm>
#include <cstdint>
#include <cstdio>
#include <cstdlib>

#include "src/capture/inc/Handshake.hpp"
#include "helpers/DemoWorkloads.hpp"

namespace pc = perfcap::capture;
namespace demo = perfcap::capture::demo;

/* ----------------------------- Constants ----------------------------- */

static constexpr std::size_t RING_SLOTS = 8 * 1024 * 1024; // 32 MiB of indices, past LLC
static constexpr std::size_t HOPS_PER_ROUND = 2 * 1024 * 1024;
static constexpr std::size_t NOISE_BYTES = 16 * 1024 * 1024;
static constexpr std::uint64_t COLLATZ_SPAN = 200000;

int main(int argc, char** argv) {
  const int ROUNDS = (argc > 1) ? std::max(1, std::atoi(argv[1])) : 10;

  // Unmeasured setup.
  const auto RING = demo::makeChaseRing(RING_SLOTS);
  const auto NOISE = demo::makeNoiseBytes(NOISE_BYTES);

  const bool MEASURED = pc::requestCollectionStart();
  if (!MEASURED && pc::controllerFromEnv() != 0) {
    std::fprintf(stderr, "[demo] no acknowledgement from perfcap; running unmeasured\n");
  }

  volatile std::uint64_t sink = 0;
  for (int r = 0; r < ROUNDS; ++r) {
    sink = sink + demo::chaseRing(RING, HOPS_PER_ROUND);
    const auto TALLY = demo::classifyBytes(NOISE.data(), NOISE.size());
    sink = sink + TALLY[1] + TALLY[2];
    sink = sink + demo::collatzSteps(1 + static_cast<std::uint64_t>(r) * COLLATZ_SPAN,
                                     COLLATZ_SPAN);
  }

  if (MEASURED) {
    pc::requestCollectionStop();
  }
  std::printf("[demo] %d rounds, checksum %llu\n", ROUNDS,
              static_cast<unsigned long long>(sink));
  return 0;
}

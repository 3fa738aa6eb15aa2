/**
 * @file DemoWorkloads.hpp
 * @brief CPU-bound workloads for targets profiled by perfcap demos.
 *
 * Each workload leans on a different part of the interactive event list:
 *  - chaseRing:     LLC-load-misses, dTLB-load-misses (dependent loads)
 *  - classifyBytes: branch-misses (data-dependent branches)
 *  - collatzSteps:  instructions, cycles (integer ALU only)
 */

#ifndef PERFCAP_DEMO_WORKLOADS_HPP
#define PERFCAP_DEMO_WORKLOADS_HPP

#include <array>
#include <cstddef>
#include <cstdint>
#include <numeric>
#include <random>
#include <utility>
#include <vector>

namespace perfcap {
namespace capture {
namespace demo {

/* ----------------------------- Data Generators ----------------------------- */

/**
 * @brief Random single-cycle permutation (Sattolo's algorithm).
 *
 * Following ring[i] from any slot visits every slot once before returning,
 * so the walk never settles into a cache-resident sub-cycle.
 */
inline std::vector<std::uint32_t> makeChaseRing(std::size_t slots, std::uint32_t seed = 7) {
  std::vector<std::uint32_t> ring(slots);
  std::iota(ring.begin(), ring.end(), 0u);
  std::minstd_rand rng(seed);
  for (std::size_t i = slots; i > 1; --i) {
    std::uniform_int_distribution<std::size_t> pick(0, i - 2);
    std::swap(ring[i - 1], ring[pick(rng)]);
  }
  return ring;
}

/** @brief Uniformly random bytes; the classifier cannot predict them. */
inline std::vector<std::uint8_t> makeNoiseBytes(std::size_t count, std::uint32_t seed = 99) {
  std::vector<std::uint8_t> out(count);
  std::minstd_rand rng(seed);
  for (auto& b : out) {
    b = static_cast<std::uint8_t>(rng() >> 7);
  }
  return out;
}

/* ----------------------------- Workloads ----------------------------- */

/** @brief Follow the ring for `hops` dependent loads. @return final slot. */
inline std::uint32_t chaseRing(const std::vector<std::uint32_t>& ring, std::size_t hops) {
  std::uint32_t at = 0;
  for (std::size_t h = 0; h < hops; ++h) {
    at = ring[at];
  }
  return at;
}

/**
 * @brief Tally bytes into four classes by value.
 * @return counts for {control, digit, letter, other}.
 */
inline std::array<std::uint64_t, 4> classifyBytes(const std::uint8_t* data, std::size_t len) {
  std::array<std::uint64_t, 4> tally{};
  for (std::size_t i = 0; i < len; ++i) {
    const std::uint8_t B = data[i];
    if (B < 0x20) {
      ++tally[0];
    } else if (B >= '0' && B <= '9') {
      ++tally[1];
    } else if ((B | 0x20) >= 'a' && (B | 0x20) <= 'z') {
      ++tally[2];
    } else {
      ++tally[3];
    }
  }
  return tally;
}

/** @brief Total Collatz steps for every start value in [first, first + count). */
inline std::uint64_t collatzSteps(std::uint64_t first, std::uint64_t count) {
  std::uint64_t steps = 0;
  for (std::uint64_t n = first; n < first + count; ++n) {
    for (std::uint64_t x = n; x > 1; ++steps) {
      x = (x & 1) ? 3 * x + 1 : x >> 1;
    }
  }
  return steps;
}

} // namespace demo
} // namespace capture
} // namespace perfcap

#endif // PERFCAP_DEMO_WORKLOADS_HPP

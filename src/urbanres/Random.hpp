#pragma once

#include <chrono>
#include <cmath>
#include <cstdint>
#include <limits>

namespace urbanres {

// SplitMix64: small, fast, high-quality generator for seeds / hashing.
inline std::uint64_t SplitMix64Next(std::uint64_t& state)
{
  std::uint64_t z = (state += 0x9E3779B97F4A7C15ULL);
  z = (z ^ (z >> 30)) * 0xBF58476D1CE4E5B9ULL;
  z = (z ^ (z >> 27)) * 0x94D049BB133111EBULL;
  return z ^ (z >> 31);
}

// Used when a caller does not pin the seed of a disaster run.
inline std::uint64_t TimeSeed()
{
  const auto now = std::chrono::high_resolution_clock::now().time_since_epoch().count();
  std::uint64_t s = static_cast<std::uint64_t>(now);
  return SplitMix64Next(s);
}

// Derive an independent stream for a sub-generator (trees, facilities, ...) from one
// world seed, so adding draws in one stage never shifts another stage's output.
inline std::uint64_t DeriveSeed(std::uint64_t seed, std::uint64_t salt)
{
  std::uint64_t s = seed ^ (salt * 0xD6E8FEB86659FD93ULL);
  return SplitMix64Next(s);
}

// Explicitly seeded generator. Every randomized stage takes one by reference; there is
// no hidden global state.
struct RNG {
  std::uint64_t state = 0;

  explicit RNG(std::uint64_t seed)
      : state(seed ? seed : 0x12345678ABCDEF00ULL)
  {}

  std::uint64_t nextU64() { return SplitMix64Next(state); }

  std::uint32_t nextU32() { return static_cast<std::uint32_t>(nextU64() >> 32); }

  // Uniform integer in [0, maxExclusive), rejection sampled to avoid modulo bias.
  std::uint32_t rangeU32(std::uint32_t maxExclusive)
  {
    if (maxExclusive <= 1u) return 0u;

    if ((maxExclusive & (maxExclusive - 1u)) == 0u) {
      return nextU32() & (maxExclusive - 1u);
    }

    const std::uint32_t threshold = static_cast<std::uint32_t>((std::uint64_t{1} << 32) % maxExclusive);
    while (true) {
      const std::uint32_t r = nextU32();
      if (r >= threshold) return r % maxExclusive;
    }
  }

  // [0, 1) with 53 bits of precision.
  double nextF01()
  {
    return static_cast<double>(nextU64() >> 11) * (1.0 / 9007199254740992.0);
  }

  int rangeInt(int minInclusive, int maxInclusive)
  {
    if (maxInclusive <= minInclusive) return minInclusive;

    const std::int64_t lo = static_cast<std::int64_t>(minInclusive);
    const std::int64_t span = static_cast<std::int64_t>(maxInclusive) - lo + 1;
    if (span <= 0) return minInclusive;

    if (span <= static_cast<std::int64_t>(std::numeric_limits<std::uint32_t>::max())) {
      const std::uint32_t r = rangeU32(static_cast<std::uint32_t>(span));
      return static_cast<int>(lo + static_cast<std::int64_t>(r));
    }

    return static_cast<int>(lo + static_cast<std::int64_t>(nextU64() % static_cast<std::uint64_t>(span)));
  }

  double rangeDouble(double minInclusive, double maxInclusive)
  {
    return minInclusive + (maxInclusive - minInclusive) * nextF01();
  }

  bool chance(double p) { return nextF01() < p; }

  // Normal distribution (Box-Muller, one draw per call).
  double gaussian(double mean, double stddev)
  {
    double u1 = nextF01();
    if (u1 < 1e-300) u1 = 1e-300;
    const double u2 = nextF01();
    const double z = std::sqrt(-2.0 * std::log(u1)) * std::cos(6.283185307179586 * u2);
    return mean + stddev * z;
  }
};

} // namespace urbanres

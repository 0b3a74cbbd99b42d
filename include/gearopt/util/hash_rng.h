#pragma once

#include <cstddef>
#include <cstdint>

namespace gearopt::util {

// splitmix64 (Sebastiano Vigna): a tiny 64-bit mixer, used here as a
// deterministic, seedable stream for the benchmark sampler.
//
// Not cryptographically secure.
inline std::uint64_t splitmix64(std::uint64_t x) {
  x += 0x9e3779b97f4a7c15ULL;
  x = (x ^ (x >> 30)) * 0xbf58476d1ce4e5b9ULL;
  x = (x ^ (x >> 27)) * 0x94d049bb133111ebULL;
  return x ^ (x >> 31);
}

class HashRng {
 public:
  explicit HashRng(std::uint64_t seed) : state_(seed) {}

  std::uint64_t next_u64() {
    const std::uint64_t out = splitmix64(state_);
    state_ += 0x9e3779b97f4a7c15ULL;
    return out;
  }

  // Unbiased index in [0, n). Rejection sampling avoids modulo bias.
  std::size_t index(std::size_t n) {
    if (n <= 1) return 0;
    const std::uint64_t bound = static_cast<std::uint64_t>(n);
    const std::uint64_t threshold = (std::uint64_t(0) - bound) % bound;
    for (;;) {
      const std::uint64_t r = next_u64();
      if (r >= threshold) return static_cast<std::size_t>(r % bound);
    }
  }

 private:
  std::uint64_t state_{0};
};

} // namespace gearopt::util

#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

#include "gearopt/core/combination.h"
#include "gearopt/core/settings.h"

namespace gearopt {

// Random gear assignments scored per combination during the benchmark.
inline constexpr int kBenchmarkIterationsPerSetting = 100;

struct HeuristicOptions {
  // Samples per combination; also the benchmark collector's capacity.
  int iterations{kBenchmarkIterationsPerSetting};

  std::uint64_t seed{1};
};

// Indices i with weighted[i] strictly above 10% of `capacity`.
std::vector<std::uint32_t> pick_combinations(const std::vector<int>& weighted, std::size_t capacity);

// Benchmarks every combination on `iterations` random gear assignments, keeps
// the best `iterations` characters overall and returns the combinations that
// hold more than 10% of them.
//
// This is a sampling heuristic: it can drop a combination that would win the
// exhaustive search, or keep one that would not. With a fixed seed the
// selection is reproducible. Throws std::invalid_argument on malformed settings.
std::vector<std::uint32_t> select_combinations_by_heuristic(const Settings& settings,
                                                            const std::vector<Combination>& combinations,
                                                            const HeuristicOptions& options = {});

} // namespace gearopt

#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "gearopt/core/affix.h"
#include "gearopt/core/character.h"
#include "gearopt/core/combination.h"
#include "gearopt/core/result.h"
#include "gearopt/core/settings.h"

namespace gearopt {

// Evaluations between two progress callbacks.
inline constexpr std::uint64_t kProgressUpdateInterval = 500000;

// Retained characters with combination ids remapped to indices into
// `combinations`, which lists only the combinations they reference (in order
// of first appearance).
struct CompactedResults {
  std::vector<Character> characters;
  std::vector<Combination> combinations;
};

CompactedResults compact_results(const std::vector<Character>& characters,
                                 const std::vector<Combination>& combinations);

struct ProgressSnapshot {
  // Estimated evaluations for the whole invocation.
  std::uint64_t total{0};

  // Evaluations since the previous snapshot.
  std::uint64_t batch{0};

  CompactedResults results;
};

// Receives periodic snapshots during a search. Implementations own the
// transport; an exception thrown here is logged and the search continues.
class ProgressSink {
 public:
  virtual ~ProgressSink() = default;
  virtual void on_progress(const ProgressSnapshot& snapshot) = 0;
};

struct SearchOptions {
  // 0 disables progress callbacks.
  std::uint64_t progress_interval{kProgressUpdateInterval};
};

struct SearchOutcome {
  ResultCollector results;

  // (leaf, combination) pairs scored.
  std::uint64_t evaluations{0};

  // Pairs rejected by the Settings constraints.
  std::uint64_t invalid{0};

  // Pairs skipped because a gear affix was not among its slot's candidates.
  std::uint64_t anomalies{0};

  std::uint64_t total_estimate{0};
};

// Total (leaf, combination) evaluations the chunks will produce, saturating
// at UINT64_MAX.
std::uint64_t total_evaluations(const std::vector<Gear>& chunks, const Settings& settings,
                                std::size_t combination_count);

// Structural checks on everything run_search consumes: the settings, each
// chunk prefix (length, affixes known to their slot) and each combination's
// rankby-independent shape. Empty means valid.
std::vector<std::string> validate_search_inputs(const std::vector<Gear>& chunks,
                                                const Settings& settings,
                                                const std::vector<Combination>& combinations);

// Exhaustively scores every leaf of every chunk against every combination and
// returns the best settings.max_results characters.
//
// Chunks are independent and processed sequentially; callers that want
// parallelism run disjoint chunk lists on separate threads and merge the
// collectors. Throws std::invalid_argument (listing every problem) if
// validate_search_inputs fails.
SearchOutcome run_search(const std::vector<Gear>& chunks,
                         const Settings& settings,
                         const std::vector<Combination>& combinations,
                         const SearchOptions& options = {},
                         ProgressSink* sink = nullptr);

} // namespace gearopt

#include "gearopt/core/heuristics.h"

#include <stdexcept>
#include <string>

#include "gearopt/core/character.h"
#include "gearopt/core/gear_tree.h"
#include "gearopt/core/result.h"
#include "gearopt/core/stat_evaluator.h"
#include "gearopt/util/hash_rng.h"
#include "gearopt/util/log.h"
#include "gearopt/util/strings.h"

namespace gearopt {

std::vector<std::uint32_t> pick_combinations(const std::vector<int>& weighted, std::size_t capacity) {
  std::vector<std::uint32_t> picked;
  for (std::size_t i = 0; i < weighted.size(); ++i) {
    // count > capacity / 10, kept in integers.
    if (weighted[i] > 0 && static_cast<std::size_t>(weighted[i]) * 10 > capacity) {
      picked.push_back(static_cast<std::uint32_t>(i));
    }
  }
  return picked;
}

std::vector<std::uint32_t> select_combinations_by_heuristic(const Settings& settings,
                                                            const std::vector<Combination>& combinations,
                                                            const HeuristicOptions& options) {
  const auto errors = validate_settings(settings);
  if (!errors.empty()) throw std::invalid_argument("invalid settings: " + join(errors, "; "));

  const std::size_t iterations = options.iterations > 0 ? static_cast<std::size_t>(options.iterations) : 0;
  const auto slots = static_cast<std::size_t>(settings.slots);

  ResultCollector benchmark(iterations, settings.rankby);
  Character character(slots, settings.rankby);
  util::HashRng rng(options.seed);

  for (std::size_t index = 0; index < combinations.size(); ++index) {
    for (std::size_t n = 0; n < iterations; ++n) {
      character.clear();
      character.combination_id = static_cast<std::uint32_t>(index);

      const Gear gear = random_gear(settings.affixes_array, slots, rng);
      if (test_character(character, settings, combinations[index], gear)) {
        benchmark.insert(character);
      }
    }
  }

  const auto picked = pick_combinations(benchmark.weighted_combinations(combinations.size()), iterations);
  log::info("Finished heuristics. Picked " + std::to_string(picked.size()) + " of " +
            std::to_string(combinations.size()) + " combinations");
  return picked;
}

} // namespace gearopt

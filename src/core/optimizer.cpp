#include "gearopt/core/optimizer.h"

#include <algorithm>
#include <exception>
#include <stdexcept>
#include <unordered_map>

#include "gearopt/core/gear_tree.h"
#include "gearopt/core/stat_evaluator.h"
#include "gearopt/util/log.h"
#include "gearopt/util/strings.h"

namespace gearopt {

namespace {

void publish(ProgressSink* sink, const ResultCollector& results, const std::vector<Combination>& combinations,
             std::uint64_t total, std::uint64_t batch) {
  if (!sink) return;

  ProgressSnapshot snapshot;
  snapshot.total = total;
  snapshot.batch = batch;
  snapshot.results = compact_results(results.characters(), combinations);

  try {
    sink->on_progress(snapshot);
  } catch (const std::exception& e) {
    log::warn(std::string("Progress report failed, search continues: ") + e.what());
  }
}

} // namespace

CompactedResults compact_results(const std::vector<Character>& characters,
                                 const std::vector<Combination>& combinations) {
  CompactedResults out;
  out.characters = characters;

  std::unordered_map<std::uint32_t, std::uint32_t> remap;
  for (Character& c : out.characters) {
    const auto it = remap.find(c.combination_id);
    if (it != remap.end()) {
      c.combination_id = it->second;
      continue;
    }
    if (c.combination_id >= combinations.size()) {
      throw std::out_of_range("result references unknown combination " + std::to_string(c.combination_id));
    }
    const auto local = static_cast<std::uint32_t>(out.combinations.size());
    out.combinations.push_back(combinations[c.combination_id]);
    remap.emplace(c.combination_id, local);
    c.combination_id = local;
  }
  return out;
}

std::uint64_t total_evaluations(const std::vector<Gear>& chunks, const Settings& settings,
                                std::size_t combination_count) {
  const std::size_t slots = settings.slots > 0 ? static_cast<std::size_t>(settings.slots) : 0;
  std::uint64_t leaves = 0;
  for (const Gear& chunk : chunks) {
    leaves = saturating_add(leaves, count_leaves(settings.affixes_array, std::min(chunk.size(), slots), slots));
  }
  return saturating_mul(leaves, static_cast<std::uint64_t>(combination_count));
}

std::vector<std::string> validate_search_inputs(const std::vector<Gear>& chunks,
                                                const Settings& settings,
                                                const std::vector<Combination>& combinations) {
  std::vector<std::string> errors = validate_settings(settings);
  if (!errors.empty()) return errors;

  const auto slots = static_cast<std::size_t>(settings.slots);
  for (std::size_t c = 0; c < chunks.size(); ++c) {
    const Gear& chunk = chunks[c];
    if (chunk.size() > slots) {
      errors.push_back("chunk " + std::to_string(c) + " fixes " + std::to_string(chunk.size()) +
                       " slots, only " + std::to_string(slots) + " exist");
      continue;
    }
    for (std::size_t slot = 0; slot < chunk.size(); ++slot) {
      const auto& options = settings.affixes_array[slot];
      const bool known = options.empty() ? chunk[slot] == Affix::None
                                         : std::find(options.begin(), options.end(), chunk[slot]) != options.end();
      if (!known) {
        errors.push_back("chunk " + std::to_string(c) + ": affix " + affix_to_string(chunk[slot]) +
                         " is not a candidate for slot " + std::to_string(slot));
      }
    }
  }

  for (std::size_t i = 0; i < combinations.size(); ++i) {
    if (combinations[i].modifiers.get_dmg_multiplier(Attribute::IncomingStrikeDamage) == 0.0) {
      errors.push_back("combination " + std::to_string(i) + ": IncomingStrikeDamage multiplier is 0");
    }
  }
  return errors;
}

SearchOutcome run_search(const std::vector<Gear>& chunks,
                         const Settings& settings,
                         const std::vector<Combination>& combinations,
                         const SearchOptions& options,
                         ProgressSink* sink) {
  const auto errors = validate_search_inputs(chunks, settings, combinations);
  if (!errors.empty()) throw std::invalid_argument("invalid search input: " + join(errors, "; "));

  const auto slots = static_cast<std::size_t>(settings.slots);
  SearchOutcome out{ResultCollector(static_cast<std::size_t>(settings.max_results), settings.rankby)};
  out.total_estimate = total_evaluations(chunks, settings, combinations.size());

  Character character(slots, settings.rankby);
  std::uint64_t since_report = 0;
  std::string anomaly;

  for (const Gear& chunk : chunks) {
    LeafSequence leaves(settings.affixes_array, chunk, slots);
    while (leaves.next()) {
      const Gear& gear = leaves.gear();
      for (std::size_t i = 0; i < combinations.size(); ++i) {
        character.clear();
        character.combination_id = static_cast<std::uint32_t>(i);
        anomaly.clear();

        if (test_character(character, settings, combinations[i], gear, &anomaly)) {
          out.results.insert(character);
        } else if (!anomaly.empty()) {
          ++out.anomalies;
        } else {
          ++out.invalid;
        }

        ++out.evaluations;
        if (options.progress_interval > 0 && ++since_report >= options.progress_interval) {
          publish(sink, out.results, combinations, out.total_estimate, since_report);
          since_report = 0;
        }
      }
    }
  }

  log::debug("Search finished: " + std::to_string(out.evaluations) + " evaluations, " +
             std::to_string(out.invalid) + " invalid, " + std::to_string(out.anomalies) + " anomalies, " +
             std::to_string(out.results.size()) + " retained");
  return out;
}

} // namespace gearopt

#pragma once

#include <string>
#include <vector>

#include "gearopt/core/affix.h"
#include "gearopt/core/character.h"
#include "gearopt/core/combination.h"
#include "gearopt/core/optimizer.h"
#include "gearopt/core/result_analysis.h"
#include "gearopt/core/settings.h"
#include "gearopt/util/json.h"

namespace gearopt {

// Everything one optimizer invocation needs.
struct SearchJob {
  Settings settings;
  std::vector<Combination> combinations;

  // Chunk prefixes to search. Only meaningful if has_chunks; otherwise the
  // caller derives them with make_chunks.
  std::vector<Gear> chunks;
  bool has_chunks{false};
};

// Parsers throw std::runtime_error naming the offending path
// (e.g. "combinations[2].modifiers.buff[0]: unknown attribute 'Powr'").
Settings settings_from_json(const json::Value& v);
Combination combination_from_json(const json::Value& v, const std::string& path = "combination");
SearchJob search_job_from_json(const json::Value& v);
SearchJob search_job_from_json_text(const std::string& text);

json::Value settings_to_json(const Settings& settings);
json::Value combination_to_json(const Combination& combination);

// Gear, combination id and the non-zero base/final attributes.
json::Value character_to_json(const Character& character);

json::Value analysis_to_json(const CharacterAnalysis& analysis);

// {"results": [...], "combinations": [...]} for compacted results. If
// `analyses` is non-empty it must be parallel to results.characters.
json::Value results_to_json(const CompactedResults& results,
                            const std::vector<CharacterAnalysis>& analyses = {});

// {"type": "PROGRESS", "total", "new", "results", "combinations"}
json::Value progress_to_json(const ProgressSnapshot& snapshot);

} // namespace gearopt

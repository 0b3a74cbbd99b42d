#pragma once

#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "gearopt/core/attribute.h"
#include "gearopt/core/character.h"
#include "gearopt/core/combination.h"
#include "gearopt/core/condition.h"
#include "gearopt/core/settings.h"

namespace gearopt {

// Points added/removed per stat when probing marginal value.
inline constexpr double kStatProbePoints = 5.0;

struct DamageShare {
  std::string source;  // "Power", "Siphon" or a condition name
  double dps{0.0};
  double share{0.0};   // fraction of Damage; 0 when Damage is 0
};

// DPS of one condition as a linear function of its coefficient.
struct CoefficientHelper {
  Condition condition{Condition::Bleeding};
  double slope{0.0};
  double intercept{0.0};
};

// Details for one retained character, recomputed without rounding.
struct CharacterAnalysis {
  double value{0.0};

  std::vector<std::pair<Attribute, double>> indicators;

  // Damage change from +5 / -5 points of each probed stat.
  std::vector<std::pair<Attribute, double>> effective_positive_values;
  std::vector<std::pair<Attribute, double>> effective_negative_values;

  std::vector<DamageShare> damage_breakdown;
  std::vector<CoefficientHelper> coefficient_helper;
};

// Stats probed for marginal damage.
const std::vector<Attribute>& probed_stats();

// Attributes reported as indicators.
const std::vector<Attribute>& indicator_attributes();

// `character` must hold the base_attributes of a successful evaluation
// (e.g. an entry of ResultCollector::characters()). Constraints are not
// re-checked.
CharacterAnalysis analyze_character(const Character& character,
                                    const Settings& settings,
                                    const Combination& combination);

// Coefficient needed for a condition to reach `target_dps`.
// nullopt if the helper's slope is zero.
std::optional<double> coefficient_for_target_dps(const CoefficientHelper& helper, double target_dps);

} // namespace gearopt

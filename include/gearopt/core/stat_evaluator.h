#pragma once

#include <string>

#include "gearopt/core/affix.h"
#include "gearopt/core/character.h"
#include "gearopt/core/combination.h"
#include "gearopt/core/condition.h"
#include "gearopt/core/settings.h"

namespace gearopt {

// Reference target armor used by in-game damage tooltips.
inline constexpr double kReferenceArmor = 2597.0;

// Divisor that normalizes effective health into the survivability score.
inline constexpr double kSurvivabilityDivisor = 1967.0;

// Representative healing skill: 390 base, 0.3 healing power coefficient.
inline constexpr double kHealingBase = 390.0;
inline constexpr double kHealingCoefficient = 0.3;

// Round to nearest, ties to even (2.5 -> 2, 3.5 -> 4, -2.5 -> -2).
double round_even(double v);

// Populates `character` for one gear assignment and scores it.
//
// Writes the combination's base attributes, then adds the stat deltas of each
// slot's affix; the affix's position within settings.affixes_array[slot] is
// the key into settings.affix_stats_array[slot]. An affix missing from its
// slot's candidate list stops delta accumulation, is logged, and fails the
// leaf (false, `anomaly` filled if provided).
//
// Precondition: character.clear() since the last evaluation (std::logic_error
// otherwise).
//
// Returns false if the leaf is anomalous or the character is invalid; the
// score attributes are unspecified in that case.
bool test_character(Character& character,
                    const Settings& settings,
                    const Combination& combination,
                    const Gear& gear,
                    std::string* anomaly = nullptr);

// Runs the modifier/derivation pipeline on base_attributes, checks validity
// and computes Damage, Survivability and Healing. `no_rounding` disables the
// ties-to-even rounding of point conversions and Health.
bool update_attributes(Character& character,
                       const Settings& settings,
                       const Combination& combination,
                       bool no_rounding = false);

// Pipeline stages, exposed for tests and result analysis.
void calc_stats(Character& character, const Settings& settings, const Combination& combination, bool no_rounding);
double calc_power(Character& character, const Settings& settings, const Combination& combination);
double calc_condi(Character& character, const Settings& settings, const Combination& combination);
void calc_survivability(Character& character, const Combination& combination);
void calc_healing(Character& character);

// (factor * cdmg + base) * mult for one tick of `condition`.
double condition_damage_tick(Condition condition, double cdmg, double mult, bool wvw, bool special);

} // namespace gearopt

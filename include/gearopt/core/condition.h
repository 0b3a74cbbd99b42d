#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "gearopt/core/attribute.h"

namespace gearopt {

// Damage-over-time effects scored by calc_condi.
enum class Condition : std::uint8_t {
  Bleeding = 0,
  Burning,
  Confusion,
  Poison,
  Torment,
};

// Tick formula: factor * ConditionDamage + base.
//
// `special` selects the alternate tick (Confusion while the target acts,
// Torment while the target moves). Conditions without a special tick ignore it.
double condition_factor(Condition c, bool wvw, bool special);
double condition_base_damage(Condition c, bool wvw, bool special);

bool condition_has_special_tick(Condition c);

Attribute condition_coefficient_attribute(Condition c);
Attribute condition_duration_attribute(Condition c);
Attribute condition_damage_tick_attribute(Condition c);
Attribute condition_stacks_attribute(Condition c);
Attribute condition_dps_attribute(Condition c);

// Damage multiplier key specific to this condition (e.g. OutgoingBleedingDamage).
Attribute condition_damage_mod_attribute(Condition c);

std::string condition_to_string(Condition c);
std::optional<Condition> condition_from_string(const std::string& s);

} // namespace gearopt

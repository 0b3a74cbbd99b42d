#pragma once

#include <utility>
#include <vector>

#include "gearopt/core/attribute.h"
#include "gearopt/core/condition.h"

namespace gearopt {

// (source attribute, fraction of the source added to the target)
using Conversion = std::vector<std::pair<Attribute, double>>;

// Flat (attribute, value) deltas.
using AttributeDeltas = std::vector<std::pair<Attribute, double>>;

struct Modifiers {
  // Applied in list order, reading pre-conversion base values.
  std::vector<std::pair<Attribute, Conversion>> convert;

  // Flat bonuses, applied after `convert`.
  AttributeDeltas buff;

  // Like `convert`, but reads the post-buff working values.
  std::vector<std::pair<Attribute, Conversion>> convert_after_buffs;

  // Multiplier per Outgoing*/Incoming* key. Keys never set stay at 1.0.
  AttributesArray damage_multiplier{1.0};

  double get_dmg_multiplier(Attribute a) const { return damage_multiplier.get(a); }
};

// One "extras" configuration (runes, sigils, food, base stats) that every
// gear assignment is tested against.
struct Combination {
  AttributeDeltas base_attributes;
  Modifiers modifiers;
  std::vector<Condition> relevant_conditions;
};

} // namespace gearopt

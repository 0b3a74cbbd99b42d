#include "gearopt/core/character.h"

#include <algorithm>
#include <stdexcept>

#include "gearopt/core/settings.h"

namespace gearopt {

Character::Character(std::size_t slots, Attribute rank_attribute)
    : gear(slots, Affix::None), rankby(rank_attribute) {}

void Character::clear() {
  std::fill(gear.begin(), gear.end(), Affix::None);
  base_attributes.fill(0.0);
  attributes.fill(0.0);
  combination_id = 0;
  in_use_ = false;
}

void Character::begin_evaluation() {
  if (in_use_) throw std::logic_error("Character reused without clear()");
  in_use_ = true;
}

bool Character::is_invalid(const Settings& settings) const {
  const Constraints& c = settings.constraints;
  const double boon_duration = attributes.get(Attribute::BoonDuration);
  const double crit_chance = attributes.get(Attribute::CriticalChance);
  const double toughness = attributes.get(Attribute::Toughness);

  if (c.min_boon_duration && boon_duration < *c.min_boon_duration / 100.0) return true;
  if (c.min_crit_chance && crit_chance < *c.min_crit_chance / 100.0) return true;
  if (c.min_healing_power && attributes.get(Attribute::HealingPower) < *c.min_healing_power) return true;
  if (c.min_toughness && toughness < *c.min_toughness) return true;
  if (c.max_toughness && toughness > *c.max_toughness) return true;
  if (c.min_health && attributes.get(Attribute::Health) < *c.min_health) return true;
  return false;
}

} // namespace gearopt

#include "gearopt/core/condition.h"

namespace gearopt {
namespace {

struct TickData {
  double factor;
  double base;
  double wvw_factor;
  double wvw_base;
};

// Values as shown by in-game tooltips (PvE / WvW split).
constexpr TickData kBleeding{0.06, 22.0, 0.06, 22.0};
constexpr TickData kBurning{0.155, 131.0, 0.155, 131.0};
constexpr TickData kConfusion{0.03, 11.0, 0.0175, 10.0};
constexpr TickData kConfusionActive{0.195, 95.0, 0.12, 60.0};
constexpr TickData kPoison{0.06, 33.5, 0.06, 33.5};
constexpr TickData kTorment{0.09, 31.8, 0.06, 22.0};
constexpr TickData kTormentMoving{0.06, 22.0, 0.06, 22.0};

const TickData& tick_data(Condition c, bool special) {
  switch (c) {
    case Condition::Bleeding: return kBleeding;
    case Condition::Burning: return kBurning;
    case Condition::Confusion: return special ? kConfusionActive : kConfusion;
    case Condition::Poison: return kPoison;
    case Condition::Torment: return special ? kTormentMoving : kTorment;
  }
  return kBleeding;
}

// Per-condition attributes are laid out as five consecutive slots starting at
// <Condition>Coefficient.
Attribute condition_slot(Condition c, int offset) {
  Attribute first = Attribute::BleedingCoefficient;
  switch (c) {
    case Condition::Bleeding: first = Attribute::BleedingCoefficient; break;
    case Condition::Burning: first = Attribute::BurningCoefficient; break;
    case Condition::Confusion: first = Attribute::ConfusionCoefficient; break;
    case Condition::Poison: first = Attribute::PoisonCoefficient; break;
    case Condition::Torment: first = Attribute::TormentCoefficient; break;
  }
  return static_cast<Attribute>(attribute_index(first) + static_cast<std::size_t>(offset));
}

static_assert(attribute_index(Attribute::BurningCoefficient) - attribute_index(Attribute::BleedingCoefficient) == 5,
              "condition attribute blocks must be five slots wide");
static_assert(attribute_index(Attribute::TormentDPS) - attribute_index(Attribute::TormentCoefficient) == 4,
              "condition attribute blocks must be five slots wide");

} // namespace

double condition_factor(Condition c, bool wvw, bool special) {
  const TickData& d = tick_data(c, special);
  return wvw ? d.wvw_factor : d.factor;
}

double condition_base_damage(Condition c, bool wvw, bool special) {
  const TickData& d = tick_data(c, special);
  return wvw ? d.wvw_base : d.base;
}

bool condition_has_special_tick(Condition c) {
  return c == Condition::Confusion || c == Condition::Torment;
}

Attribute condition_coefficient_attribute(Condition c) { return condition_slot(c, 0); }
Attribute condition_duration_attribute(Condition c) { return condition_slot(c, 1); }
Attribute condition_damage_tick_attribute(Condition c) { return condition_slot(c, 2); }
Attribute condition_stacks_attribute(Condition c) { return condition_slot(c, 3); }
Attribute condition_dps_attribute(Condition c) { return condition_slot(c, 4); }

Attribute condition_damage_mod_attribute(Condition c) {
  switch (c) {
    case Condition::Bleeding: return Attribute::OutgoingBleedingDamage;
    case Condition::Burning: return Attribute::OutgoingBurningDamage;
    case Condition::Confusion: return Attribute::OutgoingConfusionDamage;
    case Condition::Poison: return Attribute::OutgoingPoisonDamage;
    case Condition::Torment: return Attribute::OutgoingTormentDamage;
  }
  return Attribute::OutgoingBleedingDamage;
}

std::string condition_to_string(Condition c) {
  switch (c) {
    case Condition::Bleeding: return "Bleeding";
    case Condition::Burning: return "Burning";
    case Condition::Confusion: return "Confusion";
    case Condition::Poison: return "Poison";
    case Condition::Torment: return "Torment";
  }
  return "Bleeding";
}

std::optional<Condition> condition_from_string(const std::string& s) {
  if (s == "Bleeding") return Condition::Bleeding;
  if (s == "Burning") return Condition::Burning;
  if (s == "Confusion") return Condition::Confusion;
  if (s == "Poison") return Condition::Poison;
  if (s == "Torment") return Condition::Torment;
  return std::nullopt;
}

} // namespace gearopt

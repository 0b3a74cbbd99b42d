#include <cmath>
#include <iostream>

#include "gearopt/core/character.h"
#include "gearopt/core/combination.h"
#include "gearopt/core/condition.h"
#include "gearopt/core/settings.h"
#include "gearopt/core/stat_evaluator.h"

#define GEAROPT_ASSERT(expr) \
  do { \
    if (!(expr)) { \
      std::cerr << "ASSERT failed: " #expr " (" << __FILE__ << ":" << __LINE__ << ")\n"; \
      return 1; \
    } \
  } while (0)

namespace {

bool near(double a, double b, double eps = 1e-9) { return std::fabs(a - b) <= eps; }

// Character with 1000 condition damage and one stack of `cond` (no duration bonus).
gearopt::Character condi_character(gearopt::Condition cond, double coefficient = 1.0) {
  using namespace gearopt;
  Character c(0, Attribute::Damage);
  c.attributes.set(Attribute::ConditionDamage, 1000.0);
  c.attributes.set(condition_coefficient_attribute(cond), coefficient);
  return c;
}

} // namespace

int test_damage_formulas() {
  using namespace gearopt;

  GEAROPT_ASSERT(near(condition_damage_tick(Condition::Bleeding, 1000.0, 1.0, false, false), 82.0));
  GEAROPT_ASSERT(near(condition_damage_tick(Condition::Burning, 1000.0, 1.0, false, false), 286.0));
  GEAROPT_ASSERT(near(condition_damage_tick(Condition::Poison, 1000.0, 2.0, false, false), 187.0));
  GEAROPT_ASSERT(near(condition_damage_tick(Condition::Confusion, 1000.0, 1.0, true, false), 27.5));
  GEAROPT_ASSERT(near(condition_damage_tick(Condition::Confusion, 1000.0, 1.0, true, true), 180.0));
  GEAROPT_ASSERT(near(condition_damage_tick(Condition::Torment, 1000.0, 1.0, true, false), 82.0));

  Settings settings;
  Combination combo;

  // Torment blends normal and moving ticks by movement uptime.
  {
    combo.relevant_conditions = {Condition::Torment};

    settings.movement_uptime = 0.0;
    Character still = condi_character(Condition::Torment);
    GEAROPT_ASSERT(near(calc_condi(still, settings, combo), 121.8));
    GEAROPT_ASSERT(near(still.attributes.get(Attribute::TormentDamageTick), 121.8));

    settings.movement_uptime = 1.0;
    Character moving = condi_character(Condition::Torment);
    GEAROPT_ASSERT(near(calc_condi(moving, settings, combo), 82.0));

    settings.movement_uptime = 0.5;
    Character half = condi_character(Condition::Torment);
    GEAROPT_ASSERT(near(calc_condi(half, settings, combo), 101.9));
    settings.movement_uptime = 0.0;
  }

  // Confusion adds the active tick scaled by the attack rate.
  {
    combo.relevant_conditions = {Condition::Confusion};
    settings.attack_rate = 0.5;
    Character c = condi_character(Condition::Confusion);
    GEAROPT_ASSERT(near(calc_condi(c, settings, combo), 41.0 + 290.0 * 0.5));

    settings.attack_rate = 0.0;
    Character idle = condi_character(Condition::Confusion);
    GEAROPT_ASSERT(near(calc_condi(idle, settings, combo), 41.0));
  }

  // Duration: per-condition plus expertise, total bonus capped at 100%.
  {
    combo.relevant_conditions = {Condition::Bleeding};
    Character c = condi_character(Condition::Bleeding, 2.0);
    c.attributes.set(Attribute::Expertise, 1500.0);
    c.attributes.set(Attribute::BleedingDuration, 0.5);
    GEAROPT_ASSERT(near(calc_condi(c, settings, combo), 2.0 * 2.0 * 82.0));
    GEAROPT_ASSERT(near(c.attributes.get(Attribute::ConditionDuration), 1.0));
    GEAROPT_ASSERT(near(c.attributes.get(Attribute::BleedingStacks), 4.0));

    Character partial = condi_character(Condition::Bleeding, 2.0);
    partial.attributes.set(Attribute::Expertise, 300.0);
    GEAROPT_ASSERT(near(calc_condi(partial, settings, combo), 2.0 * 1.2 * 82.0));
  }

  // Multipliers stack; a non-positive tick counts stacks only.
  {
    combo.relevant_conditions = {Condition::Burning};
    combo.modifiers.damage_multiplier.set(Attribute::OutgoingConditionDamage, 1.1);
    combo.modifiers.damage_multiplier.set(Attribute::OutgoingBurningDamage, 1.2);
    Character c = condi_character(Condition::Burning);
    GEAROPT_ASSERT(near(calc_condi(c, settings, combo), 286.0 * 1.1 * 1.2, 1e-9));

    combo.modifiers.damage_multiplier.set(Attribute::OutgoingBurningDamage, 0.0);
    Character zero = condi_character(Condition::Burning, 3.0);
    GEAROPT_ASSERT(near(calc_condi(zero, settings, combo), 3.0));
    combo.modifiers.damage_multiplier.fill(1.0);
  }

  // Irrelevant conditions contribute nothing.
  {
    combo.relevant_conditions.clear();
    Character c = condi_character(Condition::Bleeding);
    GEAROPT_ASSERT(calc_condi(c, settings, combo) == 0.0);
  }

  // Strike sources: clone professions use phantasm stats, others the Alt path.
  {
    Combination strike;
    Character c(0, Attribute::Damage);
    c.attributes.set(Attribute::Power, 1000.0);
    c.attributes.set(Attribute::Power2Coefficient, kReferenceArmor);
    c.attributes.set(Attribute::AltPower, 2000.0);
    c.attributes.set(Attribute::SiphonBaseCoefficient, 50.0);
    strike.modifiers.damage_multiplier.set(Attribute::OutgoingSiphonDamage, 2.0);

    Settings warrior;
    warrior.profession = "Warrior";
    GEAROPT_ASSERT(near(calc_power(c, warrior, strike), 2000.0 + 100.0));
    GEAROPT_ASSERT(near(c.attributes.get(Attribute::Power2DPS), 2000.0));
    GEAROPT_ASSERT(near(c.attributes.get(Attribute::SiphonDPS), 100.0));

    Settings mesmer;
    mesmer.profession = "Mesmer";
    strike.modifiers.damage_multiplier.set(Attribute::OutgoingPhantasmDamage, 1.5);
    GEAROPT_ASSERT(near(calc_power(c, mesmer, strike), 1500.0 + 100.0));
    GEAROPT_ASSERT(near(c.attributes.get(Attribute::PhantasmEffectivePower), 1500.0));
  }

  // Survivability and healing.
  {
    Combination defense;
    defense.modifiers.damage_multiplier.set(Attribute::IncomingStrikeDamage, 0.5);
    Character c(0, Attribute::Survivability);
    c.attributes.set(Attribute::Health, 10000.0);
    c.attributes.set(Attribute::Armor, 1000.0);
    c.attributes.set(Attribute::Toughness, 1000.0);
    calc_survivability(c, defense);
    GEAROPT_ASSERT(c.attributes.get(Attribute::Armor) == 2000.0);
    GEAROPT_ASSERT(near(c.attributes.get(Attribute::EffectiveHealth), 4.0e7));
    GEAROPT_ASSERT(near(c.attributes.get(Attribute::Survivability), 4.0e7 / kSurvivabilityDivisor, 1e-6));

    c.attributes.set(Attribute::HealingPower, 1000.0);
    c.attributes.set(Attribute::OutgoingHealing, 0.1);
    calc_healing(c);
    GEAROPT_ASSERT(near(c.attributes.get(Attribute::Healing), 690.0 * 1.1, 1e-9));
  }

  return 0;
}

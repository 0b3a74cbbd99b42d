#include <cmath>
#include <iostream>
#include <stdexcept>
#include <string>

#include "gearopt/core/character.h"
#include "gearopt/core/combination.h"
#include "gearopt/core/settings.h"
#include "gearopt/core/stat_evaluator.h"
#include "gearopt/util/log.h"
#include "test.h"

#define GEAROPT_ASSERT(expr) \
  do { \
    if (!(expr)) { \
      std::cerr << "ASSERT failed: " #expr " (" << __FILE__ << ":" << __LINE__ << ")\n"; \
      return 1; \
    } \
  } while (0)

namespace {

bool near(double a, double b, double eps = 1e-9) { return std::fabs(a - b) <= eps; }

gearopt::Settings one_slot_settings() {
  using namespace gearopt;
  Settings s;
  s.slots = 1;
  s.affixes_array = {{Affix::Berserker, Affix::Assassin}};
  s.affix_stats_array = {{
      {{Attribute::Power, 100.0}},
      {{Attribute::Power, 50.0}, {Attribute::Precision, 210.0}},
  }};
  s.rankby = Attribute::Damage;
  s.profession = "Warrior";
  return s;
}

// Strike-only baseline: 1000 power, no crit, coefficient equal to the
// reference armor so PowerDPS == EffectivePower.
gearopt::Combination strike_combination() {
  using namespace gearopt;
  Combination c;
  c.base_attributes = {
      {Attribute::Power, 1000.0},
      {Attribute::Precision, 1000.0},
      {Attribute::CriticalDamage, 1.5},
      {Attribute::PowerCoefficient, kReferenceArmor},
      {Attribute::Health, 10000.0},
      {Attribute::Armor, 1000.0},
  };
  return c;
}

} // namespace

int test_stat_evaluator() {
  using namespace gearopt;

  GEAROPT_ASSERT(round_even(2.5) == 2.0);
  GEAROPT_ASSERT(round_even(3.5) == 4.0);
  GEAROPT_ASSERT(round_even(-2.5) == -2.0);
  GEAROPT_ASSERT(round_even(2.4) == 2.0);
  GEAROPT_ASSERT(round_even(2.6) == 3.0);

  const Settings settings = one_slot_settings();

  // Convert-stage contributions to point attributes round half to even.
  {
    Combination combo;
    combo.modifiers.convert = {{Attribute::Precision, {{Attribute::Power, 0.1}}}};

    Character c(1, Attribute::Damage);
    c.base_attributes.set(Attribute::Power, 25.0);
    c.base_attributes.set(Attribute::Precision, 1000.0);
    calc_stats(c, settings, combo, false);
    GEAROPT_ASSERT(c.attributes.get(Attribute::Precision) == 1002.0);

    calc_stats(c, settings, combo, true);
    GEAROPT_ASSERT(c.attributes.get(Attribute::Precision) == 1002.5);

    // Non-point targets are never rounded.
    Combination frac;
    frac.modifiers.convert = {{Attribute::CriticalChance, {{Attribute::Power, 0.1}}}};
    calc_stats(c, settings, frac, false);
    GEAROPT_ASSERT(near(c.attributes.get(Attribute::CriticalChance), 2.5));
  }

  // Conversions read base values; post-buff conversions read buffed values.
  {
    Combination combo;
    combo.modifiers.convert = {{Attribute::Ferocity, {{Attribute::Power, 0.1}}}};
    combo.modifiers.buff = {{Attribute::Power, 100.0}};
    combo.modifiers.convert_after_buffs = {{Attribute::ConditionDamage, {{Attribute::Power, 0.5}}}};

    Character c(1, Attribute::Damage);
    c.base_attributes.set(Attribute::Power, 1000.0);
    calc_stats(c, settings, combo, false);
    GEAROPT_ASSERT(c.attributes.get(Attribute::Power) == 1100.0);
    GEAROPT_ASSERT(c.attributes.get(Attribute::Ferocity) == 100.0);
    GEAROPT_ASSERT(c.attributes.get(Attribute::ConditionDamage) == 550.0);
  }

  // Probability sources of post-buff conversions are clamped to [0, 1].
  {
    Combination over;
    over.modifiers.buff = {{Attribute::CriticalChance, 1.5}};
    over.modifiers.convert_after_buffs = {{Attribute::Ferocity, {{Attribute::CriticalChance, 200.0}}}};

    Character c(1, Attribute::Damage);
    c.base_attributes.set(Attribute::Precision, 1000.0);
    calc_stats(c, settings, over, false);
    GEAROPT_ASSERT(c.attributes.get(Attribute::Ferocity) == 200.0);

    Combination under;
    under.modifiers.buff = {{Attribute::CriticalChance, -0.2}};
    under.modifiers.convert_after_buffs = {{Attribute::Ferocity, {{Attribute::CriticalChance, 200.0}}}};
    calc_stats(c, settings, under, false);
    GEAROPT_ASSERT(c.attributes.get(Attribute::Ferocity) == 0.0);

    Combination phantasm;
    phantasm.modifiers.buff = {{Attribute::PhantasmCriticalChance, 1.5}, {Attribute::CloneCriticalChance, -0.2}};
    phantasm.modifiers.convert_after_buffs = {
        {Attribute::Power, {{Attribute::PhantasmCriticalChance, 100.0}}},
        {Attribute::Precision, {{Attribute::CloneCriticalChance, 100.0}}},
        {Attribute::BoonDuration, {{Attribute::PhantasmCriticalChance, 0.5}}},
    };
    calc_stats(c, settings, phantasm, false);
    GEAROPT_ASSERT(c.attributes.get(Attribute::Power) == 100.0);
    GEAROPT_ASSERT(c.attributes.get(Attribute::Precision) == 1000.0);
    GEAROPT_ASSERT(near(c.attributes.get(Attribute::BoonDuration), 0.5));

    // The stored value itself stays unclamped.
    GEAROPT_ASSERT(c.attributes.get(Attribute::PhantasmCriticalChance) == 1.5);
  }

  // Derived stats.
  {
    Combination combo;
    combo.base_attributes = {};
    Character c(1, Attribute::Damage);
    c.base_attributes.set(Attribute::Precision, 1210.0);
    c.base_attributes.set(Attribute::Ferocity, 150.0);
    c.base_attributes.set(Attribute::Concentration, 150.0);
    c.base_attributes.set(Attribute::CriticalDamage, 1.5);
    c.base_attributes.set(Attribute::Health, 1000.0);
    c.base_attributes.set(Attribute::Vitality, 100.0);
    c.base_attributes.set(Attribute::MaxHealth, 0.1);
    calc_stats(c, settings, combo, false);
    GEAROPT_ASSERT(near(c.attributes.get(Attribute::CriticalChance), 0.1));
    GEAROPT_ASSERT(near(c.attributes.get(Attribute::CriticalDamage), 1.6));
    GEAROPT_ASSERT(near(c.attributes.get(Attribute::BoonDuration), 0.1));
    GEAROPT_ASSERT(c.attributes.get(Attribute::Health) == 2200.0);

    // Health rounding follows the same switch.
    Character h(1, Attribute::Damage);
    h.base_attributes.set(Attribute::Health, 0.25);
    h.base_attributes.set(Attribute::MaxHealth, 1.0);
    calc_stats(h, settings, combo, false);
    GEAROPT_ASSERT(h.attributes.get(Attribute::Health) == 0.0);
    calc_stats(h, settings, combo, true);
    GEAROPT_ASSERT(h.attributes.get(Attribute::Health) == 0.5);
  }

  // Clone/phantasm stats only for clone professions; Alt stats only with a
  // second strike coefficient.
  {
    Combination combo;
    Settings mesmer = settings;
    mesmer.profession = "Mesmer";

    Character c(1, Attribute::Damage);
    c.base_attributes.set(Attribute::Precision, 1210.0);
    c.base_attributes.set(Attribute::Ferocity, 150.0);
    c.base_attributes.set(Attribute::Power2Coefficient, 1.0);
    c.base_attributes.set(Attribute::AltPrecision, 210.0);
    calc_stats(c, mesmer, combo, false);
    GEAROPT_ASSERT(near(c.attributes.get(Attribute::CloneCriticalChance), 0.1));
    GEAROPT_ASSERT(near(c.attributes.get(Attribute::PhantasmCriticalChance), 0.1));
    GEAROPT_ASSERT(near(c.attributes.get(Attribute::PhantasmCriticalDamage), 0.1));
    GEAROPT_ASSERT(c.attributes.get(Attribute::AltCriticalChance) == 0.0);

    c.base_attributes.set(Attribute::Power, 1000.0);
    calc_stats(c, settings, combo, false);
    GEAROPT_ASSERT(c.attributes.get(Attribute::CloneCriticalChance) == 0.0);
    GEAROPT_ASSERT(c.attributes.get(Attribute::AltPower) == 1000.0);
    GEAROPT_ASSERT(near(c.attributes.get(Attribute::AltCriticalChance), 0.2));
    GEAROPT_ASSERT(near(c.attributes.get(Attribute::AltCriticalDamage), 0.1));

    c.base_attributes.set(Attribute::Power2Coefficient, 0.0);
    calc_stats(c, settings, combo, false);
    GEAROPT_ASSERT(c.attributes.get(Attribute::AltPower) == 0.0);
  }

  // Full evaluation of one leaf.
  {
    const Combination combo = strike_combination();
    Character c(1, Attribute::Damage);
    GEAROPT_ASSERT(test_character(c, settings, combo, Gear{Affix::Berserker}));
    GEAROPT_ASSERT(c.gear == Gear{Affix::Berserker});
    GEAROPT_ASSERT(c.base_attributes.get(Attribute::Power) == 1100.0);
    GEAROPT_ASSERT(near(c.attributes.get(Attribute::EffectivePower), 1100.0));
    GEAROPT_ASSERT(near(c.attributes.get(Attribute::Damage), 1100.0));
    GEAROPT_ASSERT(near(c.rank_value(), 1100.0));

    // Crit chance is clamped to 1 for effective power.
    c.clear();
    Combination crit = combo;
    crit.base_attributes.emplace_back(Attribute::CriticalChance, 1.5);
    GEAROPT_ASSERT(test_character(c, settings, crit, Gear{Affix::Berserker}));
    GEAROPT_ASSERT(near(c.attributes.get(Attribute::EffectivePower), 1100.0 * 1.5));

    // Outgoing strike multiplier and flat DPS.
    c.clear();
    Combination mult = combo;
    mult.modifiers.damage_multiplier.set(Attribute::OutgoingStrikeDamage, 1.1);
    mult.base_attributes.emplace_back(Attribute::FlatDPS, 7.0);
    GEAROPT_ASSERT(test_character(c, settings, mult, Gear{Affix::Berserker}));
    GEAROPT_ASSERT(near(c.attributes.get(Attribute::Damage), 1210.0 + 7.0, 1e-6));
  }

  // Identical inputs on a cleared character give identical results.
  {
    const Combination combo = strike_combination();
    Character a(1, Attribute::Damage);
    Character b(1, Attribute::Damage);
    GEAROPT_ASSERT(test_character(a, settings, combo, Gear{Affix::Assassin}));
    GEAROPT_ASSERT(test_character(b, settings, combo, Gear{Affix::Assassin}));
    GEAROPT_ASSERT(a.attributes == b.attributes);
    a.clear();
    GEAROPT_ASSERT(test_character(a, settings, combo, Gear{Affix::Assassin}));
    GEAROPT_ASSERT(a.attributes == b.attributes);
  }

  // Evaluating again without clear() is rejected.
  {
    const Combination combo = strike_combination();
    Character c(1, Attribute::Damage);
    GEAROPT_ASSERT(c.is_cleared());
    GEAROPT_ASSERT(test_character(c, settings, combo, Gear{Affix::Berserker}));
    GEAROPT_ASSERT(!c.is_cleared());
    bool threw = false;
    try {
      (void)test_character(c, settings, combo, Gear{Affix::Berserker});
    } catch (const std::logic_error&) {
      threw = true;
    }
    GEAROPT_ASSERT(threw);
  }

  // An affix outside its slot's candidates fails the leaf without throwing.
  {
    const ScopedLogLevel quiet(log::Level::Off);

    const Combination combo = strike_combination();
    Character c(1, Attribute::Damage);
    std::string anomaly;
    const bool ok = test_character(c, settings, combo, Gear{Affix::Viper}, &anomaly);

    GEAROPT_ASSERT(!ok);
    GEAROPT_ASSERT(anomaly.find("Viper") != std::string::npos);
  }

  // Unused slots accept Affix::None.
  {
    Settings two = settings;
    two.slots = 2;
    two.affixes_array.push_back({});
    two.affix_stats_array.push_back({});
    Character c(2, Attribute::Damage);
    GEAROPT_ASSERT(test_character(c, two, strike_combination(), Gear{Affix::Berserker, Affix::None}));
    GEAROPT_ASSERT(near(c.attributes.get(Attribute::Damage), 1100.0));
  }

  // Constraints. Percent bounds are compared against fractions.
  {
    const Combination combo = strike_combination();
    Character c(1, Attribute::Damage);

    Settings s = settings;
    s.constraints.min_crit_chance = 10.0;
    GEAROPT_ASSERT(test_character(c, s, combo, Gear{Affix::Assassin}));  // 1210 precision -> 10%
    c.clear();
    GEAROPT_ASSERT(!test_character(c, s, combo, Gear{Affix::Berserker}));  // 0%

    s = settings;
    s.constraints.min_toughness = 1.0;
    c.clear();
    GEAROPT_ASSERT(!test_character(c, s, combo, Gear{Affix::Berserker}));

    s = settings;
    s.constraints.max_toughness = 0.0;
    c.clear();
    GEAROPT_ASSERT(test_character(c, s, combo, Gear{Affix::Berserker}));

    s = settings;
    s.constraints.min_health = 10001.0;
    c.clear();
    GEAROPT_ASSERT(!test_character(c, s, combo, Gear{Affix::Berserker}));

    s = settings;
    s.constraints.min_boon_duration = 1.0;
    c.clear();
    GEAROPT_ASSERT(!test_character(c, s, combo, Gear{Affix::Berserker}));

    s = settings;
    s.constraints.min_healing_power = 0.0;
    c.clear();
    GEAROPT_ASSERT(test_character(c, s, combo, Gear{Affix::Berserker}));
  }

  {
    Settings bad = settings;
    bad.affix_stats_array.clear();
    bad.attack_rate = 2.0;
    GEAROPT_ASSERT(validate_settings(bad).size() == 2);
    GEAROPT_ASSERT(validate_settings(settings).empty());
    GEAROPT_ASSERT(has_clone_mechanics("Mesmer"));
    GEAROPT_ASSERT(!has_clone_mechanics("mesmer"));
  }

  return 0;
}

#include "gearopt/core/stat_evaluator.h"

#include <algorithm>
#include <cmath>
#include <string>

#include "gearopt/util/log.h"

namespace gearopt {

namespace {

double clamp01(double v) { return std::clamp(v, 0.0, 1.0); }

// Probability-like sources are clamped before a post-buff conversion reads them.
bool is_probability_source(Attribute a) {
  return a == Attribute::CriticalChance || a == Attribute::CloneCriticalChance ||
         a == Attribute::PhantasmCriticalChance;
}

// Crit chance gained from precision above the 1000 baseline.
double crit_chance_from_precision(double precision) { return (precision - 1000.0) / 21.0 / 100.0; }
double crit_damage_from_ferocity(double ferocity) { return ferocity / 15.0 / 100.0; }
double duration_from_points(double points) { return points / 15.0 / 100.0; }

double effective_power(double power, double crit_chance, double crit_damage, double mult) {
  return power * (1.0 + clamp01(crit_chance) * (crit_damage - 1.0)) * mult;
}

} // namespace

double round_even(double v) {
  const double floor_v = std::floor(v);
  if (v - floor_v == 0.5) {
    return std::fmod(floor_v, 2.0) == 0.0 ? floor_v : floor_v + 1.0;
  }
  return std::round(v);
}

bool test_character(Character& character,
                    const Settings& settings,
                    const Combination& combination,
                    const Gear& gear,
                    std::string* anomaly) {
  character.begin_evaluation();
  if (character.gear.size() != gear.size()) character.gear.assign(gear.size(), Affix::None);

  for (const auto& [attribute, value] : combination.base_attributes) {
    character.base_attributes.set(attribute, value);
  }

  const std::size_t slots = std::min(gear.size(), settings.affixes_array.size());
  for (std::size_t slot = 0; slot < slots; ++slot) {
    const Affix affix = gear[slot];
    const auto& candidates = settings.affixes_array[slot];

    // Unused slot (e.g. off-hand with a two-handed weapon).
    if (candidates.empty() && affix == Affix::None) {
      character.gear[slot] = Affix::None;
      continue;
    }

    const auto it = std::find(candidates.begin(), candidates.end(), affix);
    if (it == candidates.end()) {
      const std::string msg = "Affix " + affix_to_string(affix) + " not found in candidates of slot " +
                              std::to_string(slot) + "; leaf skipped";
      log::warn(msg);
      if (anomaly) *anomaly = msg;
      return false;
    }

    const auto position = static_cast<std::size_t>(it - candidates.begin());
    if (slot < settings.affix_stats_array.size() && position < settings.affix_stats_array[slot].size()) {
      for (const auto& [attribute, value] : settings.affix_stats_array[slot][position]) {
        character.base_attributes.add(attribute, value);
      }
    }
    character.gear[slot] = affix;
  }

  return update_attributes(character, settings, combination, false);
}

bool update_attributes(Character& character,
                       const Settings& settings,
                       const Combination& combination,
                       bool no_rounding) {
  calc_stats(character, settings, combination, no_rounding);

  if (character.is_invalid(settings)) return false;

  const double power_damage = calc_power(character, settings, combination);
  const double condi_damage = calc_condi(character, settings, combination);

  AttributesArray& attrs = character.attributes;
  attrs.set(Attribute::Damage, power_damage + condi_damage + attrs.get(Attribute::FlatDPS));

  calc_survivability(character, combination);
  calc_healing(character);
  return true;
}

void calc_stats(Character& character, const Settings& settings, const Combination& combination, bool no_rounding) {
  const AttributesArray& base = character.base_attributes;
  AttributesArray& attrs = character.attributes;
  const Modifiers& mods = combination.modifiers;

  attrs = base;

  const auto round = [no_rounding](double v) { return no_rounding ? v : round_even(v); };

  for (const auto& [target, conversion] : mods.convert) {
    const bool point = is_point_attribute(target);
    for (const auto& [source, percent] : conversion) {
      const double v = base.get(source) * percent;
      attrs.add(target, point ? round(v) : v);
    }
  }

  for (const auto& [target, bonus] : mods.buff) {
    attrs.add(target, bonus);
  }

  for (const auto& [target, conversion] : mods.convert_after_buffs) {
    const bool point = is_point_attribute(target);
    for (const auto& [source, percent] : conversion) {
      const double src = is_probability_source(source) ? clamp01(attrs.get(source)) : attrs.get(source);
      const double v = src * percent;
      attrs.add(target, point ? round(v) : v);
    }
  }

  attrs.add(Attribute::CriticalChance, crit_chance_from_precision(attrs.get(Attribute::Precision)));
  attrs.add(Attribute::CriticalDamage, crit_damage_from_ferocity(attrs.get(Attribute::Ferocity)));
  attrs.add(Attribute::BoonDuration, duration_from_points(attrs.get(Attribute::Concentration)));
  attrs.set(Attribute::Health,
            round((attrs.get(Attribute::Health) + attrs.get(Attribute::Vitality) * 10.0) *
                  (1.0 + attrs.get(Attribute::MaxHealth))));

  // Clones and phantasms share the character's precision/ferocity; other
  // professions with a second strike source use the Alt* stats.
  if (has_clone_mechanics(settings.profession)) {
    const double crit_chance = crit_chance_from_precision(attrs.get(Attribute::Precision));
    attrs.add(Attribute::CloneCriticalChance, crit_chance);
    attrs.add(Attribute::PhantasmCriticalChance, crit_chance);
    attrs.add(Attribute::PhantasmCriticalDamage, crit_damage_from_ferocity(attrs.get(Attribute::Ferocity)));
  } else if (attrs.get(Attribute::Power2Coefficient) > 0.0) {
    attrs.add(Attribute::AltPower, attrs.get(Attribute::Power));
    attrs.add(Attribute::AltCriticalChance,
              attrs.get(Attribute::CriticalChance) + attrs.get(Attribute::AltPrecision) / 21.0 / 100.0);
    attrs.add(Attribute::AltCriticalDamage,
              attrs.get(Attribute::CriticalDamage) + crit_damage_from_ferocity(attrs.get(Attribute::AltFerocity)));
  }
}

double calc_power(Character& character, const Settings& settings, const Combination& combination) {
  AttributesArray& attrs = character.attributes;
  const Modifiers& mods = combination.modifiers;

  const double strike_mult = mods.get_dmg_multiplier(Attribute::OutgoingStrikeDamage);
  const double crit_damage =
      attrs.get(Attribute::CriticalDamage) * mods.get_dmg_multiplier(Attribute::OutgoingCriticalDamage);

  attrs.set(Attribute::EffectivePower,
            effective_power(attrs.get(Attribute::Power), attrs.get(Attribute::CriticalChance), crit_damage,
                            strike_mult));
  attrs.set(Attribute::NonCritEffectivePower, attrs.get(Attribute::Power) * strike_mult);

  double power_damage =
      (attrs.get(Attribute::PowerCoefficient) / kReferenceArmor) * attrs.get(Attribute::EffectivePower) +
      (attrs.get(Attribute::NonCritPowerCoefficient) / kReferenceArmor) * attrs.get(Attribute::NonCritEffectivePower);
  attrs.set(Attribute::PowerDPS, power_damage);

  const double power2_coefficient = attrs.get(Attribute::Power2Coefficient);
  if (power2_coefficient > 0.0) {
    double power2_damage = 0.0;
    if (has_clone_mechanics(settings.profession)) {
      const double phantasm_crit_damage = attrs.get(Attribute::PhantasmCriticalDamage) *
                                          mods.get_dmg_multiplier(Attribute::OutgoingPhantasmCriticalDamage);
      attrs.set(Attribute::PhantasmEffectivePower,
                effective_power(attrs.get(Attribute::Power), attrs.get(Attribute::PhantasmCriticalChance),
                                phantasm_crit_damage, mods.get_dmg_multiplier(Attribute::OutgoingPhantasmDamage)));
      power2_damage = (power2_coefficient / kReferenceArmor) * attrs.get(Attribute::PhantasmEffectivePower);
    } else {
      const double alt_crit_damage =
          attrs.get(Attribute::AltCriticalDamage) * mods.get_dmg_multiplier(Attribute::OutgoingAltCriticalDamage);
      attrs.set(Attribute::AltEffectivePower,
                effective_power(attrs.get(Attribute::AltPower), attrs.get(Attribute::AltCriticalChance),
                                alt_crit_damage,
                                strike_mult * mods.get_dmg_multiplier(Attribute::OutgoingAltDamage)));
      power2_damage = (power2_coefficient / kReferenceArmor) * attrs.get(Attribute::AltEffectivePower);
    }
    attrs.set(Attribute::Power2DPS, power2_damage);
    power_damage += power2_damage;
  } else {
    attrs.set(Attribute::Power2DPS, 0.0);
  }

  const double siphon_damage =
      attrs.get(Attribute::SiphonBaseCoefficient) * mods.get_dmg_multiplier(Attribute::OutgoingSiphonDamage);
  attrs.set(Attribute::SiphonDPS, siphon_damage);

  return power_damage + siphon_damage;
}

double condition_damage_tick(Condition condition, double cdmg, double mult, bool wvw, bool special) {
  return (condition_factor(condition, wvw, special) * cdmg + condition_base_damage(condition, wvw, special)) * mult;
}

double calc_condi(Character& character, const Settings& settings, const Combination& combination) {
  AttributesArray& attrs = character.attributes;
  const Modifiers& mods = combination.modifiers;
  const bool wvw = settings.is_wvw();

  attrs.add(Attribute::ConditionDuration, duration_from_points(attrs.get(Attribute::Expertise)));

  double score = 0.0;
  for (const Condition condition : combination.relevant_conditions) {
    const double cdmg = attrs.get(Attribute::ConditionDamage);
    const double mult = mods.get_dmg_multiplier(Attribute::OutgoingConditionDamage) *
                        mods.get_dmg_multiplier(condition_damage_mod_attribute(condition));

    const double normal = condition_damage_tick(condition, cdmg, mult, wvw, false);
    double tick = normal;
    if (condition_has_special_tick(condition)) {
      const double special = condition_damage_tick(condition, cdmg, mult, wvw, true);
      // Confusion adds its on-action tick; Torment blends in its moving tick.
      tick = condition == Condition::Confusion
                 ? normal + special * settings.attack_rate
                 : normal * (1.0 - settings.movement_uptime) + special * settings.movement_uptime;
    }
    attrs.set(condition_damage_tick_attribute(condition), tick);

    const double duration =
        1.0 + clamp01(attrs.get(condition_duration_attribute(condition)) + attrs.get(Attribute::ConditionDuration));
    const double stacks = attrs.get(condition_coefficient_attribute(condition)) * duration;
    attrs.set(condition_stacks_attribute(condition), stacks);

    // A coefficient-only condition (no positive tick) contributes its stacks.
    const double tick_value = attrs.get(condition_damage_tick_attribute(condition));
    const double dps = stacks * (tick_value > 0.0 ? tick_value : 1.0);
    attrs.set(condition_dps_attribute(condition), dps);

    score += dps;
  }
  return score;
}

void calc_survivability(Character& character, const Combination& combination) {
  AttributesArray& attrs = character.attributes;

  attrs.add(Attribute::Armor, attrs.get(Attribute::Toughness));
  attrs.set(Attribute::EffectiveHealth,
            attrs.get(Attribute::Health) * attrs.get(Attribute::Armor) *
                (1.0 / combination.modifiers.get_dmg_multiplier(Attribute::IncomingStrikeDamage)));
  attrs.set(Attribute::Survivability, attrs.get(Attribute::EffectiveHealth) / kSurvivabilityDivisor);
}

void calc_healing(Character& character) {
  AttributesArray& attrs = character.attributes;

  attrs.set(Attribute::EffectiveHealing,
            (attrs.get(Attribute::HealingPower) * kHealingCoefficient + kHealingBase) *
                (1.0 + attrs.get(Attribute::OutgoingHealing)));
  attrs.set(Attribute::Healing, attrs.get(Attribute::EffectiveHealing));
}

} // namespace gearopt

#include "gearopt/core/result_analysis.h"

#include <algorithm>

#include "gearopt/core/stat_evaluator.h"

namespace gearopt {

namespace {

// Scoring without the validity gate: analysis runs on characters that already
// passed it, and probing may push a stat across a bound.
Character rescore(Character c, const Settings& settings, const Combination& combination) {
  calc_stats(c, settings, combination, true);
  AttributesArray& attrs = c.attributes;
  const double power = calc_power(c, settings, combination);
  const double condi = calc_condi(c, settings, combination);
  attrs.set(Attribute::Damage, power + condi + attrs.get(Attribute::FlatDPS));
  calc_survivability(c, combination);
  calc_healing(c);
  return c;
}

double damage_of(const Character& c) { return c.attributes.get(Attribute::Damage); }

} // namespace

const std::vector<Attribute>& probed_stats() {
  static const std::vector<Attribute> kStats = {
      Attribute::Power, Attribute::Precision, Attribute::Ferocity, Attribute::ConditionDamage, Attribute::Expertise,
  };
  return kStats;
}

const std::vector<Attribute>& indicator_attributes() {
  static const std::vector<Attribute> kIndicators = {
      Attribute::Damage,         Attribute::Survivability,  Attribute::Healing,      Attribute::EffectivePower,
      Attribute::CriticalChance, Attribute::CriticalDamage, Attribute::BoonDuration, Attribute::ConditionDuration,
      Attribute::Health,         Attribute::Armor,
  };
  return kIndicators;
}

CharacterAnalysis analyze_character(const Character& character,
                                    const Settings& settings,
                                    const Combination& combination) {
  CharacterAnalysis out;
  out.value = character.rank_value();

  const Character baseline = rescore(character, settings, combination);
  for (const Attribute a : indicator_attributes()) {
    out.indicators.emplace_back(a, baseline.attributes.get(a));
  }

  for (const Attribute a : probed_stats()) {
    Character more = character;
    more.base_attributes.add(a, kStatProbePoints);
    out.effective_positive_values.emplace_back(a, damage_of(rescore(more, settings, combination)) - damage_of(baseline));

    Character less = character;
    less.base_attributes.set(a, std::max(less.base_attributes.get(a) - kStatProbePoints, 0.0));
    out.effective_negative_values.emplace_back(a, damage_of(rescore(less, settings, combination)) - damage_of(baseline));
  }

  const AttributesArray& attrs = baseline.attributes;
  const double total = attrs.get(Attribute::Damage);
  const auto add_share = [&](std::string source, double dps) {
    out.damage_breakdown.push_back(DamageShare{std::move(source), dps, total != 0.0 ? dps / total : 0.0});
  };
  add_share("Power", attrs.get(Attribute::PowerDPS) + attrs.get(Attribute::Power2DPS));
  add_share("Siphon", attrs.get(Attribute::SiphonDPS));
  for (const Condition cond : combination.relevant_conditions) {
    add_share(condition_to_string(cond), attrs.get(condition_dps_attribute(cond)));
  }

  for (const Condition cond : combination.relevant_conditions) {
    Character one = character;
    one.base_attributes.set(condition_coefficient_attribute(cond), 1.0);
    Character zero = character;
    zero.base_attributes.set(condition_coefficient_attribute(cond), 0.0);

    const double dps_one = rescore(one, settings, combination).attributes.get(condition_dps_attribute(cond));
    const double dps_zero = rescore(zero, settings, combination).attributes.get(condition_dps_attribute(cond));
    out.coefficient_helper.push_back(CoefficientHelper{cond, dps_one - dps_zero, dps_zero});
  }
  return out;
}

std::optional<double> coefficient_for_target_dps(const CoefficientHelper& helper, double target_dps) {
  if (helper.slope == 0.0) return std::nullopt;
  return (target_dps - helper.intercept) / helper.slope;
}

} // namespace gearopt

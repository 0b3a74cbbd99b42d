#include <iostream>
#include <stdexcept>
#include <string>

#include "gearopt/core/affix.h"
#include "gearopt/core/attribute.h"
#include "gearopt/core/condition.h"

#define GEAROPT_ASSERT(expr) \
  do { \
    if (!(expr)) { \
      std::cerr << "ASSERT failed: " #expr " (" << __FILE__ << ":" << __LINE__ << ")\n"; \
      return 1; \
    } \
  } while (0)

int test_attributes() {
  using namespace gearopt;

  // Every enumerator has a distinct name that parses back to itself.
  for (std::size_t i = 0; i < kAttributeCount; ++i) {
    const auto a = static_cast<Attribute>(i);
    const auto parsed = attribute_from_string(attribute_to_string(a));
    GEAROPT_ASSERT(parsed.has_value());
    GEAROPT_ASSERT(*parsed == a);
  }
  GEAROPT_ASSERT(attribute_to_string(Attribute::ConditionDamage) == "ConditionDamage");
  GEAROPT_ASSERT(!attribute_from_string("power").has_value());
  GEAROPT_ASSERT(!attribute_from_string("Count").has_value());

  GEAROPT_ASSERT(is_point_attribute(Attribute::Power));
  GEAROPT_ASSERT(is_point_attribute(Attribute::Armor));
  GEAROPT_ASSERT(!is_point_attribute(Attribute::CriticalChance));
  GEAROPT_ASSERT(!is_point_attribute(Attribute::Health));

  {
    AttributesArray attrs;
    GEAROPT_ASSERT(attrs.get(Attribute::Power) == 0.0);
    attrs.set(Attribute::Power, 1000.0);
    attrs.add(Attribute::Power, 25.0);
    GEAROPT_ASSERT(attrs.get(Attribute::Power) == 1025.0);
    attrs.at(Attribute::Toughness) = 3.0;
    GEAROPT_ASSERT(attrs.get(Attribute::Toughness) == 3.0);

    AttributesArray ones(1.0);
    GEAROPT_ASSERT(ones.get(Attribute::IncomingStrikeDamage) == 1.0);
    GEAROPT_ASSERT(ones != attrs);
    ones.fill(0.0);
    GEAROPT_ASSERT(ones == AttributesArray());
  }

  // A value outside the enumeration is a programming error and fails fast.
  {
    AttributesArray attrs;
    bool threw = false;
    try {
      (void)attrs.get(static_cast<Attribute>(200));
    } catch (const std::out_of_range&) {
      threw = true;
    }
    GEAROPT_ASSERT(threw);

    threw = false;
    try {
      attrs.set(Attribute::Count, 1.0);
    } catch (const std::out_of_range&) {
      threw = true;
    }
    GEAROPT_ASSERT(threw);
  }

  GEAROPT_ASSERT(affix_to_string(Affix::Berserker) == "Berserker");
  GEAROPT_ASSERT(affix_from_string("Viper") == Affix::Viper);
  GEAROPT_ASSERT(affix_from_string("None") == Affix::None);
  GEAROPT_ASSERT(!affix_from_string("Zerker").has_value());

  GEAROPT_ASSERT(condition_to_string(Condition::Torment) == "Torment");
  GEAROPT_ASSERT(condition_from_string("Confusion") == Condition::Confusion);
  GEAROPT_ASSERT(!condition_from_string("Vulnerability").has_value());
  GEAROPT_ASSERT(condition_coefficient_attribute(Condition::Poison) == Attribute::PoisonCoefficient);
  GEAROPT_ASSERT(condition_duration_attribute(Condition::Burning) == Attribute::BurningDuration);
  GEAROPT_ASSERT(condition_damage_tick_attribute(Condition::Torment) == Attribute::TormentDamageTick);
  GEAROPT_ASSERT(condition_stacks_attribute(Condition::Bleeding) == Attribute::BleedingStacks);
  GEAROPT_ASSERT(condition_dps_attribute(Condition::Confusion) == Attribute::ConfusionDPS);
  GEAROPT_ASSERT(condition_damage_mod_attribute(Condition::Burning) == Attribute::OutgoingBurningDamage);
  GEAROPT_ASSERT(condition_has_special_tick(Condition::Torment));
  GEAROPT_ASSERT(!condition_has_special_tick(Condition::Poison));

  return 0;
}

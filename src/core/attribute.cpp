#include "gearopt/core/attribute.h"

#include <stdexcept>
#include <string_view>

namespace gearopt {
namespace {

constexpr std::array<std::string_view, kAttributeCount> kAttributeNames = {
    "Power",
    "Precision",
    "Toughness",
    "Vitality",
    "Ferocity",
    "ConditionDamage",
    "Expertise",
    "Concentration",
    "HealingPower",
    "AgonyResistance",
    "AltPower",
    "AltPrecision",
    "AltFerocity",
    "Armor",
    "Health",
    "MaxHealth",
    "CriticalChance",
    "CriticalDamage",
    "BoonDuration",
    "ConditionDuration",
    "AltCriticalChance",
    "AltCriticalDamage",
    "CloneCriticalChance",
    "PhantasmCriticalChance",
    "PhantasmCriticalDamage",
    "PowerCoefficient",
    "NonCritPowerCoefficient",
    "Power2Coefficient",
    "EffectivePower",
    "NonCritEffectivePower",
    "AltEffectivePower",
    "PhantasmEffectivePower",
    "PowerDPS",
    "Power2DPS",
    "SiphonBaseCoefficient",
    "SiphonDPS",
    "FlatDPS",
    "BleedingCoefficient",
    "BleedingDuration",
    "BleedingDamageTick",
    "BleedingStacks",
    "BleedingDPS",
    "BurningCoefficient",
    "BurningDuration",
    "BurningDamageTick",
    "BurningStacks",
    "BurningDPS",
    "ConfusionCoefficient",
    "ConfusionDuration",
    "ConfusionDamageTick",
    "ConfusionStacks",
    "ConfusionDPS",
    "PoisonCoefficient",
    "PoisonDuration",
    "PoisonDamageTick",
    "PoisonStacks",
    "PoisonDPS",
    "TormentCoefficient",
    "TormentDuration",
    "TormentDamageTick",
    "TormentStacks",
    "TormentDPS",
    "OutgoingStrikeDamage",
    "OutgoingCriticalDamage",
    "OutgoingConditionDamage",
    "OutgoingBleedingDamage",
    "OutgoingBurningDamage",
    "OutgoingConfusionDamage",
    "OutgoingPoisonDamage",
    "OutgoingTormentDamage",
    "OutgoingSiphonDamage",
    "OutgoingPhantasmDamage",
    "OutgoingPhantasmCriticalDamage",
    "OutgoingAltDamage",
    "OutgoingAltCriticalDamage",
    "IncomingStrikeDamage",
    "OutgoingHealing",
    "EffectiveHealth",
    "EffectiveHealing",
    "Survivability",
    "Healing",
    "Damage",
};

// A missing or extra name leaves an empty trailing entry or fails to compile.
static_assert(!kAttributeNames[kAttributeCount - 1].empty(), "attribute name table out of sync with Attribute");
static_assert(kAttributeNames[attribute_index(Attribute::Damage)] == "Damage",
              "attribute name table out of sync with Attribute");
static_assert(kAttributeNames[attribute_index(Attribute::OutgoingStrikeDamage)] == "OutgoingStrikeDamage",
              "attribute name table out of sync with Attribute");

} // namespace

std::size_t AttributesArray::checked(Attribute a) {
  const std::size_t idx = attribute_index(a);
  if (idx >= kAttributeCount) {
    throw std::out_of_range("attribute index out of range: " + std::to_string(idx));
  }
  return idx;
}

bool is_point_attribute(Attribute a) {
  switch (a) {
    case Attribute::Power:
    case Attribute::Precision:
    case Attribute::Toughness:
    case Attribute::Vitality:
    case Attribute::Ferocity:
    case Attribute::ConditionDamage:
    case Attribute::Expertise:
    case Attribute::Concentration:
    case Attribute::HealingPower:
    case Attribute::AgonyResistance:
    case Attribute::AltPower:
    case Attribute::AltPrecision:
    case Attribute::AltFerocity:
    case Attribute::Armor:
      return true;
    default:
      return false;
  }
}

std::string attribute_to_string(Attribute a) {
  const std::size_t idx = attribute_index(a);
  if (idx >= kAttributeCount) return "Unknown";
  return std::string(kAttributeNames[idx]);
}

std::optional<Attribute> attribute_from_string(const std::string& s) {
  for (std::size_t i = 0; i < kAttributeCount; ++i) {
    if (kAttributeNames[i] == s) return static_cast<Attribute>(i);
  }
  return std::nullopt;
}

} // namespace gearopt

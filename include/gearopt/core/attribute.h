#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace gearopt {

// Closed set of character attributes. The enumerator value is the slot index
// into AttributesArray; keep `Count` last.
enum class Attribute : std::uint8_t {
  // Points.
  Power = 0,
  Precision,
  Toughness,
  Vitality,
  Ferocity,
  ConditionDamage,
  Expertise,
  Concentration,
  HealingPower,
  AgonyResistance,
  AltPower,
  AltPrecision,
  AltFerocity,

  // Derived.
  Armor,
  Health,
  MaxHealth,
  CriticalChance,
  CriticalDamage,
  BoonDuration,
  ConditionDuration,
  AltCriticalChance,
  AltCriticalDamage,
  CloneCriticalChance,
  PhantasmCriticalChance,
  PhantasmCriticalDamage,

  // Strike / siphon damage.
  PowerCoefficient,
  NonCritPowerCoefficient,
  Power2Coefficient,
  EffectivePower,
  NonCritEffectivePower,
  AltEffectivePower,
  PhantasmEffectivePower,
  PowerDPS,
  Power2DPS,
  SiphonBaseCoefficient,
  SiphonDPS,
  FlatDPS,

  // Conditions.
  BleedingCoefficient,
  BleedingDuration,
  BleedingDamageTick,
  BleedingStacks,
  BleedingDPS,
  BurningCoefficient,
  BurningDuration,
  BurningDamageTick,
  BurningStacks,
  BurningDPS,
  ConfusionCoefficient,
  ConfusionDuration,
  ConfusionDamageTick,
  ConfusionStacks,
  ConfusionDPS,
  PoisonCoefficient,
  PoisonDuration,
  PoisonDamageTick,
  PoisonStacks,
  PoisonDPS,
  TormentCoefficient,
  TormentDuration,
  TormentDamageTick,
  TormentStacks,
  TormentDPS,

  // Damage multiplier keys.
  OutgoingStrikeDamage,
  OutgoingCriticalDamage,
  OutgoingConditionDamage,
  OutgoingBleedingDamage,
  OutgoingBurningDamage,
  OutgoingConfusionDamage,
  OutgoingPoisonDamage,
  OutgoingTormentDamage,
  OutgoingSiphonDamage,
  OutgoingPhantasmDamage,
  OutgoingPhantasmCriticalDamage,
  OutgoingAltDamage,
  OutgoingAltCriticalDamage,
  IncomingStrikeDamage,

  // Scores.
  OutgoingHealing,
  EffectiveHealth,
  EffectiveHealing,
  Survivability,
  Healing,
  Damage,

  Count
};

inline constexpr std::size_t kAttributeCount = static_cast<std::size_t>(Attribute::Count);

constexpr std::size_t attribute_index(Attribute a) { return static_cast<std::size_t>(a); }

// Integer-like stats. Convert-stage contributions to these are rounded.
bool is_point_attribute(Attribute a);

std::string attribute_to_string(Attribute a);
std::optional<Attribute> attribute_from_string(const std::string& s);

// Dense register file with one double per Attribute.
//
// Indexing with anything outside [0, Count) throws std::out_of_range; that can
// only happen through a bad cast and is treated as a programming error.
class AttributesArray {
 public:
  AttributesArray() { values_.fill(0.0); }
  explicit AttributesArray(double fill) { values_.fill(fill); }

  double get(Attribute a) const { return values_[checked(a)]; }
  void set(Attribute a, double v) { values_[checked(a)] = v; }
  void add(Attribute a, double v) { values_[checked(a)] += v; }

  double& at(Attribute a) { return values_[checked(a)]; }
  double at(Attribute a) const { return values_[checked(a)]; }

  void fill(double v) { values_.fill(v); }

  static constexpr std::size_t size() { return kAttributeCount; }

  bool operator==(const AttributesArray& o) const { return values_ == o.values_; }
  bool operator!=(const AttributesArray& o) const { return !(*this == o); }

 private:
  static std::size_t checked(Attribute a);

  std::array<double, kAttributeCount> values_;
};

} // namespace gearopt

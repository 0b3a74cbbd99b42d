#pragma once

#include <cstddef>
#include <cstdint>

#include "gearopt/core/affix.h"
#include "gearopt/core/attribute.h"

namespace gearopt {

struct Settings;

// Scratch evaluation target. One instance is owned by each search loop and
// reused for every (leaf, combination) pair.
//
// Contract: call clear() before every evaluation. test_character() refuses a
// character that was evaluated since its last clear().
struct Character {
  Gear gear;

  // Combination base stats plus gear deltas.
  AttributesArray base_attributes;

  // base_attributes after modifiers, derivation and scoring.
  AttributesArray attributes;

  // Index into the combinations list used for this evaluation.
  std::uint32_t combination_id{0};

  Attribute rankby{Attribute::Damage};

  Character() = default;
  Character(std::size_t slots, Attribute rank_attribute);

  void clear();

  // True if any Settings constraint is violated by `attributes`.
  bool is_invalid(const Settings& settings) const;

  double rank_value() const { return attributes.get(rankby); }

  // Marks the start of an evaluation; throws std::logic_error if the
  // character has not been cleared since the previous one.
  void begin_evaluation();

  bool is_cleared() const { return !in_use_; }

 private:
  bool in_use_{false};
};

} // namespace gearopt

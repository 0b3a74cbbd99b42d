#pragma once

#include <optional>
#include <string>
#include <vector>

#include "gearopt/core/affix.h"
#include "gearopt/core/attribute.h"
#include "gearopt/core/combination.h"

namespace gearopt {

// Optional stat floors/caps. Unset bounds are ignored.
struct Constraints {
  // Percent, compared against BoonDuration / CriticalChance fractions.
  std::optional<double> min_boon_duration;
  std::optional<double> min_crit_chance;

  std::optional<double> min_healing_power;
  std::optional<double> min_toughness;
  std::optional<double> max_toughness;
  std::optional<double> min_health;
};

struct Settings {
  // Gear slot count; also the leaf depth of the search tree.
  int slots{0};

  // Candidate affixes per slot (length == slots).
  SlotCandidates affixes_array;

  // affix_stats_array[slot][i] holds the deltas for affixes_array[slot][i].
  std::vector<std::vector<AttributeDeltas>> affix_stats_array;

  // Damage, Survivability or Healing.
  Attribute rankby{Attribute::Damage};

  std::string profession;

  int max_results{10};

  // Fraction of time the target spends attacking (Confusion active ticks).
  double attack_rate{0.0};

  // Fraction of time the target spends moving (Torment moving ticks).
  double movement_uptime{0.0};

  bool wvw{false};

  Constraints constraints;

  bool is_wvw() const { return wvw; }
};

// Whether the profession scores clone/phantasm strikes instead of the generic
// alternate power path.
//
// Keyed on the profession name; see DESIGN.md for why this is not data driven.
bool has_clone_mechanics(const std::string& profession);

bool is_rank_attribute(Attribute a);

// Structural checks (slot count vs table lengths, stat table shape, rankby,
// rates in [0,1]). Returns human-readable problems; empty means valid.
std::vector<std::string> validate_settings(const Settings& settings);

} // namespace gearopt

#include "gearopt/core/settings.h"

#include <algorithm>
#include <string>

namespace gearopt {

bool has_clone_mechanics(const std::string& profession) { return profession == "Mesmer"; }

bool is_rank_attribute(Attribute a) {
  return a == Attribute::Damage || a == Attribute::Survivability || a == Attribute::Healing;
}

std::vector<std::string> validate_settings(const Settings& settings) {
  std::vector<std::string> errors;

  if (settings.slots < 0) errors.push_back("slots must be >= 0 (got " + std::to_string(settings.slots) + ")");

  const std::size_t slots = settings.slots > 0 ? static_cast<std::size_t>(settings.slots) : 0;
  if (settings.affixes_array.size() != slots) {
    errors.push_back("affixes_array has " + std::to_string(settings.affixes_array.size()) +
                     " slots, expected " + std::to_string(slots));
  }
  if (settings.affix_stats_array.size() != settings.affixes_array.size()) {
    errors.push_back("affix_stats_array has " + std::to_string(settings.affix_stats_array.size()) +
                     " slots, affixes_array has " + std::to_string(settings.affixes_array.size()));
  }

  const std::size_t common = std::min(settings.affixes_array.size(), settings.affix_stats_array.size());
  for (std::size_t slot = 0; slot < common; ++slot) {
    const std::size_t candidates = settings.affixes_array[slot].size();
    const std::size_t stats = settings.affix_stats_array[slot].size();
    if (candidates != stats) {
      errors.push_back("slot " + std::to_string(slot) + ": " + std::to_string(candidates) +
                       " candidate affixes but " + std::to_string(stats) + " stat entries");
    }
  }

  if (!is_rank_attribute(settings.rankby)) {
    errors.push_back("rankby must be Damage, Survivability or Healing (got " +
                     attribute_to_string(settings.rankby) + ")");
  }
  if (settings.max_results < 0) {
    errors.push_back("max_results must be >= 0 (got " + std::to_string(settings.max_results) + ")");
  }
  if (!(settings.attack_rate >= 0.0 && settings.attack_rate <= 1.0)) {
    errors.push_back("attack_rate must be within [0, 1]");
  }
  if (!(settings.movement_uptime >= 0.0 && settings.movement_uptime <= 1.0)) {
    errors.push_back("movement_uptime must be within [0, 1]");
  }
  return errors;
}

} // namespace gearopt

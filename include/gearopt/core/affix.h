#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace gearopt {

// Stat prefix choosable for one gear slot. `None` marks an unused slot, e.g.
// the off-hand when a two-handed weapon is equipped.
enum class Affix : std::uint8_t {
  None = 0,
  Berserker,
  Assassin,
  Harrier,
  Commander,
  Minstrel,
  Magi,
  Marauder,
  Cleric,
  Nomad,
  Zealot,
  Viper,
  Sinister,
  Grieving,
  Trailblazer,
  Seraph,
  Marshal,
  Giver,
  Knight,
  Plaguedoctor,
  Carrion,
  Rabid,
  Dire,
  Vigilant,
  Valkyrie,
  Cavalier,
  Celestial,
  Diviner,
  Wanderer,
  Apothecary,
  Sentinel,
  Soldier,
  Shaman,
  Settler,
  Bringer,
  Ritualist,
  Dragon,
  Demolisher,
  Swashbuckler,
  Rampager,
  Crusader,
};

// Per-slot ordered candidate lists. Position within a slot's list is the key
// into the matching per-slot stat table.
using SlotCandidates = std::vector<std::vector<Affix>>;

// One gear assignment, or a prefix of one (a search chunk).
using Gear = std::vector<Affix>;

std::string affix_to_string(Affix a);
std::optional<Affix> affix_from_string(const std::string& s);

} // namespace gearopt

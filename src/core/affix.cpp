#include "gearopt/core/affix.h"

#include <array>
#include <string_view>

namespace gearopt {
namespace {

constexpr std::array<std::string_view, 41> kAffixNames = {
    "None",        "Berserker", "Assassin", "Harrier",      "Commander",  "Minstrel", "Magi",
    "Marauder",    "Cleric",    "Nomad",    "Zealot",       "Viper",      "Sinister", "Grieving",
    "Trailblazer", "Seraph",    "Marshal",  "Giver",        "Knight",     "Plaguedoctor",
    "Carrion",     "Rabid",     "Dire",     "Vigilant",     "Valkyrie",   "Cavalier", "Celestial",
    "Diviner",     "Wanderer",  "Apothecary", "Sentinel",   "Soldier",    "Shaman",   "Settler",
    "Bringer",     "Ritualist", "Dragon",   "Demolisher",   "Swashbuckler", "Rampager", "Crusader",
};

static_assert(static_cast<std::size_t>(Affix::Crusader) + 1 == kAffixNames.size(),
              "affix name table out of sync with Affix");

} // namespace

std::string affix_to_string(Affix a) {
  const auto idx = static_cast<std::size_t>(a);
  if (idx >= kAffixNames.size()) return "None";
  return std::string(kAffixNames[idx]);
}

std::optional<Affix> affix_from_string(const std::string& s) {
  for (std::size_t i = 0; i < kAffixNames.size(); ++i) {
    if (kAffixNames[i] == s) return static_cast<Affix>(i);
  }
  return std::nullopt;
}

} // namespace gearopt

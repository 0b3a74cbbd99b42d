#include "gearopt/core/serialization.h"

#include <algorithm>
#include <cmath>
#include <limits>
#include <optional>
#include <stdexcept>

#include "gearopt/core/attribute.h"
#include "gearopt/core/condition.h"

namespace gearopt {
namespace {

using json::Array;
using json::Object;
using json::Value;

[[noreturn]] void fail(const std::string& path, const std::string& msg) {
  throw std::runtime_error(path + ": " + msg);
}

std::string index_path(const std::string& path, std::size_t i) { return path + "[" + std::to_string(i) + "]"; }

const Array& array_at(const Value& v, const std::string& path) {
  if (!v.is_array()) fail(path, "expected array");
  return *v.as_array();
}

const Object& object_at(const Value& v, const std::string& path) {
  if (!v.is_object()) fail(path, "expected object");
  return *v.as_object();
}

double number_at(const Value& v, const std::string& path) {
  if (!v.is_number()) fail(path, "expected number");
  return *v.as_number();
}

const std::string& string_at(const Value& v, const std::string& path) {
  if (!v.is_string()) fail(path, "expected string");
  return *v.as_string();
}

const Value& required(const Object& o, const std::string& key, const std::string& path) {
  const auto it = o.find(key);
  if (it == o.end()) fail(path, "missing key '" + key + "'");
  return it->second;
}

const Value* find_value(const Object& o, const std::string& key) {
  const auto it = o.find(key);
  if (it == o.end() || it->second.is_null()) return nullptr;
  return &it->second;
}

int int_at(const Value& v, const std::string& path) {
  const double d = number_at(v, path);
  if (d != std::floor(d)) fail(path, "expected integer");
  if (d < static_cast<double>(std::numeric_limits<int>::min()) ||
      d > static_cast<double>(std::numeric_limits<int>::max())) {
    fail(path, "integer out of range");
  }
  return static_cast<int>(d);
}

Attribute attribute_at(const Value& v, const std::string& path) {
  const std::string& name = string_at(v, path);
  const auto a = attribute_from_string(name);
  if (!a) fail(path, "unknown attribute '" + name + "'");
  return *a;
}

Affix affix_at(const Value& v, const std::string& path) {
  const std::string& name = string_at(v, path);
  const auto a = affix_from_string(name);
  if (!a) fail(path, "unknown affix '" + name + "'");
  return *a;
}

Condition condition_at(const Value& v, const std::string& path) {
  const std::string& name = string_at(v, path);
  const auto c = condition_from_string(name);
  if (!c) fail(path, "unknown condition '" + name + "'");
  return *c;
}

// [["Power", 100], ...]
std::vector<std::pair<Attribute, double>> pairs_from_json(const Value& v, const std::string& path) {
  std::vector<std::pair<Attribute, double>> out;
  const Array& arr = array_at(v, path);
  out.reserve(arr.size());
  for (std::size_t i = 0; i < arr.size(); ++i) {
    const std::string p = index_path(path, i);
    const Array& pair = array_at(arr[i], p);
    if (pair.size() != 2) fail(p, "expected [attribute, number]");
    out.emplace_back(attribute_at(pair[0], p + "[0]"), number_at(pair[1], p + "[1]"));
  }
  return out;
}

// {"Power": 100, ...}; sorted by attribute so the result is independent of
// hash order.
std::vector<std::pair<Attribute, double>> map_from_json(const Value& v, const std::string& path) {
  std::vector<std::pair<Attribute, double>> out;
  for (const auto& [key, value] : object_at(v, path)) {
    const auto a = attribute_from_string(key);
    if (!a) fail(path, "unknown attribute '" + key + "'");
    out.emplace_back(*a, number_at(value, path + "." + key));
  }
  std::sort(out.begin(), out.end(),
            [](const auto& l, const auto& r) { return attribute_index(l.first) < attribute_index(r.first); });
  return out;
}

// [["Precision", [["Power", 0.1]]], ...]
std::vector<std::pair<Attribute, Conversion>> conversions_from_json(const Value& v, const std::string& path) {
  std::vector<std::pair<Attribute, Conversion>> out;
  const Array& arr = array_at(v, path);
  for (std::size_t i = 0; i < arr.size(); ++i) {
    const std::string p = index_path(path, i);
    const Array& pair = array_at(arr[i], p);
    if (pair.size() != 2) fail(p, "expected [attribute, [[source, fraction], ...]]");
    out.emplace_back(attribute_at(pair[0], p + "[0]"), pairs_from_json(pair[1], p + "[1]"));
  }
  return out;
}

std::optional<double> optional_number(const Object& o, const std::string& key, const std::string& path) {
  const Value* v = find_value(o, key);
  if (!v) return std::nullopt;
  return number_at(*v, path + "." + key);
}

Value pairs_to_json(const std::vector<std::pair<Attribute, double>>& pairs) {
  Array arr;
  arr.reserve(pairs.size());
  for (const auto& [a, value] : pairs) arr.push_back(Array{attribute_to_string(a), value});
  return arr;
}

Value conversions_to_json(const std::vector<std::pair<Attribute, Conversion>>& stages) {
  Array arr;
  for (const auto& [target, conversion] : stages) {
    arr.push_back(Array{attribute_to_string(target), pairs_to_json(conversion)});
  }
  return arr;
}

Value nonzero_attributes(const AttributesArray& attrs) {
  Object o;
  for (std::size_t i = 0; i < AttributesArray::size(); ++i) {
    const auto a = static_cast<Attribute>(i);
    const double v = attrs.get(a);
    if (v != 0.0) o[attribute_to_string(a)] = v;
  }
  return o;
}

Value gear_to_json(const Gear& gear) {
  Array arr;
  arr.reserve(gear.size());
  for (const Affix a : gear) arr.push_back(affix_to_string(a));
  return arr;
}

Value attribute_values_to_json(const std::vector<std::pair<Attribute, double>>& values) {
  Object o;
  for (const auto& [a, v] : values) o[attribute_to_string(a)] = v;
  return o;
}

} // namespace

Settings settings_from_json(const Value& v) {
  const std::string path = "settings";
  const Object& o = object_at(v, path);

  Settings s;
  s.slots = int_at(required(o, "slots", path), path + ".slots");
  if (s.slots < 0) fail(path + ".slots", "must be >= 0");

  const Array& affixes = array_at(required(o, "affixes", path), path + ".affixes");
  for (std::size_t slot = 0; slot < affixes.size(); ++slot) {
    const std::string p = index_path(path + ".affixes", slot);
    std::vector<Affix> candidates;
    const Array& names = array_at(affixes[slot], p);
    for (std::size_t i = 0; i < names.size(); ++i) candidates.push_back(affix_at(names[i], index_path(p, i)));
    s.affixes_array.push_back(std::move(candidates));
  }

  const Array& stats = array_at(required(o, "affix_stats", path), path + ".affix_stats");
  for (std::size_t slot = 0; slot < stats.size(); ++slot) {
    const std::string p = index_path(path + ".affix_stats", slot);
    std::vector<AttributeDeltas> per_slot;
    const Array& entries = array_at(stats[slot], p);
    for (std::size_t i = 0; i < entries.size(); ++i) per_slot.push_back(pairs_from_json(entries[i], index_path(p, i)));
    s.affix_stats_array.push_back(std::move(per_slot));
  }

  if (const Value* r = find_value(o, "rankby")) {
    s.rankby = attribute_at(*r, path + ".rankby");
    if (!is_rank_attribute(s.rankby)) fail(path + ".rankby", "must be Damage, Survivability or Healing");
  }
  if (const Value* p = find_value(o, "profession")) s.profession = string_at(*p, path + ".profession");
  if (const Value* m = find_value(o, "max_results")) s.max_results = int_at(*m, path + ".max_results");
  if (const Value* a = find_value(o, "attack_rate")) s.attack_rate = number_at(*a, path + ".attack_rate");
  if (const Value* m = find_value(o, "movement_uptime")) s.movement_uptime = number_at(*m, path + ".movement_uptime");
  if (const Value* w = find_value(o, "wvw")) {
    if (!w->is_bool()) fail(path + ".wvw", "expected bool");
    s.wvw = *w->as_bool();
  }

  if (const Value* c = find_value(o, "constraints")) {
    const std::string cp = path + ".constraints";
    const Object& co = object_at(*c, cp);
    s.constraints.min_boon_duration = optional_number(co, "min_boon_duration", cp);
    s.constraints.min_crit_chance = optional_number(co, "min_crit_chance", cp);
    s.constraints.min_healing_power = optional_number(co, "min_healing_power", cp);
    s.constraints.min_toughness = optional_number(co, "min_toughness", cp);
    s.constraints.max_toughness = optional_number(co, "max_toughness", cp);
    s.constraints.min_health = optional_number(co, "min_health", cp);
  }
  return s;
}

Combination combination_from_json(const Value& v, const std::string& path) {
  const Object& o = object_at(v, path);
  Combination c;

  if (const Value* b = find_value(o, "base_attributes")) {
    c.base_attributes = map_from_json(*b, path + ".base_attributes");
  }

  if (const Value* m = find_value(o, "modifiers")) {
    const std::string mp = path + ".modifiers";
    const Object& mo = object_at(*m, mp);
    if (const Value* cv = find_value(mo, "convert")) c.modifiers.convert = conversions_from_json(*cv, mp + ".convert");
    if (const Value* bf = find_value(mo, "buff")) c.modifiers.buff = pairs_from_json(*bf, mp + ".buff");
    if (const Value* ca = find_value(mo, "convert_after_buffs")) {
      c.modifiers.convert_after_buffs = conversions_from_json(*ca, mp + ".convert_after_buffs");
    }
    if (const Value* dm = find_value(mo, "damage_multiplier")) {
      for (const auto& [a, mult] : map_from_json(*dm, mp + ".damage_multiplier")) {
        c.modifiers.damage_multiplier.set(a, mult);
      }
    }
  }

  if (const Value* rc = find_value(o, "relevant_conditions")) {
    const std::string rp = path + ".relevant_conditions";
    const Array& arr = array_at(*rc, rp);
    for (std::size_t i = 0; i < arr.size(); ++i) c.relevant_conditions.push_back(condition_at(arr[i], index_path(rp, i)));
  }
  return c;
}

SearchJob search_job_from_json(const Value& v) {
  const Object& o = object_at(v, "job");
  SearchJob job;
  job.settings = settings_from_json(required(o, "settings", "job"));

  const Array& combos = array_at(required(o, "combinations", "job"), "combinations");
  job.combinations.reserve(combos.size());
  for (std::size_t i = 0; i < combos.size(); ++i) {
    job.combinations.push_back(combination_from_json(combos[i], index_path("combinations", i)));
  }

  if (const Value* ch = find_value(o, "chunks")) {
    const Array& chunks = array_at(*ch, "chunks");
    for (std::size_t i = 0; i < chunks.size(); ++i) {
      const std::string p = index_path("chunks", i);
      Gear prefix;
      const Array& arr = array_at(chunks[i], p);
      for (std::size_t j = 0; j < arr.size(); ++j) prefix.push_back(affix_at(arr[j], index_path(p, j)));
      job.chunks.push_back(std::move(prefix));
    }
    job.has_chunks = true;
  }
  return job;
}

SearchJob search_job_from_json_text(const std::string& text) { return search_job_from_json(json::parse(text)); }

Value settings_to_json(const Settings& settings) {
  Object o;
  o["slots"] = static_cast<double>(settings.slots);
  o["profession"] = settings.profession;
  o["rankby"] = attribute_to_string(settings.rankby);
  o["max_results"] = static_cast<double>(settings.max_results);
  o["attack_rate"] = settings.attack_rate;
  o["movement_uptime"] = settings.movement_uptime;
  o["wvw"] = settings.wvw;

  Array affixes;
  for (const auto& slot : settings.affixes_array) affixes.push_back(gear_to_json(slot));
  o["affixes"] = affixes;

  Array stats;
  for (const auto& slot : settings.affix_stats_array) {
    Array per_slot;
    for (const auto& deltas : slot) per_slot.push_back(pairs_to_json(deltas));
    stats.push_back(per_slot);
  }
  o["affix_stats"] = stats;

  Object constraints;
  const Constraints& c = settings.constraints;
  if (c.min_boon_duration) constraints["min_boon_duration"] = *c.min_boon_duration;
  if (c.min_crit_chance) constraints["min_crit_chance"] = *c.min_crit_chance;
  if (c.min_healing_power) constraints["min_healing_power"] = *c.min_healing_power;
  if (c.min_toughness) constraints["min_toughness"] = *c.min_toughness;
  if (c.max_toughness) constraints["max_toughness"] = *c.max_toughness;
  if (c.min_health) constraints["min_health"] = *c.min_health;
  o["constraints"] = constraints;
  return o;
}

Value combination_to_json(const Combination& combination) {
  Object o;
  o["base_attributes"] = attribute_values_to_json(combination.base_attributes);

  Object mods;
  mods["convert"] = conversions_to_json(combination.modifiers.convert);
  mods["buff"] = pairs_to_json(combination.modifiers.buff);
  mods["convert_after_buffs"] = conversions_to_json(combination.modifiers.convert_after_buffs);

  // Only multipliers that differ from the 1.0 default.
  Object mults;
  for (std::size_t i = 0; i < AttributesArray::size(); ++i) {
    const auto a = static_cast<Attribute>(i);
    const double m = combination.modifiers.get_dmg_multiplier(a);
    if (m != 1.0) mults[attribute_to_string(a)] = m;
  }
  mods["damage_multiplier"] = mults;
  o["modifiers"] = mods;

  Array conditions;
  for (const Condition c : combination.relevant_conditions) conditions.push_back(condition_to_string(c));
  o["relevant_conditions"] = conditions;
  return o;
}

namespace {

Object character_object(const Character& character) {
  Object o;
  o["gear"] = gear_to_json(character.gear);
  o["combination_id"] = static_cast<double>(character.combination_id);
  o["rankby"] = attribute_to_string(character.rankby);
  o["value"] = character.rank_value();
  o["base_attributes"] = nonzero_attributes(character.base_attributes);
  o["attributes"] = nonzero_attributes(character.attributes);
  return o;
}

} // namespace

Value character_to_json(const Character& character) { return character_object(character); }

Value analysis_to_json(const CharacterAnalysis& analysis) {
  Object o;
  o["value"] = analysis.value;
  o["indicators"] = attribute_values_to_json(analysis.indicators);
  o["effective_positive_values"] = attribute_values_to_json(analysis.effective_positive_values);
  o["effective_negative_values"] = attribute_values_to_json(analysis.effective_negative_values);

  Array breakdown;
  for (const DamageShare& d : analysis.damage_breakdown) {
    Object e;
    e["source"] = d.source;
    e["dps"] = d.dps;
    e["share"] = d.share;
    breakdown.push_back(e);
  }
  o["damage_breakdown"] = breakdown;

  Array helpers;
  for (const CoefficientHelper& h : analysis.coefficient_helper) {
    Object e;
    e["condition"] = condition_to_string(h.condition);
    e["slope"] = h.slope;
    e["intercept"] = h.intercept;
    helpers.push_back(e);
  }
  o["coefficient_helper"] = helpers;
  return o;
}

namespace {

Object results_object(const CompactedResults& results, const std::vector<CharacterAnalysis>& analyses) {
  if (!analyses.empty() && analyses.size() != results.characters.size()) {
    throw std::invalid_argument("results_to_json: analyses must be parallel to characters");
  }

  Array chars;
  chars.reserve(results.characters.size());
  for (std::size_t i = 0; i < results.characters.size(); ++i) {
    Object c = character_object(results.characters[i]);
    if (!analyses.empty()) c["analysis"] = analysis_to_json(analyses[i]);
    chars.push_back(std::move(c));
  }

  Array combos;
  combos.reserve(results.combinations.size());
  for (const Combination& c : results.combinations) combos.push_back(combination_to_json(c));

  Object o;
  o["results"] = chars;
  o["combinations"] = combos;
  return o;
}

} // namespace

Value results_to_json(const CompactedResults& results, const std::vector<CharacterAnalysis>& analyses) {
  return results_object(results, analyses);
}

Value progress_to_json(const ProgressSnapshot& snapshot) {
  Object o = results_object(snapshot.results, {});
  o["type"] = std::string("PROGRESS");
  o["total"] = static_cast<double>(snapshot.total);
  o["new"] = static_cast<double>(snapshot.batch);
  return o;
}

} // namespace gearopt

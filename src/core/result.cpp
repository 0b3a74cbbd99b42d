#include "gearopt/core/result.h"

#include <algorithm>

namespace gearopt {

bool ranks_above(const Character& a, const Character& b, Attribute rankby) {
  const double sa = a.attributes.get(rankby);
  const double sb = b.attributes.get(rankby);
  if (sa != sb) return sa > sb;

  const Attribute tiebreak = rankby == Attribute::Damage ? Attribute::Survivability : Attribute::Damage;
  return a.attributes.get(tiebreak) > b.attributes.get(tiebreak);
}

ResultCollector::ResultCollector(std::size_t capacity, Attribute rankby) : capacity_(capacity), rankby_(rankby) {
  best_.reserve(capacity_);
}

bool ResultCollector::insert(const Character& candidate) {
  if (capacity_ == 0) return false;
  if (full() && !(candidate.attributes.get(rankby_) > worst_score())) return false;

  // After any entries that rank at least as high, so earlier finds keep their place on ties.
  const auto pos = std::upper_bound(best_.begin(), best_.end(), candidate,
                                    [this](const Character& c, const Character& existing) {
                                      return ranks_above(c, existing, rankby_);
                                    });
  const auto offset = pos - best_.begin();
  if (full()) best_.pop_back();
  best_.insert(best_.begin() + offset, candidate);
  return true;
}

void ResultCollector::merge(const ResultCollector& other) {
  for (const Character& c : other.best_) insert(c);
}

std::vector<int> ResultCollector::weighted_combinations(std::size_t combination_count) const {
  std::vector<int> counts(combination_count, 0);
  for (const Character& c : best_) {
    if (c.combination_id < combination_count) ++counts[c.combination_id];
  }
  return counts;
}

double ResultCollector::worst_score() const {
  if (best_.empty()) return 0.0;
  return best_.back().attributes.get(rankby_);
}

} // namespace gearopt

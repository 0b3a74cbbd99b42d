#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

#include "gearopt/core/attribute.h"
#include "gearopt/core/character.h"

namespace gearopt {

// True if `a` should be listed before `b` when ranking by `rankby`.
//
// Higher rank score wins. Equal scores fall back to Survivability when
// ranking by Damage, and to Damage otherwise.
bool ranks_above(const Character& a, const Character& b, Attribute rankby);

// Bounded top-K collection of character snapshots, best first.
//
// Invariants: size() <= capacity(); a full collector only admits a candidate
// whose rank score strictly exceeds the current worst score.
class ResultCollector {
 public:
  ResultCollector(std::size_t capacity, Attribute rankby);

  // Copies `candidate` in if it ranks among the best `capacity`. Returns
  // whether it was retained.
  bool insert(const Character& candidate);

  // Inserts every entry of `other` (same rankby expected).
  void merge(const ResultCollector& other);

  const std::vector<Character>& characters() const { return best_; }
  std::vector<Character> snapshot() const { return best_; }

  // Histogram over combination_id: result[i] = retained entries that used
  // combination i. Ids >= combination_count are ignored.
  std::vector<int> weighted_combinations(std::size_t combination_count) const;

  std::size_t size() const { return best_.size(); }
  std::size_t capacity() const { return capacity_; }
  bool full() const { return best_.size() >= capacity_; }
  bool empty() const { return best_.empty(); }
  Attribute rankby() const { return rankby_; }

  // Rank score of the last retained entry (0 when empty).
  double worst_score() const;

 private:
  std::size_t capacity_{0};
  Attribute rankby_{Attribute::Damage};
  std::vector<Character> best_;
};

} // namespace gearopt

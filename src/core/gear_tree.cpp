#include "gearopt/core/gear_tree.h"

#include <algorithm>
#include <limits>
#include <stdexcept>
#include <string>
#include <utility>

namespace gearopt {

std::size_t branching_factor(const SlotCandidates& candidates, std::size_t slot) {
  if (slot >= candidates.size()) return 1;
  return candidates[slot].empty() ? 1 : candidates[slot].size();
}

std::uint64_t saturating_mul(std::uint64_t a, std::uint64_t b) {
  constexpr std::uint64_t kMax = std::numeric_limits<std::uint64_t>::max();
  if (a != 0 && b > kMax / a) return kMax;
  return a * b;
}

std::uint64_t saturating_add(std::uint64_t a, std::uint64_t b) {
  constexpr std::uint64_t kMax = std::numeric_limits<std::uint64_t>::max();
  return b > kMax - a ? kMax : a + b;
}

std::uint64_t count_leaves(const SlotCandidates& candidates, std::size_t prefix_len, std::size_t slots) {
  std::uint64_t total = 1;
  for (std::size_t slot = prefix_len; slot < slots; ++slot) {
    total = saturating_mul(total, static_cast<std::uint64_t>(branching_factor(candidates, slot)));
  }
  return total;
}

LeafSequence::LeafSequence(const SlotCandidates& candidates, Gear prefix, std::size_t slots)
    : candidates_(&candidates), prefix_len_(prefix.size()), gear_(std::move(prefix)) {
  if (prefix_len_ > slots) {
    throw std::invalid_argument("chunk prefix has " + std::to_string(prefix_len_) + " slots, tree depth is " +
                                std::to_string(slots));
  }
  if (candidates.size() < slots) {
    throw std::invalid_argument("candidate table has " + std::to_string(candidates.size()) +
                                " slots, tree depth is " + std::to_string(slots));
  }
  gear_.resize(slots, Affix::None);
  indices_.assign(slots, 0);
  reset();
}

Affix LeafSequence::candidate_at(std::size_t slot, std::size_t index) const {
  const auto& options = (*candidates_)[slot];
  return options.empty() ? Affix::None : options[index];
}

void LeafSequence::reset() {
  for (std::size_t slot = prefix_len_; slot < gear_.size(); ++slot) {
    indices_[slot] = 0;
    gear_[slot] = candidate_at(slot, 0);
  }
  started_ = false;
  done_ = false;
}

bool LeafSequence::next() {
  if (done_) return false;
  if (!started_) {
    started_ = true;
    return true;
  }

  // Odometer step over the unfixed slots.
  for (std::size_t slot = gear_.size(); slot-- > prefix_len_;) {
    if (++indices_[slot] < branching_factor(*candidates_, slot)) {
      gear_[slot] = candidate_at(slot, indices_[slot]);
      return true;
    }
    indices_[slot] = 0;
    gear_[slot] = candidate_at(slot, 0);
  }
  done_ = true;
  return false;
}

Gear random_gear(const SlotCandidates& candidates, std::size_t slots, util::HashRng& rng) {
  Gear gear(slots, Affix::None);
  for (std::size_t slot = 0; slot < slots && slot < candidates.size(); ++slot) {
    const auto& options = candidates[slot];
    if (!options.empty()) gear[slot] = options[rng.index(options.size())];
  }
  return gear;
}

std::vector<Gear> make_chunks(const SlotCandidates& candidates, std::size_t slots, std::size_t split_depth) {
  const std::size_t depth = std::min(split_depth, std::min(slots, candidates.size()));
  std::vector<Gear> chunks;
  chunks.reserve(static_cast<std::size_t>(count_leaves(candidates, 0, depth)));

  LeafSequence prefixes(candidates, Gear{}, depth);
  while (prefixes.next()) chunks.push_back(prefixes.gear());
  return chunks;
}

std::vector<std::vector<Gear>> split_chunks_round_robin(const std::vector<Gear>& chunks, std::size_t workers) {
  if (workers == 0) workers = 1;
  std::vector<std::vector<Gear>> buckets(std::min(workers, std::max<std::size_t>(chunks.size(), 1)));
  for (std::size_t i = 0; i < chunks.size(); ++i) {
    buckets[i % buckets.size()].push_back(chunks[i]);
  }
  buckets.erase(std::remove_if(buckets.begin(), buckets.end(), [](const auto& b) { return b.empty(); }),
                buckets.end());
  return buckets;
}

} // namespace gearopt

#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

#include "gearopt/core/affix.h"
#include "gearopt/util/hash_rng.h"

namespace gearopt {

// Options for slot `slot`. An empty candidate list still yields one branch
// (Affix::None) so slot positions stay aligned with the stat tables.
std::size_t branching_factor(const SlotCandidates& candidates, std::size_t slot);

// a * b, or UINT64_MAX if the product does not fit.
std::uint64_t saturating_mul(std::uint64_t a, std::uint64_t b);

// a + b, or UINT64_MAX if the sum does not fit.
std::uint64_t saturating_add(std::uint64_t a, std::uint64_t b);

// Number of complete assignments below `prefix`: the product of branching
// factors over the unfixed slots [prefix_len, slots). Saturates at UINT64_MAX.
std::uint64_t count_leaves(const SlotCandidates& candidates, std::size_t prefix_len, std::size_t slots);

// Restartable, finite generator over every leaf under a chunk prefix, in the
// lexicographic order of the candidate lists (last slot varies fastest).
//
//   LeafSequence leaves(candidates, prefix, slots);
//   while (leaves.next()) use(leaves.gear());
//
// gear() is a borrowed view that the next call to next() overwrites.
class LeafSequence {
 public:
  // Throws std::invalid_argument if the prefix is longer than `slots` or
  // `candidates` has fewer than `slots` entries.
  LeafSequence(const SlotCandidates& candidates, Gear prefix, std::size_t slots);

  // Advances to the next leaf. Returns false once the subtree is exhausted.
  bool next();

  const Gear& gear() const { return gear_; }

  // Rewinds to before the first leaf.
  void reset();

  std::uint64_t size() const { return count_leaves(*candidates_, prefix_len_, gear_.size()); }

 private:
  Affix candidate_at(std::size_t slot, std::size_t index) const;

  const SlotCandidates* candidates_;
  std::size_t prefix_len_{0};
  Gear gear_;
  std::vector<std::size_t> indices_;
  bool started_{false};
  bool done_{false};
};

// Recursive depth-first descent from `subtree` to depth `max_depth`; calls
// `leaf(const Gear&)` for every complete assignment, in the same order as
// LeafSequence. `subtree` is used as scratch and restored on return.
template <typename LeafFn>
void descend_subtree_dfs(const SlotCandidates& candidates, Gear& subtree, std::size_t max_depth, LeafFn& leaf) {
  const std::size_t layer = subtree.size();
  if (layer >= max_depth) {
    leaf(static_cast<const Gear&>(subtree));
    return;
  }

  const auto& options = candidates[layer];
  if (options.empty()) {
    subtree.push_back(Affix::None);
    descend_subtree_dfs(candidates, subtree, max_depth, leaf);
    subtree.pop_back();
    return;
  }
  for (const Affix option : options) {
    subtree.push_back(option);
    descend_subtree_dfs(candidates, subtree, max_depth, leaf);
    subtree.pop_back();
  }
}

// Uniformly random complete assignment (one draw per slot).
Gear random_gear(const SlotCandidates& candidates, std::size_t slots, util::HashRng& rng);

// Every prefix of length `split_depth` (clamped to `slots`), in traversal
// order. The prefixes partition the full tree into independent chunks.
std::vector<Gear> make_chunks(const SlotCandidates& candidates, std::size_t slots, std::size_t split_depth);

// Deals chunks to `workers` buckets round-robin. Empty buckets are dropped.
std::vector<std::vector<Gear>> split_chunks_round_robin(const std::vector<Gear>& chunks, std::size_t workers);

} // namespace gearopt

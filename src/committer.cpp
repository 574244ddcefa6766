#include "mdlvocab/committer.hpp"

namespace mdlvocab {

ConflictAwareCommitter::ConflictAwareCommitter(const CostModel& cost_model, Count min_count,
                                               const TrainingCorpus& corpus, EpochState& state)
    : cost_model_(cost_model), min_count_(min_count), corpus_(corpus), state_(state) {}

Count ConflictAwareCommitter::CheckValid(const TokenPair& pair, Count total) const {
  const auto& codebook = state_.codebook;
  for (const auto& ctx : corpus_.SearchIndices(pair)) {
    if (!ctx.prev.empty() && codebook.Contains(ctx.prev + ctx.first)) {
      --total;
    } else if (!ctx.next.empty() && codebook.Contains(ctx.second + ctx.next)) {
      --total;
    }
  }
  return total;
}

bool ConflictAwareCommitter::Commit(const Candidate& candidate) {
  const auto& [w1, w2] = candidate.pair;
  const Count total = CheckValid(candidate.pair, candidate.total);
  if (total < min_count_) {
    return false;
  }

  state_.data_len -= total;
  // Zero passes: a merge that consumes every remaining token degenerates to 0.
  if (cost_model_.PairCost(state_.codebook, w1, w2, total, state_.data_len).Total() > 0.0) {
    return false;
  }

  state_.codebook.Add(w1 + w2, total);
  state_.codebook.Add(w1, -total);
  state_.codebook.Add(w2, -total);
  return true;
}

}  // namespace mdlvocab

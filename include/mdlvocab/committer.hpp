#pragma once

#include "mdlvocab/candidate_selector.hpp"
#include "mdlvocab/codebook.hpp"
#include "mdlvocab/cost_model.hpp"
#include "mdlvocab/training_corpus.hpp"

namespace mdlvocab {

// Mutable state of one epoch. Only the committer writes to it while the
// epoch is committing.
struct EpochState {
  Codebook codebook;
  Count data_len = 0;
};

class ConflictAwareCommitter {
 public:
  ConflictAwareCommitter(const CostModel& cost_model, Count min_count, const TrainingCorpus& corpus,
                         EpochState& state);

  // `total` minus one for each occurrence whose left neighbour already forms
  // a codebook entry with w1, or whose right neighbour does with w2.
  [[nodiscard]] Count CheckValid(const TokenPair& pair, Count total) const;

  // Applies the merge when its overlap-adjusted count still reaches
  // min_count and its recomputed cost is not positive. data_len is reduced
  // before the cost check and stays reduced if that check fails.
  bool Commit(const Candidate& candidate);

 private:
  const CostModel& cost_model_;
  Count min_count_;
  const TrainingCorpus& corpus_;
  EpochState& state_;
};

}  // namespace mdlvocab

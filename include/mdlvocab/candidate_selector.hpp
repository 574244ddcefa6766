#pragma once

#include <cstddef>
#include <vector>

#include "mdlvocab/codebook.hpp"
#include "mdlvocab/cost_model.hpp"
#include "mdlvocab/pair_stats.hpp"

namespace mdlvocab {

struct Candidate {
  TokenPair pair;
  Count total = 0;
  MergeCost cost;
};

struct SelectorOptions {
  Count min_count = 5;
  std::size_t vocab_size = 20000;
  // Fraction of the beneficial candidates kept after ranking.
  double threshold = 0.8;
  // The frequency-ranked pool holds floor(vocab_size * candidate_pool_ratio) pairs.
  double candidate_pool_ratio = 0.5;

  [[nodiscard]] std::size_t PoolSize() const;
};

class CandidateSelector {
 public:
  CandidateSelector(SelectorOptions options, const CostModel& cost_model);

  // Beneficial merges from `stats`, costed against `codebook` and `data_len`,
  // most beneficial first. The weakest (1 - threshold) share is dropped.
  [[nodiscard]] std::vector<Candidate> Select(const PairStatistics& stats, const Codebook& codebook,
                                              Count data_len) const;

 private:
  SelectorOptions options_;
  const CostModel& cost_model_;
};

}  // namespace mdlvocab

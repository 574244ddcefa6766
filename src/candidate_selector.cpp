#include "mdlvocab/candidate_selector.hpp"

#include <algorithm>
#include <cmath>

namespace mdlvocab {

std::size_t SelectorOptions::PoolSize() const {
  return static_cast<std::size_t>(std::floor(static_cast<double>(vocab_size) * candidate_pool_ratio));
}

CandidateSelector::CandidateSelector(SelectorOptions options, const CostModel& cost_model)
    : options_(options), cost_model_(cost_model) {}

std::vector<Candidate> CandidateSelector::Select(const PairStatistics& stats, const Codebook& codebook,
                                                 Count data_len) const {
  std::vector<Candidate> candidates;
  for (auto& [pair, total] : stats.MostCommon(options_.PoolSize())) {
    if (total < options_.min_count) {
      continue;
    }
    const auto cost = cost_model_.PairCost(codebook, pair.first, pair.second, total, data_len);
    if (cost.Beneficial()) {
      candidates.push_back({std::move(pair), total, cost});
    }
  }

  std::stable_sort(candidates.begin(), candidates.end(),
                   [](const Candidate& l, const Candidate& r) { return l.cost.Total() < r.cost.Total(); });

  const auto keep = static_cast<std::size_t>(std::ceil(static_cast<double>(candidates.size()) * options_.threshold));
  if (candidates.size() > keep) {
    candidates.resize(keep);
  }
  return candidates;
}

}  // namespace mdlvocab

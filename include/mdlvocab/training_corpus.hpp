#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "mdlvocab/codebook.hpp"
#include "mdlvocab/pair_stats.hpp"

namespace mdlvocab {

// What the trainer needs from the text it learns on.
class TrainingCorpus {
 public:
  virtual ~TrainingCorpus() = default;

  // Token -> count over the current segmentation; recomputed on every call.
  virtual const TokenCounts& BuildVocab() = 0;
  [[nodiscard]] virtual const TokenCounts& vocab() const = 0;
  [[nodiscard]] virtual Count DataLen() const = 0;

  [[nodiscard]] virtual PairStatistics BuildPairStats() = 0;
  [[nodiscard]] virtual std::vector<PairContext> SearchIndices(const TokenPair& pair) const = 0;

  virtual void ApplyCodebook(const Codebook& codebook) = 0;

  [[nodiscard]] virtual const std::vector<std::string>& stopwords() const = 0;
  [[nodiscard]] virtual std::vector<std::string> SampleLines(std::size_t count) const = 0;
};

}  // namespace mdlvocab

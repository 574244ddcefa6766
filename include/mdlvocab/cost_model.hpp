#pragma once

#include <cstddef>
#include <string>

#include "mdlvocab/codebook.hpp"

namespace mdlvocab {

// Two-part description length delta of a merge, in nats. Negative means the
// merge shortens the total description.
struct MergeCost {
  double code_cost = 0.0;
  double data_cost = 0.0;

  [[nodiscard]] double Total() const { return code_cost + data_cost; }
  [[nodiscard]] bool Beneficial() const { return Total() < 0.0; }
};

// Change in log-likelihood of a unigram model over `n` tokens when `c1w2`
// adjacent occurrences of (w1, w2) are replaced by one merged token. Terms
// whose log argument would be non-positive contribute 0.
[[nodiscard]] double DataCost(double c1w2, double c1, double c2, double n);

// Dictionary growth in characters, negated: adding w1w2 costs |w1| + |w2|,
// and a part whose every occurrence is consumed leaves the dictionary.
[[nodiscard]] double CodeCost(const std::string& w1, const std::string& w2, Count c1, Count c2, Count total);

class CostModel {
 public:
  // `log_base` is -ln(alphabet size): nats per character under a uniform code.
  explicit CostModel(double log_base) : log_base_(log_base) {}

  [[nodiscard]] double log_base() const { return log_base_; }

  [[nodiscard]] MergeCost PairCost(const std::string& w1, const std::string& w2, Count c1, Count c2, Count total,
                                   Count data_len) const;

  // Looks up the standalone counts of w1 and w2 in `codebook`.
  [[nodiscard]] MergeCost PairCost(const Codebook& codebook, const std::string& w1, const std::string& w2,
                                   Count total, Count data_len) const;

  // -ln(alphabet_size); 0 for an empty alphabet.
  [[nodiscard]] static double LogBaseFor(std::size_t alphabet_size);

 private:
  double log_base_;
};

}  // namespace mdlvocab

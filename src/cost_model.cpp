#include "mdlvocab/cost_model.hpp"

#include <cmath>

#include "mdlvocab/utf8.hpp"

namespace mdlvocab {

namespace {

// count * ln(part / n), 0 unless every operand is positive.
double WeightedLog(double count, double part, double n) {
  if (count == 0.0 || part <= 0.0 || n <= 0.0) {
    return 0.0;
  }
  return count * std::log(part / n);
}

}  // namespace

double DataCost(double c1w2, double c1, double c2, double n) {
  double cost = 0.0;
  cost += WeightedLog(c1, c1, n);
  if (c1 > c1w2) {
    cost -= WeightedLog(c1 - c1w2, c1 - c1w2, n);
  }

  cost += WeightedLog(c2, c2, n);
  if (c2 > c1w2) {
    cost -= WeightedLog(c2 - c1w2, c2 - c1w2, n);
  }

  cost -= WeightedLog(c1w2, c1w2, n);
  cost += WeightedLog(n - c1 - c2, n - c1w2, n);
  return cost;
}

double CodeCost(const std::string& w1, const std::string& w2, Count c1, Count c2, Count total) {
  const auto len1 = static_cast<double>(CodepointLength(w1));
  const auto len2 = static_cast<double>(CodepointLength(w2));
  double raw = 0.0;
  if (total > 0) {
    raw += len1 + len2;
  }
  if (total == c1) {
    raw -= len1;
  }
  if (total == c2) {
    raw -= len2;
  }
  return -raw;
}

MergeCost CostModel::PairCost(const std::string& w1, const std::string& w2, Count c1, Count c2, Count total,
                              Count data_len) const {
  MergeCost cost;
  cost.code_cost = CodeCost(w1, w2, c1, c2, total) * log_base_;
  cost.data_cost = DataCost(static_cast<double>(total), static_cast<double>(c1), static_cast<double>(c2),
                            static_cast<double>(data_len));
  return cost;
}

MergeCost CostModel::PairCost(const Codebook& codebook, const std::string& w1, const std::string& w2, Count total,
                              Count data_len) const {
  return PairCost(w1, w2, codebook.Get(w1), codebook.Get(w2), total, data_len);
}

double CostModel::LogBaseFor(std::size_t alphabet_size) {
  if (alphabet_size == 0) {
    return 0.0;
  }
  return -std::log(static_cast<double>(alphabet_size));
}

}  // namespace mdlvocab

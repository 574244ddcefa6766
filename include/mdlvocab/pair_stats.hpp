#pragma once

#include <cstddef>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "mdlvocab/codebook.hpp"

namespace mdlvocab {

using TokenPair = std::pair<std::string, std::string>;

struct PairHash {
  std::size_t operator()(const TokenPair& p) const noexcept;
};

struct PairCount {
  TokenPair pair;
  Count count = 0;
};

// One occurrence of (first, second) with its neighbours. An empty neighbour
// marks a segment edge.
struct PairContext {
  std::string prev;
  std::string first;
  std::string second;
  std::string next;
};

// Adjacent pair -> co-occurrence count, remembering first-seen order so that
// frequency ties rank deterministically.
class PairStatistics {
 public:
  void Add(const TokenPair& pair, Count n = 1);

  [[nodiscard]] Count Get(const TokenPair& pair) const;
  [[nodiscard]] std::size_t Size() const { return entries_.size(); }
  [[nodiscard]] bool Empty() const { return entries_.empty(); }

  // Up to `limit` pairs by descending count; ties keep first-seen order.
  [[nodiscard]] std::vector<PairCount> MostCommon(std::size_t limit) const;

 private:
  std::vector<PairCount> entries_;
  std::unordered_map<TokenPair, std::size_t, PairHash> index_;
};

}  // namespace mdlvocab

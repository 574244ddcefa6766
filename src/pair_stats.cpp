#include "mdlvocab/pair_stats.hpp"

#include <algorithm>
#include <functional>

namespace mdlvocab {

std::size_t PairHash::operator()(const TokenPair& p) const noexcept {
  const std::size_t a = std::hash<std::string>{}(p.first);
  const std::size_t b = std::hash<std::string>{}(p.second);
  return a ^ (b + 0x9e3779b97f4a7c15ull + (a << 6) + (a >> 2));
}

void PairStatistics::Add(const TokenPair& pair, Count n) {
  auto [it, inserted] = index_.emplace(pair, entries_.size());
  if (inserted) {
    entries_.push_back({pair, n});
  } else {
    entries_[it->second].count += n;
  }
}

Count PairStatistics::Get(const TokenPair& pair) const {
  auto it = index_.find(pair);
  return it == index_.end() ? 0 : entries_[it->second].count;
}

std::vector<PairCount> PairStatistics::MostCommon(std::size_t limit) const {
  std::vector<PairCount> out(entries_.begin(), entries_.end());
  std::stable_sort(out.begin(), out.end(), [](const PairCount& l, const PairCount& r) { return l.count > r.count; });
  if (out.size() > limit) {
    out.resize(limit);
  }
  return out;
}

}  // namespace mdlvocab

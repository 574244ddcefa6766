#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

namespace mdlvocab {

using Count = std::int64_t;
using TokenCounts = std::unordered_map<std::string, Count>;

// Token -> occurrence count. Every key holds a count >= 1; a mutation that
// drops a count below 1 erases the key before returning. Protected tokens
// (stopwords) keep whatever count seeding gave them.
class Codebook {
 public:
  Codebook() = default;
  Codebook(const TokenCounts& alphabet, const std::vector<std::string>& stopwords);

  [[nodiscard]] Count Get(const std::string& token) const;
  [[nodiscard]] bool Contains(const std::string& token) const { return counts_.count(token) != 0; }
  [[nodiscard]] bool IsProtected(const std::string& token) const { return protected_.count(token) != 0; }
  [[nodiscard]] std::size_t Size() const { return counts_.size(); }
  [[nodiscard]] bool Empty() const { return counts_.empty(); }

  // Adds `delta` (possibly negative) to `token`; inserts the token when absent.
  void Add(const std::string& token, Count delta);

  [[nodiscard]] const TokenCounts& Counts() const { return counts_; }

  // Descending by count, ties by token bytes.
  [[nodiscard]] std::vector<std::pair<std::string, Count>> SortedEntries() const;

  // JSON when `path` ends in ".json", "token<TAB>count" lines otherwise.
  void Save(const std::string& path) const;

  bool operator==(const Codebook& other) const { return counts_ == other.counts_; }

 private:
  TokenCounts counts_;
  std::unordered_set<std::string> protected_;
};

}  // namespace mdlvocab

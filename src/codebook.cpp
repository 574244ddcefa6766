#include "mdlvocab/codebook.hpp"

#include <algorithm>
#include <filesystem>

#include "mdlvocab/formats.hpp"

namespace mdlvocab {

Codebook::Codebook(const TokenCounts& alphabet, const std::vector<std::string>& stopwords)
    : counts_(alphabet) {
  for (auto it = counts_.begin(); it != counts_.end();) {
    if (it->second < 1) {
      it = counts_.erase(it);
    } else {
      ++it;
    }
  }
  for (const auto& word : stopwords) {
    if (word.empty()) {
      continue;
    }
    protected_.insert(word);
    counts_.emplace(word, 1);
  }
}

Count Codebook::Get(const std::string& token) const {
  auto it = counts_.find(token);
  return it == counts_.end() ? 0 : it->second;
}

void Codebook::Add(const std::string& token, Count delta) {
  if (delta == 0 || IsProtected(token)) {
    return;
  }
  auto it = counts_.find(token);
  if (it == counts_.end()) {
    if (delta >= 1) {
      counts_.emplace(token, delta);
    }
    return;
  }
  it->second += delta;
  if (it->second < 1) {
    counts_.erase(it);
  }
}

std::vector<std::pair<std::string, Count>> Codebook::SortedEntries() const {
  std::vector<std::pair<std::string, Count>> entries(counts_.begin(), counts_.end());
  std::sort(entries.begin(), entries.end(), [](const auto& l, const auto& r) {
    if (l.second != r.second) {
      return l.second > r.second;
    }
    return l.first < r.first;
  });
  return entries;
}

void Codebook::Save(const std::string& path) const {
  if (std::filesystem::path(path).extension() == ".json") {
    SaveCodebookJson(*this, path);
  } else {
    SaveCodebookTsv(*this, path);
  }
}

}  // namespace mdlvocab

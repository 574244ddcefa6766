#include "mdlvocab/corpus.hpp"

#include <algorithm>
#include <cstdint>
#include <fstream>
#include <initializer_list>
#include <stdexcept>

#include "mdlvocab/utf8.hpp"

namespace mdlvocab {

std::vector<std::string> DefaultStopwords() {
  std::vector<std::string> out;
  const std::string_view ascii = "!\"#$%&'()*+,-./:;<=>?@[\\]^_`{|}~";
  for (char c : ascii) {
    out.emplace_back(1, c);
  }
  for (const char* p : {"，", "。", "、", "；", "：", "？", "！", "“", "”", "‘", "’", "（", "）", "《", "》",
                        "【", "】", "「", "」", "…", "—", "·"}) {
    out.emplace_back(p);
  }
  out.emplace_back(kEndOfSentence);
  return out;
}

Corpus::Corpus(CorpusOptions options) : options_(std::move(options)) {
  if (options_.append_eos &&
      std::find(options_.stopwords.begin(), options_.stopwords.end(), kEndOfSentence) == options_.stopwords.end()) {
    options_.stopwords.emplace_back(kEndOfSentence);
  }
  for (const auto& word : options_.stopwords) {
    if (!word.empty() && stopword_set_.insert(word).second) {
      stopwords_by_length_.push_back(word);
    }
  }
  std::stable_sort(stopwords_by_length_.begin(), stopwords_by_length_.end(),
                   [](const std::string& l, const std::string& r) { return l.size() > r.size(); });
}

Corpus Corpus::FromFiles(const std::vector<std::string>& files, CorpusOptions options,
                         CorpusReadOptions read_options) {
  Corpus corpus(std::move(options));
  CorpusReader reader(std::move(read_options));
  for (const auto& file : files) {
    if (!reader.ForEachRecord(file, [&corpus](const std::string& text) { corpus.AddRecord(text); })) {
      throw std::runtime_error("unable to read file: " + file);
    }
  }
  if (corpus.Empty()) {
    throw std::invalid_argument("training corpus is empty");
  }
  corpus.BuildVocab();
  return corpus;
}

std::size_t Corpus::MatchStopword(std::string_view text, std::size_t pos) const {
  const std::string_view rest = text.substr(pos);
  for (const auto& word : stopwords_by_length_) {
    if (rest.starts_with(word)) {
      return word.size();
    }
  }
  return 0;
}

void Corpus::PushSegment(std::string raw, bool stopword) {
  Segment seg;
  if (stopword) {
    seg.tokens.push_back(raw);
  } else {
    seg.tokens = SplitCodepoints(raw);
  }
  seg.raw = std::move(raw);
  seg.stopword = stopword;
  segments_.push_back(std::move(seg));
}

void Corpus::AddRecord(std::string_view text) {
  const std::string trimmed = TruncateUtf8(text, options_.max_chars_per_record);
  const std::string_view view(trimmed);
  const std::size_t first = segments_.size();

  std::string current;
  auto flush = [&] {
    if (!current.empty()) {
      PushSegment(std::move(current), false);
      current.clear();
    }
  };

  std::size_t i = 0;
  while (i < view.size()) {
    if (const std::size_t len = MatchStopword(view, i); len > 0) {
      flush();
      PushSegment(std::string(view.substr(i, len)), true);
      i += len;
      continue;
    }
    std::size_t next = i;
    std::uint32_t cp = 0;
    NextCodepoint(view, next, cp);
    if (IsSpace(cp)) {
      flush();
    } else {
      current.append(view.substr(i, next - i));
    }
    i = next;
  }
  flush();

  if (segments_.size() == first) {
    return;
  }
  if (options_.append_eos) {
    PushSegment(std::string(kEndOfSentence), true);
  }
  records_.push_back({first, segments_.size() - first});
  occurrences_ready_ = false;
}

const TokenCounts& Corpus::BuildVocab() {
  vocab_.clear();
  data_len_ = 0;
  for (const auto& seg : segments_) {
    for (const auto& token : seg.tokens) {
      ++vocab_[token];
      ++data_len_;
    }
  }
  return vocab_;
}

PairStatistics Corpus::BuildPairStats() {
  PairStatistics stats;
  occurrences_.clear();
  for (std::size_t s = 0; s < segments_.size(); ++s) {
    const auto& seg = segments_[s];
    if (seg.stopword || seg.tokens.size() < 2) {
      continue;
    }
    for (std::size_t j = 0; j + 1 < seg.tokens.size(); ++j) {
      TokenPair pair(seg.tokens[j], seg.tokens[j + 1]);
      occurrences_[pair].push_back({s, j});
      stats.Add(pair);
    }
  }
  occurrences_ready_ = true;
  return stats;
}

PairContext Corpus::ContextAt(const Position& pos) const {
  const auto& tokens = segments_[pos.segment].tokens;
  PairContext ctx;
  ctx.first = tokens[pos.offset];
  ctx.second = tokens[pos.offset + 1];
  if (pos.offset > 0) {
    ctx.prev = tokens[pos.offset - 1];
  }
  if (pos.offset + 2 < tokens.size()) {
    ctx.next = tokens[pos.offset + 2];
  }
  return ctx;
}

std::vector<PairContext> Corpus::SearchIndices(const TokenPair& pair) const {
  std::vector<PairContext> out;
  if (occurrences_ready_) {
    auto it = occurrences_.find(pair);
    if (it == occurrences_.end()) {
      return out;
    }
    out.reserve(it->second.size());
    for (const auto& pos : it->second) {
      out.push_back(ContextAt(pos));
    }
    return out;
  }

  for (std::size_t s = 0; s < segments_.size(); ++s) {
    const auto& tokens = segments_[s].tokens;
    if (segments_[s].stopword) {
      continue;
    }
    for (std::size_t j = 0; j + 1 < tokens.size(); ++j) {
      if (tokens[j] == pair.first && tokens[j + 1] == pair.second) {
        out.push_back(ContextAt({s, j}));
      }
    }
  }
  return out;
}

void Corpus::ApplyCodebook(const Codebook& codebook) {
  std::size_t max_len = 1;
  for (const auto& kv : codebook.Counts()) {
    max_len = std::max(max_len, CodepointLength(kv.first));
  }

  std::vector<std::size_t> offsets;
  std::string piece;
  for (auto& seg : segments_) {
    if (seg.stopword) {
      continue;
    }
    offsets.clear();
    std::size_t i = 0;
    std::uint32_t cp = 0;
    while (i < seg.raw.size()) {
      offsets.push_back(i);
      NextCodepoint(seg.raw, i, cp);
    }
    offsets.push_back(seg.raw.size());

    const std::size_t n = offsets.size() - 1;
    std::vector<std::string> tokens;
    tokens.reserve(n);
    for (std::size_t pos = 0; pos < n;) {
      std::size_t take = 1;
      for (std::size_t len = std::min(max_len, n - pos); len > 1; --len) {
        piece.assign(seg.raw, offsets[pos], offsets[pos + len] - offsets[pos]);
        if (codebook.Contains(piece)) {
          take = len;
          break;
        }
      }
      tokens.emplace_back(seg.raw, offsets[pos], offsets[pos + take] - offsets[pos]);
      pos += take;
    }
    seg.tokens = std::move(tokens);
  }

  occurrences_.clear();
  occurrences_ready_ = false;
  BuildVocab();
}

std::string Corpus::RenderRecord(std::size_t index) const {
  const auto& record = records_.at(index);
  std::string out;
  for (std::size_t s = record.first_segment; s < record.first_segment + record.segment_count; ++s) {
    const auto& seg = segments_[s];
    if (seg.stopword && seg.raw == kEndOfSentence) {
      continue;
    }
    for (const auto& token : seg.tokens) {
      if (!out.empty()) {
        out.push_back(' ');
      }
      out += token;
    }
  }
  return out;
}

std::vector<std::string> Corpus::SampleLines(std::size_t count) const {
  std::vector<std::string> out;
  const std::size_t n = std::min(count, records_.size());
  out.reserve(n);
  for (std::size_t i = 0; i < n; ++i) {
    out.push_back(RenderRecord(i));
  }
  return out;
}

void Corpus::WriteSegmented(const std::string& path) const {
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  if (!out) {
    throw std::runtime_error("failed to create segmented output: " + path);
  }
  for (std::size_t i = 0; i < records_.size(); ++i) {
    out << RenderRecord(i) << '\n';
  }
  if (!out) {
    throw std::runtime_error("failed to write segmented output: " + path);
  }
}

}  // namespace mdlvocab

#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

#include "mdlvocab/codebook.hpp"
#include "mdlvocab/corpus_reader.hpp"
#include "mdlvocab/pair_stats.hpp"
#include "mdlvocab/training_corpus.hpp"

namespace mdlvocab {

inline constexpr std::string_view kEndOfSentence = "</s>";

// ASCII and common CJK punctuation plus kEndOfSentence.
[[nodiscard]] std::vector<std::string> DefaultStopwords();

struct CorpusOptions {
  // Protected tokens. Each is cut out of the text as its own segment, so it
  // is counted in the alphabet but never takes part in a pair.
  std::vector<std::string> stopwords = DefaultStopwords();
  // Appends kEndOfSentence as a stopword segment after every record.
  bool append_eos = true;
  // Code points kept per record; 0 keeps everything.
  std::size_t max_chars_per_record = 0;
};

// The training text, split into segments at whitespace and stopwords. Each
// segment keeps its raw text plus its current segmentation into tokens; pairs
// never cross a segment boundary.
class Corpus final : public TrainingCorpus {
 public:
  explicit Corpus(CorpusOptions options = {});

  // Throws std::runtime_error on an unreadable file and std::invalid_argument
  // when no record survives loading.
  static Corpus FromFiles(const std::vector<std::string>& files, CorpusOptions options = {},
                          CorpusReadOptions read_options = {});

  void AddRecord(std::string_view text);

  // Recounts token occurrences in the current segmentation.
  const TokenCounts& BuildVocab() override;
  [[nodiscard]] const TokenCounts& vocab() const override { return vocab_; }
  [[nodiscard]] Count DataLen() const override { return data_len_; }

  // Counts adjacent pairs and indexes their positions for SearchIndices.
  [[nodiscard]] PairStatistics BuildPairStats() override;

  // Every occurrence of `pair` in the current segmentation, with neighbours.
  [[nodiscard]] std::vector<PairContext> SearchIndices(const TokenPair& pair) const override;

  // Re-segments every segment from its raw text by greedy longest match
  // against `codebook`, falling back to single code points, then recounts.
  void ApplyCodebook(const Codebook& codebook) override;

  [[nodiscard]] const std::vector<std::string>& stopwords() const override { return options_.stopwords; }
  [[nodiscard]] std::size_t RecordCount() const { return records_.size(); }
  [[nodiscard]] std::size_t SegmentCount() const { return segments_.size(); }
  [[nodiscard]] bool Empty() const { return records_.empty(); }

  // Record `index` with tokens separated by single spaces (EOS omitted).
  [[nodiscard]] std::string RenderRecord(std::size_t index) const;
  [[nodiscard]] std::vector<std::string> SampleLines(std::size_t count) const override;

  // One rendered record per line; throws std::runtime_error on write failure.
  void WriteSegmented(const std::string& path) const;

 private:
  struct Segment {
    std::string raw;
    std::vector<std::string> tokens;
    bool stopword = false;
  };

  struct Record {
    std::size_t first_segment = 0;
    std::size_t segment_count = 0;
  };

  struct Position {
    std::size_t segment = 0;
    std::size_t offset = 0;
  };

  void PushSegment(std::string raw, bool stopword);
  [[nodiscard]] std::size_t MatchStopword(std::string_view text, std::size_t pos) const;
  [[nodiscard]] PairContext ContextAt(const Position& pos) const;

  CorpusOptions options_;
  std::vector<std::string> stopwords_by_length_;
  std::unordered_set<std::string> stopword_set_;
  std::vector<Segment> segments_;
  std::vector<Record> records_;
  TokenCounts vocab_;
  Count data_len_ = 0;
  std::unordered_map<TokenPair, std::vector<Position>, PairHash> occurrences_;
  bool occurrences_ready_ = false;
};

}  // namespace mdlvocab

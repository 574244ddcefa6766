#include <cassert>
#include <initializer_list>

#include "mdlvocab/committer.hpp"
#include "mdlvocab/corpus.hpp"

namespace {

mdlvocab::Corpus MakeCorpus(std::initializer_list<const char*> lines) {
  mdlvocab::CorpusOptions opts;
  opts.stopwords.clear();
  opts.append_eos = false;
  mdlvocab::Corpus corpus(opts);
  for (const char* line : lines) {
    corpus.AddRecord(line);
  }
  corpus.BuildVocab();
  return corpus;
}

}  // namespace

int main() {
  using namespace mdlvocab;

  const CostModel model(CostModel::LogBaseFor(2));

  {
    // "ababab" -> {"ab": 3}
    auto corpus = MakeCorpus({"ababab"});
    (void)corpus.BuildPairStats();
    EpochState state{Codebook(corpus.vocab(), corpus.stopwords()), corpus.DataLen()};
    ConflictAwareCommitter committer(model, 1, corpus, state);

    Candidate ab{{"a", "b"}, 3, model.PairCost(state.codebook, "a", "b", 3, state.data_len)};
    assert(ab.cost.Beneficial());
    assert(committer.CheckValid(ab.pair, ab.total) == 3);
    assert(committer.Commit(ab));
    assert(state.codebook.Size() == 1);
    assert(state.codebook.Get("ab") == 3);
    assert(!state.codebook.Contains("a"));
    assert(!state.codebook.Contains("b"));
    assert(state.data_len == 3);

    // Every (b, a) now sits next to a committed "ab".
    assert(committer.CheckValid({"b", "a"}, 2) == 0);
  }

  {
    // A merge that costs more than it saves leaves the codebook alone.
    auto corpus = MakeCorpus({"ababab"});
    (void)corpus.BuildPairStats();
    EpochState state{Codebook(corpus.vocab(), corpus.stopwords()), corpus.DataLen()};
    const Codebook before = state.codebook;
    ConflictAwareCommitter committer(model, 1, corpus, state);

    Candidate ba{{"b", "a"}, 2, model.PairCost(state.codebook, "b", "a", 2, state.data_len)};
    assert(!committer.Commit(ba));
    assert(state.codebook == before);
    // The decrement happens before the re-check and is kept.
    assert(state.data_len == 4);
  }

  {
    // Below min_count nothing changes, data_len included.
    auto corpus = MakeCorpus({"ababab"});
    (void)corpus.BuildPairStats();
    EpochState state{Codebook(corpus.vocab(), corpus.stopwords()), corpus.DataLen()};
    const Codebook before = state.codebook;
    ConflictAwareCommitter committer(model, 4, corpus, state);

    Candidate ab{{"a", "b"}, 3, model.PairCost(state.codebook, "a", "b", 3, state.data_len)};
    assert(!committer.Commit(ab));
    assert(state.codebook == before);
    assert(state.data_len == 6);
  }

  {
    // A part that occurs outside the pair keeps the remainder of its count.
    auto corpus = MakeCorpus({"ab", "ccccc a"});
    (void)corpus.BuildPairStats();
    const CostModel local(CostModel::LogBaseFor(corpus.vocab().size()));
    EpochState state{Codebook(corpus.vocab(), corpus.stopwords()), corpus.DataLen()};
    assert(state.codebook.Get("a") == 2);
    ConflictAwareCommitter committer(local, 1, corpus, state);

    Candidate ab{{"a", "b"}, 1, local.PairCost(state.codebook, "a", "b", 1, state.data_len)};
    assert(committer.Commit(ab));
    assert(state.codebook.Get("ab") == 1);
    assert(state.codebook.Get("a") == 1);
    assert(!state.codebook.Contains("b"));
    assert(state.codebook.Get("c") == 5);
    assert(state.codebook.Size() == 3);
    assert(state.data_len == 7);
  }

  {
    // Right-hand overlap, and an edge never matches.
    auto corpus = MakeCorpus({"abc ab"});
    (void)corpus.BuildPairStats();
    EpochState state{Codebook({{"a", 2}, {"b", 2}, {"c", 1}, {"bc", 1}}, {}), corpus.DataLen()};
    ConflictAwareCommitter committer(model, 1, corpus, state);
    assert(committer.CheckValid({"a", "b"}, 2) == 1);
    assert(committer.CheckValid({"a", "b"}, 2) <= 2);

    // Left and right overlap in one context count once.
    EpochState both{Codebook({{"xa", 1}, {"bc", 1}}, {}), corpus.DataLen()};
    auto wide = MakeCorpus({"xabc"});
    (void)wide.BuildPairStats();
    ConflictAwareCommitter wide_committer(model, 1, wide, both);
    assert(wide_committer.CheckValid({"a", "b"}, 1) == 0);
  }

  return 0;
}

#include <cassert>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "mdlvocab/corpus.hpp"
#include "mdlvocab/observer.hpp"
#include "mdlvocab/progress.hpp"
#include "mdlvocab/trainer.hpp"

namespace {

using namespace mdlvocab;

Corpus MakeCorpus(const std::vector<std::string>& lines) {
  CorpusOptions opts;
  opts.stopwords.clear();
  opts.append_eos = false;
  Corpus corpus(opts);
  for (const auto& line : lines) {
    corpus.AddRecord(line);
  }
  return corpus;
}

struct RecordingObserver : TrainObserver {
  std::size_t begins = 0;
  std::size_t epochs = 0;
  std::size_t samples = 0;
  std::size_t commits = 0;
  std::size_t accepted = 0;
  std::size_t epoch_ends = 0;
  std::size_t capped = 0;
  std::size_t ends = 0;
  TrainState final_state = TrainState::seeded;

  void OnTrainBegin(std::size_t, double, Count) override { ++begins; }
  void OnEpochBegin(std::size_t, std::size_t) override { ++epochs; }
  void OnSamples(const std::vector<std::string>&) override { ++samples; }
  void OnCommit(const Candidate&, bool committed, std::size_t) override {
    ++commits;
    if (committed) ++accepted;
  }
  void OnEpochEnd(const EpochReport&) override { ++epoch_ends; }
  void OnCapped(const EpochReport&) override { ++capped; }
  void OnTrainEnd(std::size_t, TrainState state, std::size_t) override {
    ++ends;
    final_state = state;
  }
};

}  // namespace

int main() {
  {
    auto corpus = MakeCorpus({"ababab"});
    TrainerOptions opts;
    opts.iterations = 1;
    opts.min_count = 1;
    opts.vocab_size = 100;
    auto result = MdlTrainer(opts).Train(corpus);

    assert(result.codebook.Size() == 1);
    assert(result.codebook.Get("ab") == 3);
    assert(result.final_state == TrainState::epoch_done);
    assert(result.alphabet_size == 2);
    assert(result.epochs.size() == 1);
    assert(result.epochs[0].committed == 1);
    assert(result.epochs[0].vocab_before == 2);
    assert(result.epochs[0].vocab_after == 1);
    assert(corpus.RenderRecord(0) == "ab ab ab");
  }

  {
    // No epochs: the seeded codebook comes back.
    auto corpus = MakeCorpus({"ababab", "cab"});
    TrainerOptions opts;
    opts.iterations = 0;
    opts.min_count = 1;
    auto result = MdlTrainer(opts).Train(corpus);
    assert(result.codebook == Codebook(corpus.vocab(), corpus.stopwords()));
    assert(result.codebook.Get("a") == 4);
    assert(result.epochs.empty());
    assert(result.final_state == TrainState::seeded);
  }

  {
    // Later epochs find nothing worth merging and keep the codebook.
    auto corpus = MakeCorpus({"ababab"});
    TrainerOptions opts;
    opts.iterations = 3;
    opts.min_count = 1;
    opts.vocab_size = 100;
    opts.verbose = true;
    RecordingObserver observer;
    auto result = MdlTrainer(opts, &observer).Train(corpus);

    assert(result.epochs.size() == 3);
    assert(result.epochs[0].state == TrainState::epoch_done);
    assert(result.epochs[1].state == TrainState::converged);
    assert(result.epochs[2].state == TrainState::converged);
    assert(result.final_state == TrainState::converged);
    assert(result.codebook.Size() == 1);
    assert(result.codebook.Get("ab") == 3);

    assert(observer.begins == 1);
    assert(observer.epochs == 3);
    assert(observer.samples == 3);
    assert(observer.commits == 1);
    assert(observer.accepted == 1);
    assert(observer.epoch_ends == 3);
    assert(observer.capped == 0);
    assert(observer.ends == 1);
    assert(observer.final_state == TrainState::converged);
  }

  {
    // The cap is checked before every commit attempt and ends training.
    auto corpus = MakeCorpus({"ababab c"});
    TrainerOptions opts;
    opts.iterations = 3;
    opts.min_count = 1;
    opts.vocab_size = 2;
    RecordingObserver observer;
    auto result = MdlTrainer(opts, &observer).Train(corpus);

    assert(result.final_state == TrainState::capped);
    assert(result.epochs.size() == 1);
    assert(result.epochs[0].candidate_count == 1);
    assert(result.epochs[0].attempted == 0);
    assert(result.codebook.Size() <= opts.vocab_size + 1);
    assert(observer.capped == 1);
    assert(observer.commits == 0);
    assert(observer.epoch_ends == 0);
    assert(observer.ends == 1);
  }

  {
    // Partial merges grow the codebook; the cap stops the epoch one commit past the limit.
    auto corpus = MakeCorpus({"ab ab ab ab ab a b", "cd cd cd cd cd c d", "ef ef ef ef ef e f",
                              "gh gh gh gh gh g h"});
    TrainerOptions opts;
    opts.iterations = 3;
    opts.min_count = 1;
    opts.vocab_size = 9;
    RecordingObserver observer;
    auto result = MdlTrainer(opts, &observer).Train(corpus);

    assert(result.final_state == TrainState::capped);
    assert(result.epochs.size() == 1);
    const auto& report = result.epochs[0];
    assert(report.candidate_count == 4);
    assert(report.attempted == 2);
    assert(report.committed == 2);
    assert(report.attempted > 0 && report.attempted < report.candidate_count);
    assert(result.codebook.Size() == opts.vocab_size + 1);
    assert(result.codebook.Get("ab") == 5);
    assert(result.codebook.Get("a") == 1);
    assert(result.codebook.Get("cd") == 5);
    assert(!result.codebook.Contains("ef"));
    assert(!result.codebook.Contains("gh"));
    assert(observer.commits == 2);
    assert(observer.capped == 1);
  }

  {
    // Epoch numbers in the log are 1-based.
    std::ostringstream log;
    LogObserver observer(log, 0);
    auto corpus = MakeCorpus({"ababab"});
    TrainerOptions opts;
    opts.iterations = 2;
    opts.min_count = 1;
    opts.vocab_size = 100;
    (void)MdlTrainer(opts, &observer).Train(corpus);
    const std::string text = log.str();
    assert(text.find("Epoch: [2/2]") != std::string::npos);
    assert(text.find("No merge committed in epoch 2") != std::string::npos);
    assert(text.find("epoch 1\n") == std::string::npos);
  }

  {
    std::ostringstream log;
    LogObserver observer(log, 0);
    auto corpus = MakeCorpus({"ababab"});
    TrainerOptions opts;
    opts.iterations = 1;
    opts.min_count = 1;
    opts.vocab_size = 100;
    (void)MdlTrainer(opts, &observer).Train(corpus);
    const std::string text = log.str();
    assert(text.find("Epoch: [1/1]") != std::string::npos);
    assert(text.find("Candidates: 1") != std::string::npos);
    assert(text.find("Vocabulary size: 2 -> 1") != std::string::npos);
    assert(text.find("Codebook size: 1") != std::string::npos);
  }

  assert(FormatDuration(3725.0) == "01:02:05");
  {
    std::ostringstream out;
    ProgressTracker progress(out, 4, "Commit to codebook", 0);
    progress.Add(1, 1);
    progress.Add(3, 0);
    progress.Finish();
    progress.Finish();
    assert(progress.done() == 4);
    assert(progress.accepted() == 1);
    assert(out.str().find("[Commit to codebook] 4/4 (100.0%) accepted 1") != std::string::npos);
  }

  {
    auto corpus = MakeCorpus({"ababab"});
    TrainerOptions opts;
    opts.min_count = 0;
    bool threw = false;
    try {
      (void)MdlTrainer(opts).Train(corpus);
    } catch (const std::invalid_argument&) {
      threw = true;
    }
    assert(threw);

    opts.min_count = 1;
    opts.threshold = 1.5;
    threw = false;
    try {
      (void)MdlTrainer(opts).Train(corpus);
    } catch (const std::invalid_argument&) {
      threw = true;
    }
    assert(threw);

    Corpus empty;
    threw = false;
    try {
      (void)MdlTrainer().Train(empty);
    } catch (const std::invalid_argument&) {
      threw = true;
    }
    assert(threw);
  }

  return 0;
}

#include "mdlvocab/trainer.hpp"

#include <cmath>
#include <stdexcept>
#include <string>
#include <utility>

namespace mdlvocab {

namespace {

TrainObserver& SilentObserver() {
  static TrainObserver observer;
  return observer;
}

}  // namespace

void TrainerOptions::Validate() const {
  if (min_count < 1) {
    throw std::invalid_argument("min_count must be positive");
  }
  if (vocab_size == 0) {
    throw std::invalid_argument("vocab_size must be positive");
  }
  if (!std::isfinite(threshold) || threshold <= 0.0 || threshold > 1.0) {
    throw std::invalid_argument("threshold must be in (0, 1]");
  }
  if (!std::isfinite(candidate_pool_ratio) || candidate_pool_ratio <= 0.0) {
    throw std::invalid_argument("candidate_pool_ratio must be positive");
  }
}

SelectorOptions TrainerOptions::ToSelectorOptions() const {
  SelectorOptions out;
  out.min_count = min_count;
  out.vocab_size = vocab_size;
  out.threshold = threshold;
  out.candidate_pool_ratio = candidate_pool_ratio;
  return out;
}

MdlTrainer::MdlTrainer(TrainerOptions options, TrainObserver* observer)
    : options_(options), observer_(observer != nullptr ? observer : &SilentObserver()) {}

bool MdlTrainer::UpdateCodebook(const std::vector<Candidate>& candidates, ConflictAwareCommitter& committer,
                                EpochState& state, EpochReport& report) const {
  for (const auto& candidate : candidates) {
    if (state.codebook.Size() > options_.vocab_size) {
      return false;
    }
    ++report.attempted;
    const bool committed = committer.Commit(candidate);
    if (committed) {
      ++report.committed;
    }
    observer_->OnCommit(candidate, committed, state.codebook.Size());
  }
  return true;
}

TrainResult MdlTrainer::Train(TrainingCorpus& corpus) const {
  options_.Validate();

  const auto& alphabet = corpus.BuildVocab();
  if (alphabet.empty()) {
    throw std::invalid_argument("training corpus is empty");
  }

  TrainResult result;
  result.alphabet_size = alphabet.size();
  result.log_base = CostModel::LogBaseFor(alphabet.size());
  result.codebook = Codebook(corpus.vocab(), corpus.stopwords());
  observer_->OnTrainBegin(result.alphabet_size, result.log_base, corpus.DataLen());

  const CostModel cost_model(result.log_base);
  const CandidateSelector selector(options_.ToSelectorOptions(), cost_model);

  for (std::size_t epoch = 0; epoch < options_.iterations; ++epoch) {
    observer_->OnEpochBegin(epoch, options_.iterations);
    if (options_.verbose) {
      observer_->OnSamples(corpus.SampleLines(options_.sample_count));
    }

    EpochReport report;
    report.epoch = epoch;
    report.state = TrainState::seeded;
    EpochState state{Codebook(corpus.vocab(), corpus.stopwords()), corpus.DataLen()};
    report.vocab_before = state.codebook.Size();
    report.data_len_before = state.data_len;

    const PairStatistics stats = corpus.BuildPairStats();
    report.state = TrainState::stats_collected;
    report.pair_count = stats.Size();

    const std::vector<Candidate> candidates = selector.Select(stats, state.codebook, state.data_len);
    report.state = TrainState::candidates_selected;
    report.candidate_count = candidates.size();
    observer_->OnCandidates(epoch, report.pair_count, report.candidate_count);

    report.state = TrainState::committing;
    ConflictAwareCommitter committer(cost_model, options_.min_count, corpus, state);
    const bool completed = UpdateCodebook(candidates, committer, state, report);

    report.vocab_after = state.codebook.Size();
    report.data_len_after = state.data_len;
    result.codebook = std::move(state.codebook);

    if (!completed) {
      report.state = TrainState::capped;
      result.final_state = report.state;
      result.epochs.push_back(report);
      observer_->OnCapped(report);
      break;
    }

    report.state = report.committed == 0 ? TrainState::converged : TrainState::epoch_done;
    result.final_state = report.state;
    result.epochs.push_back(report);
    corpus.ApplyCodebook(result.codebook);
    observer_->OnEpochEnd(report);
  }

  observer_->OnTrainEnd(result.epochs.size(), result.final_state, result.codebook.Size());
  return result;
}

}  // namespace mdlvocab

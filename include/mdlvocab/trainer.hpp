#pragma once

#include <cstddef>
#include <vector>

#include "mdlvocab/candidate_selector.hpp"
#include "mdlvocab/codebook.hpp"
#include "mdlvocab/committer.hpp"
#include "mdlvocab/cost_model.hpp"
#include "mdlvocab/observer.hpp"
#include "mdlvocab/training_corpus.hpp"

namespace mdlvocab {

struct TrainerOptions {
  std::size_t iterations = 5;
  Count min_count = 5;
  // Soft cap: an epoch stops as soon as the codebook grows past it.
  std::size_t vocab_size = 20000;
  double threshold = 0.8;
  double candidate_pool_ratio = 0.5;
  // Report sample segmentations at the start of every epoch.
  bool verbose = false;
  std::size_t sample_count = 5;

  // Throws std::invalid_argument. iterations == 0 is accepted.
  void Validate() const;
  [[nodiscard]] SelectorOptions ToSelectorOptions() const;
};

struct TrainResult {
  Codebook codebook;
  TrainState final_state = TrainState::seeded;
  double log_base = 0.0;
  std::size_t alphabet_size = 0;
  std::vector<EpochReport> epochs;
};

// Epoch loop: seed a codebook from the corpus, collect pair statistics,
// select and commit MDL-beneficial merges, then re-encode the corpus. Stops
// after `iterations` epochs or when the codebook outgrows `vocab_size`.
class MdlTrainer {
 public:
  // `observer` may be null and must outlive the trainer otherwise.
  explicit MdlTrainer(TrainerOptions options = {}, TrainObserver* observer = nullptr);

  [[nodiscard]] TrainResult Train(TrainingCorpus& corpus) const;

  [[nodiscard]] const TrainerOptions& options() const { return options_; }

 private:
  // Commits `candidates` in order; returns false when the cap stopped it.
  bool UpdateCodebook(const std::vector<Candidate>& candidates, ConflictAwareCommitter& committer,
                      EpochState& state, EpochReport& report) const;

  TrainerOptions options_;
  TrainObserver* observer_;
};

}  // namespace mdlvocab

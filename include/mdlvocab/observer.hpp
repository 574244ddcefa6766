#pragma once

#include <cstddef>
#include <cstdint>
#include <iosfwd>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "mdlvocab/candidate_selector.hpp"
#include "mdlvocab/codebook.hpp"

namespace mdlvocab {

class ProgressTracker;

enum class TrainState {
  seeded = 0,
  stats_collected,
  candidates_selected,
  committing,
  converged,
  capped,
  epoch_done
};

[[nodiscard]] std::string_view TrainStateName(TrainState state);

struct EpochReport {
  std::size_t epoch = 0;
  // epoch_done, converged (nothing committed) or capped.
  TrainState state = TrainState::seeded;
  std::size_t pair_count = 0;
  std::size_t candidate_count = 0;
  std::size_t attempted = 0;
  std::size_t committed = 0;
  std::size_t vocab_before = 0;
  std::size_t vocab_after = 0;
  Count data_len_before = 0;
  Count data_len_after = 0;
};

// Side channel for progress reporting. Every hook defaults to a no-op, so
// the base class itself is the silent observer.
class TrainObserver {
 public:
  virtual ~TrainObserver() = default;

  virtual void OnTrainBegin(std::size_t /*alphabet_size*/, double /*log_base*/, Count /*data_len*/) {}
  virtual void OnEpochBegin(std::size_t /*epoch*/, std::size_t /*iterations*/) {}
  virtual void OnSamples(const std::vector<std::string>& /*samples*/) {}
  virtual void OnCandidates(std::size_t /*epoch*/, std::size_t /*pair_count*/, std::size_t /*candidate_count*/) {}
  virtual void OnCommit(const Candidate& /*candidate*/, bool /*committed*/, std::size_t /*codebook_size*/) {}
  virtual void OnEpochEnd(const EpochReport& /*report*/) {}
  virtual void OnCapped(const EpochReport& /*report*/) {}
  virtual void OnTrainEnd(std::size_t /*epochs_run*/, TrainState /*final_state*/, std::size_t /*codebook_size*/) {}
};

// Human-readable progress on a stream, normally std::cerr.
class LogObserver final : public TrainObserver {
 public:
  explicit LogObserver(std::ostream& out, std::uint64_t progress_interval_ms = 1000);
  ~LogObserver() override;

  void OnTrainBegin(std::size_t alphabet_size, double log_base, Count data_len) override;
  void OnEpochBegin(std::size_t epoch, std::size_t iterations) override;
  void OnSamples(const std::vector<std::string>& samples) override;
  void OnCandidates(std::size_t epoch, std::size_t pair_count, std::size_t candidate_count) override;
  void OnCommit(const Candidate& candidate, bool committed, std::size_t codebook_size) override;
  void OnEpochEnd(const EpochReport& report) override;
  void OnCapped(const EpochReport& report) override;
  void OnTrainEnd(std::size_t epochs_run, TrainState final_state, std::size_t codebook_size) override;

 private:
  void FinishProgress();

  std::ostream& out_;
  std::uint64_t progress_interval_ms_;
  std::unique_ptr<ProgressTracker> progress_;
};

}  // namespace mdlvocab

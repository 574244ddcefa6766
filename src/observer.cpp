#include "mdlvocab/observer.hpp"

#include <iomanip>
#include <ostream>
#include <sstream>

#include "mdlvocab/progress.hpp"

namespace mdlvocab {

std::string_view TrainStateName(TrainState state) {
  switch (state) {
    case TrainState::seeded:
      return "seeded";
    case TrainState::stats_collected:
      return "stats_collected";
    case TrainState::candidates_selected:
      return "candidates_selected";
    case TrainState::committing:
      return "committing";
    case TrainState::converged:
      return "converged";
    case TrainState::capped:
      return "capped";
    case TrainState::epoch_done:
      return "epoch_done";
  }
  return "seeded";
}

LogObserver::LogObserver(std::ostream& out, std::uint64_t progress_interval_ms)
    : out_(out), progress_interval_ms_(progress_interval_ms) {}

LogObserver::~LogObserver() = default;

void LogObserver::OnTrainBegin(std::size_t alphabet_size, double log_base, Count data_len) {
  std::ostringstream oss;
  oss << "Alphabet: " << alphabet_size << "\n"
      << "Tokens: " << data_len << "\n"
      << "Log base: " << std::setprecision(6) << log_base << "\n";
  out_ << oss.str();
}

void LogObserver::OnEpochBegin(std::size_t epoch, std::size_t iterations) {
  const std::string rule(30, '-');
  out_ << rule << " Epoch: [" << (epoch + 1) << "/" << iterations << "] " << rule << "\n";
}

void LogObserver::OnSamples(const std::vector<std::string>& samples) {
  for (const auto& line : samples) {
    out_ << "  | " << line << "\n";
  }
}

void LogObserver::OnCandidates(std::size_t /*epoch*/, std::size_t pair_count, std::size_t candidate_count) {
  out_ << "Pairs: " << pair_count << "\n";
  out_ << "Candidates: " << candidate_count << "\n";
  progress_ = std::make_unique<ProgressTracker>(out_, candidate_count, "Commit to codebook", progress_interval_ms_);
}

void LogObserver::OnCommit(const Candidate& /*candidate*/, bool committed, std::size_t /*codebook_size*/) {
  if (progress_) {
    progress_->Add(1, committed ? 1 : 0);
  }
}

void LogObserver::FinishProgress() {
  if (progress_) {
    progress_->Finish();
    progress_.reset();
  }
}

void LogObserver::OnEpochEnd(const EpochReport& report) {
  FinishProgress();
  out_ << "Vocabulary size: " << report.vocab_before << " -> " << report.vocab_after << "\n";
  if (report.state == TrainState::converged) {
    out_ << "No merge committed in epoch " << (report.epoch + 1) << "\n";
  }
}

void LogObserver::OnCapped(const EpochReport& report) {
  FinishProgress();
  out_ << "Vocabulary size: " << report.vocab_before << " -> " << report.vocab_after << "\n";
  out_ << "Vocabulary cap reached after " << report.committed << " merges; stopping\n";
}

void LogObserver::OnTrainEnd(std::size_t epochs_run, TrainState final_state, std::size_t codebook_size) {
  out_ << "Epochs: " << epochs_run << " (" << TrainStateName(final_state) << ")\n";
  out_ << "Codebook size: " << codebook_size << "\n";
}

}  // namespace mdlvocab

#include "mdlvocab/progress.hpp"

#include <iomanip>
#include <sstream>
#include <utility>

namespace mdlvocab {

std::string FormatDuration(double seconds) {
  const int sec = static_cast<int>(seconds + 0.5);
  const int h = sec / 3600;
  const int m = (sec % 3600) / 60;
  const int s = sec % 60;
  std::ostringstream oss;
  oss << std::setfill('0') << std::setw(2) << h << ":" << std::setw(2) << m << ":" << std::setw(2) << s;
  return oss.str();
}

ProgressTracker::ProgressTracker(std::ostream& out, std::uint64_t total, std::string label,
                                 std::uint64_t interval_ms)
    : out_(out), label_(std::move(label)), total_(total), interval_ms_(interval_ms) {
  start_ = std::chrono::steady_clock::now();
  last_print_ = start_;
}

void ProgressTracker::Add(std::uint64_t done, std::uint64_t accepted) {
  done_ += done;
  accepted_ += accepted;
  MaybePrint(false);
}

void ProgressTracker::Finish() {
  if (finished_) {
    return;
  }
  finished_ = true;
  MaybePrint(true);
}

void ProgressTracker::MaybePrint(bool force) {
  const auto now = std::chrono::steady_clock::now();
  if (!force) {
    const auto delta = std::chrono::duration_cast<std::chrono::milliseconds>(now - last_print_).count();
    if (delta < static_cast<long long>(interval_ms_)) {
      return;
    }
  }
  last_print_ = now;

  const double elapsed = std::chrono::duration_cast<std::chrono::duration<double>>(now - start_).count();
  const double rate = elapsed > 0.0 ? static_cast<double>(done_) / elapsed : 0.0;
  const double eta = (rate > 0.0 && total_ > done_) ? static_cast<double>(total_ - done_) / rate : 0.0;

  std::ostringstream oss;
  oss.setf(std::ios::fixed);
  oss << "[" << label_ << "] " << done_;
  if (total_ > 0) {
    const double pct = 100.0 * static_cast<double>(done_) / static_cast<double>(total_);
    oss << "/" << total_ << " (" << std::setprecision(1) << pct << "%)";
  }
  oss << " accepted " << accepted_;
  if (rate > 0.0) {
    oss << " rate " << std::setprecision(2) << rate << " it/s";
  }
  if (eta > 0.0) {
    oss << " ETA " << FormatDuration(eta);
  }
  oss << "\n";
  out_ << oss.str();
}

}  // namespace mdlvocab

#pragma once

#include <chrono>
#include <cstdint>
#include <ostream>
#include <string>

namespace mdlvocab {

// Rate-limited "[label] done/total" progress lines.
class ProgressTracker {
 public:
  ProgressTracker(std::ostream& out, std::uint64_t total, std::string label, std::uint64_t interval_ms);

  void Add(std::uint64_t done, std::uint64_t accepted);
  void Finish();

  [[nodiscard]] std::uint64_t done() const { return done_; }
  [[nodiscard]] std::uint64_t accepted() const { return accepted_; }

 private:
  void MaybePrint(bool force);

  std::ostream& out_;
  std::string label_;
  std::uint64_t total_ = 0;
  std::uint64_t interval_ms_ = 1000;
  std::uint64_t done_ = 0;
  std::uint64_t accepted_ = 0;
  bool finished_ = false;
  std::chrono::steady_clock::time_point start_;
  std::chrono::steady_clock::time_point last_print_;
};

[[nodiscard]] std::string FormatDuration(double seconds);

}  // namespace mdlvocab

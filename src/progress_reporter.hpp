#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

// 350 -> "350.0B", 1536 -> "1.5KiB"
std::string format_file_size(double num, const std::string& suffix = "B");

// Counts download completions (in whatever order they arrive) and decides
// when a progress line is due: whenever floor(100 * completed / total) moves
// past the highest percentage reported so far.
class ProgressTracker {
public:
  explicit ProgressTracker(std::size_t total);

  // Returns true when this completion crosses a new percentage.
  bool record(bool success);

  std::size_t total() const { return total_; }
  std::size_t completed() const { return completed_; }
  std::size_t succeeded() const { return succeeded_; }
  int reported_percent() const { return reported_percent_; }

  std::string status_line() const;

private:
  std::size_t total_ = 0;
  std::size_t completed_ = 0;
  std::size_t succeeded_ = 0;
  int reported_percent_ = 0;
};

std::string summary_line(std::size_t succeeded, std::size_t total);

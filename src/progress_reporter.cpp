#include "progress_reporter.hpp"

#include <array>
#include <cmath>

#include <spdlog/fmt/fmt.h>

std::string format_file_size(double num, const std::string& suffix) {
  static const std::array<const char*, 8> units = {"", "Ki", "Mi", "Gi", "Ti", "Pi", "Ei", "Zi"};
  for(const char* unit : units) {
    if(std::fabs(num) < 1024.0) {
      return fmt::format("{:3.1f}{}{}", num, unit, suffix);
    }
    num /= 1024.0;
  }
  return fmt::format("{:.1f}Yi{}", num, suffix);
}

ProgressTracker::ProgressTracker(std::size_t total) : total_(total) {}

bool ProgressTracker::record(bool success) {
  if(completed_ >= total_) return false;
  ++completed_;
  if(success) ++succeeded_;
  const int percent = static_cast<int>((completed_ * 100) / total_);
  if(percent <= reported_percent_) return false;
  reported_percent_ = percent;
  return true;
}

std::string ProgressTracker::status_line() const {
  return fmt::format("Finished {}/{} downloads ({} successful)", completed_, total_, succeeded_);
}

std::string summary_line(std::size_t succeeded, std::size_t total) {
  return fmt::format("{}/{} downloads finished successfully", succeeded, total);
}

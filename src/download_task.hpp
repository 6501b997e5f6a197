#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

#include "log.hpp"
#include "process_runner.hpp"

struct CopySettings {
  std::vector<std::string> command{"gfal-copy"};
  EnvOverlay env;
};

// One remote file to mirror. The task checks the destination when it is built:
// a local file at least as large as the remote one counts as done, a smaller
// one is removed so the copy starts from scratch.
class DownloadTask {
public:
  enum class Status { Pending, Done };
  enum class Outcome { AlreadyComplete, Downloaded, Failed };

  DownloadTask(std::string origin_url,
               std::filesystem::path destination,
               uint64_t expected_bytes,
               Logger* logger = nullptr);

  DownloadTask(DownloadTask&&) = default;
  DownloadTask& operator=(DownloadTask&&) = default;
  DownloadTask(const DownloadTask&) = delete;
  DownloadTask& operator=(const DownloadTask&) = delete;

  Outcome run(const CommandRunner& runner, const CopySettings& copy, Logger* logger = nullptr);

  const std::string& origin_url() const { return origin_url_; }
  const std::filesystem::path& destination() const { return destination_; }
  uint64_t expected_bytes() const { return expected_bytes_; }
  Status status() const { return status_; }
  bool done() const { return status_ == Status::Done; }

  std::vector<std::string> copy_arguments(const CopySettings& copy) const;
  // "% gfal-copy <url> <dest> (1.5KiB, TODO)"
  std::string describe(const CopySettings& copy) const;

private:
  Status classify(Logger* logger);
  static void make_parent_dir(const std::filesystem::path& path);

  std::string origin_url_;
  std::filesystem::path destination_;
  uint64_t expected_bytes_ = 0;
  Status status_ = Status::Pending;
};

const char* to_string(DownloadTask::Outcome outcome);

#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include "download_task.hpp"
#include "log.hpp"
#include "process_runner.hpp"
#include "remote_lister.hpp"

class SettingsManager;
class TaskHarvester;

struct SyncOptions {
  std::string srm;
  std::filesystem::path dest = ".";
  std::vector<std::string> paths;
  std::vector<std::string> lfn_strip;
  std::string filter = "*.root";
  std::vector<std::string> exclude;
  std::vector<std::string> dirfilter;
  int max_depth = 1;
  std::size_t jobs = 1;
  std::size_t list_jobs = 10;
  RemoteLister::Commands commands;
  CopySettings copy;
  std::filesystem::path local_list;
  bool dry_run = false;

  // Loads the gfalenv file too; throws ConfigError on invalid values.
  static SyncOptions from_settings(const SettingsManager& settings);
  void validate() const;
};

struct SyncSummary {
  std::size_t total_tasks = 0;
  std::size_t already_complete = 0;
  std::size_t pending_tasks = 0;
  std::size_t succeeded = 0;
  std::size_t failed = 0;
  uint64_t bytes_pending = 0;
  uint64_t bytes_transferred = 0;
};

class SyncEngine {
public:
  SyncEngine(SyncOptions options,
             CommandRunner runner = {},
             std::shared_ptr<Logger> logger = nullptr);
  ~SyncEngine();

  // Harvest everything, then download what is still missing.
  SyncSummary run();

  // Harvests every path argument in order; tasks keep their classification.
  std::vector<DownloadTask> collect_tasks();

  // Runs the pending tasks on the download pool; Done tasks are skipped.
  SyncSummary download(std::vector<DownloadTask> tasks);

  const SyncOptions& options() const { return options_; }
  std::shared_ptr<Logger> logger() const { return logger_; }

private:
  std::vector<DownloadTask> tasks_for_path(const std::string& path);
  void write_local_list(const std::vector<DownloadTask>& tasks) const;

  SyncOptions options_;
  CommandRunner runner_;
  std::shared_ptr<Logger> logger_;
  std::shared_ptr<RemoteLister> lister_;
  std::unique_ptr<TaskHarvester> harvester_;
};

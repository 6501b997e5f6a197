#include "sync_engine.hpp"

#include <asio.hpp>

#include <algorithm>
#include <fstream>
#include <mutex>

#include "path_utils.hpp"
#include "progress_reporter.hpp"
#include "settings_manager.hpp"
#include "sync_errors.hpp"
#include "task_harvester.hpp"

namespace fs = std::filesystem;

namespace {

struct TaskTotals {
  std::size_t count = 0;
  uint64_t bytes = 0;
};

TaskTotals pending_totals(const std::vector<DownloadTask>& tasks) {
  TaskTotals totals;
  for(const auto& task : tasks) {
    if(task.done()) continue;
    ++totals.count;
    totals.bytes += task.expected_bytes();
  }
  return totals;
}

TaskTotals all_totals(const std::vector<DownloadTask>& tasks) {
  TaskTotals totals;
  for(const auto& task : tasks) {
    ++totals.count;
    totals.bytes += task.expected_bytes();
  }
  return totals;
}

std::string size_string(uint64_t bytes) {
  return format_file_size(static_cast<double>(bytes));
}

std::vector<std::string> command_from_setting(const SettingsManager& settings, const std::string& key) {
  auto argv = split_command(settings.get<std::string>(key));
  if(argv.empty()) {
    throw ConfigError("Setting '" + key + "' must name a command");
  }
  return argv;
}

} // namespace

SyncOptions SyncOptions::from_settings(const SettingsManager& settings) {
  SyncOptions options;
  options.srm = settings.get<std::string>("srm");
  options.dest = settings.get<std::string>("dest");
  options.paths = settings.get<std::vector<std::string>>("path");
  options.lfn_strip = settings.get<std::vector<std::string>>("lfn_strip");
  options.filter = settings.get<std::string>("filter");
  options.exclude = settings.get<std::vector<std::string>>("exclude");
  options.dirfilter = settings.get<std::vector<std::string>>("dirfilter");
  options.max_depth = settings.get<int>("max_depth");

  int jobs = settings.get<int>("jobs");
  int list_jobs = settings.get<int>("list_jobs");
  if(jobs < 1) throw ConfigError("jobs must be at least 1 (got " + std::to_string(jobs) + ")");
  if(list_jobs < 1) throw ConfigError("list_jobs must be at least 1 (got " + std::to_string(list_jobs) + ")");
  options.jobs = static_cast<std::size_t>(jobs);
  options.list_jobs = static_cast<std::size_t>(list_jobs);

  options.commands.list = command_from_setting(settings, "ls_command");
  options.commands.list_detailed = command_from_setting(settings, "lfn_ls_command");
  options.copy.command = command_from_setting(settings, "copy_command");

  auto gfalenv = settings.get<std::string>("gfalenv");
  if(!gfalenv.empty()) {
    options.copy.env = load_env_overlay(gfalenv, settings.get<bool>("gfalenv_replace"));
  }
  options.local_list = settings.get<std::string>("local_list");
  options.dry_run = settings.get<bool>("dry_run");
  options.validate();
  return options;
}

void SyncOptions::validate() const {
  if(srm.empty()) throw ConfigError("No SRM server given (--srm)");
  if(paths.empty()) throw ConfigError("No path to synchronize given");
  if(max_depth < 1) throw ConfigError("max_depth must be at least 1 (got " + std::to_string(max_depth) + ")");
  if(jobs < 1) throw ConfigError("jobs must be at least 1");
  if(list_jobs < 1) throw ConfigError("list_jobs must be at least 1");
  if(dest.empty()) throw ConfigError("Destination must not be empty");
  for(const auto& prefix : lfn_strip) {
    if(prefix.empty()) throw ConfigError("Empty --lfn-strip prefix");
  }
}

SyncEngine::SyncEngine(SyncOptions options, CommandRunner runner, std::shared_ptr<Logger> logger)
  : options_(std::move(options)),
    runner_(runner ? std::move(runner) : default_command_runner()),
    logger_(logger ? std::move(logger) : std::make_shared<Logger>("sync-engine")) {
  options_.validate();

  lister_ = std::make_shared<RemoteLister>(runner_, options_.commands, options_.copy.env, logger_);

  HarvestSettings harvest;
  harvest.remote_root = options_.srm;
  harvest.destination = options_.dest;
  harvest.list_jobs = options_.list_jobs;
  harvest.file_selector = make_file_selector(options_.filter, options_.exclude);
  harvest.dir_selector = make_directory_selector(options_.dirfilter);
  harvest.lfn_strip = options_.lfn_strip;
  harvester_ = std::make_unique<TaskHarvester>(lister_, std::move(harvest), logger_);
}

SyncEngine::~SyncEngine() = default;

std::vector<DownloadTask> SyncEngine::tasks_for_path(const std::string& path) {
  std::vector<DownloadTask> tasks;
  auto sink = [&tasks](DownloadTask&& task){ tasks.push_back(std::move(task)); };

  std::error_code ec;
  if(fs::is_regular_file(path, ec)) {
    logger_->debug("Reading LFNs from {}", path);
    auto lfns = read_lfn_list(path);
    harvester_->harvest_lfns(lfns, sink);
  } else {
    logger_->debug("{} is not a file, going recursive", path);
    harvester_->harvest_path(path, options_.max_depth - 1, sink);
    if(!tasks.empty()) {
      auto totals = all_totals(tasks);
      logger_->info("List of files to synchronize for {} ({} files, {})",
                    join_url({options_.srm, path}), totals.count, size_string(totals.bytes));
      for(const auto& task : tasks) {
        logger_->debug("{}", task.describe(options_.copy));
      }
    }
  }

  if(!tasks.empty()) {
    auto pending = pending_totals(tasks);
    logger_->debug("Still to download for {}: {} files, {}", path, pending.count, size_string(pending.bytes));
  } else {
    logger_->warn("No files found for {}", path);
  }
  return tasks;
}

std::vector<DownloadTask> SyncEngine::collect_tasks() {
  std::vector<DownloadTask> tasks;
  for(const auto& path : options_.paths) {
    auto path_tasks = tasks_for_path(path);
    tasks.insert(tasks.end(),
                 std::make_move_iterator(path_tasks.begin()),
                 std::make_move_iterator(path_tasks.end()));
  }
  auto pending = pending_totals(tasks);
  logger_->info("Still to download in total: {} files, {}", pending.count, size_string(pending.bytes));
  return tasks;
}

void SyncEngine::write_local_list(const std::vector<DownloadTask>& tasks) const {
  std::vector<std::string> lines;
  lines.reserve(tasks.size());
  for(const auto& task : tasks) lines.push_back(task.destination().string());
  std::sort(lines.begin(), lines.end());

  std::error_code ec;
  if(fs::exists(options_.local_list, ec)) {
    throw OutputExistsError(options_.local_list.string());
  }
  if(options_.local_list.has_parent_path()) {
    fs::create_directories(options_.local_list.parent_path(), ec);
  }
  std::ofstream out(options_.local_list);
  if(!out) {
    throw SyncError("Unable to write " + options_.local_list.string());
  }
  for(std::size_t i = 0; i < lines.size(); ++i) {
    if(i > 0) out << '\n';
    out << lines[i];
  }
  logger_->info("Wrote {} local paths to {}", lines.size(), options_.local_list.string());
}

SyncSummary SyncEngine::run() {
  if(!options_.local_list.empty()) {
    std::error_code ec;
    if(fs::exists(options_.local_list, ec)) {
      throw OutputExistsError(options_.local_list.string());
    }
  }

  auto tasks = collect_tasks();
  if(!options_.local_list.empty()) {
    write_local_list(tasks);
  }
  return download(std::move(tasks));
}

SyncSummary SyncEngine::download(std::vector<DownloadTask> tasks) {
  SyncSummary summary;
  summary.total_tasks = tasks.size();

  std::vector<DownloadTask> pending;
  pending.reserve(tasks.size());
  for(auto& task : tasks) {
    if(task.done()) {
      ++summary.already_complete;
      continue;
    }
    summary.bytes_pending += task.expected_bytes();
    pending.push_back(std::move(task));
  }
  summary.pending_tasks = pending.size();

  if(pending.empty()) {
    logger_->info("Nothing to download, all {} files are present", summary.total_tasks);
    return summary;
  }
  logger_->debug("An example task: {}", pending.front().describe(options_.copy));

  if(options_.dry_run) {
    for(const auto& task : pending) {
      logger_->print("{}", task.describe(options_.copy));
    }
    logger_->info("Dry run: would download {} files, {}", pending.size(), size_string(summary.bytes_pending));
    return summary;
  }

  logger_->info("Launching {} simultaneous downloads", options_.jobs);
  ProgressTracker tracker(pending.size());
  std::mutex progress_mutex;

  asio::thread_pool pool(options_.jobs);
  for(auto& task : pending) {
    asio::post(pool, [this, &task, &tracker, &summary, &progress_mutex]() {
      DownloadTask::Outcome outcome = DownloadTask::Outcome::Failed;
      try {
        outcome = task.run(runner_, options_.copy, logger_.get());
      } catch(const std::exception& e) {
        logger_->error("Unexpected error while downloading {}: {}", task.origin_url(), e.what());
      }
      const bool ok = outcome != DownloadTask::Outcome::Failed;

      std::lock_guard<std::mutex> lock(progress_mutex);
      if(ok) {
        ++summary.succeeded;
        if(outcome == DownloadTask::Outcome::Downloaded) {
          summary.bytes_transferred += task.expected_bytes();
        }
        logger_->debug("{} {}", to_string(outcome), task.origin_url());
      } else {
        ++summary.failed;
        logger_->error("{} while downloading {}", to_string(outcome), task.origin_url());
      }
      if(tracker.record(ok)) {
        logger_->info("{}", tracker.status_line());
      }
    });
  }
  pool.join();

  logger_->info("{}", summary_line(summary.succeeded, pending.size()));
  logger_->info("Transferred {} of {}", size_string(summary.bytes_transferred), size_string(summary.bytes_pending));
  return summary;
}

#include "task_harvester.hpp"

#include <algorithm>
#include <cctype>
#include <condition_variable>
#include <deque>
#include <exception>
#include <fstream>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <thread>
#include <unordered_map>

#include <spdlog/fmt/ranges.h>

#include "path_utils.hpp"
#include "progress_reporter.hpp"
#include "sync_errors.hpp"

namespace {

// Fixed set of listing workers sharing one job queue. Jobs may push more jobs;
// run() returns once the queue is drained and no job is in flight.
class ListingPool {
public:
  using Job = std::function<void(ListingPool&)>;

  explicit ListingPool(std::size_t workers) : workers_(std::max<std::size_t>(1, workers)) {}

  void push(Job job) {
    {
      std::lock_guard<std::mutex> lock(job_mutex_);
      if(failure_) return;
      job_queue_.push_back(std::move(job));
    }
    job_cv_.notify_one();
  }

  void run() {
    std::vector<std::thread> threads;
    threads.reserve(workers_);
    for(std::size_t i = 0; i < workers_; ++i) {
      threads.emplace_back([this]{ worker_fn(); });
    }
    for(auto& thread : threads) {
      if(thread.joinable()) thread.join();
    }
    if(error_) std::rethrow_exception(error_);
  }

private:
  std::optional<Job> take_job() {
    std::unique_lock<std::mutex> lock(job_mutex_);
    job_cv_.wait(lock, [&]{
      return failure_ || !job_queue_.empty() || active_jobs_ == 0;
    });
    if(failure_ || job_queue_.empty()) return std::nullopt;
    Job job = std::move(job_queue_.front());
    job_queue_.pop_front();
    ++active_jobs_;
    return job;
  }

  void finish_job(std::exception_ptr error) {
    {
      std::lock_guard<std::mutex> lock(job_mutex_);
      if(active_jobs_ > 0) --active_jobs_;
      if(error && !failure_) {
        failure_ = true;
        error_ = error;
        job_queue_.clear();
      }
    }
    job_cv_.notify_all();
  }

  void worker_fn() {
    while(true) {
      auto job = take_job();
      if(!job) break;
      std::exception_ptr error;
      try {
        (*job)(*this);
      } catch(...) {
        error = std::current_exception();
      }
      finish_job(error);
    }
  }

  std::size_t workers_;
  std::mutex job_mutex_;
  std::condition_variable job_cv_;
  std::deque<Job> job_queue_;
  std::size_t active_jobs_ = 0;
  bool failure_ = false;
  std::exception_ptr error_;
};

std::string directory_basename(const std::string& name) {
  auto trimmed = rstrip_slashes(name);
  auto pos = trimmed.rfind('/');
  return pos == std::string::npos ? trimmed : trimmed.substr(pos + 1);
}

} // namespace

FileSelector make_file_selector(std::string pattern, std::vector<std::string> excludes) {
  return [pattern = std::move(pattern), excludes = std::move(excludes)](const std::string& name) {
    if(!glob_match(pattern, name)) return false;
    return std::none_of(excludes.begin(), excludes.end(),
                        [&](const std::string& ex){ return glob_match(ex, name); });
  };
}

DirectorySelector make_directory_selector(const std::vector<std::string>& globs) {
  std::map<int, std::vector<std::string>> by_level;
  for(const auto& glob : globs) {
    int level = 1;
    std::string pattern = glob;
    auto colon = glob.find(':');
    if(colon != std::string::npos && colon > 0 &&
       std::all_of(glob.begin(), glob.begin() + colon, [](unsigned char c){ return std::isdigit(c); })) {
      try {
        level = std::stoi(glob.substr(0, colon));
      } catch(const std::out_of_range&) {
        throw ConfigError("Invalid --dirfilter level in '" + glob + "'");
      }
      pattern = glob.substr(colon + 1);
    }
    by_level[level].push_back(pattern);
  }
  return [by_level = std::move(by_level)](int level, const std::string& name) {
    auto it = by_level.find(level);
    if(it == by_level.end()) return true;
    const auto base = directory_basename(name);
    return std::any_of(it->second.begin(), it->second.end(),
                       [&](const std::string& pattern){ return glob_match(pattern, base); });
  };
}

TaskHarvester::TaskHarvester(std::shared_ptr<RemoteLister> lister,
                             HarvestSettings settings,
                             std::shared_ptr<Logger> logger)
  : lister_(std::move(lister)),
    settings_(std::move(settings)),
    logger_(logger ? std::move(logger) : std::make_shared<Logger>("harvester")) {
  if(!lister_) throw InvalidArgumentError("TaskHarvester needs a RemoteLister");
  if(!settings_.dir_selector) settings_.dir_selector = [](int, const std::string&){ return true; };
  if(!settings_.file_selector) settings_.file_selector = [](const std::string&){ return true; };
}

std::size_t TaskHarvester::harvest_path(const std::string& base, int remaining_levels, const TaskSink& sink) {
  std::mutex sink_mutex;
  std::size_t produced = 0;

  struct Walk {
    std::string path;
    int level = 0;
    int remaining = 0;
  };

  std::function<void(ListingPool&, const Walk&)> visit;
  visit = [&](ListingPool& pool, const Walk& walk) {
    logger_->debug("harvest with srm={}, base={}, path={}, level={}, remaining={}, dest={}",
                   settings_.remote_root, base, walk.path, walk.level, walk.remaining,
                   settings_.destination.string());
    auto listing = lister_->list(settings_.remote_root, join_url({base, walk.path}));
    for(const auto& file : listing.files) {
      if(!settings_.file_selector(file.name)) continue;
      DownloadTask task(join_url({settings_.remote_root, base, walk.path, file.name}),
                        join_url({settings_.destination.string(), walk.path, file.name}),
                        file.size_bytes.value_or(0),
                        logger_.get());
      std::lock_guard<std::mutex> lock(sink_mutex);
      ++produced;
      sink(std::move(task));
    }
    if(walk.remaining <= 0) return;
    for(const auto& subdir : listing.subdirectories) {
      if(!settings_.dir_selector(walk.level, subdir)) {
        logger_->debug("Skipping directory {} at level {}", subdir, walk.level);
        continue;
      }
      Walk child{join_url({walk.path, subdir}), walk.level + 1, walk.remaining - 1};
      pool.push([&visit, child](ListingPool& p){ visit(p, child); });
    }
  };

  ListingPool pool(settings_.list_jobs);
  Walk root{".", 0, remaining_levels};
  pool.push([&visit, root](ListingPool& p){ visit(p, root); });
  pool.run();
  return produced;
}

std::filesystem::path TaskHarvester::resolve_destination_dir(const std::string& lfn_directory) const {
  if(settings_.lfn_strip.empty()) {
    return settings_.destination / lstrip_slashes(lfn_directory);
  }
  const std::string covered = rstrip_slashes(lfn_directory) + "/";
  std::vector<std::string> matches;
  for(const auto& prefix : settings_.lfn_strip) {
    if(covered.compare(0, prefix.size(), prefix) != 0) continue;
    if(std::find(matches.begin(), matches.end(), prefix) == matches.end()) {
      matches.push_back(prefix);
    }
  }
  if(matches.empty()) {
    throw UnresolvedPrefixError(lfn_directory,
      fmt::format("LFN directory {} does not start with any of the prefixes [{}]",
                  lfn_directory, fmt::join(settings_.lfn_strip, ", ")));
  }
  if(matches.size() > 1) {
    throw AmbiguousPrefixError(lfn_directory,
      fmt::format("LFN directory {} matches more than one prefix [{}]",
                  lfn_directory, fmt::join(matches, ", ")));
  }
  auto remainder = covered.substr(matches.front().size());
  return settings_.destination / strip_slashes(remainder);
}

std::vector<LfnGroup> TaskHarvester::group_lfns(const std::vector<std::string>& lfns) const {
  std::vector<LfnGroup> groups;
  std::unordered_map<std::string, std::size_t> index;
  for(const auto& lfn : lfns) {
    auto [directory, name] = split_lfn(lfn);
    if(name.empty()) {
      logger_->warn("Ignoring LFN without a file name: '{}'", lfn);
      continue;
    }
    auto it = index.find(directory);
    if(it == index.end()) {
      it = index.emplace(directory, groups.size()).first;
      groups.push_back(LfnGroup{directory, {}, {}});
    }
    groups[it->second].names.push_back(name);
  }
  for(auto& group : groups) {
    group.destination = resolve_destination_dir(group.directory);
  }
  return groups;
}

std::size_t TaskHarvester::harvest_lfns(const std::vector<std::string>& lfns, const TaskSink& sink) {
  const auto groups = group_lfns(lfns);

  std::mutex sink_mutex;
  std::size_t produced = 0;
  ListingPool pool(settings_.list_jobs);
  for(const auto& group : groups) {
    pool.push([&, group_ptr = &group](ListingPool&) {
      const auto& g = *group_ptr;
      auto sizes = lister_->list_detailed(join_url({settings_.remote_root, g.directory}));
      for(const auto& name : g.names) {
        auto it = sizes.find(name);
        if(it == sizes.end()) {
          logger_->error("No size found for {} in the listing of {}, skipping",
                         name, join_url({settings_.remote_root, g.directory}));
          continue;
        }
        DownloadTask task(join_url({settings_.remote_root, g.directory, name}),
                          join_url({g.destination.string(), name}),
                          it->second,
                          logger_.get());
        std::lock_guard<std::mutex> lock(sink_mutex);
        ++produced;
        sink(std::move(task));
      }
    });
  }
  pool.run();
  return produced;
}

std::vector<std::string> read_lfn_list(const std::filesystem::path& path) {
  std::ifstream in(path);
  if(!in) {
    throw ConfigError("Unable to read LFN list " + path.string());
  }
  std::vector<std::string> lfns;
  std::string line;
  while(std::getline(in, line)) {
    auto trimmed = line;
    trimmed.erase(0, trimmed.find_first_not_of(" \t\r\n"));
    auto end = trimmed.find_last_not_of(" \t\r\n");
    if(end == std::string::npos) continue;
    trimmed.erase(end + 1);
    if(trimmed.front() == '#') continue;
    lfns.push_back(std::move(trimmed));
  }
  return lfns;
}

#pragma once

#include <cstddef>
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "download_task.hpp"
#include "log.hpp"
#include "remote_lister.hpp"

// level is the depth of the directory being listed (0 for the walked path),
// name is the subdirectory name as listed (with trailing '/').
using DirectorySelector = std::function<bool(int level, const std::string& name)>;
using FileSelector = std::function<bool(const std::string& name)>;
using TaskSink = std::function<void(DownloadTask&& task)>;

// Accepts files matching pattern and none of the exclusions.
FileSelector make_file_selector(std::string pattern, std::vector<std::string> excludes = {});

// Globs are "GLOB" (applies at level 1) or "LEVEL:GLOB". At a level with
// globs a directory must match at least one of them; other levels pass.
DirectorySelector make_directory_selector(const std::vector<std::string>& globs);

struct HarvestSettings {
  std::string remote_root;
  std::filesystem::path destination = ".";
  std::size_t list_jobs = 10;
  DirectorySelector dir_selector;
  FileSelector file_selector;
  std::vector<std::string> lfn_strip;
};

struct LfnGroup {
  std::string directory;
  std::vector<std::string> names;
  std::filesystem::path destination;
};

class TaskHarvester {
public:
  TaskHarvester(std::shared_ptr<RemoteLister> lister,
                HarvestSettings settings,
                std::shared_ptr<Logger> logger = nullptr);

  // Walks remote_root/base down remaining_levels directories. Tasks reach the
  // sink as each listing resolves; the sink is never called concurrently.
  std::size_t harvest_path(const std::string& base, int remaining_levels, const TaskSink& sink);

  // One detailed listing per distinct LFN directory. Destinations are resolved
  // for every directory before the first listing, so a bad prefix aborts early.
  std::size_t harvest_lfns(const std::vector<std::string>& lfns, const TaskSink& sink);

  std::vector<LfnGroup> group_lfns(const std::vector<std::string>& lfns) const;
  std::filesystem::path resolve_destination_dir(const std::string& lfn_directory) const;

  const HarvestSettings& settings() const { return settings_; }

private:
  std::shared_ptr<RemoteLister> lister_;
  HarvestSettings settings_;
  std::shared_ptr<Logger> logger_;
};

// One LFN per line; blank lines and lines starting with '#' are skipped.
std::vector<std::string> read_lfn_list(const std::filesystem::path& path);

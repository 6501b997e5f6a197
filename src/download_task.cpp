#include "download_task.hpp"

#include <system_error>

#include "progress_reporter.hpp"

namespace fs = std::filesystem;

DownloadTask::DownloadTask(std::string origin_url,
                           fs::path destination,
                           uint64_t expected_bytes,
                           Logger* logger)
  : origin_url_(std::move(origin_url)),
    destination_(std::move(destination)),
    expected_bytes_(expected_bytes) {
  status_ = classify(logger);
}

DownloadTask::Status DownloadTask::classify(Logger* logger) {
  std::error_code ec;
  if(!fs::exists(destination_, ec)) return Status::Pending;

  auto disk_size = fs::file_size(destination_, ec);
  if(ec) {
    log_warn(logger, "Unable to read size of {}: {}", destination_.string(), ec.message());
    return Status::Pending;
  }
  if(disk_size >= expected_bytes_) return Status::Done;

  log_warn(logger, "Disk size of {} is {}, but {} is expected from SRM, removing",
           destination_.string(), disk_size, expected_bytes_);
  if(!fs::remove(destination_, ec) || ec) {
    log_error(logger, "Failed to remove {}: {}", destination_.string(),
              ec ? ec.message() : std::string("not removed"));
  }
  return Status::Pending;
}

void DownloadTask::make_parent_dir(const fs::path& path) {
  auto parent = path.parent_path();
  if(parent.empty()) return;
  std::error_code ec;
  if(fs::is_directory(parent, ec)) return;
  fs::create_directories(parent, ec);
  if(ec) {
    throw std::system_error(ec, "cannot create " + parent.string());
  }
}

std::vector<std::string> DownloadTask::copy_arguments(const CopySettings& copy) const {
  auto argv = copy.command;
  argv.push_back(origin_url_);
  argv.push_back(fs::absolute(destination_).string());
  return argv;
}

std::string DownloadTask::describe(const CopySettings& copy) const {
  return fmt::format("% {} ({}, {})",
                     format_command(copy_arguments(copy)),
                     format_file_size(static_cast<double>(expected_bytes_)),
                     done() ? "DONE" : "TODO");
}

DownloadTask::Outcome DownloadTask::run(const CommandRunner& runner,
                                        const CopySettings& copy,
                                        Logger* logger) {
  if(done()) return Outcome::AlreadyComplete;

  try {
    make_parent_dir(destination_);
  } catch(const std::system_error& e) {
    log_error(logger, "Cannot prepare {} for {}: {}", destination_.string(), origin_url_, e.what());
    return Outcome::Failed;
  }

  auto argv = copy_arguments(copy);
  auto result = runner(argv, copy.env);
  if(!result.ok()) {
    if(!result.launched) {
      log_error(logger, "Copy of {} to {} could not start: {}",
                origin_url_, destination_.string(), result.launch_error);
    } else {
      log_error(logger, "Command '{}' exited with status code {} while downloading {} to {}\n{}",
                format_command(argv), result.exit_code, origin_url_, destination_.string(), result.err);
    }
    return Outcome::Failed;
  }
  status_ = Status::Done;
  return Outcome::Downloaded;
}

const char* to_string(DownloadTask::Outcome outcome) {
  switch(outcome) {
    case DownloadTask::Outcome::AlreadyComplete: return "Already downloaded";
    case DownloadTask::Outcome::Downloaded: return "Downloaded";
    case DownloadTask::Outcome::Failed: return "Failed";
  }
  return "Unknown";
}

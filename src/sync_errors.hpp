#pragma once

#include <stdexcept>
#include <string>

// Fatal conditions. Anything thrown from this hierarchy aborts the run;
// per-entry failures (listing, copy) are logged instead.
class SyncError : public std::runtime_error {
public:
  explicit SyncError(const std::string& message) : std::runtime_error(message) {}
};

class InvalidArgumentError : public SyncError {
public:
  explicit InvalidArgumentError(const std::string& message) : SyncError(message) {}
};

class ConfigError : public SyncError {
public:
  explicit ConfigError(const std::string& message) : SyncError(message) {}
};

// An LFN directory is not covered by any --lfn-strip prefix.
class UnresolvedPrefixError : public SyncError {
public:
  UnresolvedPrefixError(const std::string& directory, const std::string& message)
    : SyncError(message), directory_(directory) {}

  const std::string& directory() const { return directory_; }

private:
  std::string directory_;
};

// An LFN directory is covered by more than one --lfn-strip prefix.
class AmbiguousPrefixError : public SyncError {
public:
  AmbiguousPrefixError(const std::string& directory, const std::string& message)
    : SyncError(message), directory_(directory) {}

  const std::string& directory() const { return directory_; }

private:
  std::string directory_;
};

class OutputExistsError : public SyncError {
public:
  explicit OutputExistsError(const std::string& path)
    : SyncError("File " + path + " already exists"), path_(path) {}

  const std::string& path() const { return path_; }

private:
  std::string path_;
};

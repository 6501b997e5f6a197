#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "log.hpp"
#include "process_runner.hpp"

struct RemoteEntry {
  std::string name;
  bool is_directory = false;
  std::optional<uint64_t> size_bytes;
};

struct DirectoryListing {
  std::vector<std::string> subdirectories; // names keep their trailing '/'
  std::vector<RemoteEntry> files;
};

// srmls entry lines start with this many spaces
inline constexpr std::size_t kListingIndent = 6;

class RemoteLister {
public:
  struct Commands {
    std::vector<std::string> list{"srmls"};
    std::vector<std::string> list_detailed{"gfal-ls", "-l"};
  };

  RemoteLister(CommandRunner runner,
               Commands commands,
               EnvOverlay env,
               std::shared_ptr<Logger> logger = nullptr);

  // Immediate children of join_url(remote_root, path). A failing listing is
  // logged and returns an empty listing.
  DirectoryListing list(const std::string& remote_root, const std::string& path) const;

  // name -> size for every entry of a "gfal-ls -l" style listing of url.
  std::map<std::string, uint64_t> list_detailed(const std::string& url) const;

  static DirectoryListing parse_listing(const std::string& output,
                                        const std::string& path,
                                        Logger* logger = nullptr);
  static std::map<std::string, uint64_t> parse_detailed_listing(const std::string& output,
                                                                Logger* logger = nullptr);

private:
  bool check(const std::vector<std::string>& argv, const CommandResult& result) const;

  CommandRunner runner_;
  Commands commands_;
  EnvOverlay env_;
  std::shared_ptr<Logger> logger_;
};

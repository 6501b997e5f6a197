#include "remote_lister.hpp"

#include <sstream>

#include "path_utils.hpp"

namespace {

std::vector<std::string> split_whitespace(const std::string& line) {
  std::vector<std::string> tokens;
  std::istringstream in(line);
  std::string token;
  while(in >> token) tokens.push_back(std::move(token));
  return tokens;
}

std::optional<uint64_t> parse_size(const std::string& token) {
  if(token.empty()) return std::nullopt;
  for(char c : token) {
    if(c < '0' || c > '9') return std::nullopt;
  }
  try {
    return static_cast<uint64_t>(std::stoull(token));
  } catch(const std::exception&) {
    return std::nullopt;
  }
}

} // namespace

RemoteLister::RemoteLister(CommandRunner runner,
                           Commands commands,
                           EnvOverlay env,
                           std::shared_ptr<Logger> logger)
  : runner_(runner ? std::move(runner) : default_command_runner()),
    commands_(std::move(commands)),
    env_(std::move(env)),
    logger_(logger ? std::move(logger) : std::make_shared<Logger>("lister")) {}

bool RemoteLister::check(const std::vector<std::string>& argv, const CommandResult& result) const {
  if(result.ok()) return true;
  if(!result.launched) {
    logger_->error("Command '{}' could not be run: {}", format_command(argv), result.launch_error);
  } else {
    logger_->error("Command '{}' exited with status code {}\n{}",
                   format_command(argv), result.exit_code, result.err);
  }
  return false;
}

DirectoryListing RemoteLister::list(const std::string& remote_root, const std::string& path) const {
  auto argv = commands_.list;
  argv.push_back(join_url({remote_root, path}));
  logger_->debug("Listing {}", argv.back());
  // srmls runs with the inherited environment; the overlay is only for gfal tools
  auto result = runner_(argv, EnvOverlay{});
  if(!check(argv, result)) return {};
  return parse_listing(result.out, path, logger_.get());
}

std::map<std::string, uint64_t> RemoteLister::list_detailed(const std::string& url) const {
  auto argv = commands_.list_detailed;
  argv.push_back(url);
  logger_->debug("Listing {}", url);
  auto result = runner_(argv, env_);
  if(!check(argv, result)) return {};
  return parse_detailed_listing(result.out, logger_.get());
}

DirectoryListing RemoteLister::parse_listing(const std::string& output,
                                             const std::string& path,
                                             Logger* logger) {
  DirectoryListing listing;
  const std::string prefix = rstrip_slashes(path) + "/";
  const std::string indent(kListingIndent, ' ');

  std::istringstream in(output);
  std::string line;
  while(std::getline(in, line)) {
    if(line.compare(0, indent.size(), indent) != 0) continue;
    auto tokens = split_whitespace(line);
    if(tokens.size() < 2) continue;
    auto size = parse_size(tokens[0]);
    auto pos = tokens[1].find(prefix);
    if(!size || pos == std::string::npos) {
      if(logger) logger->debug("Skipping unexpected listing line '{}'", line);
      continue;
    }
    std::string name = tokens[1].substr(pos + prefix.size());
    if(name.empty()) continue;
    if(name.back() == '/') {
      listing.subdirectories.push_back(std::move(name));
    } else {
      listing.files.push_back(RemoteEntry{std::move(name), false, size});
    }
  }
  return listing;
}

std::map<std::string, uint64_t> RemoteLister::parse_detailed_listing(const std::string& output,
                                                                     Logger* logger) {
  std::map<std::string, uint64_t> sizes;
  std::istringstream in(output);
  std::string line;
  while(std::getline(in, line)) {
    auto tokens = split_whitespace(line);
    if(tokens.empty()) continue;
    if(tokens.size() < 9) {
      if(logger) logger->debug("Skipping short listing line '{}'", line);
      continue;
    }
    auto size = parse_size(tokens[4]);
    if(!size) {
      if(logger) logger->debug("Skipping listing line without size '{}'", line);
      continue;
    }
    sizes[tokens[8]] = *size;
  }
  return sizes;
}

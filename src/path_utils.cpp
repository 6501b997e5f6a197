#include "path_utils.hpp"

#include <fnmatch.h>

#include "sync_errors.hpp"

std::string lstrip_slashes(const std::string& value) {
  auto pos = value.find_first_not_of('/');
  if(pos == std::string::npos) return std::string();
  return value.substr(pos);
}

std::string rstrip_slashes(const std::string& value) {
  auto pos = value.find_last_not_of('/');
  if(pos == std::string::npos) return std::string();
  return value.substr(0, pos + 1);
}

std::string strip_slashes(const std::string& value) {
  return lstrip_slashes(rstrip_slashes(value));
}

std::string join_url(const std::vector<std::string>& parts) {
  if(parts.empty()) {
    throw InvalidArgumentError("join_url needs at least one path segment");
  }
  if(parts.size() == 1) return parts.front();

  std::vector<std::string> kept;
  kept.reserve(parts.size());
  kept.push_back(parts.front());
  for(std::size_t i = 1; i < parts.size(); ++i) {
    const auto trimmed = strip_slashes(parts[i]);
    if(trimmed == "." || trimmed.empty()) continue;
    kept.push_back(parts[i]);
  }
  if(kept.size() == 1) return kept.front();

  std::string joined = rstrip_slashes(kept.front());
  for(std::size_t i = 1; i < kept.size(); ++i) {
    joined += '/';
    if(i + 1 == kept.size()) {
      joined += lstrip_slashes(kept[i]);
    } else {
      joined += strip_slashes(kept[i]);
    }
  }

  // collapse "/./" left inside segments
  std::string out;
  out.reserve(joined.size());
  std::size_t pos = 0;
  while(pos < joined.size()) {
    if(joined.compare(pos, 3, "/./") == 0) {
      out += '/';
      pos += 3;
    } else {
      out += joined[pos++];
    }
  }
  return out;
}

std::string join_url(std::initializer_list<std::string> parts) {
  return join_url(std::vector<std::string>(parts));
}

std::pair<std::string, std::string> split_lfn(const std::string& lfn) {
  auto pos = lfn.rfind('/');
  if(pos == std::string::npos) return {std::string(), lfn};
  return {lfn.substr(0, pos), lfn.substr(pos + 1)};
}

bool glob_match(const std::string& pattern, const std::string& name) {
  return ::fnmatch(pattern.c_str(), name.c_str(), 0) == 0;
}

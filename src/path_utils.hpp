#pragma once

#include <initializer_list>
#include <string>
#include <utility>
#include <vector>

// Joins URL/path segments with exactly one '/' between them.
// The first segment keeps its leading slashes and the last its trailing ones;
// "." segments after the first are dropped. Throws InvalidArgumentError when
// called without segments.
std::string join_url(const std::vector<std::string>& parts);
std::string join_url(std::initializer_list<std::string> parts);

// "/store/X/a.root" -> {"/store/X", "a.root"}; no slash -> {"", name}
std::pair<std::string, std::string> split_lfn(const std::string& lfn);

// Case-sensitive shell glob (fnmatch without flags).
bool glob_match(const std::string& pattern, const std::string& name);

std::string strip_slashes(const std::string& value);
std::string lstrip_slashes(const std::string& value);
std::string rstrip_slashes(const std::string& value);

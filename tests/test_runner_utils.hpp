#pragma once

#include "log.hpp"
#include "process_runner.hpp"
#include "sync_engine.hpp"

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iostream>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

namespace srmsync::test {

inline constexpr const char* kFakeHost = "srm://se.example.org";

class LogCapture {
public:
  LogCapture() = default;

  ~LogCapture() {
    detach_all();
  }

  void attach(const std::shared_ptr<Logger>& logger,
              const std::string& label = std::string()) {
    if(!logger) return;
    auto handle = logger->add_listener([this, label](const LogRecord& record) {
      std::lock_guard<std::mutex> lock(mutex_);
      lines_.emplace_back((label.empty() ? record.source : label) + ":" +
                          to_string(record.channel) + ": " + record.message);
      return false;
    });
    std::lock_guard<std::mutex> lock(attachments_mutex_);
    attachments_.push_back({logger, handle});
  }

  void detach_all() {
    std::vector<Attachment> pending;
    {
      std::lock_guard<std::mutex> lock(attachments_mutex_);
      pending.swap(attachments_);
    }
    for(auto& attachment : pending) {
      if(attachment.logger && attachment.handle != 0) {
        attachment.logger->remove_listener(attachment.handle);
      }
    }
  }

  void clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    lines_.clear();
  }

  std::vector<std::string> snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return lines_;
  }

  std::size_t count_substring(const std::string& needle) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<std::size_t>(std::count_if(lines_.begin(), lines_.end(),
      [&](const std::string& line){ return line.find(needle) != std::string::npos; }));
  }

  bool contains(const std::string& needle) const {
    return count_substring(needle) > 0;
  }

private:
  struct Attachment {
    std::shared_ptr<Logger> logger;
    LogListenerHandle handle = 0;
  };

  mutable std::mutex mutex_;
  std::vector<std::string> lines_;
  std::mutex attachments_mutex_;
  std::vector<Attachment> attachments_;
};

struct TestContext {
  LogCapture& logs;
  bool verbose = false;
  std::vector<std::string> failures;

  bool expect(bool condition, const std::string& what) {
    if(!condition) failures.push_back(what);
    return condition;
  }
};

struct TestCase {
  const char* name;
  std::function<bool(TestContext&)> fn;
};

inline std::filesystem::path make_workspace(const std::string& name) {
  auto root = std::filesystem::temp_directory_path() / ("srmsync_" + name);
  std::error_code ec;
  std::filesystem::remove_all(root, ec);
  std::filesystem::create_directories(root, ec);
  return root;
}

inline void write_file(const std::filesystem::path& path, uint64_t size) {
  std::error_code ec;
  if(path.has_parent_path()) std::filesystem::create_directories(path.parent_path(), ec);
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  std::string block(static_cast<std::size_t>(std::min<uint64_t>(size, 4096)), 'x');
  uint64_t left = size;
  while(left > 0) {
    auto n = std::min<uint64_t>(left, block.size());
    out.write(block.data(), static_cast<std::streamsize>(n));
    left -= n;
  }
}

inline void write_text(const std::filesystem::path& path, const std::string& text) {
  std::error_code ec;
  if(path.has_parent_path()) std::filesystem::create_directories(path.parent_path(), ec);
  std::ofstream out(path, std::ios::trunc);
  out << text;
}

// In-process stand-in for srmls, gfal-ls -l and gfal-copy over a fixed tree.
// Remote paths are absolute ("/pnfs/root/A/f1.root"); URLs are kFakeHost + path.
class FakeRemote {
public:
  void add_file(const std::string& path, uint64_t size) {
    std::lock_guard<std::mutex> lock(mutex_);
    files_[path] = size;
    auto dir = path.substr(0, path.rfind('/'));
    while(!dir.empty()) {
      directories_.insert(dir);
      auto pos = dir.rfind('/');
      if(pos == std::string::npos) break;
      dir = dir.substr(0, pos);
    }
  }

  void fail_listing(const std::string& path) {
    std::lock_guard<std::mutex> lock(mutex_);
    failing_listings_.insert(path);
  }

  void fail_copy(const std::string& path) {
    std::lock_guard<std::mutex> lock(mutex_);
    failing_copies_.insert(path);
  }

  CommandRunner runner() {
    return [this](const std::vector<std::string>& argv, const EnvOverlay& env) {
      return handle(argv, env);
    };
  }

  std::vector<std::string> listed_paths() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return listed_;
  }

  std::vector<std::string> detailed_paths() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return detailed_;
  }

  std::vector<std::string> copied_paths() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return copied_;
  }

  std::vector<EnvOverlay> copy_environments() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return copy_envs_;
  }

  void reset_calls() {
    std::lock_guard<std::mutex> lock(mutex_);
    listed_.clear();
    detailed_.clear();
    copied_.clear();
    copy_envs_.clear();
  }

private:
  static std::string strip_host(const std::string& url) {
    std::string host(kFakeHost);
    if(url.compare(0, host.size(), host) == 0) return url.substr(host.size());
    return url;
  }

  static std::string without_trailing_slash(std::string path) {
    while(path.size() > 1 && path.back() == '/') path.pop_back();
    return path;
  }

  CommandResult handle(const std::vector<std::string>& argv, const EnvOverlay& env) {
    CommandResult result;
    result.launched = true;
    if(argv.empty()) {
      result.exit_code = 1;
      return result;
    }
    const auto& cmd = argv.front();
    if(cmd == "srmls" && argv.size() == 2) return list(without_trailing_slash(strip_host(argv[1])));
    if(cmd == "gfal-ls" && argv.size() == 3) return list_long(without_trailing_slash(strip_host(argv[2])));
    if(cmd == "gfal-copy" && argv.size() == 3) return copy(strip_host(argv[1]), argv[2], env);
    result.exit_code = 2;
    result.err = "unexpected command";
    return result;
  }

  std::vector<std::pair<std::string, bool>> children_locked(const std::string& dir) const {
    std::vector<std::pair<std::string, bool>> out;
    const std::string prefix = dir + "/";
    for(const auto& d : directories_) {
      if(d.compare(0, prefix.size(), prefix) == 0 && d.find('/', prefix.size()) == std::string::npos) {
        out.emplace_back(d, true);
      }
    }
    for(const auto& f : files_) {
      if(f.first.compare(0, prefix.size(), prefix) == 0 && f.first.find('/', prefix.size()) == std::string::npos) {
        out.emplace_back(f.first, false);
      }
    }
    return out;
  }

  CommandResult list(const std::string& dir) {
    std::lock_guard<std::mutex> lock(mutex_);
    listed_.push_back(dir);
    CommandResult result;
    result.launched = true;
    if(failing_listings_.count(dir) || !directories_.count(dir)) {
      result.exit_code = 1;
      result.err = "SRM_INVALID_PATH";
      return result;
    }
    std::ostringstream out;
    out << "  512 " << dir << "/\n";
    for(const auto& [path, is_dir] : children_locked(dir)) {
      if(is_dir) {
        out << "      512 " << path << "/\n";
      } else {
        out << "      " << files_.at(path) << " " << path << "\n";
        out << "         space token(s) :none found\n";
      }
    }
    result.exit_code = 0;
    result.out = out.str();
    return result;
  }

  CommandResult list_long(const std::string& dir) {
    std::lock_guard<std::mutex> lock(mutex_);
    detailed_.push_back(dir);
    CommandResult result;
    result.launched = true;
    if(failing_listings_.count(dir) || !directories_.count(dir)) {
      result.exit_code = 2;
      result.err = "No such file or directory";
      return result;
    }
    std::ostringstream out;
    for(const auto& [path, is_dir] : children_locked(dir)) {
      auto name = path.substr(path.rfind('/') + 1);
      uint64_t size = is_dir ? 512 : files_.at(path);
      out << (is_dir ? "drwxr-xr-x" : "-rw-r--r--") << "   1 1000  1000  "
          << size << " Jun 25 10:00 " << name << "\n";
    }
    result.exit_code = 0;
    result.out = out.str();
    return result;
  }

  CommandResult copy(const std::string& source, const std::string& dest, const EnvOverlay& env) {
    uint64_t size = 0;
    bool fail = false;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      copied_.push_back(source);
      copy_envs_.push_back(env);
      auto it = files_.find(source);
      fail = failing_copies_.count(source) || it == files_.end();
      if(!fail) size = it->second;
    }
    CommandResult result;
    result.launched = true;
    if(fail) {
      result.exit_code = 70;
      result.err = "Communication error on send";
      return result;
    }
    write_file(dest, size);
    result.exit_code = 0;
    return result;
  }

  mutable std::mutex mutex_;
  std::map<std::string, uint64_t> files_;
  std::set<std::string> directories_;
  std::set<std::string> failing_listings_;
  std::set<std::string> failing_copies_;
  std::vector<std::string> listed_;
  std::vector<std::string> detailed_;
  std::vector<std::string> copied_;
  std::vector<EnvOverlay> copy_envs_;
};

// Tracks how many calls of one command run at the same time.
class InFlightCounter {
public:
  void enter() {
    std::lock_guard<std::mutex> lock(mutex_);
    ++calls_;
    ++current_;
    peak_ = std::max(peak_, current_);
  }

  void leave() {
    std::lock_guard<std::mutex> lock(mutex_);
    --current_;
  }

  std::size_t peak() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return peak_;
  }

  std::size_t calls() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return calls_;
  }

private:
  mutable std::mutex mutex_;
  std::size_t current_ = 0;
  std::size_t peak_ = 0;
  std::size_t calls_ = 0;
};

using CallDelay = std::function<std::chrono::milliseconds(const std::vector<std::string>& argv)>;

// Wraps inner so that every call of command is counted and held for delay(argv)
// before it runs. The counter must outlive the returned runner.
inline CommandRunner slowed_runner(CommandRunner inner, std::string command,
                                   CallDelay delay, InFlightCounter& counter) {
  return [inner = std::move(inner), command = std::move(command), delay = std::move(delay), &counter]
         (const std::vector<std::string>& argv, const EnvOverlay& env) {
    if(argv.empty() || argv.front() != command) return inner(argv, env);
    counter.enter();
    std::this_thread::sleep_for(delay(argv));
    auto result = inner(argv, env);
    counter.leave();
    return result;
  };
}

inline int run_tests(const char* suite, const std::vector<TestCase>& tests, int argc, char** argv) {
  bool verbose = (std::getenv("SRMSYNC_TEST_VERBOSE") != nullptr);
  for(int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if(arg == "-v" || arg == "--verbose") {
      verbose = true;
    }
  }

  bool show_logs = (std::getenv("SRMSYNC_TEST_LOGS") != nullptr) || verbose;
  const bool suppress_logs = !show_logs;
  if(suppress_logs) {
    set_log_passthrough(false);
  }
  init(verbose);

  LogCapture logs;
  std::size_t failures = 0;
  std::cout << "Running " << tests.size() << " " << suite << " tests: " << std::flush;

  for(const auto& test : tests) {
    logs.clear();
    TestContext ctx{logs, verbose, {}};
    bool passed = false;
    try {
      passed = test.fn(ctx) && ctx.failures.empty();
    } catch(const std::exception& e) {
      passed = false;
      ctx.failures.push_back(std::string("exception: ") + e.what());
    }
    logs.detach_all();
    if(passed) {
      std::cout << '.' << std::flush;
    } else {
      std::cout << 'F' << " (" << test.name << ")\n";
      failures++;
      for(const auto& failure : ctx.failures) {
        std::cout << "    expected: " << failure << "\n";
      }
      for(const auto& line : logs.snapshot()) {
        std::cout << "    " << line << "\n";
      }
    }
  }
  std::cout << "\n";
  if(suppress_logs) {
    set_log_passthrough(true);
  }
  if(failures == 0) {
    std::cout << "PASS (" << tests.size() << " tests)\n";
    return 0;
  }
  std::cout << "FAIL (" << failures << "/" << tests.size() << " failed)\n";
  return 1;
}

} // namespace srmsync::test

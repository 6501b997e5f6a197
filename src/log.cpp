#include "log.hpp"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <memory>
#include <vector>

namespace {

struct ConsoleLoggers {
  std::shared_ptr<spdlog::logger> out;
  std::shared_ptr<spdlog::logger> err;
  std::shared_ptr<spdlog::logger> plain;
  std::shared_ptr<spdlog::sinks::basic_file_sink_mt> file;
};

ConsoleLoggers g_loggers;
std::mutex g_setup_mutex;
std::atomic<bool> g_passthrough{true};
std::atomic<bool> g_verbose{false};

constexpr const char* kPattern = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v";

std::shared_ptr<spdlog::logger> make_console(const char* name,
                                             spdlog::sink_ptr sink,
                                             const char* pattern) {
  sink->set_pattern(pattern);
  auto logger = std::make_shared<spdlog::logger>(name, std::move(sink));
  logger->set_level(spdlog::level::debug);
  logger->flush_on(spdlog::level::warn);
  return logger;
}

// Warnings and errors go to stderr so that dry-run listings on stdout stay clean.
const ConsoleLoggers& loggers_locked() {
  if(!g_loggers.out) {
    g_loggers.out = make_console("srmsync", std::make_shared<spdlog::sinks::stdout_color_sink_mt>(), kPattern);
    g_loggers.err = make_console("srmsync.err", std::make_shared<spdlog::sinks::stderr_color_sink_mt>(), kPattern);
    g_loggers.plain = make_console("srmsync.print", std::make_shared<spdlog::sinks::stdout_color_sink_mt>(), "%v");
    g_loggers.plain->flush_on(spdlog::level::info);
  }
  return g_loggers;
}

} // namespace

void set_log_passthrough(bool enabled) {
  g_passthrough.store(enabled);
}

bool log_passthrough() {
  return g_passthrough.load();
}

const char* to_string(LogChannel channel) {
  switch(channel) {
    case LogChannel::Debug: return "debug";
    case LogChannel::Info: return "info";
    case LogChannel::Warn: return "warn";
    case LogChannel::Error: return "error";
    case LogChannel::Print: return "print";
  }
  return "info";
}

spdlog::level::level_enum level_for(LogChannel channel) {
  switch(channel) {
    case LogChannel::Debug: return spdlog::level::debug;
    case LogChannel::Warn: return spdlog::level::warn;
    case LogChannel::Error: return spdlog::level::err;
    case LogChannel::Info:
    case LogChannel::Print: return spdlog::level::info;
  }
  return spdlog::level::info;
}

void init(bool verbose, const std::string& log_file) {
  std::lock_guard<std::mutex> lock(g_setup_mutex);
  const auto& loggers = loggers_locked();
  if(!log_file.empty() && !g_loggers.file) {
    g_loggers.file = std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file, false);
    g_loggers.file->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] %v");
    loggers.out->sinks().push_back(g_loggers.file);
    loggers.err->sinks().push_back(g_loggers.file);
  }

  g_verbose.store(verbose);
  const auto level = verbose ? spdlog::level::debug : spdlog::level::info;
  loggers.out->set_level(level);
  loggers.err->set_level(level);
  spdlog::set_default_logger(loggers.out);
}

LogListenerHandle Logger::add_listener(Listener listener) {
  if(!listener) return 0;
  std::lock_guard<std::mutex> lock(listener_mutex_);
  const auto id = next_listener_id_++;
  listeners_.emplace(id, std::move(listener));
  return id;
}

void Logger::remove_listener(LogListenerHandle handle) {
  std::lock_guard<std::mutex> lock(listener_mutex_);
  listeners_.erase(handle);
}

bool Logger::debug_enabled() const {
  if(g_verbose.load()) return true;
  // listeners see debug lines even when the console does not
  std::lock_guard<std::mutex> lock(listener_mutex_);
  return !listeners_.empty();
}

void Logger::publish(LogChannel channel, const std::string& message) {
  std::vector<Listener> snapshot;
  {
    std::lock_guard<std::mutex> lock(listener_mutex_);
    for(const auto& entry : listeners_) snapshot.push_back(entry.second);
  }
  const LogRecord record{name_, channel, message};
  bool consumed = false;
  for(const auto& listener : snapshot) {
    try {
      consumed = listener(record) || consumed;
    } catch(const std::exception& e) {
      detail::emit_to_console(LogChannel::Error, name_, fmt::format("log listener threw: {}", e.what()));
    }
  }
  if(consumed) return;
  if(channel == LogChannel::Debug && !g_verbose.load()) return;
  detail::emit_to_console(channel, name_, message);
}

namespace detail {

void emit_to_console(LogChannel channel, const std::string& source, const std::string& message) {
  std::shared_ptr<spdlog::logger> target;
  {
    std::lock_guard<std::mutex> lock(g_setup_mutex);
    const auto& loggers = loggers_locked();
    if(channel == LogChannel::Print) {
      target = loggers.plain;
    } else if(channel == LogChannel::Warn || channel == LogChannel::Error) {
      target = loggers.err;
    } else {
      target = loggers.out;
    }
  }
  if(!log_passthrough()) return;

  if(channel == LogChannel::Print || source.empty()) {
    target->log(level_for(channel), message);
  } else {
    target->log(level_for(channel), fmt::format("[{}] {}", source, message));
  }
}

} // namespace detail

#include "process_runner.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <fstream>
#include <poll.h>
#include <sstream>
#include <sys/wait.h>
#include <unistd.h>

#include <spdlog/fmt/fmt.h>
#include <nlohmann/json.hpp>

#include "sync_errors.hpp"

extern char** environ;

namespace {

struct Pipe {
  int fds[2] = {-1, -1};

  ~Pipe() {
    close_read();
    close_write();
  }

  bool open() { return ::pipe2(fds, O_CLOEXEC) == 0; }
  void close_read() {
    if(fds[0] >= 0) ::close(fds[0]);
    fds[0] = -1;
  }
  void close_write() {
    if(fds[1] >= 0) ::close(fds[1]);
    fds[1] = -1;
  }
};

std::vector<std::string> build_environment(const EnvOverlay& env) {
  std::map<std::string, std::string> merged;
  if(!env.replace && environ) {
    for(char** it = environ; *it; ++it) {
      std::string entry(*it);
      auto eq = entry.find('=');
      if(eq == std::string::npos) continue;
      merged[entry.substr(0, eq)] = entry.substr(eq + 1);
    }
  }
  for(const auto& [key, value] : env.variables) {
    merged[key] = value;
  }
  std::vector<std::string> out;
  out.reserve(merged.size());
  for(const auto& [key, value] : merged) {
    out.push_back(key + "=" + value);
  }
  return out;
}

std::vector<char*> as_c_array(std::vector<std::string>& strings) {
  std::vector<char*> out;
  out.reserve(strings.size() + 1);
  for(auto& s : strings) out.push_back(s.data());
  out.push_back(nullptr);
  return out;
}

// Drains both pipes until EOF on each.
void read_outputs(int out_fd, int err_fd, std::string& out, std::string& err) {
  pollfd fds[2];
  fds[0] = {out_fd, POLLIN, 0};
  fds[1] = {err_fd, POLLIN, 0};
  int open_count = 2;
  char buf[4096];
  while(open_count > 0) {
    int rc = ::poll(fds, 2, -1);
    if(rc < 0) {
      if(errno == EINTR) continue;
      break;
    }
    for(int i = 0; i < 2; ++i) {
      if(fds[i].fd < 0 || fds[i].revents == 0) continue;
      ssize_t n = ::read(fds[i].fd, buf, sizeof(buf));
      if(n > 0) {
        (i == 0 ? out : err).append(buf, static_cast<std::size_t>(n));
      } else if(n == 0 || errno != EINTR) {
        fds[i].fd = -1;
        --open_count;
      }
    }
  }
}

} // namespace

CommandResult run_command(const std::vector<std::string>& argv, const EnvOverlay& env) {
  CommandResult result;
  if(argv.empty()) {
    result.launch_error = "empty command line";
    return result;
  }

  Pipe out_pipe;
  Pipe err_pipe;
  // closed by a successful exec; otherwise carries the child's errno
  Pipe status_pipe;
  if(!out_pipe.open() || !err_pipe.open() || !status_pipe.open()) {
    result.launch_error = fmt::format("pipe failed: {}", std::strerror(errno));
    return result;
  }
  int devnull = ::open("/dev/null", O_RDONLY | O_CLOEXEC);

  // everything the child touches is prepared before fork
  std::vector<std::string> args_storage(argv.begin(), argv.end());
  auto args = as_c_array(args_storage);
  std::vector<std::string> env_storage = build_environment(env);
  auto envp = as_c_array(env_storage);

  const pid_t pid = ::fork();
  if(pid < 0) {
    result.launch_error = fmt::format("fork failed: {}", std::strerror(errno));
    if(devnull >= 0) ::close(devnull);
    return result;
  }

  if(pid == 0) {
    if(devnull >= 0) ::dup2(devnull, STDIN_FILENO);
    ::dup2(out_pipe.fds[1], STDOUT_FILENO);
    ::dup2(err_pipe.fds[1], STDERR_FILENO);
    ::execvpe(args[0], args.data(), envp.data());
    const int exec_errno = errno;
    ssize_t ignored = ::write(status_pipe.fds[1], &exec_errno, sizeof(exec_errno));
    (void)ignored;
    ::_exit(127);
  }

  if(devnull >= 0) ::close(devnull);
  out_pipe.close_write();
  err_pipe.close_write();
  status_pipe.close_write();
  read_outputs(out_pipe.fds[0], err_pipe.fds[0], result.out, result.err);

  int exec_errno = 0;
  ssize_t status_bytes = 0;
  do {
    status_bytes = ::read(status_pipe.fds[0], &exec_errno, sizeof(exec_errno));
  } while(status_bytes < 0 && errno == EINTR);

  int status = 0;
  pid_t waited = 0;
  do {
    waited = ::waitpid(pid, &status, 0);
  } while(waited < 0 && errno == EINTR);
  if(waited < 0) {
    result.launch_error = fmt::format("waitpid failed: {}", std::strerror(errno));
    return result;
  }

  if(status_bytes == static_cast<ssize_t>(sizeof(exec_errno))) {
    result.launch_error = fmt::format("could not execute '{}': {}", argv.front(), std::strerror(exec_errno));
    return result;
  }

  if(WIFEXITED(status)) {
    result.launched = true;
    result.exit_code = WEXITSTATUS(status);
  } else if(WIFSIGNALED(status)) {
    result.launched = true;
    result.exit_code = 128 + WTERMSIG(status);
  }
  return result;
}

CommandRunner default_command_runner() {
  return [](const std::vector<std::string>& argv, const EnvOverlay& env) {
    return run_command(argv, env);
  };
}

EnvOverlay load_env_overlay(const std::filesystem::path& path, bool replace) {
  std::ifstream in(path);
  if(!in) {
    throw ConfigError("Unable to read environment file " + path.string());
  }
  nlohmann::json doc;
  try {
    in >> doc;
  } catch(const std::exception& e) {
    throw ConfigError(fmt::format("Failed to parse {}: {}", path.string(), e.what()));
  }
  if(!doc.is_object()) {
    throw ConfigError("Environment file " + path.string() + " must contain a JSON object");
  }
  EnvOverlay overlay;
  overlay.replace = replace;
  for(const auto& item : doc.items()) {
    const auto& value = item.value();
    if(value.is_string()) {
      overlay.variables[item.key()] = value.get<std::string>();
    } else if(value.is_null()) {
      continue;
    } else if(value.is_primitive()) {
      overlay.variables[item.key()] = value.dump();
    } else {
      throw ConfigError(fmt::format("Environment variable '{}' in {} is not a scalar",
                                    item.key(), path.string()));
    }
  }
  return overlay;
}

std::string format_command(const std::vector<std::string>& argv) {
  std::string out;
  for(const auto& arg : argv) {
    if(!out.empty()) out += ' ';
    out += arg;
  }
  return out;
}

std::vector<std::string> split_command(const std::string& command) {
  std::vector<std::string> out;
  std::istringstream in(command);
  std::string token;
  while(in >> token) out.push_back(token);
  return out;
}

/**
 * @file command_runner.cpp
 * @brief Implements ProcessRunner on top of fork/execvp and poll.
 *
 * stdout and stderr are drained concurrently so a chatty command cannot
 * block on a full pipe, and the whole exchange is bounded by the command's
 * deadline. A close-on-exec status pipe reports exec failures back to the
 * parent.
 */
#include "command_runner.hpp"
#include "errors.hpp"
#include "log.hpp"

#include <array>
#include <cerrno>
#include <cstring>
#include <memory>
#include <sstream>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <spdlog/spdlog.h>

namespace agsq {

namespace {

std::shared_ptr<spdlog::logger> process_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("process");
  }();
  return logger;
}

/// Owns a file descriptor and closes it on destruction.
class ScopedFd {
public:
  ScopedFd() = default;
  explicit ScopedFd(int fd) : fd_(fd) {}
  ~ScopedFd() { reset(); }
  ScopedFd(const ScopedFd &) = delete;
  ScopedFd &operator=(const ScopedFd &) = delete;

  int get() const { return fd_; }
  bool valid() const { return fd_ >= 0; }
  void reset(int fd = -1) {
    if (fd_ >= 0) {
      ::close(fd_);
    }
    fd_ = fd;
  }

private:
  int fd_{-1};
};

struct Pipe {
  ScopedFd read;
  ScopedFd write;
};

bool open_pipe(Pipe &p) {
  int fds[2];
  if (::pipe2(fds, O_CLOEXEC) != 0) {
    return false;
  }
  p.read.reset(fds[0]);
  p.write.reset(fds[1]);
  return true;
}

int wait_child(pid_t pid) {
  int status = 0;
  while (::waitpid(pid, &status, 0) < 0) {
    if (errno != EINTR) {
      return -1;
    }
  }
  if (WIFEXITED(status)) {
    return WEXITSTATUS(status);
  }
  if (WIFSIGNALED(status)) {
    return 128 + WTERMSIG(status);
  }
  return -1;
}

void kill_child(pid_t pid) {
  ::kill(pid, SIGKILL);
  wait_child(pid);
}

} // namespace

std::string describe_command(const std::vector<std::string> &args) {
  std::ostringstream oss;
  for (std::size_t i = 0; i < args.size(); ++i) {
    if (i) {
      oss << ' ';
    }
    const auto &arg = args[i];
    if (arg.find_first_of(" \t\"'") != std::string::npos) {
      oss << '"' << arg << '"';
    } else {
      oss << arg;
    }
  }
  return oss.str();
}

CommandResult ProcessRunner::run(const CommandSpec &spec) {
  if (spec.args.empty()) {
    throw BackendCommandFailure("<empty command>", -1, "no program given");
  }
  const std::string label = describe_command(spec.args);
  process_log()->debug("exec: {} (cwd='{}', timeout={}s)", label, spec.cwd,
                       spec.timeout.count());

  Pipe out_pipe;
  Pipe err_pipe;
  Pipe status_pipe;
  if (!open_pipe(out_pipe) || !open_pipe(err_pipe) || !open_pipe(status_pipe)) {
    throw BackendCommandFailure(label, -1, std::strerror(errno));
  }

  std::vector<char *> argv;
  argv.reserve(spec.args.size() + 1);
  for (const auto &arg : spec.args) {
    argv.push_back(const_cast<char *>(arg.c_str()));
  }
  argv.push_back(nullptr);

  pid_t pid = ::fork();
  if (pid < 0) {
    throw BackendCommandFailure(label, -1, std::strerror(errno));
  }

  if (pid == 0) {
    int status_fd = status_pipe.write.get();
    if (!spec.cwd.empty() && ::chdir(spec.cwd.c_str()) != 0) {
      int err = errno;
      (void)!::write(status_fd, &err, sizeof(err));
      _exit(127);
    }
    for (const auto &[key, value] : spec.env) {
      ::setenv(key.c_str(), value.c_str(), 1);
    }
    ::dup2(out_pipe.write.get(), STDOUT_FILENO);
    ::dup2(err_pipe.write.get(), STDERR_FILENO);
    ::execvp(argv[0], argv.data());
    int err = errno;
    (void)!::write(status_fd, &err, sizeof(err));
    _exit(127);
  }

  out_pipe.write.reset();
  err_pipe.write.reset();
  status_pipe.write.reset();

  int child_errno = 0;
  ssize_t n = 0;
  do {
    n = ::read(status_pipe.read.get(), &child_errno, sizeof(child_errno));
  } while (n < 0 && errno == EINTR);
  if (n > 0) {
    wait_child(pid);
    throw BackendCommandFailure(label, 127, std::strerror(child_errno));
  }

  CommandResult result;
  const auto deadline = std::chrono::steady_clock::now() + spec.timeout;
  std::array<pollfd, 2> fds{{{out_pipe.read.get(), POLLIN, 0},
                             {err_pipe.read.get(), POLLIN, 0}}};
  std::array<std::string *, 2> sinks{&result.out, &result.err};
  std::array<char, 8192> buffer{};
  int open_count = 2;

  while (open_count > 0) {
    auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - std::chrono::steady_clock::now());
    if (remaining.count() <= 0) {
      kill_child(pid);
      process_log()->warn("Command timed out: {}", label);
      throw BackendTimeout(label, static_cast<int>(spec.timeout.count()));
    }
    int rc = ::poll(fds.data(), fds.size(), static_cast<int>(remaining.count()));
    if (rc < 0) {
      if (errno == EINTR) {
        continue;
      }
      int err = errno;
      kill_child(pid);
      throw BackendCommandFailure(label, -1, std::strerror(err));
    }
    for (std::size_t i = 0; i < fds.size(); ++i) {
      if (fds[i].fd < 0 || (fds[i].revents & (POLLIN | POLLHUP | POLLERR)) == 0) {
        continue;
      }
      ssize_t got = ::read(fds[i].fd, buffer.data(), buffer.size());
      if (got > 0) {
        sinks[i]->append(buffer.data(), static_cast<std::size_t>(got));
      } else if (got == 0 || errno != EINTR) {
        fds[i].fd = -1;
        --open_count;
      }
    }
  }

  result.exit_code = wait_child(pid);
  process_log()->trace("exit {}: {}", result.exit_code, label);
  return result;
}

} // namespace agsq

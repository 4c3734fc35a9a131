#include "subprocess_runner.hpp"

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <sstream>
#include <thread>

#include "internal/observability/logging.hpp"

namespace prepush::process {

namespace {

using prepush::observability::IntField;
using prepush::observability::StringField;

// Owns one end of a pipe.
class ScopedFd {
 public:
  ScopedFd() = default;
  explicit ScopedFd(int fd) : fd_(fd) {
  }
  ~ScopedFd() {
    Reset();
  }

  ScopedFd(const ScopedFd&)            = delete;
  ScopedFd& operator=(const ScopedFd&) = delete;

  int get() const {
    return fd_;
  }

  void Reset() {
    if (fd_ >= 0) {
      ::close(fd_);
      fd_ = -1;
    }
  }

 private:
  int fd_ = -1;
};

ProcessResult LaunchFailure(const std::string& message, const util::Stopwatch& watch) {
  ProcessResult result;
  result.outcome = Outcome::kFailure;
  result.output  = message;
  result.elapsed = watch.Elapsed();
  return result;
}

ProcessResult TimedOut(pid_t pid, bool reaped, const std::vector<std::string>& argv, std::chrono::seconds timeout,
                       const util::Stopwatch& watch) {
  ::kill(-pid, SIGKILL);
  if (!reaped) ::waitpid(pid, nullptr, 0);

  PREPUSH_LOG_WARN("command timed out", {StringField("command", JoinCommand(argv)), IntField("timeout_s", timeout.count())});

  ProcessResult result;
  result.outcome = Outcome::kTimeout;
  result.output  = TimeoutMarker(timeout);
  result.elapsed = watch.Elapsed();
  return result;
}

// Drains whatever is readable right now. Returns false at EOF.
bool ReadAvailable(int fd, std::string* out) {
  char buffer[4096];
  for (;;) {
    const ssize_t n = ::read(fd, buffer, sizeof(buffer));
    if (n > 0) {
      out->append(buffer, static_cast<std::size_t>(n));
      continue;
    }
    if (n == 0) return false;
    if (errno == EINTR) continue;
    return errno == EAGAIN || errno == EWOULDBLOCK;
  }
}

} // namespace

SubprocessRunner::SubprocessRunner(std::filesystem::path working_dir) : working_dir_(std::move(working_dir)) {
}

ProcessResult SubprocessRunner::Run(const std::vector<std::string>& argv, std::chrono::seconds timeout) {
  util::Stopwatch watch;

  if (argv.empty()) {
    return LaunchFailure("empty command", watch);
  }

  int output_fds[2];
  int status_fds[2];
  if (::pipe2(output_fds, O_CLOEXEC) != 0) {
    return LaunchFailure(std::string("pipe2: ") + std::strerror(errno), watch);
  }
  ScopedFd output_read(output_fds[0]);
  ScopedFd output_write(output_fds[1]);

  // The child reports an exec failure through this pipe; a successful exec
  // closes it (O_CLOEXEC) and the parent reads EOF.
  if (::pipe2(status_fds, O_CLOEXEC) != 0) {
    return LaunchFailure(std::string("pipe2: ") + std::strerror(errno), watch);
  }
  ScopedFd status_read(status_fds[0]);
  ScopedFd status_write(status_fds[1]);

  std::vector<char*> args;
  args.reserve(argv.size() + 1);
  for (const auto& arg : argv) {
    args.push_back(const_cast<char*>(arg.c_str()));
  }
  args.push_back(nullptr);

  const std::string dir = working_dir_.string();

  const pid_t pid = ::fork();
  if (pid < 0) {
    return LaunchFailure(std::string("fork: ") + std::strerror(errno), watch);
  }

  if (pid == 0) {
    ::setpgid(0, 0);
    ::dup2(output_write.get(), STDOUT_FILENO);
    ::dup2(output_write.get(), STDERR_FILENO);

    int err = 0;
    if (::chdir(dir.c_str()) != 0) {
      err = errno;
    } else {
      ::execvp(args[0], args.data());
      err = errno;
    }
    ssize_t ignored = ::write(status_write.get(), &err, sizeof(err));
    (void)ignored;
    ::_exit(127);
  }

  ::setpgid(pid, pid);
  output_write.Reset();
  status_write.Reset();

  int     exec_errno = 0;
  ssize_t got        = 0;
  do {
    got = ::read(status_read.get(), &exec_errno, sizeof(exec_errno));
  } while (got < 0 && errno == EINTR);

  if (got == static_cast<ssize_t>(sizeof(exec_errno))) {
    ::waitpid(pid, nullptr, 0);
    std::ostringstream message;
    message << "failed to execute '" << argv[0] << "' in " << dir << ": " << std::strerror(exec_errno);
    PREPUSH_LOG_WARN("launch failed", {StringField("command", JoinCommand(argv)), StringField("error", std::strerror(exec_errno))});
    return LaunchFailure(message.str(), watch);
  }

  ::fcntl(output_read.get(), F_SETFL, ::fcntl(output_read.get(), F_GETFL) | O_NONBLOCK);

  const auto deadline = util::SteadyClock::now() + timeout;

  std::string output;
  bool        timed_out   = false;
  bool        reaped      = false;
  int         wait_status = 0;

  for (;;) {
    const auto now = util::SteadyClock::now();
    if (now >= deadline) {
      timed_out = true;
      break;
    }

    const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
    const int  slice_ms  = static_cast<int>(std::min<long long>(remaining.count() + 1, 100));

    pollfd pfd{};
    pfd.fd     = output_read.get();
    pfd.events = POLLIN;

    const int ready = ::poll(&pfd, 1, slice_ms);
    if (ready < 0 && errno != EINTR) {
      break;
    }
    if (ready > 0 && !ReadAvailable(output_read.get(), &output)) {
      break;
    }

    // A background grandchild can keep the pipe open after the child exits.
    if (::waitpid(pid, &wait_status, WNOHANG) == pid) {
      reaped = true;
      ReadAvailable(output_read.get(), &output);
      break;
    }
  }

  if (timed_out) {
    return TimedOut(pid, reaped, argv, timeout, watch);
  }

  // Output closed early; the child still has until the deadline to exit.
  while (!reaped && !timed_out) {
    if (::waitpid(pid, &wait_status, WNOHANG) == pid) {
      reaped = true;
    } else if (util::SteadyClock::now() >= deadline) {
      timed_out = true;
    } else {
      std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
  }

  if (timed_out) {
    return TimedOut(pid, reaped, argv, timeout, watch);
  }

  ProcessResult result;
  result.elapsed = watch.Elapsed();
  result.output  = std::move(output);

  if (WIFEXITED(wait_status)) {
    result.exit_code = WEXITSTATUS(wait_status);
  } else if (WIFSIGNALED(wait_status)) {
    result.exit_code = 128 + WTERMSIG(wait_status);
  }
  result.outcome = result.exit_code == 0 ? Outcome::kSuccess : Outcome::kFailure;

  PREPUSH_LOG_DEBUG("command finished", {StringField("command", JoinCommand(argv)), IntField("exit_code", result.exit_code)});
  return result;
}

std::optional<std::filesystem::path> FindExecutable(const std::string& name) {
  if (name.empty()) {
    return std::nullopt;
  }

  auto is_executable = [](const std::filesystem::path& candidate) {
    std::error_code ec;
    return std::filesystem::is_regular_file(candidate, ec) && ::access(candidate.c_str(), X_OK) == 0;
  };

  if (name.find('/') != std::string::npos) {
    if (is_executable(name)) return std::filesystem::path(name);
    return std::nullopt;
  }

  const char* path_env = std::getenv("PATH");
  if (!path_env) {
    return std::nullopt;
  }

  std::istringstream dirs(path_env);
  std::string        dir;
  while (std::getline(dirs, dir, ':')) {
    if (dir.empty()) dir = ".";
    auto candidate = std::filesystem::path(dir) / name;
    if (is_executable(candidate)) {
      return candidate;
    }
  }
  return std::nullopt;
}

} // namespace prepush::process

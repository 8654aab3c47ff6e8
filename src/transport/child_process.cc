#define CONDUCTOR_LOG_COMPONENT "transport.process"

#include "conductor/transport/child_process.h"

#include <errno.h>
#include <fcntl.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cstring>
#include <mutex>
#include <thread>

#include "conductor/logging/log_macros.h"

extern char** environ;

namespace conductor {
namespace transport {

namespace {

// Writes to a pipe whose reader died must fail with EPIPE, not kill us
void ignoreSigpipe() {
  static std::once_flag flag;
  std::call_once(flag, []() { signal(SIGPIPE, SIG_IGN); });
}

void closeIfOpen(int& fd) {
  if (fd >= 0) {
    ::close(fd);
    fd = -1;
  }
}

std::vector<std::string> buildEnvironment(
    const std::map<std::string, std::string>& overrides) {
  std::map<std::string, std::string> merged;
  for (char** entry = environ; entry && *entry; ++entry) {
    std::string kv(*entry);
    auto eq = kv.find('=');
    if (eq == std::string::npos) {
      continue;
    }
    merged[kv.substr(0, eq)] = kv.substr(eq + 1);
  }
  for (const auto& kv : overrides) {
    merged[kv.first] = kv.second;
  }

  std::vector<std::string> out;
  out.reserve(merged.size());
  for (const auto& kv : merged) {
    out.push_back(kv.first + "=" + kv.second);
  }
  return out;
}

std::vector<char*> toCharPointers(std::vector<std::string>& strings) {
  std::vector<char*> out;
  out.reserve(strings.size() + 1);
  for (auto& s : strings) {
    out.push_back(&s[0]);
  }
  out.push_back(nullptr);
  return out;
}

}  // namespace

Result<std::unique_ptr<ChildProcess>> ChildProcess::spawn(
    const Options& options) {
  using ResultType = Result<std::unique_ptr<ChildProcess>>;

  if (options.command.empty()) {
    return ResultType(Error(ErrorCode::ConnectError, "No command configured"));
  }
  ignoreSigpipe();

  // Everything the child touches is prepared before fork
  std::vector<std::string> argv_storage;
  argv_storage.push_back(options.command);
  argv_storage.insert(argv_storage.end(), options.args.begin(),
                      options.args.end());
  std::vector<std::string> env_storage = buildEnvironment(options.env);
  std::vector<char*> argv = toCharPointers(argv_storage);
  std::vector<char*> envp = toCharPointers(env_storage);

  int stdin_pipe[2] = {-1, -1};
  int stdout_pipe[2] = {-1, -1};
  int stderr_pipe[2] = {-1, -1};
  // Closed on successful exec; carries errno when exec fails
  int exec_pipe[2] = {-1, -1};

  auto closeAll = [&]() {
    for (int* p : {stdin_pipe, stdout_pipe, stderr_pipe, exec_pipe}) {
      closeIfOpen(p[0]);
      closeIfOpen(p[1]);
    }
  };

  if (pipe2(stdin_pipe, O_CLOEXEC) != 0 || pipe2(stdout_pipe, O_CLOEXEC) != 0 ||
      (options.capture_stderr && pipe2(stderr_pipe, O_CLOEXEC) != 0) ||
      pipe2(exec_pipe, O_CLOEXEC) != 0) {
    int err = errno;
    closeAll();
    return ResultType(Error(ErrorCode::ConnectError,
                            std::string("pipe failed: ") + strerror(err)));
  }

  pid_t pid = fork();
  if (pid < 0) {
    int err = errno;
    closeAll();
    return ResultType(Error(ErrorCode::ConnectError,
                            std::string("fork failed: ") + strerror(err)));
  }

  if (pid == 0) {
    // Child: only async-signal-safe calls from here on
    dup2(stdin_pipe[0], STDIN_FILENO);
    dup2(stdout_pipe[1], STDOUT_FILENO);
    if (options.capture_stderr) {
      dup2(stderr_pipe[1], STDERR_FILENO);
    }
    signal(SIGPIPE, SIG_DFL);
    execvpe(argv[0], argv.data(), envp.data());

    int err = errno;
    ssize_t rc = write(exec_pipe[1], &err, sizeof(err));
    (void)rc;
    _exit(127);
  }

  closeIfOpen(stdin_pipe[0]);
  closeIfOpen(stdout_pipe[1]);
  closeIfOpen(stderr_pipe[1]);
  closeIfOpen(exec_pipe[1]);

  int exec_errno = 0;
  ssize_t n;
  do {
    n = read(exec_pipe[0], &exec_errno, sizeof(exec_errno));
  } while (n < 0 && errno == EINTR);
  closeIfOpen(exec_pipe[0]);

  if (n > 0) {
    int status = 0;
    waitpid(pid, &status, 0);
    closeAll();
    return ResultType(Error(ErrorCode::ConnectError,
                            "Cannot execute '" + options.command +
                                "': " + strerror(exec_errno)));
  }

  CONDUCTOR_LOG(Debug, "spawned '{}' as pid {}", options.command,
                static_cast<int>(pid));

  std::unique_ptr<ChildProcess> child(
      new ChildProcess(pid, stdin_pipe[1], stdout_pipe[0], stderr_pipe[0],
                       options.kill_grace));
  return ResultType(std::move(child));
}

ChildProcess::ChildProcess(pid_t pid,
                           int stdin_fd,
                           int stdout_fd,
                           int stderr_fd,
                           std::chrono::milliseconds kill_grace)
    : pid_(pid),
      stdin_fd_(stdin_fd),
      stdout_fd_(stdout_fd),
      stderr_fd_(stderr_fd),
      kill_grace_(kill_grace) {}

ChildProcess::~ChildProcess() { terminate(); }

bool ChildProcess::isRunning() {
  if (reaped_) {
    return false;
  }
  int status = 0;
  pid_t rc = waitpid(pid_, &status, WNOHANG);
  if (rc == pid_ || (rc < 0 && errno == ECHILD)) {
    reaped_ = true;
    return false;
  }
  return true;
}

bool ChildProcess::waitFor(std::chrono::milliseconds timeout) {
  auto deadline = std::chrono::steady_clock::now() + timeout;
  while (isRunning()) {
    if (std::chrono::steady_clock::now() >= deadline) {
      return false;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }
  return true;
}

void ChildProcess::terminate() {
  // Closing stdin is the polite shutdown signal for stdio servers
  closeIfOpen(stdin_fd_);

  if (isRunning()) {
    kill(pid_, SIGTERM);
    if (!waitFor(kill_grace_)) {
      CONDUCTOR_LOG(Warning, "pid {} ignored SIGTERM for {}ms, killing",
                    static_cast<int>(pid_),
                    static_cast<int64_t>(kill_grace_.count()));
      kill(pid_, SIGKILL);
      int status = 0;
      waitpid(pid_, &status, 0);
      reaped_ = true;
    }
  }
  closeFds();
}

void ChildProcess::closeFds() {
  closeIfOpen(stdin_fd_);
  closeIfOpen(stdout_fd_);
  closeIfOpen(stderr_fd_);
}

}  // namespace transport
}  // namespace conductor

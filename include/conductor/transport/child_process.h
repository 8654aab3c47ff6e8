#ifndef CONDUCTOR_TRANSPORT_CHILD_PROCESS_H
#define CONDUCTOR_TRANSPORT_CHILD_PROCESS_H

#include <sys/types.h>

#include <chrono>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "conductor/core/result.h"

namespace conductor {
namespace transport {

/**
 * @brief Owns a spawned process and its stdio pipes
 *
 * Destruction terminates the child: stdin is closed, SIGTERM is sent, and
 * SIGKILL follows if the child has not exited within the grace period. The
 * child is always reaped.
 */
class ChildProcess {
 public:
  struct Options {
    std::string command;
    std::vector<std::string> args;
    // Merged over the parent environment
    std::map<std::string, std::string> env;
    // Otherwise the child inherits the parent's stderr
    bool capture_stderr{false};
    std::chrono::milliseconds kill_grace{5000};
  };

  // Fails with ConnectError when the command cannot be executed
  static Result<std::unique_ptr<ChildProcess>> spawn(const Options& options);

  ~ChildProcess();

  ChildProcess(const ChildProcess&) = delete;
  ChildProcess& operator=(const ChildProcess&) = delete;

  pid_t pid() const { return pid_; }
  int stdinFd() const { return stdin_fd_; }
  int stdoutFd() const { return stdout_fd_; }
  int stderrFd() const { return stderr_fd_; }  // -1 unless captured

  // Reaps the child if it has exited
  bool isRunning();

  void terminate();

 private:
  ChildProcess(pid_t pid,
               int stdin_fd,
               int stdout_fd,
               int stderr_fd,
               std::chrono::milliseconds kill_grace);

  bool waitFor(std::chrono::milliseconds timeout);
  void closeFds();

  pid_t pid_;
  int stdin_fd_;
  int stdout_fd_;
  int stderr_fd_;
  std::chrono::milliseconds kill_grace_;
  bool reaped_{false};
};

}  // namespace transport
}  // namespace conductor

#endif  // CONDUCTOR_TRANSPORT_CHILD_PROCESS_H

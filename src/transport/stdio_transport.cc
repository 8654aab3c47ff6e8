#define CONDUCTOR_LOG_COMPONENT "transport.stdio"

#include "conductor/transport/stdio_transport.h"

#include <errno.h>
#include <fcntl.h>
#include <poll.h>
#include <unistd.h>

#include <algorithm>
#include <cstring>

#include "conductor/logging/log_macros.h"
#include "conductor/protocol/jsonrpc.h"

namespace conductor {
namespace transport {

namespace {

constexpr size_t kMaxLineBytes = 16 * 1024 * 1024;

int remainingMs(std::chrono::steady_clock::time_point deadline) {
  auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
      deadline - std::chrono::steady_clock::now());
  if (left.count() <= 0) {
    return 0;
  }
  return static_cast<int>(std::min<int64_t>(left.count(), 60000));
}

void setNonBlocking(int fd) {
  int flags = fcntl(fd, F_GETFL, 0);
  if (flags >= 0) {
    fcntl(fd, F_SETFL, flags | O_NONBLOCK);
  }
}

}  // namespace

ProcessTransport::ProcessTransport(config::ConnectionType type,
                                   std::chrono::milliseconds kill_grace)
    : type_(type), kill_grace_(kill_grace) {}

ProcessTransport::~ProcessTransport() { close(); }

std::string ProcessTransport::protocol() const {
  return config::connectionTypeToString(type_);
}

VoidResult ProcessTransport::connect(
    const config::ServiceDescriptor& descriptor) {
  close();
  service_id_ = descriptor.id;

  ChildProcess::Options options;
  options.command = descriptor.command.value_or("");
  options.args = descriptor.args.value_or(std::vector<std::string>{});
  options.env =
      descriptor.env.value_or(std::map<std::string, std::string>{});
  options.capture_stderr = type_ == config::ConnectionType::Subprocess;
  options.kill_grace = kill_grace_;

  auto spawned = ChildProcess::spawn(options);
  if (isError(spawned)) {
    return makeVoidError(errorOf(spawned));
  }
  child_ = std::move(get<std::unique_ptr<ChildProcess>>(spawned));
  setNonBlocking(child_->stdoutFd());
  setNonBlocking(child_->stdinFd());
  read_buffer_.clear();

  if (child_->stderrFd() >= 0) {
    stderr_stop_ = false;
    stderr_thread_ =
        std::thread(&ProcessTransport::stderrLoop, this, child_->stderrFd());
  }

  connected_ = true;
  logging::LogContext ctx;
  ctx.service_id = service_id_;
  CONDUCTOR_LOG_CTX(Info, ctx, "started '{}' (pid {})", options.command,
                    static_cast<int>(child_->pid()));
  return makeVoidSuccess();
}

Result<json::JsonValue> ProcessTransport::sendRequest(
    const json::JsonValue& request, std::chrono::milliseconds timeout) {
  if (!connected_) {
    return makeError<json::JsonValue>(ErrorCode::TransportError,
                                      "Transport is not connected");
  }
  const std::string id = request["id"].getString("");
  auto deadline = Clock::now() + timeout;

  auto written = writeLine(request.toString(), deadline);
  if (isError(written)) {
    return errorOf(written);
  }

  for (;;) {
    auto line = readLine(deadline);
    if (isError(line)) {
      return errorOf(line);
    }

    json::JsonValue message;
    try {
      message = json::JsonValue::parse(valueOf(line));
    } catch (const json::JsonException&) {
      CONDUCTOR_LOG(Debug, "[{}] skipping non-JSON output: {}", service_id_,
                    valueOf(line));
      continue;
    }

    if (protocol::isResponseTo(message, id)) {
      return message;
    }
    if (protocol::isNotification(message)) {
      CONDUCTOR_LOG(Debug, "[{}] ignoring notification {}", service_id_,
                    message["method"].getString(""));
    } else {
      CONDUCTOR_LOG(Debug, "[{}] discarding unmatched message {}",
                    service_id_, message.toString());
    }
  }
}

VoidResult ProcessTransport::sendNotification(
    const json::JsonValue& notification) {
  if (!connected_) {
    return makeVoidError(
        Error(ErrorCode::TransportError, "Transport is not connected"));
  }
  return writeLine(notification.toString(),
                   Clock::now() + std::chrono::seconds(5));
}

void ProcessTransport::close() {
  bool was_connected = connected_.exchange(false);

  stderr_stop_ = true;
  if (stderr_thread_.joinable()) {
    stderr_thread_.join();
  }
  if (child_) {
    child_->terminate();
    child_.reset();
  }
  read_buffer_.clear();

  if (was_connected) {
    CONDUCTOR_LOG(Debug, "[{}] process transport closed", service_id_);
  }
}

VoidResult ProcessTransport::writeLine(const std::string& line,
                                       Clock::time_point deadline) {
  std::string data = line + "\n";
  size_t offset = 0;
  const int fd = child_->stdinFd();

  while (offset < data.size()) {
    ssize_t n = ::write(fd, data.data() + offset, data.size() - offset);
    if (n > 0) {
      offset += static_cast<size_t>(n);
      continue;
    }
    if (n < 0 && errno == EINTR) {
      continue;
    }
    if (n < 0 && errno != EAGAIN && errno != EWOULDBLOCK) {
      connected_ = false;
      return makeVoidError(Error(ErrorCode::TransportError,
                                 std::string("write to service failed: ") +
                                     strerror(errno)));
    }

    struct pollfd pfd = {fd, POLLOUT, 0};
    int ready = poll(&pfd, 1, remainingMs(deadline));
    if (ready == 0) {
      if (offset > 0) {
        // The child holds a partial line, anything written next would be
        // appended to it
        connected_ = false;
        return makeVoidError(Error(ErrorCode::TransportError,
                                   "Timed out mid-message writing to service; "
                                   "connection is no longer usable"));
      }
      return makeVoidError(Error(ErrorCode::TransportTimeout,
                                 "Timed out writing to service"));
    }
    if (ready < 0 && errno != EINTR) {
      return makeVoidError(Error(ErrorCode::TransportError,
                                 std::string("poll failed: ") +
                                     strerror(errno)));
    }
  }
  return makeVoidSuccess();
}

Result<std::string> ProcessTransport::readLine(Clock::time_point deadline) {
  const int fd = child_->stdoutFd();
  for (;;) {
    auto newline = read_buffer_.find('\n');
    if (newline != std::string::npos) {
      std::string line = read_buffer_.substr(0, newline);
      read_buffer_.erase(0, newline + 1);
      if (!line.empty() && line.back() == '\r') {
        line.pop_back();
      }
      if (line.empty()) {
        continue;
      }
      return line;
    }
    if (read_buffer_.size() > kMaxLineBytes) {
      read_buffer_.clear();
      return makeError<std::string>(ErrorCode::ProtocolError,
                                    "Service output line too long");
    }

    char chunk[8192];
    ssize_t n = ::read(fd, chunk, sizeof(chunk));
    if (n > 0) {
      read_buffer_.append(chunk, static_cast<size_t>(n));
      continue;
    }
    if (n == 0) {
      connected_ = false;
      return makeError<std::string>(ErrorCode::TransportError,
                                    "Service closed its output");
    }
    if (errno == EINTR) {
      continue;
    }
    if (errno != EAGAIN && errno != EWOULDBLOCK) {
      connected_ = false;
      return makeError<std::string>(
          ErrorCode::TransportError,
          std::string("read from service failed: ") + strerror(errno));
    }

    int wait_ms = remainingMs(deadline);
    if (wait_ms == 0) {
      return makeError<std::string>(ErrorCode::TransportTimeout,
                                    "Timed out waiting for response");
    }
    struct pollfd pfd = {fd, POLLIN, 0};
    int ready = poll(&pfd, 1, wait_ms);
    if (ready < 0 && errno != EINTR) {
      return makeError<std::string>(
          ErrorCode::TransportError,
          std::string("poll failed: ") + strerror(errno));
    }
  }
}

void ProcessTransport::stderrLoop(int fd) {
  std::string pending;
  char chunk[4096];
  while (!stderr_stop_) {
    struct pollfd pfd = {fd, POLLIN, 0};
    int ready = poll(&pfd, 1, 100);
    if (ready <= 0) {
      continue;
    }
    ssize_t n = ::read(fd, chunk, sizeof(chunk));
    if (n <= 0) {
      if (n < 0 && errno == EINTR) {
        continue;
      }
      break;
    }
    pending.append(chunk, static_cast<size_t>(n));
    size_t newline;
    while ((newline = pending.find('\n')) != std::string::npos) {
      if (newline > 0) {
        CONDUCTOR_LOG(Debug, "[{}] stderr: {}", service_id_,
                      pending.substr(0, newline));
      }
      pending.erase(0, newline + 1);
    }
  }
  if (!pending.empty()) {
    CONDUCTOR_LOG(Debug, "[{}] stderr: {}", service_id_, pending);
  }
}

}  // namespace transport
}  // namespace conductor

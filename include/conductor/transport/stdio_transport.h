#ifndef CONDUCTOR_TRANSPORT_STDIO_TRANSPORT_H
#define CONDUCTOR_TRANSPORT_STDIO_TRANSPORT_H

#include <atomic>
#include <chrono>
#include <memory>
#include <string>
#include <thread>

#include "conductor/transport/child_process.h"
#include "conductor/transport/transport.h"

namespace conductor {
namespace transport {

/**
 * @brief Newline-delimited JSON-RPC over a child's stdin/stdout
 *
 * Serves both process connection types. Stdio lets the child write to our
 * stderr; Subprocess captures the child's stderr and forwards each line to
 * the log at debug level.
 */
class ProcessTransport : public Transport {
 public:
  ProcessTransport(config::ConnectionType type,
                   std::chrono::milliseconds kill_grace);
  ~ProcessTransport() override;

  VoidResult connect(const config::ServiceDescriptor& descriptor) override;
  Result<json::JsonValue> sendRequest(
      const json::JsonValue& request,
      std::chrono::milliseconds timeout) override;
  VoidResult sendNotification(const json::JsonValue& notification) override;
  void close() override;
  bool isConnected() const override { return connected_; }
  std::string protocol() const override;

 private:
  using Clock = std::chrono::steady_clock;

  VoidResult writeLine(const std::string& line, Clock::time_point deadline);
  Result<std::string> readLine(Clock::time_point deadline);
  void stderrLoop(int fd);

  config::ConnectionType type_;
  std::chrono::milliseconds kill_grace_;
  std::string service_id_;
  std::unique_ptr<ChildProcess> child_;
  std::string read_buffer_;
  std::atomic<bool> connected_{false};

  std::thread stderr_thread_;
  std::atomic<bool> stderr_stop_{false};
};

}  // namespace transport
}  // namespace conductor

#endif  // CONDUCTOR_TRANSPORT_STDIO_TRANSPORT_H

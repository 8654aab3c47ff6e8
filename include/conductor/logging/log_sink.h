#pragma once

#include <chrono>
#include <fstream>
#include <functional>
#include <memory>
#include <mutex>
#include <string>

#include "conductor/logging/log_formatter.h"
#include "conductor/logging/log_message.h"

namespace conductor {
namespace logging {

class LogSink {
 public:
  virtual ~LogSink() = default;

  virtual void log(const LogMessage& msg) = 0;
  virtual void flush() = 0;
  virtual SinkType type() const = 0;
  virtual bool supportsRotation() const { return false; }

  void setFormatter(std::unique_ptr<Formatter> formatter) {
    formatter_ = std::move(formatter);
  }

 protected:
  std::unique_ptr<Formatter> formatter_{std::make_unique<DefaultFormatter>()};
};

// Writes to stdout or stderr. The manager defaults to stderr because stdio
// services own the process's stdout in some deployments.
class StdioSink : public LogSink {
 public:
  enum Target { Stdout, Stderr };

  explicit StdioSink(Target target = Stderr) : target_(target) {}

  void log(const LogMessage& msg) override;
  void flush() override;
  SinkType type() const override { return SinkType::Stdio; }

 private:
  Target target_;
  std::mutex mutex_;
};

// Size-rotated log file: base, base.1 ... base.<max_files>
class RotatingFileSink : public LogSink {
 public:
  struct Config {
    std::string base_filename;
    size_t max_file_size = 10 * 1024 * 1024;
    size_t max_files = 5;
    bool auto_flush = false;
  };

  explicit RotatingFileSink(const Config& config);
  ~RotatingFileSink() override;

  void log(const LogMessage& msg) override;
  void flush() override;
  SinkType type() const override { return SinkType::File; }
  bool supportsRotation() const override { return true; }

 private:
  void openFile();
  void closeFile();
  void rotate();

  Config config_;
  std::ofstream file_;
  size_t current_size_{0};
  std::mutex mutex_;
};

class NullSink : public LogSink {
 public:
  void log(const LogMessage&) override {}
  void flush() override {}
  SinkType type() const override { return SinkType::Null; }
};

// Hands formatted records to an embedding application
class ExternalSink : public LogSink {
 public:
  using LogCallback =
      std::function<void(LogLevel, const std::string&, const std::string&)>;

  explicit ExternalSink(LogCallback callback)
      : callback_(std::move(callback)) {}

  void log(const LogMessage& msg) override;
  void flush() override {}
  SinkType type() const override { return SinkType::External; }

 private:
  LogCallback callback_;
};

class SinkFactory {
 public:
  static std::unique_ptr<LogSink> createFileSink(const std::string& filename);
  static std::unique_ptr<LogSink> createStdioSink(bool use_stderr = true);
  static std::unique_ptr<LogSink> createNullSink();
  static std::unique_ptr<LogSink> createExternalSink(
      ExternalSink::LogCallback callback);
};

}  // namespace logging
}  // namespace conductor

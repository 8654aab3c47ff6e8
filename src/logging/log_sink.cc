#include "conductor/logging/log_sink.h"

#include <filesystem>
#include <iostream>

namespace conductor {
namespace logging {

void StdioSink::log(const LogMessage& msg) {
  std::string line = formatter_->format(msg);
  std::lock_guard<std::mutex> lock(mutex_);
  auto& stream = (target_ == Stdout) ? std::cout : std::cerr;
  stream << line << '\n';
}

void StdioSink::flush() {
  std::lock_guard<std::mutex> lock(mutex_);
  auto& stream = (target_ == Stdout) ? std::cout : std::cerr;
  stream.flush();
}

RotatingFileSink::RotatingFileSink(const Config& config) : config_(config) {
  openFile();
}

RotatingFileSink::~RotatingFileSink() {
  flush();
  closeFile();
}

void RotatingFileSink::log(const LogMessage& msg) {
  std::string formatted = formatter_->format(msg);

  std::lock_guard<std::mutex> lock(mutex_);
  if (!file_.is_open()) {
    openFile();
  }

  if (config_.max_file_size > 0 &&
      current_size_ + formatted.size() + 1 > config_.max_file_size) {
    rotate();
  }

  file_ << formatted << '\n';
  current_size_ += formatted.size() + 1;

  if (config_.auto_flush) {
    file_.flush();
  }
}

void RotatingFileSink::flush() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (file_.is_open()) {
    file_.flush();
  }
}

void RotatingFileSink::openFile() {
  file_.open(config_.base_filename, std::ios::app);
  if (file_.is_open()) {
    file_.seekp(0, std::ios::end);
    current_size_ = static_cast<size_t>(file_.tellp());
  }
}

void RotatingFileSink::closeFile() {
  if (file_.is_open()) {
    file_.close();
  }
}

void RotatingFileSink::rotate() {
  namespace fs = std::filesystem;
  closeFile();

  std::error_code ec;
  if (config_.max_files > 0) {
    fs::remove(config_.base_filename + "." + std::to_string(config_.max_files),
               ec);
    for (size_t i = config_.max_files - 1; i > 0; --i) {
      std::string old_name = config_.base_filename + "." + std::to_string(i);
      if (fs::exists(old_name, ec)) {
        fs::rename(old_name,
                   config_.base_filename + "." + std::to_string(i + 1), ec);
      }
    }
    fs::rename(config_.base_filename, config_.base_filename + ".1", ec);
  } else {
    fs::remove(config_.base_filename, ec);
  }

  current_size_ = 0;
  openFile();
}

void ExternalSink::log(const LogMessage& msg) {
  if (callback_) {
    callback_(msg.level, msg.logger_name, formatter_->format(msg));
  }
}

std::unique_ptr<LogSink> SinkFactory::createFileSink(
    const std::string& filename) {
  RotatingFileSink::Config config;
  config.base_filename = filename;
  return std::make_unique<RotatingFileSink>(config);
}

std::unique_ptr<LogSink> SinkFactory::createStdioSink(bool use_stderr) {
  return std::make_unique<StdioSink>(use_stderr ? StdioSink::Stderr
                                                : StdioSink::Stdout);
}

std::unique_ptr<LogSink> SinkFactory::createNullSink() {
  return std::make_unique<NullSink>();
}

std::unique_ptr<LogSink> SinkFactory::createExternalSink(
    ExternalSink::LogCallback callback) {
  return std::make_unique<ExternalSink>(std::move(callback));
}

}  // namespace logging
}  // namespace conductor

#define CONDUCTOR_LOG_COMPONENT "health"

#include "conductor/manager/health_monitor.h"

#include <exception>

#include "conductor/logging/log_macros.h"

namespace conductor {
namespace manager {

HealthMonitor::HealthMonitor(std::chrono::milliseconds interval, CheckCb check)
    : interval_(interval), check_(std::move(check)) {}

HealthMonitor::~HealthMonitor() { stop(); }

void HealthMonitor::start() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (thread_.joinable()) {
    return;
  }

  dispatcher_ = std::make_unique<event::LibeventDispatcher>("health");
  event::LibeventDispatcher* dispatcher = dispatcher_.get();
  dispatcher->post([this, dispatcher]() {
    timer_ = dispatcher->createTimer([this]() { onTimer(); });
    timer_->enableTimer(interval_);
  });
  thread_ = std::thread(
      [dispatcher]() { dispatcher->run(event::RunType::RunUntilExit); });

  CONDUCTOR_LOG(Info, "health monitor started, interval {}ms",
                static_cast<int64_t>(interval_.count()));
}

void HealthMonitor::stop() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!thread_.joinable()) {
    return;
  }
  dispatcher_->exit();
  thread_.join();
  timer_.reset();
  dispatcher_.reset();
  CONDUCTOR_LOG(Info, "health monitor stopped");
}

bool HealthMonitor::running() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return thread_.joinable();
}

void HealthMonitor::onTimer() {
  try {
    check_();
  } catch (const std::exception& e) {
    CONDUCTOR_LOG(Error, "health check pass threw: {}", e.what());
  }
  timer_->enableTimer(interval_);
}

}  // namespace manager
}  // namespace conductor

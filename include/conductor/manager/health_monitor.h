#ifndef CONDUCTOR_MANAGER_HEALTH_MONITOR_H
#define CONDUCTOR_MANAGER_HEALTH_MONITOR_H

#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>

#include "conductor/event/libevent_dispatcher.h"

namespace conductor {
namespace manager {

/**
 * @brief Runs a check on a fixed interval on its own dispatcher thread
 *
 * The first check fires one interval after start(). stop() waits for a
 * check in progress and joins the thread; no check runs after it returns.
 */
class HealthMonitor {
 public:
  using CheckCb = std::function<void()>;

  HealthMonitor(std::chrono::milliseconds interval, CheckCb check);
  ~HealthMonitor();

  HealthMonitor(const HealthMonitor&) = delete;
  HealthMonitor& operator=(const HealthMonitor&) = delete;

  void start();
  void stop();
  bool running() const;

 private:
  void onTimer();

  const std::chrono::milliseconds interval_;
  CheckCb check_;

  mutable std::mutex mutex_;
  std::unique_ptr<event::LibeventDispatcher> dispatcher_;
  event::TimerPtr timer_;
  std::thread thread_;
};

}  // namespace manager
}  // namespace conductor

#endif  // CONDUCTOR_MANAGER_HEALTH_MONITOR_H

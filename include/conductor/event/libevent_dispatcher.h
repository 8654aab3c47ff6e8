#ifndef CONDUCTOR_EVENT_LIBEVENT_DISPATCHER_H
#define CONDUCTOR_EVENT_LIBEVENT_DISPATCHER_H

#include <atomic>
#include <mutex>
#include <queue>
#include <thread>

#include "conductor/event/event_loop.h"

struct event_base;
struct event;

namespace conductor {
namespace event {

using libevent_event = struct event;

/**
 * @brief Libevent-backed Dispatcher
 *
 * Cross-thread post() writes a byte to a wakeup pipe watched by the loop.
 * The thread that calls run() becomes the dispatcher thread.
 */
class LibeventDispatcher : public Dispatcher {
 public:
  explicit LibeventDispatcher(const std::string& name);
  ~LibeventDispatcher() override;

  const std::string& name() override { return name_; }

  void post(PostCb callback) override;
  bool isThreadSafe() const override;

  TimerPtr createTimer(TimerCb cb) override;

  void exit() override;
  void run(RunType type) override;

  event_base* base() { return base_; }

 private:
  class TimerImpl : public Timer {
   public:
    TimerImpl(LibeventDispatcher& dispatcher, TimerCb cb);
    ~TimerImpl() override;

    void disableTimer() override;
    void enableTimer(std::chrono::milliseconds duration) override;
    bool enabled() override { return enabled_; }

   private:
    static void timerCallback(int fd, short events, void* arg);

    LibeventDispatcher& dispatcher_;
    TimerCb cb_;
    libevent_event* event_{nullptr};
    bool enabled_{false};
  };

  void initializeLibevent();
  static void postWakeupCallback(int fd, short events, void* arg);
  void runPostCallbacks();

  std::string name_;
  event_base* base_{nullptr};
  libevent_event* wakeup_event_{nullptr};
  int wakeup_fd_[2]{-1, -1};

  std::mutex post_mutex_;
  std::queue<PostCb> post_callbacks_;

  std::atomic<std::thread::id> thread_id_{};
  std::atomic<bool> exit_requested_{false};
};

}  // namespace event
}  // namespace conductor

#endif  // CONDUCTOR_EVENT_LIBEVENT_DISPATCHER_H

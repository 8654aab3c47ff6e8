#define CONDUCTOR_LOG_COMPONENT "event.dispatcher"

#include "conductor/event/libevent_dispatcher.h"

#include <stdexcept>

#include <unistd.h>

#include <event2/event.h>
#include <event2/thread.h>
#include <event2/util.h>

#include "conductor/logging/log_macros.h"

namespace conductor {
namespace event {

namespace {

// evthread_use_pthreads must run once before any event_base is created
void ensureLibeventThreadingInitialized() {
  static std::once_flag init_flag;
  std::call_once(init_flag, []() { evthread_use_pthreads(); });
}

}  // namespace

LibeventDispatcher::LibeventDispatcher(const std::string& name) : name_(name) {
  ensureLibeventThreadingInitialized();
  initializeLibevent();
}

LibeventDispatcher::~LibeventDispatcher() {
  if (wakeup_event_) {
    event_free(wakeup_event_);
  }
  if (wakeup_fd_[0] >= 0) {
    close(wakeup_fd_[0]);
  }
  if (wakeup_fd_[1] >= 0) {
    close(wakeup_fd_[1]);
  }
  if (base_) {
    event_base_free(base_);
  }
}

void LibeventDispatcher::initializeLibevent() {
  struct event_config* config = event_config_new();
  if (config) {
    event_config_set_flag(config, EVENT_BASE_FLAG_PRECISE_TIMER);
    base_ = event_base_new_with_config(config);
    event_config_free(config);
  } else {
    base_ = event_base_new();
  }

  if (!base_) {
    throw std::runtime_error("Failed to create event base");
  }

  if (pipe(wakeup_fd_) != 0) {
    throw std::runtime_error("Failed to create wakeup pipe");
  }
  evutil_make_socket_nonblocking(wakeup_fd_[0]);
  evutil_make_socket_nonblocking(wakeup_fd_[1]);

  wakeup_event_ = event_new(base_, wakeup_fd_[0], EV_READ | EV_PERSIST,
                            &LibeventDispatcher::postWakeupCallback, this);
  if (!wakeup_event_) {
    throw std::runtime_error("Failed to create wakeup event");
  }
  event_add(wakeup_event_, nullptr);

  const char* method = event_base_get_method(base_);
  CONDUCTOR_LOG(Debug, "dispatcher '{}' created with backend {}", name_,
                method ? method : "unknown");
}

void LibeventDispatcher::post(PostCb callback) {
  bool need_wakeup = false;
  {
    std::lock_guard<std::mutex> lock(post_mutex_);
    need_wakeup = post_callbacks_.empty();
    post_callbacks_.push(std::move(callback));
  }

  if (need_wakeup && !isThreadSafe()) {
    char byte = 1;
    ssize_t rc = write(wakeup_fd_[1], &byte, 1);
    (void)rc;  // EAGAIN means a wakeup is already pending
  }
}

bool LibeventDispatcher::isThreadSafe() const {
  std::thread::id owner = thread_id_.load();
  if (owner == std::thread::id()) {
    return false;
  }
  return std::this_thread::get_id() == owner;
}

TimerPtr LibeventDispatcher::createTimer(TimerCb cb) {
  return std::make_unique<TimerImpl>(*this, std::move(cb));
}

void LibeventDispatcher::exit() {
  exit_requested_ = true;

  if (!isThreadSafe()) {
    post([]() {});
  } else {
    event_base_loopbreak(base_);
  }
}

void LibeventDispatcher::run(RunType type) {
  thread_id_ = std::this_thread::get_id();
  runPostCallbacks();

  switch (type) {
    case RunType::Block:
      event_base_loop(base_, 0);
      break;
    case RunType::NonBlock:
      event_base_loop(base_, EVLOOP_NONBLOCK);
      break;
    case RunType::RunUntilExit:
      while (!exit_requested_) {
        event_base_loop(base_, EVLOOP_ONCE);
        runPostCallbacks();
      }
      // An exit requested before run() started is consumed here too
      exit_requested_ = false;
      break;
  }

  runPostCallbacks();
  thread_id_ = std::thread::id();
}

void LibeventDispatcher::postWakeupCallback(int fd, short /*events*/,
                                            void* arg) {
  auto* dispatcher = static_cast<LibeventDispatcher*>(arg);

  char buffer[256];
  while (read(fd, buffer, sizeof(buffer)) > 0) {
  }

  dispatcher->runPostCallbacks();
  if (dispatcher->exit_requested_) {
    event_base_loopbreak(dispatcher->base_);
  }
}

void LibeventDispatcher::runPostCallbacks() {
  std::queue<PostCb> callbacks;
  {
    std::lock_guard<std::mutex> lock(post_mutex_);
    callbacks.swap(post_callbacks_);
  }

  while (!callbacks.empty()) {
    callbacks.front()();
    callbacks.pop();
  }
}

LibeventDispatcher::TimerImpl::TimerImpl(LibeventDispatcher& dispatcher,
                                         TimerCb cb)
    : dispatcher_(dispatcher), cb_(std::move(cb)) {
  event_ = evtimer_new(dispatcher_.base(), &TimerImpl::timerCallback, this);
  if (!event_) {
    throw std::runtime_error("Failed to create timer");
  }
}

LibeventDispatcher::TimerImpl::~TimerImpl() {
  if (event_) {
    event_del(event_);
    event_free(event_);
  }
}

void LibeventDispatcher::TimerImpl::disableTimer() {
  if (enabled_ && event_) {
    event_del(event_);
    enabled_ = false;
  }
}

void LibeventDispatcher::TimerImpl::enableTimer(
    std::chrono::milliseconds duration) {
  struct timeval tv;
  tv.tv_sec = duration.count() / 1000;
  tv.tv_usec = (duration.count() % 1000) * 1000;

  event_add(event_, &tv);
  enabled_ = true;
}

void LibeventDispatcher::TimerImpl::timerCallback(int /*fd*/,
                                                  short /*events*/,
                                                  void* arg) {
  auto* timer = static_cast<TimerImpl*>(arg);
  timer->enabled_ = false;
  timer->cb_();
}

}  // namespace event
}  // namespace conductor

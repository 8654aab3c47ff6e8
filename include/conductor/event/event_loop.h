#ifndef CONDUCTOR_EVENT_EVENT_LOOP_H
#define CONDUCTOR_EVENT_EVENT_LOOP_H

#include <chrono>
#include <functional>
#include <memory>
#include <string>

namespace conductor {
namespace event {

using PostCb = std::function<void()>;
using TimerCb = std::function<void()>;

enum class RunType {
  Block,        // Run until no more events are pending
  NonBlock,     // Process ready events and return
  RunUntilExit  // Run until exit() is called
};

/**
 * One-shot timer owned by a dispatcher. Re-arm from the callback for
 * periodic work.
 */
class Timer {
 public:
  virtual ~Timer() = default;

  virtual void disableTimer() = 0;
  virtual void enableTimer(std::chrono::milliseconds duration) = 0;
  virtual bool enabled() = 0;
};

using TimerPtr = std::unique_ptr<Timer>;

/**
 * Single-threaded event loop. post() and exit() may be called from any
 * thread; everything else must run on the dispatcher thread, or before
 * run() starts.
 */
class Dispatcher {
 public:
  virtual ~Dispatcher() = default;

  virtual const std::string& name() = 0;

  virtual void post(PostCb callback) = 0;

  virtual bool isThreadSafe() const = 0;

  virtual TimerPtr createTimer(TimerCb cb) = 0;

  virtual void exit() = 0;

  virtual void run(RunType type) = 0;
};

using DispatcherPtr = std::unique_ptr<Dispatcher>;

}  // namespace event
}  // namespace conductor

#endif  // CONDUCTOR_EVENT_EVENT_LOOP_H

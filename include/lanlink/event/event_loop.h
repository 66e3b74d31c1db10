#ifndef LANLINK_EVENT_EVENT_LOOP_H
#define LANLINK_EVENT_EVENT_LOOP_H

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>

namespace lanlink {
namespace event {

class DeferredDeletable;
class Dispatcher;
class FileEvent;
class Timer;
class SignalEvent;

using DeferredDeletablePtr = std::unique_ptr<DeferredDeletable>;
using DispatcherPtr = std::unique_ptr<Dispatcher>;
using FileEventPtr = std::unique_ptr<FileEvent>;
using TimerPtr = std::unique_ptr<Timer>;
using SignalEventPtr = std::unique_ptr<SignalEvent>;

using FileReadyCb = std::function<void(uint32_t events)>;
using TimerCb = std::function<void()>;
using SignalCb = std::function<void()>;

enum class FileReadyType : uint32_t { Read = 0x01, Write = 0x02 };

inline uint32_t operator&(FileReadyType type, uint32_t events) {
  return static_cast<uint32_t>(type) & events;
}

enum class FileTriggerType {
  Level,
  // Fires once per readiness change; the owner must read until EAGAIN
  Edge
};

enum class RunType {
  NonBlock,     // Dispatch whatever is ready, then return
  RunUntilExit  // Block for events until exit() is called
};

/**
 * Object handed to Dispatcher::deferredDelete() when it may still be on the
 * call stack, e.g. a socket replaced from inside its own receive callback.
 */
class DeferredDeletable {
 public:
  virtual ~DeferredDeletable() = default;
};

/**
 * Readiness watch on a descriptor. Destroying it removes the watch.
 */
class FileEvent {
 public:
  virtual ~FileEvent() = default;

  /**
   * Replace the watched FileReadyType mask. 0 disarms the event without
   * destroying it.
   */
  virtual void setEnabled(uint32_t events) = 0;
};

/**
 * One-shot timer.
 *
 * A timer fires at most once per enableTimer(). Calling enableTimer() on an
 * armed timer moves its deadline; disableTimer() on an idle one does nothing.
 * enabled() is already false when the callback runs, so the callback may
 * re-arm it.
 */
class Timer {
 public:
  virtual ~Timer() = default;

  virtual void disableTimer() = 0;
  virtual void enableTimer(std::chrono::milliseconds duration) = 0;
  virtual bool enabled() = 0;
};

class SignalEvent {
 public:
  virtual ~SignalEvent() = default;
};

/**
 * Single-threaded event loop.
 *
 * The discovery client and server bind to one dispatcher. The dispatcher and
 * everything attached to it, exit() included, are used from one thread.
 */
class Dispatcher {
 public:
  virtual ~Dispatcher() = default;

  virtual const std::string& name() = 0;

  virtual FileEventPtr createFileEvent(int fd,
                                       FileReadyCb cb,
                                       FileTriggerType trigger,
                                       uint32_t events) = 0;

  /**
   * Create a timer. The timer starts disabled.
   */
  virtual TimerPtr createTimer(TimerCb cb) = 0;

  /**
   * Install a handler for a process signal. Only one dispatcher in a process
   * should do this.
   */
  virtual SignalEventPtr listenForSignal(int signal_num, SignalCb cb) = 0;

  /**
   * Take ownership of `to_delete` and destroy it once the current loop
   * iteration has finished dispatching.
   */
  virtual void deferredDelete(DeferredDeletablePtr&& to_delete) = 0;

  /**
   * Destroy everything queued by deferredDelete() now. Called by the loop
   * after each iteration; only call it where no deferred object can be on
   * the stack.
   */
  virtual void clearDeferredDeleteList() = 0;

  virtual void run(RunType type) = 0;
  virtual void exit() = 0;

  /**
   * Monotonic clock sampled before each callback is dispatched. All
   * protocol timestamps (last seen, timeouts) are taken from here.
   */
  virtual std::chrono::steady_clock::time_point approximateMonotonicTime()
      const = 0;
};

/**
 * Create the libevent-backed dispatcher used by the tools.
 */
DispatcherPtr createLibeventDispatcher(const std::string& name);

}  // namespace event
}  // namespace lanlink

#endif  // LANLINK_EVENT_EVENT_LOOP_H

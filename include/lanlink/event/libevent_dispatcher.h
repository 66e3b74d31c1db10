#ifndef LANLINK_EVENT_LIBEVENT_DISPATCHER_H
#define LANLINK_EVENT_LIBEVENT_DISPATCHER_H

#include <vector>

#include "lanlink/event/event_loop.h"

struct event_base;
struct event;

namespace lanlink {
namespace event {

using libevent_event = struct event;

/**
 * Dispatcher on top of a libevent event_base.
 *
 * run(RunUntilExit) drives the base one iteration at a time and empties the
 * deferred delete list between iterations. It returns on exit() or once no
 * event is registered at all.
 */
class LibeventDispatcher : public Dispatcher {
 public:
  explicit LibeventDispatcher(const std::string& name);
  ~LibeventDispatcher() override;

  LibeventDispatcher(const LibeventDispatcher&) = delete;
  LibeventDispatcher& operator=(const LibeventDispatcher&) = delete;

  const std::string& name() override { return name_; }

  FileEventPtr createFileEvent(int fd,
                               FileReadyCb cb,
                               FileTriggerType trigger,
                               uint32_t events) override;
  TimerPtr createTimer(TimerCb cb) override;
  SignalEventPtr listenForSignal(int signal_num, SignalCb cb) override;

  void deferredDelete(DeferredDeletablePtr&& to_delete) override;
  void clearDeferredDeleteList() override;

  void run(RunType type) override;
  void exit() override;

  std::chrono::steady_clock::time_point approximateMonotonicTime()
      const override {
    return now_;
  }

  event_base* base() { return base_; }

 private:
  class FileEventImpl : public FileEvent {
   public:
    FileEventImpl(LibeventDispatcher& dispatcher,
                  int fd,
                  FileReadyCb cb,
                  FileTriggerType trigger,
                  uint32_t events);
    ~FileEventImpl() override;

    void setEnabled(uint32_t events) override;

   private:
    static void onReady(int fd, short what, void* arg);

    LibeventDispatcher& dispatcher_;
    const int fd_;
    FileReadyCb cb_;
    const FileTriggerType trigger_;
    libevent_event* event_{nullptr};
    bool armed_{false};
  };

  class TimerImpl : public Timer {
   public:
    TimerImpl(LibeventDispatcher& dispatcher, TimerCb cb);
    ~TimerImpl() override;

    void disableTimer() override;
    void enableTimer(std::chrono::milliseconds duration) override;
    bool enabled() override { return enabled_; }

   private:
    static void onFire(int fd, short what, void* arg);

    LibeventDispatcher& dispatcher_;
    TimerCb cb_;
    libevent_event* event_{nullptr};
    bool enabled_{false};
  };

  class SignalEventImpl : public SignalEvent {
   public:
    SignalEventImpl(LibeventDispatcher& dispatcher,
                    int signal_num,
                    SignalCb cb);
    ~SignalEventImpl() override;

   private:
    static void onSignal(int fd, short what, void* arg);

    LibeventDispatcher& dispatcher_;
    const int signal_num_;
    SignalCb cb_;
    libevent_event* event_{nullptr};
  };

  void tick() { now_ = std::chrono::steady_clock::now(); }

  const std::string name_;
  event_base* base_{nullptr};
  bool exit_requested_{false};
  std::vector<DeferredDeletablePtr> deferred_delete_list_;

  std::chrono::steady_clock::time_point now_;
};

}  // namespace event
}  // namespace lanlink

#endif  // LANLINK_EVENT_LIBEVENT_DISPATCHER_H

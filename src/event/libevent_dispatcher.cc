#define LANLINK_LOG_COMPONENT "event.libevent"

#include "lanlink/event/libevent_dispatcher.h"

#include <stdexcept>

#include <event2/event.h>

#include "lanlink/logging/log_macros.h"

namespace lanlink {
namespace event {

namespace {

short eventFlags(uint32_t events, FileTriggerType trigger) {
  short flags = EV_PERSIST;
  if (FileReadyType::Read & events) {
    flags |= EV_READ;
  }
  if (FileReadyType::Write & events) {
    flags |= EV_WRITE;
  }
  if (trigger == FileTriggerType::Edge) {
    flags |= EV_ET;
  }
  return flags;
}

uint32_t readyMask(short what) {
  uint32_t events = 0;
  if (what & EV_READ) {
    events |= static_cast<uint32_t>(FileReadyType::Read);
  }
  if (what & EV_WRITE) {
    events |= static_cast<uint32_t>(FileReadyType::Write);
  }
  return events;
}

timeval toTimeval(std::chrono::milliseconds duration) {
  timeval tv;
  tv.tv_sec = static_cast<time_t>(duration.count() / 1000);
  tv.tv_usec = static_cast<suseconds_t>((duration.count() % 1000) * 1000);
  return tv;
}

}  // namespace

LibeventDispatcher::LibeventDispatcher(const std::string& name) : name_(name) {
  event_config* config = event_config_new();
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

  const char* method = event_base_get_method(base_);
  LANLINK_LOG(Debug, "Dispatcher '{}' using {}", name_,
              method ? method : "unknown");

  tick();
}

LibeventDispatcher::~LibeventDispatcher() {
  // Deferred objects may still own events on base_
  clearDeferredDeleteList();
  if (base_) {
    event_base_free(base_);
  }
}

FileEventPtr LibeventDispatcher::createFileEvent(int fd,
                                                 FileReadyCb cb,
                                                 FileTriggerType trigger,
                                                 uint32_t events) {
  return FileEventPtr(
      new FileEventImpl(*this, fd, std::move(cb), trigger, events));
}

TimerPtr LibeventDispatcher::createTimer(TimerCb cb) {
  return TimerPtr(new TimerImpl(*this, std::move(cb)));
}

SignalEventPtr LibeventDispatcher::listenForSignal(int signal_num,
                                                   SignalCb cb) {
  return SignalEventPtr(new SignalEventImpl(*this, signal_num, std::move(cb)));
}

void LibeventDispatcher::deferredDelete(DeferredDeletablePtr&& to_delete) {
  if (to_delete) {
    deferred_delete_list_.push_back(std::move(to_delete));
  }
}

void LibeventDispatcher::clearDeferredDeleteList() {
  // A destructor may defer further objects
  while (!deferred_delete_list_.empty()) {
    std::vector<DeferredDeletablePtr> batch;
    batch.swap(deferred_delete_list_);
  }
}

void LibeventDispatcher::run(RunType type) {
  exit_requested_ = false;
  tick();

  if (type == RunType::NonBlock) {
    if (event_base_loop(base_, EVLOOP_NONBLOCK) < 0) {
      LANLINK_LOG(Error, "Dispatcher '{}' loop failed", name_);
    }
    clearDeferredDeleteList();
    return;
  }

  while (!exit_requested_) {
    int rc = event_base_loop(base_, EVLOOP_ONCE);
    clearDeferredDeleteList();
    if (rc < 0) {
      LANLINK_LOG(Error, "Dispatcher '{}' loop failed", name_);
      break;
    }
    if (rc == 1) {
      LANLINK_LOG(Debug, "Dispatcher '{}' has no events left", name_);
      break;
    }
  }
}

void LibeventDispatcher::exit() {
  exit_requested_ = true;
  event_base_loopbreak(base_);
}

// ===== FileEventImpl =====

LibeventDispatcher::FileEventImpl::FileEventImpl(LibeventDispatcher& dispatcher,
                                                 int fd,
                                                 FileReadyCb cb,
                                                 FileTriggerType trigger,
                                                 uint32_t events)
    : dispatcher_(dispatcher), fd_(fd), cb_(std::move(cb)), trigger_(trigger) {
  event_ = event_new(dispatcher_.base(), fd_, 0, &FileEventImpl::onReady, this);
  if (!event_) {
    throw std::runtime_error("Failed to create file event");
  }
  setEnabled(events);
}

LibeventDispatcher::FileEventImpl::~FileEventImpl() {
  if (armed_) {
    event_del(event_);
  }
  event_free(event_);
}

void LibeventDispatcher::FileEventImpl::setEnabled(uint32_t events) {
  if (armed_) {
    event_del(event_);
    armed_ = false;
  }
  if (events == 0) {
    return;
  }

  event_assign(event_, dispatcher_.base(), fd_, eventFlags(events, trigger_),
               &FileEventImpl::onReady, this);
  if (event_add(event_, nullptr) != 0) {
    LANLINK_LOG(Error, "event_add failed for fd {}", fd_);
    return;
  }
  armed_ = true;
}

void LibeventDispatcher::FileEventImpl::onReady(int, short what, void* arg) {
  auto* self = static_cast<FileEventImpl*>(arg);
  self->dispatcher_.tick();

  uint32_t events = readyMask(what);
  if (events != 0) {
    self->cb_(events);
  }
}

// ===== TimerImpl =====

LibeventDispatcher::TimerImpl::TimerImpl(LibeventDispatcher& dispatcher,
                                         TimerCb cb)
    : dispatcher_(dispatcher), cb_(std::move(cb)) {
  event_ = evtimer_new(dispatcher_.base(), &TimerImpl::onFire, this);
  if (!event_) {
    throw std::runtime_error("Failed to create timer");
  }
}

LibeventDispatcher::TimerImpl::~TimerImpl() {
  event_del(event_);
  event_free(event_);
}

void LibeventDispatcher::TimerImpl::disableTimer() {
  if (enabled_) {
    event_del(event_);
    enabled_ = false;
  }
}

void LibeventDispatcher::TimerImpl::enableTimer(
    std::chrono::milliseconds duration) {
  timeval tv = toTimeval(duration);
  // Re-adding a pending timer replaces its deadline
  if (event_add(event_, &tv) != 0) {
    LANLINK_LOG(Error, "Dispatcher '{}' failed to arm timer",
                dispatcher_.name());
    return;
  }
  enabled_ = true;
}

void LibeventDispatcher::TimerImpl::onFire(int, short, void* arg) {
  auto* self = static_cast<TimerImpl*>(arg);
  self->enabled_ = false;
  self->dispatcher_.tick();
  self->cb_();
}

// ===== SignalEventImpl =====

LibeventDispatcher::SignalEventImpl::SignalEventImpl(
    LibeventDispatcher& dispatcher, int signal_num, SignalCb cb)
    : dispatcher_(dispatcher), signal_num_(signal_num), cb_(std::move(cb)) {
  event_ = evsignal_new(dispatcher_.base(), signal_num_,
                        &SignalEventImpl::onSignal, this);
  if (event_ && event_add(event_, nullptr) != 0) {
    event_free(event_);
    event_ = nullptr;
  }
  if (!event_) {
    throw std::runtime_error("Failed to watch signal " +
                             std::to_string(signal_num_));
  }
}

LibeventDispatcher::SignalEventImpl::~SignalEventImpl() {
  event_del(event_);
  event_free(event_);
}

void LibeventDispatcher::SignalEventImpl::onSignal(int, short, void* arg) {
  auto* self = static_cast<SignalEventImpl*>(arg);
  self->dispatcher_.tick();

  LANLINK_LOG(Info, "Dispatcher '{}' caught signal {}",
              self->dispatcher_.name(), self->signal_num_);
  self->cb_();
}

DispatcherPtr createLibeventDispatcher(const std::string& name) {
  return DispatcherPtr(new LibeventDispatcher(name));
}

}  // namespace event
}  // namespace lanlink

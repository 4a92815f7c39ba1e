/**
 * @file WatchStateMachine.cpp
 * @brief Coalescing state machine implementation.
 */

#include "src/watch/inc/WatchStateMachine.hpp"
#include "src/helpers/inc/Log.hpp"
#include "src/mount/inc/MountDiff.hpp"
#include "src/mount/inc/MountTable.hpp"

#include <utility>

namespace mountwatch {

namespace watch {

namespace logging = mountwatch::helpers::logging;

namespace {

constexpr logging::LogDomain WATCH_DOMAIN("watch");

} // namespace

WatchStateMachine::WatchStateMachine(MountTableSource& source, MountHandler handler,
                                     TimerRegistrar registrar)
    : source_(source), handler_(std::move(handler)), registrar_(std::move(registrar)) {}

WatchError WatchStateMachine::onTrigger(bool isTimerExpiry, bool isInitial,
                                        WatchControl& decision) {
  decision = WatchControl::keepWatching();

  bool coalesced = false;
  if (coalescing_) {
    if (!isTimerExpiry) {
      // Absorbed: the expiry read will capture this change
      logging::logDebug(WATCH_DOMAIN, "change absorbed while coalescing");
      return {};
    }
    coalescing_ = false;
    coalesced = true;
  } else if (isTimerExpiry) {
    logging::logDebug(WATCH_DOMAIN, "timer expiry while idle, treated as a change notification");
  }

  mount::MountSet current;
  WatchError err = readCurrent(current);
  if (!err.ok()) {
    return err;
  }

  mount::MountDiff diff = mount::diffMountSets(lastKnown_, current);
  if (diff.empty()) {
    // Notified but nothing differs: the change may have been undone before the read
    logging::logWarning(WATCH_DOMAIN, "nothing changed");
    return {};
  }

  logging::logDebug(WATCH_DOMAIN, "change {} (coalesced={}, initial={})", diff.toString(),
                    coalesced, isInitial);

  ChangeEvent event{};
  event.mounted = std::move(diff.added);
  event.unmounted = std::move(diff.removed);
  event.coalesced = coalesced;
  event.initial = isInitial;

  ++handlerCalls_;
  decision = handler_(std::move(event));

  switch (decision.action) {
  case WatchControl::Action::CONTINUE:
  case WatchControl::Action::STOP:
    lastKnown_ = std::move(current);
    return {};
  case WatchControl::Action::COALESCE:
    // Keep the old baseline so the summary spans the whole window
    return startCoalescing(decision.delay);
  }
  return {};
}

WatchError WatchStateMachine::readCurrent(mount::MountSet& current) {
  const int ERR = source_.readAll(readBuf_);
  if (ERR != 0) {
    return WatchError::fromErrno(WatchStatus::MOUNT_READ_FAILED, ERR, source_.name());
  }

  mount::MountParseResult parsed = mount::parseMountTable(readBuf_);
  if (!parsed.success) {
    WatchError err{};
    err.status = WatchStatus::PARSE_FAILED;
    err.detail = parsed.error.toString();
    return err;
  }

  current = mount::toMountSet(parsed.mounts);
  return {};
}

WatchError WatchStateMachine::startCoalescing(std::chrono::milliseconds delay) {
  logging::logDebug(WATCH_DOMAIN, "start coalescing for {}ms", delay.count());

  WatchError err = timer_.arm(delay);
  if (!err.ok()) {
    return err;
  }

  if (timer_.wasCreatedByLastArm() && registrar_) {
    const int REG_ERR = registrar_(timer_.fd());
    if (REG_ERR != 0) {
      return WatchError::fromErrno(WatchStatus::TIMER_FAILED, REG_ERR,
                                   "epoll registration of coalescing timer");
    }
    logging::logDebug(WATCH_DOMAIN, "coalescing timer registered (fd {})", timer_.fd());
  }

  // Set only once the timer is armed and registered
  coalescing_ = true;
  return {};
}

} // namespace watch

} // namespace mountwatch

/**
 * @file WatchLoop.cpp
 * @brief Watch thread body.
 */

#include "src/watch/inc/WatchLoop.hpp"
#include "src/helpers/inc/Log.hpp"

#include <cerrno>
#include <cstdint>
#include <utility>

namespace mountwatch {

namespace watch {

namespace logging = mountwatch::helpers::logging;

namespace {

constexpr logging::LogDomain LOOP_DOMAIN("watch-loop");

} // namespace

/* ----------------------------- WatchConfig Methods ----------------------------- */

bool WatchConfig::isValid() const noexcept {
  return !mountsPath.empty() && pollTimeout.count() > 0 && pollTimeout <= MAX_POLL_TIMEOUT;
}

/* ----------------------------- WatchLoop ----------------------------- */

WatchLoop::WatchLoop(WatchConfig config, MountHandler handler)
    : config_(std::move(config)),
      machine_(source_, std::move(handler),
               [this](int timerFd) { return poller_.add(timerFd, TIMER_EVENTS, TIMER_TOKEN); }) {}

WatchError WatchLoop::setup() {
  if (!config_.isValid()) {
    return WatchError::fromErrno(WatchStatus::MOUNT_OPEN_FAILED, EINVAL,
                                 "invalid watch configuration");
  }

  int err = source_.open(config_.mountsPath);
  if (err != 0) {
    return WatchError::fromErrno(WatchStatus::MOUNT_OPEN_FAILED, err, config_.mountsPath);
  }

  err = poller_.open();
  if (err != 0) {
    return WatchError::fromErrno(WatchStatus::POLL_INIT_FAILED, err, "epoll_create1");
  }

  // A mount or unmount marks the table with a priority event
  err = poller_.add(source_.fd(), MOUNT_EVENTS, MOUNT_TOKEN);
  if (err != 0) {
    return WatchError::fromErrno(WatchStatus::POLL_REGISTER_FAILED, err, config_.mountsPath);
  }

  logging::logDebug(LOOP_DOMAIN, "watching {} (fd {}, epoll fd {})", config_.mountsPath,
                    source_.fd(), poller_.fd());
  return {};
}

WatchError WatchLoop::run(const std::atomic<bool>& stopFlag) {
  WatchControl decision{};

  // Mounts may have changed between startup and registration; the initial
  // read closes that window and reports the full table once
  WatchError err = machine_.onTrigger(false, true, decision);
  if (!err.ok()) {
    return err;
  }
  if (decision.action == WatchControl::Action::STOP) {
    logging::logDebug(LOOP_DOMAIN, "stopped by handler");
    return {};
  }

  while (!stopFlag.load(std::memory_order_relaxed)) {
    std::uint64_t token = MOUNT_TOKEN;
    const PollOutcome OUTCOME = poller_.wait(config_.pollTimeout, token);

    if (OUTCOME == PollOutcome::INTERRUPTED) {
      continue;
    }
    if (OUTCOME == PollOutcome::FAILED) {
      return WatchError::fromErrno(WatchStatus::POLL_WAIT_FAILED, poller_.lastErrno(),
                                   "epoll_wait");
    }

    if (OUTCOME == PollOutcome::READY) {
      const bool IS_TIMER = (token == TIMER_TOKEN);
      if (IS_TIMER) {
        machine_.timer().drain();
      }
      logging::logDebug(LOOP_DOMAIN, "wake-up on {}", IS_TIMER ? "timer" : config_.mountsPath);

      err = machine_.onTrigger(IS_TIMER, false, decision);
      if (!err.ok()) {
        return err;
      }
      if (decision.action == WatchControl::Action::STOP) {
        logging::logDebug(LOOP_DOMAIN, "stopped by handler");
        return {};
      }
    }
  }

  logging::logDebug(LOOP_DOMAIN, "stop requested");
  return {};
}

} // namespace watch

} // namespace mountwatch

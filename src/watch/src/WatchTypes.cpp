/**
 * @file WatchTypes.cpp
 * @brief Formatting and helpers for watch events and errors.
 */

#include "src/watch/inc/WatchTypes.hpp"

#include <cstring> // strerror_r
#include <utility>

#include <fmt/core.h>

namespace mountwatch {

namespace watch {

namespace {

/// Thread-safe errno description (GNU strerror_r returns the message pointer).
inline std::string describeErrno(int err) {
  char buf[128] = {};
  const char* msg = ::strerror_r(err, buf, sizeof(buf));
  return std::string(msg != nullptr ? msg : "unknown error");
}

} // namespace

/* ----------------------------- ChangeEvent Methods ----------------------------- */

std::string ChangeEvent::toString() const {
  std::string out = fmt::format("ChangeEvent: {} mounted, {} unmounted", mounted.size(),
                                unmounted.size());
  if (initial) {
    out += " [initial]";
  }
  if (coalesced) {
    out += " [coalesced]";
  }
  for (const auto& M : mounted) {
    out += "\n  + " + M.toString();
  }
  for (const auto& M : unmounted) {
    out += "\n  - " + M.toString();
  }
  return out;
}

/* ----------------------------- WatchControl ----------------------------- */

const char* toString(WatchControl::Action action) noexcept {
  switch (action) {
  case WatchControl::Action::CONTINUE:
    return "CONTINUE";
  case WatchControl::Action::STOP:
    return "STOP";
  case WatchControl::Action::COALESCE:
    return "COALESCE";
  }
  return "UNKNOWN";
}

/* ----------------------------- WatchStatus ----------------------------- */

const char* toString(WatchStatus status) noexcept {
  switch (status) {
  case WatchStatus::OK:
    return "OK";
  case WatchStatus::MOUNT_OPEN_FAILED:
    return "MOUNT_OPEN_FAILED";
  case WatchStatus::POLL_INIT_FAILED:
    return "POLL_INIT_FAILED";
  case WatchStatus::POLL_REGISTER_FAILED:
    return "POLL_REGISTER_FAILED";
  case WatchStatus::THREAD_START_FAILED:
    return "THREAD_START_FAILED";
  case WatchStatus::MOUNT_READ_FAILED:
    return "MOUNT_READ_FAILED";
  case WatchStatus::PARSE_FAILED:
    return "PARSE_FAILED";
  case WatchStatus::POLL_WAIT_FAILED:
    return "POLL_WAIT_FAILED";
  case WatchStatus::TIMER_FAILED:
    return "TIMER_FAILED";
  case WatchStatus::HANDLER_THREW:
    return "HANDLER_THREW";
  }
  return "UNKNOWN";
}

/* ----------------------------- WatchError Methods ----------------------------- */

bool WatchError::isSetupFailure() const noexcept {
  switch (status) {
  case WatchStatus::MOUNT_OPEN_FAILED:
  case WatchStatus::POLL_INIT_FAILED:
  case WatchStatus::POLL_REGISTER_FAILED:
  case WatchStatus::THREAD_START_FAILED:
    return true;
  default:
    return false;
  }
}

void WatchError::rethrowIfHandlerThrew() const {
  if (status == WatchStatus::HANDLER_THREW && handlerException) {
    std::rethrow_exception(handlerException);
  }
}

std::string WatchError::toString() const {
  std::string out = watch::toString(status);
  if (!detail.empty()) {
    out += ": " + detail;
  }
  if (sysErrno != 0) {
    out += fmt::format(" ({})", describeErrno(sysErrno));
  }
  return out;
}

WatchError WatchError::fromErrno(WatchStatus status, int err, std::string detail) {
  WatchError error{};
  error.status = status;
  error.sysErrno = err;
  error.detail = std::move(detail);
  return error;
}

} // namespace watch

} // namespace mountwatch

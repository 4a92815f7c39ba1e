/**
 * @file EventPoller.cpp
 * @brief epoll wrapper implementation.
 */

#include "src/watch/inc/EventPoller.hpp"

#include <unistd.h> // close

#include <algorithm>
#include <array>
#include <cerrno>
#include <limits>

namespace mountwatch {

namespace watch {

/* ----------------------------- PollOutcome ----------------------------- */

const char* toString(PollOutcome outcome) noexcept {
  switch (outcome) {
  case PollOutcome::READY:
    return "READY";
  case PollOutcome::TIMEOUT:
    return "TIMEOUT";
  case PollOutcome::INTERRUPTED:
    return "INTERRUPTED";
  case PollOutcome::FAILED:
    return "FAILED";
  }
  return "UNKNOWN";
}

/* ----------------------------- EventPoller ----------------------------- */

EventPoller::~EventPoller() {
  if (fd_ >= 0) {
    ::close(fd_);
  }
}

int EventPoller::open() noexcept {
  if (fd_ >= 0) {
    return 0;
  }
  const int FD = ::epoll_create1(EPOLL_CLOEXEC);
  if (FD < 0) {
    return errno;
  }
  fd_ = FD;
  return 0;
}

int EventPoller::add(int fd, std::uint32_t events, std::uint64_t token) noexcept {
  if (fd_ < 0 || fd < 0) {
    return EBADF;
  }
  epoll_event ev{};
  ev.events = events;
  ev.data.u64 = token;
  if (::epoll_ctl(fd_, EPOLL_CTL_ADD, fd, &ev) < 0) {
    return errno;
  }
  return 0;
}

PollOutcome EventPoller::wait(std::chrono::milliseconds timeout, std::uint64_t& token) noexcept {
  std::array<epoll_event, MAX_POLL_EVENTS> events{};
  // Saturate instead of truncating: a wrapped negative would block forever
  constexpr std::int64_t INT_MAX_MS = std::numeric_limits<int>::max();
  const int TIMEOUT_MS =
      static_cast<int>(std::clamp<std::int64_t>(timeout.count(), 0, INT_MAX_MS));
  const int N = ::epoll_wait(fd_, events.data(), MAX_POLL_EVENTS, TIMEOUT_MS);
  if (N < 0) {
    if (errno == EINTR) {
      return PollOutcome::INTERRUPTED;
    }
    lastErrno_ = errno;
    return PollOutcome::FAILED;
  }
  if (N == 0) {
    return PollOutcome::TIMEOUT;
  }

  token = events[0].data.u64;
  for (int i = 1; i < N; ++i) {
    if (events[static_cast<std::size_t>(i)].data.u64 == TIMER_TOKEN) {
      token = TIMER_TOKEN;
    }
  }
  return PollOutcome::READY;
}

} // namespace watch

} // namespace mountwatch

/**
 * @file CoalesceTimer.cpp
 * @brief timerfd-backed one-shot timer.
 */

#include "src/watch/inc/CoalesceTimer.hpp"

#include <sys/timerfd.h> // timerfd_create, timerfd_settime
#include <unistd.h>      // read, close

#include <algorithm>
#include <cerrno>
#include <ctime> // itimerspec

#include <fmt/core.h>

namespace mountwatch {

namespace watch {

namespace {

constexpr std::int64_t MS_PER_SEC = 1000;
constexpr std::int64_t NS_PER_MS = 1'000'000;

inline itimerspec oneShot(std::chrono::milliseconds delay) noexcept {
  itimerspec spec{};
  if (delay.count() <= 0) {
    spec.it_value.tv_nsec = 1;
    return spec;
  }
  const std::int64_t MS = std::min(delay, MAX_TIMER_DELAY).count();
  spec.it_value.tv_sec = static_cast<time_t>(MS / MS_PER_SEC);
  spec.it_value.tv_nsec = static_cast<long>((MS % MS_PER_SEC) * NS_PER_MS);
  return spec;
}

} // namespace

CoalesceTimer::~CoalesceTimer() {
  if (fd_ >= 0) {
    ::close(fd_);
  }
}

WatchError CoalesceTimer::arm(std::chrono::milliseconds delay) {
  createdByLastArm_ = false;

  if (fd_ < 0) {
    const int FD = ::timerfd_create(CLOCK_MONOTONIC, TFD_NONBLOCK | TFD_CLOEXEC);
    if (FD < 0) {
      const int ERR = errno;
      return WatchError::fromErrno(WatchStatus::TIMER_FAILED, ERR, "timerfd_create");
    }
    fd_ = FD;
    createdByLastArm_ = true;
  }

  const itimerspec SPEC = oneShot(delay);
  if (::timerfd_settime(fd_, 0, &SPEC, nullptr) < 0) {
    const int ERR = errno;
    return WatchError::fromErrno(
        WatchStatus::TIMER_FAILED, ERR,
        fmt::format("timerfd_settime with delay {}ms", static_cast<long long>(delay.count())));
  }

  // timerfd_settime also clears expirations that fired before the re-arm
  return {};
}

std::uint64_t CoalesceTimer::drain() noexcept {
  if (fd_ < 0) {
    return 0;
  }
  std::uint64_t expirations = 0;
  const ssize_t N = ::read(fd_, &expirations, sizeof(expirations));
  if (N != static_cast<ssize_t>(sizeof(expirations))) {
    return 0; // EAGAIN: nothing pending
  }
  return expirations;
}

} // namespace watch

} // namespace mountwatch

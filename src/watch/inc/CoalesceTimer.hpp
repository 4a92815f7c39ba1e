#ifndef MOUNTWATCH_WATCH_COALESCE_TIMER_HPP
#define MOUNTWATCH_WATCH_COALESCE_TIMER_HPP
/**
 * @file CoalesceTimer.hpp
 * @brief One-shot timerfd that ends a coalescing window.
 * @note Linux-only. Uses timerfd_create(CLOCK_MONOTONIC).
 * @note NOT thread-safe: Owned by a single watch thread.
 *
 * The descriptor becomes readable (EPOLLIN) when the timer expires, so it is
 * multiplexed with the mount table through the same epoll instance.
 */

#include "src/watch/inc/WatchTypes.hpp"

#include <chrono>
#include <cstdint>
#include <limits>

namespace mountwatch {

namespace watch {

/* ----------------------------- Constants ----------------------------- */

/// Longest window the timer schedules; arm() clamps longer delays to it.
inline constexpr std::chrono::milliseconds MAX_TIMER_DELAY =
    std::chrono::seconds(std::numeric_limits<std::int32_t>::max());

/* ----------------------------- CoalesceTimer ----------------------------- */

class CoalesceTimer {
public:
  CoalesceTimer() = default;
  ~CoalesceTimer();

  CoalesceTimer(const CoalesceTimer&) = delete;
  CoalesceTimer& operator=(const CoalesceTimer&) = delete;

  /**
   * @brief Schedule a single expiry after delay, replacing any pending one.
   * @param delay Time until expiry. Zero or negative is clamped to 1ns so
   *        the timer still fires (a zero it_value would disarm it); above
   *        MAX_TIMER_DELAY is clamped to MAX_TIMER_DELAY.
   * @return TIMER_FAILED with errno on failure.
   *
   * The underlying timerfd is created on the first call and reused after.
   */
  [[nodiscard]] WatchError arm(std::chrono::milliseconds delay);

  /**
   * @brief Consume pending expirations so the descriptor stops being readable.
   * @return Number of expirations read (0 if none were pending).
   */
  std::uint64_t drain() noexcept;

  /// @brief timerfd descriptor, -1 before the first arm().
  [[nodiscard]] int fd() const noexcept { return fd_; }

  [[nodiscard]] bool isCreated() const noexcept { return fd_ >= 0; }

  /// @brief True if the last arm() had to create the timerfd.
  [[nodiscard]] bool wasCreatedByLastArm() const noexcept { return createdByLastArm_; }

private:
  int fd_{-1};
  bool createdByLastArm_{false};
};

} // namespace watch

} // namespace mountwatch

#endif // MOUNTWATCH_WATCH_COALESCE_TIMER_HPP

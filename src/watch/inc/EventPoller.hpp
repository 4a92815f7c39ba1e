#ifndef MOUNTWATCH_WATCH_EVENT_POLLER_HPP
#define MOUNTWATCH_WATCH_EVENT_POLLER_HPP
/**
 * @file EventPoller.hpp
 * @brief Minimal epoll wrapper multiplexing the mount table and the timer.
 * @note Linux-only. Uses epoll_create1/epoll_ctl/epoll_wait.
 * @note NOT thread-safe: Owned by a single watch thread after setup.
 */

#include <sys/epoll.h> // EPOLLPRI, EPOLLERR, EPOLLIN, EPOLLET

#include <chrono>
#include <cstdint>

namespace mountwatch {

namespace watch {

/* ----------------------------- Constants ----------------------------- */

/// Token of the mount table descriptor.
inline constexpr std::uint64_t MOUNT_TOKEN = 0;

/// Token of the coalescing timer descriptor.
inline constexpr std::uint64_t TIMER_TOKEN = 1;

/// Readiness events requested for the mount table (see proc_mounts(5)), edge-triggered.
inline constexpr std::uint32_t MOUNT_EVENTS = EPOLLPRI | EPOLLERR | EPOLLET;

/// Readiness events requested for the timer.
inline constexpr std::uint32_t TIMER_EVENTS = EPOLLIN;

/// Maximum events fetched per wait (only two sources exist).
inline constexpr int MAX_POLL_EVENTS = 8;

/* ----------------------------- PollOutcome ----------------------------- */

enum class PollOutcome : std::uint8_t {
  READY = 0,   ///< At least one source is ready; token identifies it
  TIMEOUT,     ///< Nothing happened before the timeout
  INTERRUPTED, ///< EINTR; caller retries
  FAILED,      ///< Any other error; errno in lastErrno()
};

[[nodiscard]] const char* toString(PollOutcome outcome) noexcept;

/* ----------------------------- EventPoller ----------------------------- */

class EventPoller {
public:
  EventPoller() = default;
  ~EventPoller();

  EventPoller(const EventPoller&) = delete;
  EventPoller& operator=(const EventPoller&) = delete;

  /**
   * @brief Create the epoll instance.
   * @return 0 on success, errno value on failure.
   */
  [[nodiscard]] int open() noexcept;

  /**
   * @brief Register a descriptor.
   * @param fd Descriptor to watch.
   * @param events epoll event mask.
   * @param token Value reported by wait() when fd is ready.
   * @return 0 on success, errno value on failure.
   */
  [[nodiscard]] int add(int fd, std::uint32_t events, std::uint64_t token) noexcept;

  /**
   * @brief Block until a source is ready or the timeout elapses.
   * @param timeout Upper bound on the wait. Negative polls without blocking;
   *        above INT_MAX ms saturates to INT_MAX ms.
   * @param token Set to the ready source when READY. If several sources are
   *        ready, TIMER_TOKEN wins so a due timer is never starved.
   */
  [[nodiscard]] PollOutcome wait(std::chrono::milliseconds timeout, std::uint64_t& token) noexcept;

  [[nodiscard]] int fd() const noexcept { return fd_; }

  /// @brief errno of the last FAILED wait.
  [[nodiscard]] int lastErrno() const noexcept { return lastErrno_; }

private:
  int fd_{-1};
  int lastErrno_{0};
};

} // namespace watch

} // namespace mountwatch

#endif // MOUNTWATCH_WATCH_EVENT_POLLER_HPP

#ifndef MOUNTWATCH_WATCH_WATCH_LOOP_HPP
#define MOUNTWATCH_WATCH_WATCH_LOOP_HPP
/**
 * @file WatchLoop.hpp
 * @brief Body of the watch thread: epoll wait + state machine dispatch.
 * @note Linux-only.
 * @note NOT thread-safe: setup() on the starting thread, then run() on the
 *       watch thread, never concurrently.
 */

#include "src/mount/inc/MountTable.hpp"
#include "src/watch/inc/EventPoller.hpp"
#include "src/watch/inc/MountTableSource.hpp"
#include "src/watch/inc/WatchStateMachine.hpp"
#include "src/watch/inc/WatchTypes.hpp"

#include <atomic>
#include <chrono>
#include <limits>
#include <string>

namespace mountwatch {

namespace watch {

/* ----------------------------- Constants ----------------------------- */

/// Bound on each wait, so a stop request is noticed without filesystem activity.
inline constexpr std::chrono::milliseconds DEFAULT_POLL_TIMEOUT{5000};

/// Largest timeout a single epoll_wait accepts.
inline constexpr std::chrono::milliseconds MAX_POLL_TIMEOUT{std::numeric_limits<int>::max()};

/* ----------------------------- WatchConfig ----------------------------- */

/**
 * @brief Configuration for a mount watch.
 */
struct WatchConfig {
  std::string mountsPath{mount::PROC_MOUNTS_PATH};        ///< Table to watch
  std::chrono::milliseconds pollTimeout{DEFAULT_POLL_TIMEOUT}; ///< Stop-check period

  /// @brief Validate configuration (non-empty path, timeout in (0, MAX_POLL_TIMEOUT]).
  [[nodiscard]] bool isValid() const noexcept;
};

/* ----------------------------- WatchLoop ----------------------------- */

class WatchLoop {
public:
  WatchLoop(WatchConfig config, MountHandler handler);

  WatchLoop(const WatchLoop&) = delete;
  WatchLoop& operator=(const WatchLoop&) = delete;

  /**
   * @brief Open the table and register it with epoll.
   * @return MOUNT_OPEN_FAILED (also for an invalid config), POLL_INIT_FAILED or
   *         POLL_REGISTER_FAILED on failure.
   */
  [[nodiscard]] WatchError setup();

  /**
   * @brief Deliver the initial event, then wait and dispatch until stopped.
   * @param stopFlag Checked after every wait cycle.
   * @return OK when stopped (flag or STOP decision), else the fatal error.
   *
   * Handler exceptions propagate to the caller.
   */
  [[nodiscard]] WatchError run(const std::atomic<bool>& stopFlag);

  [[nodiscard]] const WatchStateMachine& stateMachine() const noexcept { return machine_; }

private:
  WatchConfig config_;
  ProcMountsSource source_;
  EventPoller poller_;
  WatchStateMachine machine_;
};

} // namespace watch

} // namespace mountwatch

#endif // MOUNTWATCH_WATCH_WATCH_LOOP_HPP

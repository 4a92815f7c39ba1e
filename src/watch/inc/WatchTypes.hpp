#ifndef MOUNTWATCH_WATCH_WATCH_TYPES_HPP
#define MOUNTWATCH_WATCH_WATCH_TYPES_HPP
/**
 * @file WatchTypes.hpp
 * @brief Events, handler decisions and error reporting of the mount watch.
 *
 * The handler receives one ChangeEvent per delivered change and answers with
 * a WatchControl telling the watch how to proceed.
 */

#include "src/mount/inc/MountRecord.hpp"

#include <chrono>
#include <cstdint>
#include <exception>
#include <functional>
#include <string>
#include <vector>

namespace mountwatch {

namespace watch {

/* ----------------------------- ChangeEvent ----------------------------- */

/**
 * @brief Change of the mounted filesystems, delivered to the handler.
 *
 * mounted and unmounted are never both empty when delivered.
 */
struct ChangeEvent {
  std::vector<mount::MountRecord> mounted;   ///< Newly present filesystems
  std::vector<mount::MountRecord> unmounted; ///< Filesystems no longer present
  bool coalesced{false}; ///< Summarizes a coalescing window (see WatchControl::coalesceFor)
  bool initial{false};   ///< First event of the watch; mounted lists every mount

  /// @brief Human-readable summary.
  [[nodiscard]] std::string toString() const;
};

/* ----------------------------- WatchControl ----------------------------- */

/**
 * @brief Handler's decision after each event.
 */
struct WatchControl {
  enum class Action : std::uint8_t {
    CONTINUE = 0, ///< Deliver the next change as it happens
    STOP,         ///< Terminate the watch permanently
    COALESCE,     ///< Hold events for delay, then deliver one summary
  };

  Action action{Action::CONTINUE};
  std::chrono::milliseconds delay{0}; ///< Only meaningful for COALESCE

  [[nodiscard]] static WatchControl keepWatching() noexcept { return {Action::CONTINUE, {}}; }

  [[nodiscard]] static WatchControl stopWatching() noexcept { return {Action::STOP, {}}; }

  /**
   * @brief Suppress notifications for delay, then deliver one event covering
   *        everything that changed since the event this decision answers,
   *        including that event's own changes.
   */
  [[nodiscard]] static WatchControl coalesceFor(std::chrono::milliseconds delay) noexcept {
    return {Action::COALESCE, delay};
  }
};

[[nodiscard]] const char* toString(WatchControl::Action action) noexcept;

/**
 * @brief User callback. Runs on the watch thread; must not block indefinitely.
 *
 * Exceptions escaping the handler end the watch and are reported by
 * MountWatcher::stop()/join() as HANDLER_THREW.
 */
using MountHandler = std::function<WatchControl(ChangeEvent)>;

/* ----------------------------- WatchStatus ----------------------------- */

/**
 * @brief Failure kinds of the watch.
 *
 * Setup kinds are returned synchronously by MountWatcher::start(); the others
 * end a running watch and surface through stop()/join().
 */
enum class WatchStatus : std::uint8_t {
  OK = 0,
  MOUNT_OPEN_FAILED,    ///< Setup: mount table could not be opened
  POLL_INIT_FAILED,     ///< Setup: epoll instance could not be created
  POLL_REGISTER_FAILED, ///< Setup: mount table could not be registered with epoll
  THREAD_START_FAILED,  ///< Setup: watch thread could not be spawned
  MOUNT_READ_FAILED,    ///< Run: reading the mount table failed
  PARSE_FAILED,         ///< Run: mount table contained a malformed line
  POLL_WAIT_FAILED,     ///< Run: epoll_wait failed (other than EINTR)
  TIMER_FAILED,         ///< Run: coalescing timer could not be created, armed or registered
  HANDLER_THREW,        ///< Run: the handler raised an exception
};

/**
 * @brief Status name ("OK", "PARSE_FAILED", ...).
 */
[[nodiscard]] const char* toString(WatchStatus status) noexcept;

/* ----------------------------- WatchError ----------------------------- */

/**
 * @brief Status with its context.
 */
struct WatchError {
  WatchStatus status{WatchStatus::OK};
  int sysErrno{0};                    ///< errno of the failing syscall, 0 if none
  std::string detail;                 ///< Path, offending line, or exception message
  std::exception_ptr handlerException; ///< Set for HANDLER_THREW

  [[nodiscard]] bool ok() const noexcept { return status == WatchStatus::OK; }

  /// @brief True for failures that prevent the watch from starting.
  [[nodiscard]] bool isSetupFailure() const noexcept;

  /// @brief Rethrow the handler's exception, if that is what ended the watch.
  void rethrowIfHandlerThrew() const;

  /// @brief Human-readable summary ("PARSE_FAILED: invalid mount line 3: ...").
  [[nodiscard]] std::string toString() const;

  [[nodiscard]] static WatchError fromErrno(WatchStatus status, int err, std::string detail);
};

} // namespace watch

} // namespace mountwatch

#endif // MOUNTWATCH_WATCH_WATCH_TYPES_HPP

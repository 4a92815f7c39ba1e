#ifndef MOUNTWATCH_WATCH_WATCH_STATE_MACHINE_HPP
#define MOUNTWATCH_WATCH_WATCH_STATE_MACHINE_HPP
/**
 * @file WatchStateMachine.hpp
 * @brief Idle/coalescing state machine driving handler invocations.
 * @note NOT thread-safe: Lives on the watch thread.
 *
 * States:
 *  - Idle:       every trigger re-reads the table and reports the diff.
 *  - Coalescing: table triggers are absorbed until the timer expires; the
 *                expiry reports everything changed since the baseline kept
 *                when coalescing started.
 *
 * The baseline (lastKnown) is only replaced when the handler answers
 * CONTINUE or STOP. A COALESCE answer keeps the old baseline, so the summary
 * event covers the whole window, including the event that requested it.
 */

#include "src/mount/inc/MountRecord.hpp"
#include "src/watch/inc/CoalesceTimer.hpp"
#include "src/watch/inc/MountTableSource.hpp"
#include "src/watch/inc/WatchTypes.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <string>

namespace mountwatch {

namespace watch {

/**
 * @brief Hook called once, right after the coalescing timer is first created.
 * @return 0 on success, errno value on failure.
 */
using TimerRegistrar = std::function<int(int timerFd)>;

/* ----------------------------- WatchStateMachine ----------------------------- */

class WatchStateMachine {
public:
  /**
   * @param source Mount table to read on each proceeding trigger (not owned).
   * @param handler User callback.
   * @param registrar Optional lazy registration of the timer descriptor.
   */
  WatchStateMachine(MountTableSource& source, MountHandler handler,
                    TimerRegistrar registrar = TimerRegistrar{});

  WatchStateMachine(const WatchStateMachine&) = delete;
  WatchStateMachine& operator=(const WatchStateMachine&) = delete;

  /**
   * @brief React to one wake-up.
   * @param isTimerExpiry True if the coalescing timer fired.
   * @param isInitial True only for the first call of a watch.
   * @param decision Set to the action the loop must take (CONTINUE when the
   *        trigger was absorbed or produced no change).
   * @return Non-OK on read/parse/timer/registration failure (fatal).
   *
   * Exceptions thrown by the handler propagate to the caller.
   */
  [[nodiscard]] WatchError onTrigger(bool isTimerExpiry, bool isInitial, WatchControl& decision);

  [[nodiscard]] bool isCoalescing() const noexcept { return coalescing_; }

  /// @brief Baseline the next diff is computed against.
  [[nodiscard]] const mount::MountSet& lastKnown() const noexcept { return lastKnown_; }

  [[nodiscard]] CoalesceTimer& timer() noexcept { return timer_; }

  [[nodiscard]] const CoalesceTimer& timer() const noexcept { return timer_; }

  /// @brief Number of handler invocations so far.
  [[nodiscard]] std::uint64_t handlerCalls() const noexcept { return handlerCalls_; }

private:
  [[nodiscard]] WatchError readCurrent(mount::MountSet& current);
  [[nodiscard]] WatchError startCoalescing(std::chrono::milliseconds delay);

  MountTableSource& source_;
  MountHandler handler_;
  TimerRegistrar registrar_;

  mount::MountSet lastKnown_;
  bool coalescing_{false};
  CoalesceTimer timer_;

  std::string readBuf_;
  std::uint64_t handlerCalls_{0};
};

} // namespace watch

} // namespace mountwatch

#endif // MOUNTWATCH_WATCH_WATCH_STATE_MACHINE_HPP

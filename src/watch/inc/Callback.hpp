#ifndef MOUNTWATCH_WATCH_CALLBACK_HPP
#define MOUNTWATCH_WATCH_CALLBACK_HPP
/**
 * @file Callback.hpp
 * @brief Ready-made handler adapters.
 *
 * coalesceHandler() wraps a handler so it only sees summary events, at most
 * one per delay:
 * @code
 *   auto watcher = MountWatcher::start(
 *       coalesceHandler(std::chrono::seconds(5), CoalesceInitial::PASS_IMMEDIATELY,
 *                       [](ChangeEvent ev) { ...; return WatchControl::keepWatching(); }),
 *       err);
 * @endcode
 */

#include "src/watch/inc/WatchTypes.hpp"

#include <chrono>
#include <cstdint>

namespace mountwatch {

namespace watch {

/**
 * @brief Treatment of the initial event (the full table at watch start).
 */
enum class CoalesceInitial : std::uint8_t {
  COALESCE = 0,     ///< Coalesce it like any other event
  PASS_IMMEDIATELY, ///< Deliver it at once; coalesce only later events
};

[[nodiscard]] const char* toString(CoalesceInitial mode) noexcept;

/**
 * @brief Wrap inner so every uncoalesced event is answered with coalesceFor(delay).
 * @param delay Coalescing window.
 * @param initial Treatment of the initial event.
 * @param inner Receives coalesced events (and the initial one under PASS_IMMEDIATELY);
 *        its decision is returned unchanged.
 */
[[nodiscard]] MountHandler coalesceHandler(std::chrono::milliseconds delay,
                                           CoalesceInitial initial, MountHandler inner);

} // namespace watch

} // namespace mountwatch

#endif // MOUNTWATCH_WATCH_CALLBACK_HPP

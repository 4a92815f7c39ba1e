#ifndef MOUNTWATCH_WATCH_MOUNT_WATCHER_HPP
#define MOUNTWATCH_WATCH_MOUNT_WATCHER_HPP
/**
 * @file MountWatcher.hpp
 * @brief Background watch of the mount table with a user handler.
 * @note Linux-only.
 * @note Thread-safe: stop() may be called from any thread, including the
 *       handler itself (then it only requests the stop).
 *
 * Usage:
 * @code
 *   using namespace mountwatch::watch;
 *   WatchError err{};
 *   auto watcher = MountWatcher::start(
 *       [](ChangeEvent ev) {
 *         fmt::print("{}\n", ev.toString());
 *         return WatchControl::keepWatching();
 *       },
 *       err);
 *   if (!watcher) {
 *     fmt::print(stderr, "{}\n", err.toString());
 *   }
 *   ...
 *   err = watcher->stop();
 * @endcode
 *
 * Destroying a MountWatcher without stop()/join() requests the stop and
 * detaches: the thread exits within one poll timeout and releases its handler.
 */

#include "src/watch/inc/WatchLoop.hpp"
#include "src/watch/inc/WatchTypes.hpp"

#include <atomic>
#include <memory>
#include <mutex>
#include <thread>

namespace mountwatch {

namespace watch {

/* ----------------------------- MountWatcher ----------------------------- */

class MountWatcher {
public:
  /**
   * @brief Open the mount table, then spawn the watch thread.
   * @param handler Called on the watch thread for the initial table and every change.
   * @param config Table path and poll timeout.
   * @param error Set to the setup failure when nullptr is returned.
   * @return Running watcher, or nullptr on setup failure (handler never called).
   */
  [[nodiscard]] static std::unique_ptr<MountWatcher> start(MountHandler handler,
                                                          const WatchConfig& config,
                                                          WatchError& error);

  /// @brief start() on /proc/mounts with the default poll timeout.
  [[nodiscard]] static std::unique_ptr<MountWatcher> start(MountHandler handler,
                                                          WatchError& error);

  ~MountWatcher();

  MountWatcher(const MountWatcher&) = delete;
  MountWatcher& operator=(const MountWatcher&) = delete;

  /**
   * @brief Request termination and wait for the watch thread.
   * @return Result of the watch: OK, or the error that ended it.
   *
   * Returns within roughly one poll timeout. Called from the handler, only
   * requests the stop and returns OK. Repeated calls return the same result.
   */
  [[nodiscard]] WatchError stop();

  /**
   * @brief Wait for the watch to end on its own (handler STOP or error).
   * @return Same as stop().
   */
  [[nodiscard]] WatchError join();

  /// @brief True once stop() was called or the handle was dropped.
  [[nodiscard]] bool isStopRequested() const noexcept;

  /// @brief True once the watch thread has left its loop.
  [[nodiscard]] bool isFinished() const noexcept;

private:
  /// State shared with the watch thread; outlives a detached handle.
  struct SharedState {
    std::atomic<bool> stop{false};
    std::atomic<bool> finished{false};
    WatchError result{}; ///< Written by the thread before finished is set
  };

  explicit MountWatcher(std::shared_ptr<SharedState> state);

  std::shared_ptr<SharedState> state_;
  std::thread thread_;

  std::mutex joinMutex_;
  bool joined_{false};
};

} // namespace watch

} // namespace mountwatch

#endif // MOUNTWATCH_WATCH_MOUNT_WATCHER_HPP

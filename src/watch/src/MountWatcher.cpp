/**
 * @file MountWatcher.cpp
 * @brief Watch thread lifecycle.
 */

#include "src/watch/inc/MountWatcher.hpp"
#include "src/helpers/inc/Log.hpp"

#include <exception>
#include <system_error>
#include <utility>

namespace mountwatch {

namespace watch {

namespace logging = mountwatch::helpers::logging;

namespace {

constexpr logging::LogDomain WATCHER_DOMAIN("watcher");

} // namespace

/* ----------------------------- Construction ----------------------------- */

MountWatcher::MountWatcher(std::shared_ptr<SharedState> state) : state_(std::move(state)) {}

std::unique_ptr<MountWatcher> MountWatcher::start(MountHandler handler, WatchError& error) {
  return start(std::move(handler), WatchConfig{}, error);
}

std::unique_ptr<MountWatcher> MountWatcher::start(MountHandler handler, const WatchConfig& config,
                                                  WatchError& error) {
  error = WatchError{};

  // Setup runs on the caller's thread so its failures are reported synchronously
  auto loop = std::make_unique<WatchLoop>(config, std::move(handler));
  error = loop->setup();
  if (!error.ok()) {
    logging::logDebug(WATCHER_DOMAIN, "setup failed: {}", error.toString());
    return nullptr;
  }

  auto state = std::make_shared<SharedState>();
  std::unique_ptr<MountWatcher> watcher(new MountWatcher(state));

  try {
    watcher->thread_ = std::thread([state, loop = std::move(loop)]() mutable {
      WatchError result{};
      try {
        result = loop->run(state->stop);
      } catch (const std::exception& e) {
        result.status = WatchStatus::HANDLER_THREW;
        result.detail = e.what();
        result.handlerException = std::current_exception();
      } catch (...) {
        result.status = WatchStatus::HANDLER_THREW;
        result.detail = "non-standard exception";
        result.handlerException = std::current_exception();
      }

      if (!result.ok()) {
        logging::logError(WATCHER_DOMAIN, "watch ended: {}", result.toString());
      }

      // Close descriptors and release the handler before reporting completion
      loop.reset();
      state->result = std::move(result);
      state->finished.store(true, std::memory_order_release);
    });
  } catch (const std::system_error& e) {
    error = WatchError::fromErrno(WatchStatus::THREAD_START_FAILED, e.code().value(), e.what());
    return nullptr;
  }

  logging::logDebug(WATCHER_DOMAIN, "watch thread started on {}", config.mountsPath);
  return watcher;
}

MountWatcher::~MountWatcher() {
  state_->stop.store(true, std::memory_order_relaxed);
  if (thread_.joinable()) {
    // Dropped without stop()/join(); the thread finishes on its own
    thread_.detach();
  }
}

/* ----------------------------- Control ----------------------------- */

WatchError MountWatcher::stop() {
  state_->stop.store(true, std::memory_order_relaxed);
  if (std::this_thread::get_id() == thread_.get_id()) {
    return {};
  }
  return join();
}

WatchError MountWatcher::join() {
  if (std::this_thread::get_id() == thread_.get_id()) {
    // Joining itself would deadlock
    return {};
  }

  std::lock_guard<std::mutex> lock(joinMutex_);
  if (!joined_) {
    if (thread_.joinable()) {
      thread_.join();
    }
    joined_ = true;
  }
  return state_->result;
}

bool MountWatcher::isStopRequested() const noexcept {
  return state_->stop.load(std::memory_order_relaxed);
}

bool MountWatcher::isFinished() const noexcept {
  return state_->finished.load(std::memory_order_acquire);
}

} // namespace watch

} // namespace mountwatch

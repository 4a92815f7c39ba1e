/**
 * @file Callback.cpp
 * @brief Handler adapters.
 */

#include "src/watch/inc/Callback.hpp"

#include <utility>

namespace mountwatch {

namespace watch {

const char* toString(CoalesceInitial mode) noexcept {
  switch (mode) {
  case CoalesceInitial::COALESCE:
    return "COALESCE";
  case CoalesceInitial::PASS_IMMEDIATELY:
    return "PASS_IMMEDIATELY";
  }
  return "UNKNOWN";
}

MountHandler coalesceHandler(std::chrono::milliseconds delay, CoalesceInitial initial,
                             MountHandler inner) {
  return [delay, initial, inner = std::move(inner)](ChangeEvent event) -> WatchControl {
    const bool PASS = event.coalesced ||
                      (initial == CoalesceInitial::PASS_IMMEDIATELY && event.initial);
    if (!PASS) {
      return WatchControl::coalesceFor(delay);
    }
    return inner(std::move(event));
  };
}

} // namespace watch

} // namespace mountwatch

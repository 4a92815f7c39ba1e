/**
 * @file MountDiff.cpp
 * @brief Implementation of mount set differencing.
 */

#include "src/mount/inc/MountDiff.hpp"

#include <algorithm> // std::set_difference
#include <iterator>  // std::back_inserter

#include <fmt/core.h>

namespace mountwatch {

namespace mount {

/* ----------------------------- MountDiff Methods ----------------------------- */

bool MountDiff::empty() const noexcept { return added.empty() && removed.empty(); }

std::string MountDiff::toString() const {
  return fmt::format("+{} -{}", added.size(), removed.size());
}

/* ----------------------------- API ----------------------------- */

MountDiff diffMountSets(const MountSet& previous, const MountSet& current) {
  MountDiff diff{};

  // Both sets iterate in natural order, so a linear merge suffices
  std::set_difference(current.begin(), current.end(), previous.begin(), previous.end(),
                      std::back_inserter(diff.added));
  std::set_difference(previous.begin(), previous.end(), current.begin(), current.end(),
                      std::back_inserter(diff.removed));

  return diff;
}

} // namespace mount

} // namespace mountwatch

#ifndef MOUNTWATCH_MOUNT_MOUNT_DIFF_HPP
#define MOUNTWATCH_MOUNT_MOUNT_DIFF_HPP
/**
 * @file MountDiff.hpp
 * @brief Added/removed mounts between two snapshots of the mount table.
 * @note Thread-safe: Stateless.
 *
 * Snapshot + delta pattern: the caller keeps the previous MountSet and
 * diffs the fresh one against it.
 */

#include "src/mount/inc/MountRecord.hpp"

#include <string>
#include <vector>

namespace mountwatch {

namespace mount {

/* ----------------------------- MountDiff ----------------------------- */

/**
 * @brief Change between two mount sets.
 *
 * Both lists are in natural MountRecord order and never share an element.
 */
struct MountDiff {
  std::vector<MountRecord> added;   ///< In current, not in previous
  std::vector<MountRecord> removed; ///< In previous, not in current

  /// @brief True when nothing was added or removed.
  [[nodiscard]] bool empty() const noexcept;

  /// @brief Human-readable summary ("+2 -1").
  [[nodiscard]] std::string toString() const;
};

/* ----------------------------- API ----------------------------- */

/**
 * @brief Compute the records added and removed between two snapshots.
 * @param previous Last known mount set.
 * @param current Freshly read mount set.
 * @return added = current \ previous, removed = previous \ current.
 */
[[nodiscard]] MountDiff diffMountSets(const MountSet& previous, const MountSet& current);

} // namespace mount

} // namespace mountwatch

#endif // MOUNTWATCH_MOUNT_MOUNT_DIFF_HPP

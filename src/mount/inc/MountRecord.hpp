#ifndef MOUNTWATCH_MOUNT_MOUNT_RECORD_HPP
#define MOUNTWATCH_MOUNT_MOUNT_RECORD_HPP
/**
 * @file MountRecord.hpp
 * @brief One mounted filesystem, as listed in /proc/mounts.
 * @note Value type: copyable, comparable, hashable.
 *
 * Fields follow the fstab(5) layout:
 *   spec mountpoint fstype options dump pass
 */

#include <cstddef> // std::size_t
#include <cstdint> // std::uint32_t
#include <functional>
#include <set>
#include <string>
#include <vector>

namespace mountwatch {

namespace mount {

/* ----------------------------- MountRecord ----------------------------- */

/**
 * @brief A mounted filesystem.
 *
 * Equality, ordering and hashing cover all six fields: two mounts at the same
 * path with different options are distinct records.
 */
struct MountRecord {
  std::string spec;                      ///< Device or source (e.g., "/dev/sda1", "tmpfs")
  std::string mountPoint;                ///< Mount point path (e.g., "/boot/efi")
  std::string fsType;                    ///< Filesystem type (e.g., "ext4")
  std::vector<std::string> mountOptions; ///< Options in table order (e.g., {"rw", "relatime"})
  std::uint32_t dumpFrequency{0};        ///< fs_freq (dump(8) interval)
  std::uint32_t fsckPassOrder{0};        ///< fs_passno (fsck(8) order)

  /// @brief Options rejoined with ',' as they appear in the table.
  [[nodiscard]] std::string optionsString() const;

  /// @brief Human-readable summary.
  [[nodiscard]] std::string toString() const;
};

[[nodiscard]] bool operator==(const MountRecord& lhs, const MountRecord& rhs) noexcept;
[[nodiscard]] bool operator!=(const MountRecord& lhs, const MountRecord& rhs) noexcept;

/// Natural ordering: lexicographic over spec, mountPoint, fsType, options, dump, pass.
[[nodiscard]] bool operator<(const MountRecord& lhs, const MountRecord& rhs) noexcept;

/* ----------------------------- MountSet ----------------------------- */

/// Set of mounts keyed by full structural equality, iterated in natural order.
using MountSet = std::set<MountRecord>;

/// @brief Build a MountSet from parsed records (duplicates collapse).
[[nodiscard]] MountSet toMountSet(const std::vector<MountRecord>& records);

} // namespace mount

} // namespace mountwatch

namespace std {

template <> struct hash<mountwatch::mount::MountRecord> {
  std::size_t operator()(const mountwatch::mount::MountRecord& record) const noexcept;
};

} // namespace std

#endif // MOUNTWATCH_MOUNT_MOUNT_RECORD_HPP

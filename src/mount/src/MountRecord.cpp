/**
 * @file MountRecord.cpp
 * @brief MountRecord comparison, hashing and formatting.
 */

#include "src/mount/inc/MountRecord.hpp"

#include <tuple>

#include <fmt/core.h>
#include <fmt/format.h>
#include <fmt/ranges.h>

namespace mountwatch {

namespace mount {

namespace {

/// boost::hash_combine mixing step.
inline void hashCombine(std::size_t& seed, std::size_t value) noexcept {
  seed ^= value + 0x9e3779b97f4a7c15ULL + (seed << 6) + (seed >> 2);
}

inline auto asTuple(const MountRecord& r) noexcept {
  return std::tie(r.spec, r.mountPoint, r.fsType, r.mountOptions, r.dumpFrequency,
                  r.fsckPassOrder);
}

} // namespace

/* ----------------------------- MountRecord Methods ----------------------------- */

std::string MountRecord::optionsString() const {
  return fmt::format("{}", fmt::join(mountOptions, ","));
}

std::string MountRecord::toString() const {
  return fmt::format("{} on {} type {} ({}) {} {}", spec, mountPoint, fsType, optionsString(),
                     dumpFrequency, fsckPassOrder);
}

/* ----------------------------- Operators ----------------------------- */

bool operator==(const MountRecord& lhs, const MountRecord& rhs) noexcept {
  return asTuple(lhs) == asTuple(rhs);
}

bool operator!=(const MountRecord& lhs, const MountRecord& rhs) noexcept { return !(lhs == rhs); }

bool operator<(const MountRecord& lhs, const MountRecord& rhs) noexcept {
  return asTuple(lhs) < asTuple(rhs);
}

/* ----------------------------- MountSet ----------------------------- */

MountSet toMountSet(const std::vector<MountRecord>& records) {
  return MountSet(records.begin(), records.end());
}

} // namespace mount

} // namespace mountwatch

std::size_t std::hash<mountwatch::mount::MountRecord>::operator()(
    const mountwatch::mount::MountRecord& record) const noexcept {
  const std::hash<std::string> STR_HASH{};
  std::size_t seed = STR_HASH(record.spec);
  mountwatch::mount::hashCombine(seed, STR_HASH(record.mountPoint));
  mountwatch::mount::hashCombine(seed, STR_HASH(record.fsType));
  mountwatch::mount::hashCombine(seed, record.mountOptions.size());
  for (const auto& OPT : record.mountOptions) {
    mountwatch::mount::hashCombine(seed, STR_HASH(OPT));
  }
  mountwatch::mount::hashCombine(seed, std::hash<std::uint32_t>{}(record.dumpFrequency));
  mountwatch::mount::hashCombine(seed, std::hash<std::uint32_t>{}(record.fsckPassOrder));
  return seed;
}

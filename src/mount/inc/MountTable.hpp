#ifndef MOUNTWATCH_MOUNT_MOUNT_TABLE_HPP
#define MOUNTWATCH_MOUNT_MOUNT_TABLE_HPP
/**
 * @file MountTable.hpp
 * @brief Parsing and reading of the /proc/mounts text table.
 * @note Linux-only. Reads /proc/mounts (or any file in the same format).
 * @note Thread-safe: All functions are stateless and safe to call concurrently.
 *
 * Each non-comment line holds exactly six whitespace-separated fields:
 *   spec mountpoint fstype opt1,opt2,... dump pass
 *
 * Blank lines and lines starting with '#' (after leading whitespace) are
 * skipped. The first malformed line aborts the whole parse.
 */

#include "src/mount/inc/MountRecord.hpp"

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace mountwatch {

namespace mount {

/* ----------------------------- Constants ----------------------------- */

/// Live mount table of the calling process' mount namespace.
inline constexpr const char* PROC_MOUNTS_PATH = "/proc/mounts";

/// Number of fields on a valid mount line.
inline constexpr std::size_t MOUNT_FIELD_COUNT = 6;

/// Initial read buffer reservation (most tables fit in one page or two).
inline constexpr std::size_t MOUNT_READ_CHUNK = 4096;

/* ----------------------------- MountParseError ----------------------------- */

/**
 * @brief Location and text of the first malformed line.
 */
struct MountParseError {
  std::string line;         ///< Offending line, exactly as read (without newline)
  std::size_t lineNumber{0}; ///< 1-based line number (0 = no error)

  /// @brief Human-readable description ("invalid mount line N: ...").
  [[nodiscard]] std::string toString() const;
};

/* ----------------------------- MountParseResult ----------------------------- */

/**
 * @brief Outcome of parsing a whole mount table.
 *
 * On failure, mounts is always empty: no partial tables are returned.
 */
struct MountParseResult {
  std::vector<MountRecord> mounts; ///< Records in table order
  MountParseError error{};         ///< Valid when success == false
  bool success{false};             ///< True if every line parsed
};

/* ----------------------------- API ----------------------------- */

/**
 * @brief Parse one non-comment mount line.
 * @param line Line text (leading whitespace allowed, no newline).
 * @param out Record to populate on success.
 * @return true if the line has six fields and numeric dump/pass values.
 */
[[nodiscard]] bool parseMountLine(std::string_view line, MountRecord& out);

/**
 * @brief Parse the full text of a mount table.
 * @param text Table content (e.g., the bytes of /proc/mounts).
 * @return Parsed records, or the first malformed line.
 * @note Pure: no I/O, re-entrant.
 */
[[nodiscard]] MountParseResult parseMountTable(std::string_view text);

/**
 * @brief Read the whole content of an open table from offset 0.
 * @param fd Open descriptor (typically /proc/mounts).
 * @param out Replaced with the file content.
 * @return 0 on success, errno value on failure.
 *
 * Seeks back to the start before reading, so the same descriptor can be
 * re-read after every change notification. Retries on EINTR.
 */
[[nodiscard]] int readMountTable(int fd, std::string& out);

} // namespace mount

} // namespace mountwatch

#endif // MOUNTWATCH_MOUNT_MOUNT_TABLE_HPP

#ifndef MOUNTWATCH_WATCH_MOUNT_TABLE_SOURCE_HPP
#define MOUNTWATCH_WATCH_MOUNT_TABLE_SOURCE_HPP
/**
 * @file MountTableSource.hpp
 * @brief Where the watch reads the mount table from.
 * @note Linux-only. The production source is /proc/mounts.
 *
 * The kernel marks /proc/mounts with a priority event (EPOLLPRI | EPOLLERR)
 * whenever a filesystem is mounted or unmounted in the reader's namespace
 * (see proc_mounts(5)).
 */

#include <string>

namespace mountwatch {

namespace watch {

/* ----------------------------- MountTableSource ----------------------------- */

/**
 * @brief Re-readable mount table with a readiness descriptor.
 */
class MountTableSource {
public:
  virtual ~MountTableSource() = default;

  /**
   * @brief Read the complete current table text.
   * @param out Replaced with the table content.
   * @return 0 on success, errno value on failure.
   */
  [[nodiscard]] virtual int readAll(std::string& out) = 0;

  /// @brief Descriptor raising priority readiness on change (-1 if none).
  [[nodiscard]] virtual int fd() const noexcept = 0;

  /// @brief Path or name, for diagnostics.
  [[nodiscard]] virtual const std::string& name() const noexcept = 0;
};

/* ----------------------------- ProcMountsSource ----------------------------- */

/**
 * @brief Mount table backed by an open file (normally /proc/mounts).
 */
class ProcMountsSource final : public MountTableSource {
public:
  ProcMountsSource() = default;
  ~ProcMountsSource() override;

  ProcMountsSource(const ProcMountsSource&) = delete;
  ProcMountsSource& operator=(const ProcMountsSource&) = delete;

  /**
   * @brief Open the table read-only.
   * @param path File to open.
   * @return 0 on success, errno value on failure.
   */
  [[nodiscard]] int open(const std::string& path);

  [[nodiscard]] int readAll(std::string& out) override;
  [[nodiscard]] int fd() const noexcept override { return fd_; }
  [[nodiscard]] const std::string& name() const noexcept override { return path_; }

private:
  int fd_{-1};
  std::string path_;
};

} // namespace watch

} // namespace mountwatch

#endif // MOUNTWATCH_WATCH_MOUNT_TABLE_SOURCE_HPP

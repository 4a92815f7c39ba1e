/**
 * @file MountTableSource.cpp
 * @brief File-backed mount table source.
 */

#include "src/watch/inc/MountTableSource.hpp"
#include "src/mount/inc/MountTable.hpp"

#include <fcntl.h>  // open, O_RDONLY, O_CLOEXEC
#include <unistd.h> // close

#include <cerrno>

namespace mountwatch {

namespace watch {

ProcMountsSource::~ProcMountsSource() {
  if (fd_ >= 0) {
    ::close(fd_);
  }
}

int ProcMountsSource::open(const std::string& path) {
  if (fd_ >= 0) {
    ::close(fd_);
    fd_ = -1;
  }
  path_ = path;

  const int FD = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
  if (FD < 0) {
    return errno;
  }
  fd_ = FD;
  return 0;
}

int ProcMountsSource::readAll(std::string& out) { return mount::readMountTable(fd_, out); }

} // namespace watch

} // namespace mountwatch

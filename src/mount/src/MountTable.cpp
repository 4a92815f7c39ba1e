/**
 * @file MountTable.cpp
 * @brief Implementation of mount table parsing and reading.
 */

#include "src/mount/inc/MountTable.hpp"
#include "src/helpers/inc/Strings.hpp"

#include <unistd.h> // lseek, read

#include <array>
#include <cerrno>
#include <charconv>
#include <system_error>
#include <utility>

#include <fmt/core.h>

namespace mountwatch {

namespace mount {

namespace strings = mountwatch::helpers::strings;

namespace {

/// Parse a non-negative decimal field that must fit in 32 bits.
inline bool parseCount(std::string_view field, std::uint32_t& out) noexcept {
  if (field.empty()) {
    return false;
  }
  const char* const BEGIN = field.data();
  const char* const END = BEGIN + field.size();
  const auto RES = std::from_chars(BEGIN, END, out, 10);
  return RES.ec == std::errc{} && RES.ptr == END;
}

} // namespace

/* ----------------------------- MountParseError Methods ----------------------------- */

std::string MountParseError::toString() const {
  return fmt::format("invalid mount line {}: {}", lineNumber, line);
}

/* ----------------------------- Parsing ----------------------------- */

bool parseMountLine(std::string_view line, MountRecord& out) {
  std::array<std::string_view, MOUNT_FIELD_COUNT> fields{};
  const std::size_t COUNT = strings::splitWhitespace(line, fields.data(), fields.size());
  if (COUNT != MOUNT_FIELD_COUNT) {
    return false;
  }

  MountRecord record{};
  if (!parseCount(fields[4], record.dumpFrequency) ||
      !parseCount(fields[5], record.fsckPassOrder)) {
    return false;
  }

  record.spec.assign(fields[0]);
  record.mountPoint.assign(fields[1]);
  record.fsType.assign(fields[2]);
  record.mountOptions = strings::splitOn(fields[3], ',');

  out = std::move(record);
  return true;
}

MountParseResult parseMountTable(std::string_view text) {
  MountParseResult result{};

  std::size_t lineNumber = 0;
  std::size_t pos = 0;
  while (pos < text.size()) {
    std::size_t eol = text.find('\n', pos);
    if (eol == std::string_view::npos) {
      eol = text.size();
    }
    const std::string_view RAW = text.substr(pos, eol - pos);
    pos = eol + 1;
    ++lineNumber;

    const std::string_view TRIMMED = strings::trimLeadingWhitespace(RAW);
    if (TRIMMED.empty() || TRIMMED.front() == '#') {
      continue;
    }

    MountRecord record{};
    if (!parseMountLine(TRIMMED, record)) {
      result.mounts.clear();
      result.error.line.assign(RAW);
      result.error.lineNumber = lineNumber;
      result.success = false;
      return result;
    }
    result.mounts.push_back(std::move(record));
  }

  result.success = true;
  return result;
}

/* ----------------------------- Reading ----------------------------- */

int readMountTable(int fd, std::string& out) {
  out.clear();
  if (fd < 0) {
    return EBADF;
  }

  if (::lseek(fd, 0, SEEK_SET) < 0) {
    return errno;
  }

  std::array<char, MOUNT_READ_CHUNK> buf{};
  out.reserve(MOUNT_READ_CHUNK);
  for (;;) {
    const ssize_t N = ::read(fd, buf.data(), buf.size());
    if (N < 0) {
      if (errno == EINTR) {
        continue;
      }
      const int ERR = errno;
      out.clear();
      return ERR;
    }
    if (N == 0) {
      break;
    }
    out.append(buf.data(), static_cast<std::size_t>(N));
  }

  return 0;
}

} // namespace mount

} // namespace mountwatch

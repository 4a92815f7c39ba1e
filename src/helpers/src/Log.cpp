/**
 * @file Log.cpp
 * @brief stderr log backend.
 */

#include "src/helpers/inc/Log.hpp"

#include <atomic>
#include <cstdio>
#include <exception>
#include <iterator> // std::back_inserter

#include <fmt/format.h>

namespace mountwatch {
namespace helpers {
namespace logging {

namespace {

std::atomic<LogLevel> gThreshold{LogLevel::WARNING};

} // namespace

/* ----------------------------- LogLevel ----------------------------- */

const char* toString(LogLevel level) noexcept {
  switch (level) {
  case LogLevel::DEBUG:
    return "debug";
  case LogLevel::INFO:
    return "info";
  case LogLevel::WARNING:
    return "warning";
  case LogLevel::ERROR:
    return "error";
  }
  return "unknown";
}

/* ----------------------------- Threshold ----------------------------- */

void setLogThreshold(LogLevel level) noexcept { gThreshold.store(level, std::memory_order_relaxed); }

LogLevel getLogThreshold() noexcept { return gThreshold.load(std::memory_order_relaxed); }

bool isLogEnabled(LogLevel level) noexcept {
  return static_cast<unsigned char>(level) >= static_cast<unsigned char>(getLogThreshold());
}

/* ----------------------------- Output ----------------------------- */

void log(LogLevel level, const LogDomain& domain, std::string_view msg) noexcept {
  if (!isLogEnabled(level)) {
    return;
  }
  try {
    fmt::print(stderr, "[{}] {}: {}\n", toString(level), domain.name(), msg);
  } catch (const std::exception&) {
    // stderr is gone; nowhere left to report
  }
}

void logVFmt(LogLevel level, const LogDomain& domain, fmt::string_view formatStr,
             fmt::format_args args) noexcept {
  if (!isLogEnabled(level)) {
    return;
  }
  try {
    fmt::memory_buffer buffer;
    fmt::vformat_to(std::back_inserter(buffer), formatStr, args);
    log(level, domain, std::string_view(buffer.data(), buffer.size()));
  } catch (const std::exception& e) {
    log(LogLevel::ERROR, domain, e.what());
  }
}

} // namespace logging
} // namespace helpers
} // namespace mountwatch

/**
 * @file mount-watch.cpp
 * @brief Print filesystem mount and unmount events as they happen.
 *
 * The first event lists every mounted filesystem. Runs until SIGINT/SIGTERM,
 * or until --count events were printed.
 */

#include "src/helpers/inc/Args.hpp"
#include "src/helpers/inc/Log.hpp"
#include "src/watch/inc/Callback.hpp"
#include "src/watch/inc/CoalesceTimer.hpp"
#include "src/watch/inc/MountWatcher.hpp"

#include <signal.h>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <ctime>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <fmt/core.h>

namespace watch = mountwatch::watch;
namespace mount = mountwatch::mount;
namespace args = mountwatch::helpers::args;
namespace logging = mountwatch::helpers::logging;

namespace {

/// Argument keys.
enum ArgKey : std::uint8_t {
  ARG_HELP = 0,
  ARG_JSON = 1,
  ARG_COALESCE = 2,
  ARG_COUNT = 3,
  ARG_VERBOSE = 4,
  ARG_MOUNTS = 5,
};

/// Tool description for --help.
constexpr std::string_view DESCRIPTION =
    "Watch the mount table and print filesystems as they are mounted or unmounted.";

constexpr logging::LogDomain CLI_DOMAIN("mount-watch");

/// How often the main thread checks whether the watch ended by itself.
constexpr struct timespec SIGNAL_POLL = {0, 200 * 1000 * 1000};

args::ArgMap buildArgMap() {
  args::ArgMap map;
  map[ARG_HELP] = {"--help", 0, false, "Show this help message"};
  map[ARG_JSON] = {"--json", 0, false, "Print one JSON object per event"};
  map[ARG_COALESCE] = {"--coalesce", 1, false, "Group changes into one event per <ms> window"};
  map[ARG_COUNT] = {"--count", 1, false, "Stop after <n> events (default: unlimited)"};
  map[ARG_VERBOSE] = {"--verbose", 0, false, "Log watch internals to stderr"};
  map[ARG_MOUNTS] = {"--mounts", 1, false, "Mount table to watch (default: /proc/mounts)"};
  return map;
}

/* ----------------------------- Output ----------------------------- */

std::string jsonEscape(std::string_view s) {
  std::string out;
  out.reserve(s.size());
  for (const char C : s) {
    switch (C) {
    case '"':
      out += "\\\"";
      break;
    case '\\':
      out += "\\\\";
      break;
    case '\n':
      out += "\\n";
      break;
    case '\t':
      out += "\\t";
      break;
    default:
      if (static_cast<unsigned char>(C) < 0x20) {
        out += fmt::format("\\u{:04x}", static_cast<unsigned>(C));
      } else {
        out += C;
      }
    }
  }
  return out;
}

std::string jsonRecords(const std::vector<mount::MountRecord>& records) {
  std::string out = "[";
  bool first = true;
  for (const auto& R : records) {
    if (!first) {
      out += ",";
    }
    first = false;
    out += fmt::format("{{\"spec\":\"{}\",\"mountPoint\":\"{}\",\"fsType\":\"{}\","
                       "\"options\":\"{}\",\"dump\":{},\"pass\":{}}}",
                       jsonEscape(R.spec), jsonEscape(R.mountPoint), jsonEscape(R.fsType),
                       jsonEscape(R.optionsString()), R.dumpFrequency, R.fsckPassOrder);
  }
  out += "]";
  return out;
}

void printEvent(const watch::ChangeEvent& ev, bool jsonOutput) {
  if (jsonOutput) {
    fmt::print("{{\"initial\":{},\"coalesced\":{},\"mounted\":{},\"unmounted\":{}}}\n",
               ev.initial, ev.coalesced, jsonRecords(ev.mounted), jsonRecords(ev.unmounted));
  } else {
    fmt::print("{}\n", ev.toString());
  }
  std::fflush(stdout);
}

/* ----------------------------- Signals ----------------------------- */

/// Block SIGINT/SIGTERM so the watch thread inherits the mask and main receives them.
bool blockStopSignals(sigset_t& set) {
  sigemptyset(&set);
  sigaddset(&set, SIGINT);
  sigaddset(&set, SIGTERM);
  return pthread_sigmask(SIG_BLOCK, &set, nullptr) == 0;
}

/// Wait for a stop signal or for the watch to end by itself.
void waitForStop(const sigset_t& set, const watch::MountWatcher& watcher) {
  while (!watcher.isFinished()) {
    const int SIG = sigtimedwait(&set, nullptr, &SIGNAL_POLL);
    if (SIG == SIGINT || SIG == SIGTERM) {
      logging::logInfo(CLI_DOMAIN, "signal {} received, stopping", SIG);
      return;
    }
  }
}

} // namespace

/* ----------------------------- Main ----------------------------- */

int main(int argc, char* argv[]) {
  const args::ArgMap ARG_MAP = buildArgMap();
  args::ParsedArgs pargs;
  bool jsonOutput = false;
  std::uint64_t coalesceMs = 0; // 0 = deliver every change
  std::uint64_t count = 0;      // 0 = unlimited
  watch::WatchConfig config{};

  std::vector<std::string_view> argList;
  argList.reserve(static_cast<std::size_t>(argc > 1 ? argc - 1 : 0));
  for (int i = 1; i < argc; ++i) {
    argList.emplace_back(argv[i]);
  }

  std::string error;
  if (!args::parseArgs(argList, ARG_MAP, pargs, error)) {
    fmt::print(stderr, "Error: {}\n\n", error);
    args::printUsage(argv[0], DESCRIPTION, ARG_MAP);
    return 1;
  }

  if (pargs.count(ARG_HELP) != 0) {
    args::printUsage(argv[0], DESCRIPTION, ARG_MAP);
    return 0;
  }

  jsonOutput = (pargs.count(ARG_JSON) != 0);
  if (pargs.count(ARG_VERBOSE) != 0) {
    logging::setLogThreshold(logging::LogLevel::DEBUG);
  }

  if (pargs.count(ARG_COALESCE) != 0) {
    const auto VALUE = args::parseUnsigned(pargs[ARG_COALESCE][0]);
    if (!VALUE || *VALUE > static_cast<std::uint64_t>(watch::MAX_TIMER_DELAY.count())) {
      fmt::print(stderr, "Error: invalid --coalesce value '{}' (max {} ms)\n",
                 pargs[ARG_COALESCE][0], watch::MAX_TIMER_DELAY.count());
      return 1;
    }
    coalesceMs = *VALUE;
  }

  if (pargs.count(ARG_COUNT) != 0) {
    const auto VALUE = args::parseUnsigned(pargs[ARG_COUNT][0]);
    if (!VALUE) {
      fmt::print(stderr, "Error: invalid --count value '{}'\n", pargs[ARG_COUNT][0]);
      return 1;
    }
    count = *VALUE;
  }

  if (pargs.count(ARG_MOUNTS) != 0) {
    config.mountsPath = std::string(pargs[ARG_MOUNTS][0]);
  }

  // Counted on the watch thread, reported from main
  auto printed = std::make_shared<std::atomic<std::uint64_t>>(0);

  watch::MountHandler printer = [printed, count, jsonOutput](watch::ChangeEvent ev) {
    printEvent(ev, jsonOutput);
    const std::uint64_t N = printed->fetch_add(1) + 1;
    if (count != 0 && N >= count) {
      return watch::WatchControl::stopWatching();
    }
    return watch::WatchControl::keepWatching();
  };

  if (coalesceMs != 0) {
    printer = watch::coalesceHandler(std::chrono::milliseconds(coalesceMs),
                                     watch::CoalesceInitial::PASS_IMMEDIATELY, std::move(printer));
  }

  sigset_t stopSignals;
  if (!blockStopSignals(stopSignals)) {
    fmt::print(stderr, "Error: cannot block stop signals\n");
    return 1;
  }

  watch::WatchError werr{};
  std::unique_ptr<watch::MountWatcher> watcher =
      watch::MountWatcher::start(std::move(printer), config, werr);
  if (!watcher) {
    fmt::print(stderr, "Error: {}\n", werr.toString());
    return 1;
  }

  waitForStop(stopSignals, *watcher);

  werr = watcher->stop();
  if (!werr.ok()) {
    fmt::print(stderr, "Error: {}\n", werr.toString());
    return 1;
  }

  logging::logInfo(CLI_DOMAIN, "{} event(s) printed", printed->load());
  return 0;
}

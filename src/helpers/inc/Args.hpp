#ifndef MOUNTWATCH_HELPERS_ARGS_HPP
#define MOUNTWATCH_HELPERS_ARGS_HPP
/**
 * @file Args.hpp
 * @brief Command-line flag parsing for the mountwatch tools.
 *
 * Flags take a fixed number of values. Unknown flags and stray tokens are
 * rejected so a mistyped option never silently falls back to a default.
 *
 * @note Cold-path: Allocates std::unordered_map for parsed results.
 */

#include <algorithm>
#include <charconv>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

#include <fmt/core.h>

namespace mountwatch {
namespace helpers {
namespace args {

/* ----------------------------- Types ----------------------------- */

/**
 * @brief Definition of one accepted flag.
 */
struct ArgDef {
  std::string_view flag;   ///< Flag string, e.g. "--count"
  std::uint8_t nargs;      ///< Number of values following the flag
  bool required;           ///< True if the flag must be given
  std::string_view desc{}; ///< Help text (optional)
};

/// Map from key to flag definition.
using ArgMap = std::unordered_map<std::uint8_t, ArgDef>;

/// Map from key to the values given after the flag.
using ParsedArgs = std::unordered_map<std::uint8_t, std::vector<std::string_view>>;

/* ----------------------------- API ----------------------------- */

/**
 * @brief Parse arguments against a flag map.
 * @param args  Arguments without the program name (views must outlive pargs).
 * @param map   Accepted flags.
 * @param pargs Output; a repeated flag keeps its last values.
 * @param error Set to a one-line message on failure.
 * @return true on success.
 */
[[nodiscard]] inline bool parseArgs(std::span<const std::string_view> args, const ArgMap& map,
                                    ParsedArgs& pargs, std::string& error) {
  std::unordered_map<std::string_view, std::uint8_t> byFlag;
  byFlag.reserve(map.size());
  for (const auto& KV : map) {
    byFlag.emplace(KV.second.flag, KV.first);
  }

  for (std::size_t i = 0; i < args.size(); ++i) {
    const std::string_view TOK = args[i];
    const auto IT = byFlag.find(TOK);
    if (IT == byFlag.end()) {
      error = fmt::format("Unknown argument '{}'", TOK);
      return false;
    }

    const std::uint8_t KEY = IT->second;
    const ArgDef& DEF = map.at(KEY);
    if (i + DEF.nargs >= args.size()) {
      error = fmt::format("Flag '{}' expects {} value(s)", DEF.flag, DEF.nargs);
      return false;
    }

    auto& values = pargs[KEY];
    values.assign(args.begin() + static_cast<std::ptrdiff_t>(i + 1),
                  args.begin() + static_cast<std::ptrdiff_t>(i + 1 + DEF.nargs));
    i += DEF.nargs;
  }

  for (const auto& KV : map) {
    if (KV.second.required && pargs.count(KV.first) == 0) {
      error = fmt::format("Missing required flag '{}'", KV.second.flag);
      return false;
    }
  }
  return true;
}

/**
 * @brief Parse a whole token as an unsigned decimal number.
 * @return The value, or nullopt for empty, signed, partial or out-of-range input.
 */
[[nodiscard]] inline std::optional<std::uint64_t> parseUnsigned(std::string_view text) noexcept {
  std::uint64_t value = 0;
  const char* const END = text.data() + text.size();
  const auto RES = std::from_chars(text.data(), END, value);
  if (text.empty() || RES.ec != std::errc{} || RES.ptr != END) {
    return std::nullopt;
  }
  return value;
}

/**
 * @brief Print generated help text to stdout.
 * @param progName    Program name (typically argv[0]).
 * @param description One-line tool summary.
 * @param map         Flags to document, listed alphabetically.
 */
inline void printUsage(const char* progName, std::string_view description, const ArgMap& map) {
  fmt::print("Usage: {} [OPTIONS]\n\n", progName);
  if (!description.empty()) {
    fmt::print("{}\n\n", description);
  }
  fmt::print("Options:\n");

  std::vector<const ArgDef*> defs;
  defs.reserve(map.size());
  for (const auto& KV : map) {
    defs.push_back(&KV.second);
  }
  std::sort(defs.begin(), defs.end(),
            [](const ArgDef* a, const ArgDef* b) { return a->flag < b->flag; });

  for (const ArgDef* def : defs) {
    std::string left(def->flag);
    for (std::uint8_t k = 0; k < def->nargs; ++k) {
      left += " <value>";
    }
    fmt::print("  {:<18}  {}{}\n", left, def->desc, def->required ? " (required)" : "");
  }
}

} // namespace args
} // namespace helpers
} // namespace mountwatch

#endif // MOUNTWATCH_HELPERS_ARGS_HPP

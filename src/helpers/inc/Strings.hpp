#ifndef MOUNTWATCH_HELPERS_STRINGS_HPP
#define MOUNTWATCH_HELPERS_STRINGS_HPP
/**
 * @file Strings.hpp
 * @brief Tokenizing helpers for line-oriented kernel tables.
 *
 * Works on std::string_view so callers can slice a table buffer without
 * copying until a field is kept.
 */

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace mountwatch {
namespace helpers {
namespace strings {

/* ----------------------------- Classification ----------------------------- */

/**
 * @brief ASCII whitespace test (space, \\t, \\n, \\v, \\f, \\r).
 * @note Locale-independent, unlike std::isspace.
 */
[[nodiscard]] constexpr bool isAsciiSpace(char c) noexcept {
  return c == ' ' || c == '\t' || c == '\n' || c == '\v' || c == '\f' || c == '\r';
}

/* ----------------------------- Trimming ----------------------------- */

/**
 * @brief Drop leading ASCII whitespace.
 * @param str Input view.
 * @return Sub-view starting at the first non-whitespace character.
 */
[[nodiscard]] inline std::string_view trimLeadingWhitespace(std::string_view str) noexcept {
  std::size_t i = 0;
  while (i < str.size() && isAsciiSpace(str[i])) {
    ++i;
  }
  return str.substr(i);
}

/* ----------------------------- Splitting ----------------------------- */

/**
 * @brief Split on runs of ASCII whitespace.
 * @param str Input view.
 * @param out Destination for up to maxFields views into str.
 * @param maxFields Capacity of out.
 * @return Total number of fields in str (may exceed maxFields; extras are not stored).
 *
 * Returning the full count lets callers reject lines with too many fields.
 */
[[nodiscard]] inline std::size_t splitWhitespace(std::string_view str, std::string_view* out,
                                                 std::size_t maxFields) noexcept {
  std::size_t count = 0;
  std::size_t i = 0;
  const std::size_t LEN = str.size();

  while (i < LEN) {
    while (i < LEN && isAsciiSpace(str[i])) {
      ++i;
    }
    if (i >= LEN) {
      break;
    }
    const std::size_t START = i;
    while (i < LEN && !isAsciiSpace(str[i])) {
      ++i;
    }
    if (out != nullptr && count < maxFields) {
      out[count] = str.substr(START, i - START);
    }
    ++count;
  }

  return count;
}

/**
 * @brief Split on a single-character separator, keeping empty pieces.
 * @param str Input view ("a,,b" -> {"a", "", "b"}).
 * @param sep Separator character.
 * @return Owned pieces in order. An empty input yields one empty piece.
 */
[[nodiscard]] inline std::vector<std::string> splitOn(std::string_view str, char sep) {
  std::vector<std::string> pieces;
  std::size_t start = 0;
  for (;;) {
    const std::size_t POS = str.find(sep, start);
    if (POS == std::string_view::npos) {
      pieces.emplace_back(str.substr(start));
      break;
    }
    pieces.emplace_back(str.substr(start, POS - start));
    start = POS + 1;
  }
  return pieces;
}

} // namespace strings
} // namespace helpers
} // namespace mountwatch

#endif // MOUNTWATCH_HELPERS_STRINGS_HPP

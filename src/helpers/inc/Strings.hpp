#ifndef PFRELAY_HELPERS_STRINGS_HPP
#define PFRELAY_HELPERS_STRINGS_HPP
/**
 * @file Strings.hpp
 * @brief String helpers for sysfs values and interface names.
 *
 * @note All functions are noexcept with no allocations.
 */

#include <cstddef>

namespace pfrelay {
namespace helpers {
namespace strings {

/* ----------------------------- Parsing ----------------------------- */

/**
 * @brief Find the start of the last whitespace-separated token.
 * @param str Null-terminated string (e.g. "802.3ad 4").
 * @return Pointer to the last token ("4"), or str itself when there is no separator.
 */
[[nodiscard]] inline const char* lastToken(const char* str) noexcept {
  if (str == nullptr) {
    return nullptr;
  }
  const char* last = str;
  for (const char* p = str; *p != '\0'; ++p) {
    if ((*p == ' ' || *p == '\t') && p[1] != '\0' && p[1] != ' ' && p[1] != '\t') {
      last = p + 1;
    }
  }
  return last;
}

/* ----------------------------- Manipulation ----------------------------- */

/**
 * @brief Strip trailing whitespace in-place.
 * @param buf Buffer to modify (null-terminated).
 * @param len Current string length (will be updated).
 */
inline void stripTrailingWhitespace(char* buf, std::size_t& len) noexcept {
  if (buf == nullptr) {
    return;
  }

  while (len > 0) {
    const char C = buf[len - 1];
    if (C == '\n' || C == '\r' || C == ' ' || C == '\t') {
      --len;
      buf[len] = '\0';
    } else {
      break;
    }
  }
}

} // namespace strings
} // namespace helpers
} // namespace pfrelay

#endif // PFRELAY_HELPERS_STRINGS_HPP

#ifndef PFRELAY_HELPERS_FILES_HPP
#define PFRELAY_HELPERS_FILES_HPP
/**
 * @file Files.hpp
 * @brief Bounded sysfs reads.
 *
 * Uses C-style I/O (open/read/close) into caller-provided buffers. Values under
 * /sys/class/net are short single-line strings or integers.
 */

#include "src/helpers/inc/Strings.hpp"

#include <fcntl.h>    // open, O_RDONLY, O_CLOEXEC
#include <unistd.h>   // read, close

#include <cstddef>
#include <cstdint>
#include <cstdlib> // strtol

namespace pfrelay {
namespace helpers {
namespace files {

/* ----------------------------- File Reading ----------------------------- */

/**
 * @brief Read file contents into buffer.
 * @param path File path to read.
 * @param buf Output buffer.
 * @param bufSize Size of output buffer.
 * @return Number of bytes read (excluding null terminator), 0 on error.
 *
 * Strips trailing newlines and carriage returns. Always null-terminates.
 */
[[nodiscard]] inline std::size_t readFileToBuffer(const char* path, char* buf,
                                                  std::size_t bufSize) noexcept {
  if (path == nullptr || buf == nullptr || bufSize == 0) {
    if (buf != nullptr && bufSize > 0) {
      buf[0] = '\0';
    }
    return 0;
  }

  buf[0] = '\0';

  const int FD = ::open(path, O_RDONLY | O_CLOEXEC);
  if (FD < 0) {
    return 0;
  }

  std::size_t total = 0;
  while (total < bufSize - 1) {
    const ssize_t N = ::read(FD, buf + total, bufSize - 1 - total);
    if (N <= 0) {
      break;
    }
    total += static_cast<std::size_t>(N);
  }

  ::close(FD);
  buf[total] = '\0';

  pfrelay::helpers::strings::stripTrailingWhitespace(buf, total);

  return total;
}

/**
 * @brief Parse a signed decimal integer from a null-terminated string.
 * @param text Text to parse (leading whitespace allowed).
 * @param out Parsed value on success.
 * @return true if at least one digit was consumed.
 */
[[nodiscard]] inline bool parseInt(const char* text, std::int32_t& out) noexcept {
  if (text == nullptr) {
    return false;
  }
  char* end = nullptr;
  const long VAL = std::strtol(text, &end, 10);
  if (end == text) {
    return false;
  }
  out = static_cast<std::int32_t>(VAL);
  return true;
}

} // namespace files
} // namespace helpers
} // namespace pfrelay

#endif // PFRELAY_HELPERS_FILES_HPP

#ifndef __ARCHTUI_RAW_FD_UTILS__
#define __ARCHTUI_RAW_FD_UTILS__

#include "Headers.hpp"

namespace archtui {
/**
 * @brief Simple blocking wrappers around POSIX fd read/write loops.
 */
class RawFdUtils {
 public:
  /**
   * @brief Writes the entire buffer to the given descriptor, retrying on
   * EAGAIN and EINTR.
   */
  static void writeAll(int fd, const char* buf, size_t count);

  /**
   * @brief Waits up to `timeoutMs` for the descriptor to become readable.
   * @return true if data (or EOF) can be read without blocking.
   */
  static bool waitOnData(int fd, int timeoutMs);

  /** @brief Closes the descriptor if it is open and resets it to -1. */
  static void closeIfOpen(int* fd);
};
}  // namespace archtui
#endif  // __ARCHTUI_RAW_FD_UTILS__
